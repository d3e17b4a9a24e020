#include "sync/CacheLayout.hpp"
#include "crypto/util/hash.hpp"
#include "sources/model/Source.hpp"
#include "util/pathSafety.hpp"

#include <stdexcept>

using namespace mds::sync;
using namespace mds::sources::model;
namespace fs = std::filesystem;

CacheLayout::CacheLayout(fs::path root) : root_(std::move(root)) {}

std::string CacheLayout::slug(const Source& source) {
    return crypto::hash::sha256Hex(source.baseUrl()).substr(0, SLUG_LENGTH);
}

fs::path CacheLayout::sourceDir(const Source& source) const {
    return root_ / slug(source);
}

fs::path CacheLayout::artifactPath(const Source& source, const std::string& relPath) const {
    if (!util::isSafeRelativePath(relPath))
        throw std::invalid_argument("Unsafe artifact path: " + relPath);
    return sourceDir(source) / fs::path(relPath);
}

fs::path CacheLayout::manifestPath(const Source& source) const {
    return sourceDir(source) / MANIFEST_FILENAME;
}

bool CacheLayout::removeSource(const Source& source) const {
    return fs::remove_all(sourceDir(source)) > 0;
}
