#include "discovery/ArtifactDiscovery.hpp"
#include "discovery/ManifestDiscovery.hpp"
#include "log/Registry.hpp"
#include "sync/CacheLayout.hpp"
#include "util/pathSafety.hpp"

#include <algorithm>
#include <unordered_set>

namespace mds::discovery {

std::vector<std::string> sanitizePaths(const std::vector<std::string>& raw,
                                       const std::vector<std::string>& extensions,
                                       const std::string& sourceId) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    out.reserve(raw.size());

    for (const auto& path : raw) {
        if (!util::isSafeRelativePath(path)) {
            log::Registry::sync()->warn("[Discovery] Dropping unsafe path '{}' from source '{}'", path, sourceId);
            continue;
        }

        // The cached manifest lives beside the artifacts in the source directory
        if (path == sync::CacheLayout::MANIFEST_FILENAME ||
            path.starts_with(std::string(sync::CacheLayout::MANIFEST_FILENAME) + "/")) {
            log::Registry::sync()->warn("[Discovery] Dropping reserved path '{}' from source '{}'", path, sourceId);
            continue;
        }

        if (!extensions.empty()) {
            const bool matches = std::ranges::any_of(extensions, [&](const std::string& ext) {
                return path.size() > ext.size() && path.ends_with(ext);
            });
            if (!matches) continue;
        }

        if (seen.insert(path).second) out.push_back(path);
    }

    return out;
}

std::shared_ptr<ArtifactDiscovery> makeDiscovery(const config::DiscoveryConfig& cfg,
                                                 std::shared_ptr<fetch::ConditionalFetcher> fetcher,
                                                 std::shared_ptr<sync::CacheLayout> layout) {
    return std::make_shared<ManifestDiscovery>(std::move(fetcher), std::move(layout), cfg);
}

}
