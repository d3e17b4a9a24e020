#pragma once

#include <filesystem>
#include <string>

namespace mds::sources::model { struct Source; }

namespace mds::sync {

// <root>/<slug>/<relative path>, slug = first 16 hex chars of sha256(base URL)
class CacheLayout {
public:
    static constexpr const char* MANIFEST_FILENAME = ".manifest";
    static constexpr size_t SLUG_LENGTH = 16;

    explicit CacheLayout(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

    [[nodiscard]] static std::string slug(const sources::model::Source& source);
    [[nodiscard]] std::filesystem::path sourceDir(const sources::model::Source& source) const;

    // Throws std::invalid_argument for a path that could escape the source directory
    [[nodiscard]] std::filesystem::path artifactPath(const sources::model::Source& source, const std::string& relPath) const;

    [[nodiscard]] std::filesystem::path manifestPath(const sources::model::Source& source) const;

    // Returns false if nothing was there to remove
    bool removeSource(const sources::model::Source& source) const;

private:
    std::filesystem::path root_;
};

}
