#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace mds::database { class Row; }

namespace mds::store::model {

struct TrackedArtifact {
    std::string source_id;
    std::string path;
    std::string content_hash;
    std::filesystem::path local_cache_path;
    uint64_t size_bytes = 0;
    std::optional<std::string> etag;
    std::time_t synced_at = 0;

    TrackedArtifact() = default;
    explicit TrackedArtifact(const database::Row& row);
};

void to_json(nlohmann::json& j, const TrackedArtifact& a);

}
