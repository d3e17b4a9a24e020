#include "store/model/TrackedArtifact.hpp"
#include "database/Result.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace mds::store::model;

TrackedArtifact::TrackedArtifact(const database::Row& row)
    : source_id(row["source_id"].as<std::string>()),
      path(row["path"].as<std::string>()),
      content_hash(row["content_hash"].as<std::string>()),
      local_cache_path(row["local_cache_path"].as<std::string>()),
      size_bytes(row["size_bytes"].as<uint64_t>()),
      etag(row["etag"].opt<std::string>()),
      synced_at(row["synced_at"].as<std::time_t>()) {}

void mds::store::model::to_json(nlohmann::json& j, const TrackedArtifact& a) {
    j = {
        {"source_id", a.source_id},
        {"path", a.path},
        {"content_hash", a.content_hash},
        {"local_cache_path", a.local_cache_path.string()},
        {"size_bytes", a.size_bytes},
        {"synced_at", util::timestampToString(a.synced_at)}
    };
    j["etag"] = a.etag ? nlohmann::json(*a.etag) : nlohmann::json(nullptr);
}
