#include "sources/model/Source.hpp"
#include "database/Result.hpp"
#include "util/http.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace mds::sources::model;

Source::Source(std::string id, std::string url, const int priority)
    : id(std::move(id)), url(std::move(url)), priority(priority) {}

Source::Source(const database::Row& row)
    : id(row["id"].as<std::string>()),
      url(row["url"].as<std::string>()),
      subdirectory(row["subdirectory"].opt<std::string>()),
      priority(row["priority"].as<int>()),
      enabled(row["enabled"].as<bool>()),
      last_sync_time(row["last_sync_time"].opt<std::time_t>()),
      last_etag(row["last_etag"].opt<std::string>()) {}

std::string Source::baseUrl() const {
    if (!subdirectory || subdirectory->empty()) return util::joinUrl(url, "");
    return util::joinUrl(url, *subdirectory);
}

std::string Source::artifactUrl(const std::string& relPath) const {
    return util::joinUrl(baseUrl(), relPath);
}

void mds::sources::model::to_json(nlohmann::json& j, const Source& s) {
    j = {
        {"id", s.id},
        {"url", s.url},
        {"priority", s.priority},
        {"enabled", s.enabled}
    };
    j["subdirectory"] = s.subdirectory ? nlohmann::json(*s.subdirectory) : nlohmann::json(nullptr);
    j["last_sync_time"] = s.last_sync_time ? nlohmann::json(util::timestampToString(*s.last_sync_time)) : nlohmann::json(nullptr);
    j["last_etag"] = s.last_etag ? nlohmann::json(*s.last_etag) : nlohmann::json(nullptr);
}
