#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace mds::database { class Row; }

namespace mds::sources::model {

struct Source {
    std::string id;
    std::string url;
    std::optional<std::string> subdirectory;
    int priority = 100;
    bool enabled = true;
    std::optional<std::time_t> last_sync_time;
    std::optional<std::string> last_etag;

    Source() = default;
    Source(std::string id, std::string url, int priority = 100);
    explicit Source(const database::Row& row);

    // url joined with subdirectory
    [[nodiscard]] std::string baseUrl() const;
    [[nodiscard]] std::string artifactUrl(const std::string& relPath) const;
};

// Fields left empty are not touched. An empty subdirectory string clears it.
struct SourceUpdate {
    std::optional<std::string> url;
    std::optional<std::string> subdirectory;
    std::optional<int> priority;
    std::optional<bool> enabled;
};

void to_json(nlohmann::json& j, const Source& s);

}
