#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>
#include <nlohmann/json_fwd.hpp>

namespace mds::database { class Row; }

namespace mds::store::model {

// One completed pass over a source. Rows are append-only.
struct SyncRun {
    enum class Status : uint8_t {
        SUCCESS,
        PARTIAL,
        ERROR
    };

    int64_t id{0};
    std::string source_id;
    std::time_t started_at{0};
    Status status{Status::SUCCESS};

    uint32_t files_fetched{0};
    uint32_t files_unchanged{0};
    uint32_t files_failed{0};

    std::string error_detail;   // optional, newline separated
    uint64_t duration_ms{0};

    SyncRun() = default;
    explicit SyncRun(const database::Row& row);

    [[nodiscard]] static Status deriveStatus(uint32_t fetched, uint32_t unchanged, uint32_t failed);

    [[nodiscard]] static std::string_view toString(Status s);
    [[nodiscard]] static bool tryParseStatus(std::string_view s, Status& out);
};

void to_json(nlohmann::json& j, const SyncRun& run);

}
