#pragma once

#include "store/model/SyncRun.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace mds::sync::model {

struct FileOutcome {
    enum class Kind : uint8_t {
        FETCHED,
        UNCHANGED,
        FAILED
    };

    std::string path;
    Kind kind{Kind::FAILED};
    std::string detail;
    bool refetched_after_divergence{false};
};

struct FileError {
    std::string path;
    std::string detail;
};

struct SourceReport {
    std::string source_id;
    int priority{0};
    store::model::SyncRun::Status status{store::model::SyncRun::Status::SUCCESS};

    uint32_t files_fetched{0};
    uint32_t files_unchanged{0};
    uint32_t files_failed{0};
    uint32_t divergences{0};

    std::vector<FileError> errors;
    std::optional<std::string> discovery_error;

    int64_t run_id{0};
    uint64_t duration_ms{0};

    void tally(const FileOutcome& outcome);

    // "path: detail" lines, capped at MAX_ERROR_DETAIL_BYTES. Lines past the
    // cap are dropped whole; an oversized first line is cut on a code point.
    [[nodiscard]] std::string errorDetail() const;

    static constexpr size_t MAX_ERROR_DETAIL_BYTES = 4096;
};

// Per-source results in the order the sources were processed
struct SyncReport {
    std::vector<SourceReport> sources;

    [[nodiscard]] uint32_t totalFetched() const;
    [[nodiscard]] uint32_t totalUnchanged() const;
    [[nodiscard]] uint32_t totalFailed() const;
    [[nodiscard]] bool allSucceeded() const;
    [[nodiscard]] const SourceReport* find(const std::string& sourceId) const;
};

std::string_view to_string(FileOutcome::Kind kind);

void to_json(nlohmann::json& j, const FileError& e);
void to_json(nlohmann::json& j, const SourceReport& r);
void to_json(nlohmann::json& j, const SyncReport& r);

}
