#include "store/model/SyncRun.hpp"
#include "database/Result.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace mds::store::model;

SyncRun::SyncRun(const database::Row& row)
    : id(row["id"].as<int64_t>())
    , source_id(row["source_id"].as<std::string>())
    , started_at(row["started_at"].as<std::time_t>())
    , files_fetched(row["files_fetched"].as<uint32_t>(0))
    , files_unchanged(row["files_unchanged"].as<uint32_t>(0))
    , files_failed(row["files_failed"].as<uint32_t>(0))
    , error_detail(row["error_detail"].as<std::string>(""))
    , duration_ms(row["duration_ms"].as<uint64_t>(0))
{
    if (auto s = Status::ERROR; tryParseStatus(row["status"].as<std::string>(""), s)) status = s;
    else status = Status::ERROR;
}

SyncRun::Status SyncRun::deriveStatus(const uint32_t fetched, const uint32_t unchanged, const uint32_t failed) {
    if (failed == 0) return Status::SUCCESS;
    if (fetched + unchanged == 0) return Status::ERROR;
    return Status::PARTIAL;
}

std::string_view SyncRun::toString(const Status s) {
    switch (s) {
        case Status::SUCCESS: return "success";
        case Status::PARTIAL: return "partial";
        case Status::ERROR: return "error";
    }
    return "error";
}

bool SyncRun::tryParseStatus(const std::string_view s, Status& out) {
    if (s == "success") { out = Status::SUCCESS; return true; }
    if (s == "partial") { out = Status::PARTIAL; return true; }
    if (s == "error") { out = Status::ERROR; return true; }
    return false;
}

void mds::store::model::to_json(nlohmann::json& j, const SyncRun& run) {
    j = {
        {"id", run.id},
        {"source_id", run.source_id},
        {"started_at", util::timestampToString(run.started_at)},
        {"status", SyncRun::toString(run.status)},
        {"files_fetched", run.files_fetched},
        {"files_unchanged", run.files_unchanged},
        {"files_failed", run.files_failed},
        {"error_detail", run.error_detail},
        {"duration_ms", run.duration_ms}
    };
}
