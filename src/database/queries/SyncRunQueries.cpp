#include "database/queries/SyncRunQueries.hpp"
#include "database/Database.hpp"
#include "store/model/SyncRun.hpp"

using namespace mds::database;
using namespace mds::store::model;

int64_t SyncRunQueries::insertRun(Database& db, const SyncRun& run) {
    return db.exec("SyncRunQueries::insertRun", [&](Transaction& txn) {
        Params p;
        p.append(run.source_id);
        p.append(run.started_at);
        p.append(SyncRun::toString(run.status));
        p.append(run.files_fetched);
        p.append(run.files_unchanged);
        p.append(run.files_failed);
        if (run.error_detail.empty()) p.append(nullptr);
        else p.append(run.error_detail);
        p.append(run.duration_ms);

        txn.exec("insert_sync_run", p);
        return txn.lastInsertId();
    });
}

std::vector<SyncRun> SyncRunQueries::listRecentRuns(Database& db, const std::string& sourceId, const unsigned int limit) {
    return db.read("SyncRunQueries::listRecentRuns", [&](Transaction& txn) {
        const auto res = txn.exec("list_recent_sync_runs", Params{sourceId, limit});
        std::vector<SyncRun> out;
        out.reserve(res.size());
        for (const auto& row : res) out.emplace_back(row);
        return out;
    });
}

unsigned int SyncRunQueries::countRuns(Database& db, const std::string& sourceId) {
    return db.read("SyncRunQueries::countRuns", [&](Transaction& txn) {
        return txn.exec("count_sync_runs", Params{sourceId}).one_row()["count"].as<unsigned int>();
    });
}

void SyncRunQueries::purgeSource(Database& db, const std::string& sourceId) {
    db.exec("SyncRunQueries::purgeSource", [&](Transaction& txn) {
        txn.exec("delete_tracked_artifacts_by_source", Params{sourceId});
        txn.exec("delete_sync_runs_by_source", Params{sourceId});
    });
}

unsigned int SyncRunQueries::deleteRunsBefore(Database& db, const std::time_t cutoff) {
    return db.exec("SyncRunQueries::deleteRunsBefore", [&](Transaction& txn) {
        return static_cast<unsigned int>(txn.exec("delete_sync_runs_before", Params{cutoff}).affected_rows());
    });
}
