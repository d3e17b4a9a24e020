#include "database/DBConnection.hpp"

using namespace mds::database;

void DBConnection::initPreparedSyncRuns() {
    prepare("insert_sync_run",
            "INSERT INTO sync_runs (source_id, started_at, status, files_fetched, files_unchanged, "
            "                       files_failed, error_detail, duration_ms) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)");

    prepare("list_recent_sync_runs",
            "SELECT * FROM sync_runs WHERE source_id = ?1 ORDER BY id DESC LIMIT ?2");

    prepare("count_sync_runs", "SELECT COUNT(*) AS count FROM sync_runs WHERE source_id = ?1");

    prepare("delete_sync_runs_by_source", "DELETE FROM sync_runs WHERE source_id = ?1");

    prepare("delete_sync_runs_before", "DELETE FROM sync_runs WHERE started_at < ?1");
}
