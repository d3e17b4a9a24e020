#include "database/schema.hpp"
#include "database/DBConnection.hpp"
#include "log/Registry.hpp"
#include "types/errors.hpp"

#include <optional>
#include <sqlite3.h>

using namespace mds::types;

namespace {

constexpr auto CREATE_SCHEMA = R"SQL(
CREATE TABLE IF NOT EXISTS schema_metadata (
    key   TEXT PRIMARY KEY,
    value TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS sources (
    id             TEXT PRIMARY KEY,
    url            TEXT NOT NULL,
    subdirectory   TEXT,
    priority       INTEGER NOT NULL DEFAULT 100 CHECK (priority >= 0),
    enabled        INTEGER NOT NULL DEFAULT 1,
    last_sync_time INTEGER,
    last_etag      TEXT,
    created_at     INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS tracked_artifacts (
    source_id        TEXT NOT NULL REFERENCES sources(id) ON DELETE CASCADE,
    path             TEXT NOT NULL,
    content_hash     TEXT NOT NULL,
    local_cache_path TEXT NOT NULL,
    size_bytes       INTEGER NOT NULL DEFAULT 0,
    etag             TEXT,
    synced_at        INTEGER NOT NULL,
    PRIMARY KEY (source_id, path)
);

CREATE INDEX IF NOT EXISTS idx_tracked_artifacts_source ON tracked_artifacts(source_id);

CREATE TABLE IF NOT EXISTS sync_runs (
    id              INTEGER PRIMARY KEY AUTOINCREMENT,
    source_id       TEXT NOT NULL REFERENCES sources(id) ON DELETE CASCADE,
    started_at      INTEGER NOT NULL,
    status          TEXT NOT NULL CHECK (status IN ('success', 'partial', 'error')),
    files_fetched   INTEGER NOT NULL DEFAULT 0,
    files_unchanged INTEGER NOT NULL DEFAULT 0,
    files_failed    INTEGER NOT NULL DEFAULT 0,
    error_detail    TEXT,
    duration_ms     INTEGER NOT NULL DEFAULT 0
);

CREATE INDEX IF NOT EXISTS idx_sync_runs_source_time ON sync_runs(source_id, started_at DESC);
CREATE INDEX IF NOT EXISTS idx_sync_runs_status ON sync_runs(status);

CREATE TRIGGER IF NOT EXISTS sync_runs_immutable BEFORE UPDATE ON sync_runs
BEGIN
    SELECT RAISE(ABORT, 'sync_runs rows are immutable');
END;

INSERT OR IGNORE INTO schema_metadata (key, value) VALUES ('version', '1');
)SQL";

constexpr auto DROP_SCHEMA = R"SQL(
DROP TRIGGER IF EXISTS sync_runs_immutable;
DROP TABLE IF EXISTS sync_runs;
DROP TABLE IF EXISTS tracked_artifacts;
DROP TABLE IF EXISTS sources;
DROP TABLE IF EXISTS schema_metadata;
)SQL";

// Single-column query helper for bootstrap, before statements are prepared
std::optional<std::string> queryText(sqlite3* db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
        throw StoreError(sqlite3_errmsg(db));

    std::optional<std::string> out;
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        if (const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0))) out = text;
    } else if (rc != SQLITE_DONE) {
        const std::string err = sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        throw StoreError(err);
    }

    sqlite3_finalize(stmt);
    return out;
}

}

namespace mds::database::schema {

void ensure(const DBConnection& conn) {
    sqlite3* db = conn.get();

    const auto check = queryText(db, "PRAGMA quick_check;");
    if (!check || *check != "ok") throw StoreError("Integrity check failed: " + check.value_or("no result"));

    const auto hasMetadata = queryText(db,
        "SELECT name FROM sqlite_master WHERE type = 'table' AND name = 'schema_metadata';");

    if (hasMetadata) {
        const auto version = queryText(db, "SELECT value FROM schema_metadata WHERE key = 'version';");
        if (version && *version != VERSION) {
            log::Registry::db()->warn("[schema] State store version {} does not match {}, rebuilding it empty",
                                      *version, VERSION);
            conn.execRaw(DROP_SCHEMA);
        }
    }

    conn.execRaw(CREATE_SCHEMA);
}

}
