#include "database/DBConnection.hpp"

using namespace mds::database;

void DBConnection::initPreparedSources() {
    prepare("insert_source",
            "INSERT INTO sources (id, url, subdirectory, priority, enabled, last_sync_time, last_etag, created_at) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)");

    prepare("update_source",
            "UPDATE sources SET url = ?2, subdirectory = ?3, priority = ?4, enabled = ?5 WHERE id = ?1");

    prepare("update_source_sync_metadata",
            "UPDATE sources SET last_sync_time = ?2, last_etag = ?3 WHERE id = ?1");

    prepare("delete_source", "DELETE FROM sources WHERE id = ?1");

    prepare("get_source", "SELECT * FROM sources WHERE id = ?1");

    prepare("list_sources", "SELECT * FROM sources ORDER BY priority ASC, id ASC");

    prepare("list_enabled_sources",
            "SELECT * FROM sources WHERE enabled = 1 ORDER BY priority ASC, id ASC");

    prepare("source_exists", "SELECT EXISTS (SELECT 1 FROM sources WHERE id = ?1) AS present");
}
