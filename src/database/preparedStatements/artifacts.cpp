#include "database/DBConnection.hpp"

using namespace mds::database;

void DBConnection::initPreparedArtifacts() {
    prepare("upsert_tracked_artifact",
            "INSERT INTO tracked_artifacts (source_id, path, content_hash, local_cache_path, size_bytes, etag, synced_at) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7) "
            "ON CONFLICT (source_id, path) DO UPDATE "
            "SET content_hash = excluded.content_hash, "
            "    local_cache_path = excluded.local_cache_path, "
            "    size_bytes = excluded.size_bytes, "
            "    etag = excluded.etag, "
            "    synced_at = excluded.synced_at");

    prepare("get_tracked_artifact",
            "SELECT * FROM tracked_artifacts WHERE source_id = ?1 AND path = ?2");

    prepare("get_content_hash",
            "SELECT content_hash FROM tracked_artifacts WHERE source_id = ?1 AND path = ?2");

    prepare("list_tracked_artifacts",
            "SELECT * FROM tracked_artifacts WHERE source_id = ?1 ORDER BY path ASC");

    prepare("count_tracked_artifacts",
            "SELECT COUNT(*) AS count FROM tracked_artifacts WHERE source_id = ?1");

    prepare("delete_tracked_artifacts_by_source", "DELETE FROM tracked_artifacts WHERE source_id = ?1");
}
