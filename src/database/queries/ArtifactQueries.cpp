#include "database/queries/ArtifactQueries.hpp"
#include "database/Database.hpp"
#include "store/model/TrackedArtifact.hpp"

using namespace mds::database;
using namespace mds::store::model;

void ArtifactQueries::upsertArtifact(Database& db, const TrackedArtifact& artifact) {
    db.exec("ArtifactQueries::upsertArtifact", [&](Transaction& txn) {
        Params p;
        p.append(artifact.source_id);
        p.append(artifact.path);
        p.append(artifact.content_hash);
        p.append(artifact.local_cache_path.string());
        p.append(artifact.size_bytes);
        p.append(artifact.etag);
        p.append(artifact.synced_at);

        txn.exec("upsert_tracked_artifact", p);
    });
}

std::shared_ptr<TrackedArtifact> ArtifactQueries::getArtifact(Database& db, const std::string& sourceId,
                                                              const std::string& path) {
    return db.read("ArtifactQueries::getArtifact", [&](Transaction& txn) -> std::shared_ptr<TrackedArtifact> {
        const auto res = txn.exec("get_tracked_artifact", Params{sourceId, path});
        if (res.empty()) return nullptr;
        return std::make_shared<TrackedArtifact>(res.one_row());
    });
}

std::optional<std::string> ArtifactQueries::getContentHash(Database& db, const std::string& sourceId,
                                                           const std::string& path) {
    return db.read("ArtifactQueries::getContentHash", [&](Transaction& txn) -> std::optional<std::string> {
        const auto res = txn.exec("get_content_hash", Params{sourceId, path});
        if (res.empty()) return std::nullopt;
        return res.one_row()["content_hash"].as<std::string>();
    });
}

std::vector<std::shared_ptr<TrackedArtifact>> ArtifactQueries::listArtifacts(Database& db, const std::string& sourceId) {
    return db.read("ArtifactQueries::listArtifacts", [&](Transaction& txn) {
        const auto res = txn.exec("list_tracked_artifacts", Params{sourceId});
        std::vector<std::shared_ptr<TrackedArtifact>> out;
        out.reserve(res.size());
        for (const auto& row : res) out.push_back(std::make_shared<TrackedArtifact>(row));
        return out;
    });
}

unsigned int ArtifactQueries::countArtifacts(Database& db, const std::string& sourceId) {
    return db.read("ArtifactQueries::countArtifacts", [&](Transaction& txn) {
        return txn.exec("count_tracked_artifacts", Params{sourceId}).one_row()["count"].as<unsigned int>();
    });
}
