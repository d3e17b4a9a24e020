#include "store/ContentHashStore.hpp"
#include "crypto/util/hash.hpp"
#include "database/Database.hpp"
#include "database/queries/ArtifactQueries.hpp"
#include "database/queries/SyncRunQueries.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <system_error>

using namespace mds::store;
using namespace mds::store::model;
using namespace mds::database;
using namespace std::chrono;

std::string_view mds::store::to_string(const Integrity integrity) {
    switch (integrity) {
        case Integrity::Ok: return "ok";
        case Integrity::Untracked: return "untracked";
        case Integrity::Missing: return "missing";
        case Integrity::Diverged: return "diverged";
    }
    return "unknown";
}

ContentHashStore::ContentHashStore(std::shared_ptr<Database> db) : db_(std::move(db)) {
    if (!db_) throw std::invalid_argument("ContentHashStore requires a database");
}

ContentHashStore::~ContentHashStore() = default;

void ContentHashStore::open() {
    db_->open();
}

void ContentHashStore::close() {
    db_->close();
}

std::optional<std::string> ContentHashStore::getHash(const std::string& sourceId, const std::string& path) const {
    return ArtifactQueries::getContentHash(*db_, sourceId, path);
}

std::shared_ptr<TrackedArtifact> ContentHashStore::getArtifact(const std::string& sourceId, const std::string& path) const {
    return ArtifactQueries::getArtifact(*db_, sourceId, path);
}

std::vector<std::shared_ptr<TrackedArtifact>> ContentHashStore::listArtifacts(const std::string& sourceId) const {
    return ArtifactQueries::listArtifacts(*db_, sourceId);
}

void ContentHashStore::recordFile(const std::string& sourceId, const std::string& path, const std::string& hash,
                                  const std::filesystem::path& localPath, const uint64_t size,
                                  const std::optional<std::string>& etag) {
    TrackedArtifact artifact;
    artifact.source_id = sourceId;
    artifact.path = path;
    artifact.content_hash = hash;
    artifact.local_cache_path = localPath;
    artifact.size_bytes = size;
    artifact.etag = etag;
    artifact.synced_at = util::nowSeconds();

    ArtifactQueries::upsertArtifact(*db_, artifact);
    log::Registry::store()->debug("[ContentHashStore] Recorded {}:{} ({})", sourceId, path, hash.substr(0, 12));
}

bool ContentHashStore::hasChanged(const std::string& sourceId, const std::string& path, const std::string& currentHash) const {
    const auto stored = getHash(sourceId, path);
    return !stored || *stored != currentHash;
}

Integrity ContentHashStore::verifyLocal(const std::string& sourceId, const std::string& path) const {
    const auto artifact = getArtifact(sourceId, path);
    if (!artifact) return Integrity::Untracked;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(artifact->local_cache_path, ec)) return Integrity::Missing;

    try {
        const auto actual = crypto::hash::sha256File(artifact->local_cache_path);
        return hasChanged(sourceId, path, actual) ? Integrity::Diverged : Integrity::Ok;
    } catch (const std::runtime_error& e) {
        log::Registry::store()->warn("[ContentHashStore] Could not re-hash {}: {}", artifact->local_cache_path.string(), e.what());
        return Integrity::Missing;
    }
}

int64_t ContentHashStore::recordSyncRun(const SyncRun& run) {
    const auto id = SyncRunQueries::insertRun(*db_, run);
    log::Registry::store()->debug("[ContentHashStore] Recorded sync run {} for '{}' ({})",
                                  id, run.source_id, SyncRun::toString(run.status));
    return id;
}

std::vector<SyncRun> ContentHashStore::getRecentRuns(const std::string& sourceId, const unsigned int limit) const {
    return SyncRunQueries::listRecentRuns(*db_, sourceId, limit);
}

void ContentHashStore::purgeSource(const std::string& sourceId) {
    SyncRunQueries::purgeSource(*db_, sourceId);
    log::Registry::store()->info("[ContentHashStore] Purged tracked state for '{}'", sourceId);
}

unsigned int ContentHashStore::pruneRunsOlderThan(const days retention) {
    if (retention.count() <= 0) return 0;

    const auto cutoff = system_clock::to_time_t(system_clock::now() - retention);
    const auto removed = SyncRunQueries::deleteRunsBefore(*db_, cutoff);
    if (removed > 0)
        log::Registry::store()->info("[ContentHashStore] Pruned {} sync runs older than {} days", removed, retention.count());
    return removed;
}
