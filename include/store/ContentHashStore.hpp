#pragma once

#include "store/model/SyncRun.hpp"
#include "store/model/TrackedArtifact.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mds::database { class Database; }

namespace mds::store {

// Result of re-hashing a cached file against its tracked hash
enum class Integrity {
    Ok,
    Untracked,
    Missing,
    Diverged
};

std::string_view to_string(Integrity integrity);

class ContentHashStore {
public:
    explicit ContentHashStore(std::shared_ptr<database::Database> db);
    ~ContentHashStore();

    void open();
    void close();

    [[nodiscard]] std::optional<std::string> getHash(const std::string& sourceId, const std::string& path) const;
    [[nodiscard]] std::shared_ptr<model::TrackedArtifact> getArtifact(const std::string& sourceId, const std::string& path) const;
    [[nodiscard]] std::vector<std::shared_ptr<model::TrackedArtifact>> listArtifacts(const std::string& sourceId) const;

    void recordFile(const std::string& sourceId, const std::string& path, const std::string& hash,
                    const std::filesystem::path& localPath, uint64_t size,
                    const std::optional<std::string>& etag = std::nullopt);

    // True for never-seen paths; false only on an exact hash match
    [[nodiscard]] bool hasChanged(const std::string& sourceId, const std::string& path, const std::string& currentHash) const;

    [[nodiscard]] Integrity verifyLocal(const std::string& sourceId, const std::string& path) const;

    int64_t recordSyncRun(const model::SyncRun& run);

    // Newest first
    [[nodiscard]] std::vector<model::SyncRun> getRecentRuns(const std::string& sourceId, unsigned int limit = 10) const;

    void purgeSource(const std::string& sourceId);

    // Returns the number of runs deleted; a zero window keeps everything
    unsigned int pruneRunsOlderThan(std::chrono::days retention);

private:
    std::shared_ptr<database::Database> db_;
};

}
