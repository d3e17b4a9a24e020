#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mds::store::model { struct TrackedArtifact; }

namespace mds::database {

class Database;

struct ArtifactQueries {
    static void upsertArtifact(Database& db, const store::model::TrackedArtifact& artifact);

    [[nodiscard]] static std::shared_ptr<store::model::TrackedArtifact> getArtifact(Database& db, const std::string& sourceId,
                                                                                    const std::string& path);
    [[nodiscard]] static std::optional<std::string> getContentHash(Database& db, const std::string& sourceId,
                                                                   const std::string& path);
    [[nodiscard]] static std::vector<std::shared_ptr<store::model::TrackedArtifact>> listArtifacts(Database& db,
                                                                                                   const std::string& sourceId);
    [[nodiscard]] static unsigned int countArtifacts(Database& db, const std::string& sourceId);
};

}
