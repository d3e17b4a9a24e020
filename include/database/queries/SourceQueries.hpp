#pragma once

#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mds::sources::model { struct Source; }

namespace mds::database {

class Database;

struct SourceQueries {
    // Returns false if a source with the same id already exists
    [[nodiscard]] static bool addSource(Database& db, const sources::model::Source& source);
    [[nodiscard]] static bool updateSource(Database& db, const sources::model::Source& source);
    [[nodiscard]] static bool updateSyncMetadata(Database& db, const std::string& id, std::time_t syncedAt,
                                                 const std::optional<std::string>& etag);
    [[nodiscard]] static bool deleteSource(Database& db, const std::string& id);

    [[nodiscard]] static std::shared_ptr<sources::model::Source> getSource(Database& db, const std::string& id);
    [[nodiscard]] static std::vector<std::shared_ptr<sources::model::Source>> listSources(Database& db, bool enabledOnly);
    [[nodiscard]] static bool sourceExists(Database& db, const std::string& id);
};

}
