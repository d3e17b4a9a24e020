#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace mds::store::model { struct SyncRun; }

namespace mds::database {

class Database;

struct SyncRunQueries {
    // Returns the new run id
    [[nodiscard]] static int64_t insertRun(Database& db, const store::model::SyncRun& run);

    [[nodiscard]] static std::vector<store::model::SyncRun> listRecentRuns(Database& db, const std::string& sourceId,
                                                                           unsigned int limit);
    [[nodiscard]] static unsigned int countRuns(Database& db, const std::string& sourceId);

    // Deletes both tracked artifacts and runs of a source in one transaction
    static void purgeSource(Database& db, const std::string& sourceId);

    [[nodiscard]] static unsigned int deleteRunsBefore(Database& db, std::time_t cutoff);
};

}
