#pragma once

#include "sources/model/Source.hpp"

#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mds::config { struct SourceConfig; }
namespace mds::database { class Database; }

namespace mds::sources {

class Registry {
public:
    static constexpr size_t MAX_ID_LENGTH = 128;
    static constexpr int HIGH_PRIORITY_WARNING = 1000;

    explicit Registry(std::shared_ptr<database::Database> db);

    // Throws types::ValidationError on a malformed or duplicate source
    void registerSource(const model::Source& source);

    // Throws types::NotFoundError for an unknown id, ValidationError if the merged result is invalid
    void update(const std::string& id, const model::SourceUpdate& fields);

    // Cascades to tracked artifacts and sync runs. Throws types::NotFoundError for an unknown id.
    void remove(const std::string& id);

    [[nodiscard]] std::shared_ptr<model::Source> get(const std::string& id) const;

    // Ascending priority, ties broken by id
    [[nodiscard]] std::vector<std::shared_ptr<model::Source>> list(bool enabledOnly = false) const;

    void recordSyncMetadata(const std::string& id, std::time_t syncedAt, const std::optional<std::string>& etag);

    // Registers configured sources that are not present yet. Returns how many were added.
    unsigned int seed(const std::vector<config::SourceConfig>& configured);

    // Normalizes the subdirectory in place and throws types::ValidationError on failure
    static void validate(model::Source& source);

private:
    std::shared_ptr<database::Database> db_;
};

}
