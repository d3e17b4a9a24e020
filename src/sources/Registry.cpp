#include "sources/Registry.hpp"
#include "config/Config.hpp"
#include "database/Database.hpp"
#include "database/queries/SourceQueries.hpp"
#include "log/Registry.hpp"
#include "types/errors.hpp"
#include "util/http.hpp"
#include "util/pathSafety.hpp"

#include <cctype>
#include <fmt/format.h>

using namespace mds::sources;
using namespace mds::sources::model;
using namespace mds::database;
using namespace mds::types;

namespace {

bool isIdChar(const char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '.' || c == '_' || c == '/' || c == '-';
}

}

Registry::Registry(std::shared_ptr<Database> db) : db_(std::move(db)) {
    if (!db_) throw std::invalid_argument("Registry requires a database");
}

void Registry::validate(Source& source) {
    if (source.id.empty()) throw ValidationError("Source id must not be empty");
    if (source.id.size() > MAX_ID_LENGTH)
        throw ValidationError(fmt::format("Source id exceeds {} characters: {}", MAX_ID_LENGTH, source.id));
    if (!std::isalnum(static_cast<unsigned char>(source.id.front())))
        throw ValidationError(fmt::format("Source id must start with a letter or digit: {}", source.id));
    for (const char c : source.id)
        if (!isIdChar(c)) throw ValidationError(fmt::format("Source id contains invalid characters: {}", source.id));

    if (!util::isHttpUrl(source.url))
        throw ValidationError(fmt::format("Source '{}' has an invalid URL (http or https required): {}", source.id, source.url));

    if (source.priority < 0)
        throw ValidationError(fmt::format("Source '{}' has a negative priority: {}", source.id, source.priority));

    if (source.subdirectory) {
        auto sub = util::stripSlashes(*source.subdirectory);
        if (sub.empty()) source.subdirectory.reset();
        else if (!util::isSafeRelativePath(sub))
            throw ValidationError(fmt::format("Source '{}' has an unsafe subdirectory: {}", source.id, *source.subdirectory));
        else source.subdirectory = std::move(sub);
    }
}

void Registry::registerSource(const Source& source) {
    auto candidate = source;
    validate(candidate);

    if (candidate.priority > HIGH_PRIORITY_WARNING)
        log::Registry::sources()->warn("[Registry] Source '{}' has an unusually high priority ({})",
                                       candidate.id, candidate.priority);

    if (!SourceQueries::addSource(*db_, candidate))
        throw ValidationError(fmt::format("Source '{}' is already registered", candidate.id));

    log::Registry::sources()->info("[Registry] Registered source '{}' ({}, priority {})",
                                   candidate.id, candidate.baseUrl(), candidate.priority);
}

void Registry::update(const std::string& id, const SourceUpdate& fields) {
    const auto existing = SourceQueries::getSource(*db_, id);
    if (!existing) throw NotFoundError(fmt::format("Source '{}' not found", id));

    auto merged = *existing;
    if (fields.url) merged.url = *fields.url;
    if (fields.subdirectory) {
        if (fields.subdirectory->empty()) merged.subdirectory.reset();
        else merged.subdirectory = *fields.subdirectory;
    }
    if (fields.priority) merged.priority = *fields.priority;
    if (fields.enabled) merged.enabled = *fields.enabled;

    validate(merged);

    if (merged.priority > HIGH_PRIORITY_WARNING)
        log::Registry::sources()->warn("[Registry] Source '{}' has an unusually high priority ({})",
                                       merged.id, merged.priority);

    if (!SourceQueries::updateSource(*db_, merged))
        throw NotFoundError(fmt::format("Source '{}' not found", id));

    log::Registry::sources()->info("[Registry] Updated source '{}'", id);
}

void Registry::remove(const std::string& id) {
    if (!SourceQueries::deleteSource(*db_, id))
        throw NotFoundError(fmt::format("Source '{}' not found", id));
    log::Registry::sources()->info("[Registry] Removed source '{}'", id);
}

std::shared_ptr<Source> Registry::get(const std::string& id) const {
    return SourceQueries::getSource(*db_, id);
}

std::vector<std::shared_ptr<Source>> Registry::list(const bool enabledOnly) const {
    return SourceQueries::listSources(*db_, enabledOnly);
}

void Registry::recordSyncMetadata(const std::string& id, const std::time_t syncedAt,
                                  const std::optional<std::string>& etag) {
    if (!SourceQueries::updateSyncMetadata(*db_, id, syncedAt, etag))
        log::Registry::sources()->warn("[Registry] Sync metadata for unknown source '{}' ignored", id);
}

unsigned int Registry::seed(const std::vector<config::SourceConfig>& configured) {
    unsigned int added = 0;
    for (const auto& cfg : configured) {
        if (cfg.id.empty()) {
            log::Registry::sources()->warn("[Registry] Skipping configured source without an id ({})", cfg.url);
            continue;
        }
        if (SourceQueries::sourceExists(*db_, cfg.id)) continue;

        Source source(cfg.id, cfg.url, cfg.priority);
        if (!cfg.subdirectory.empty()) source.subdirectory = cfg.subdirectory;
        source.enabled = cfg.enabled;

        try {
            registerSource(source);
            ++added;
        } catch (const ValidationError& e) {
            log::Registry::sources()->warn("[Registry] Skipping configured source '{}': {}", cfg.id, e.what());
        }
    }
    return added;
}
