#include "database/queries/SourceQueries.hpp"
#include "database/Database.hpp"
#include "sources/model/Source.hpp"
#include "util/timestamp.hpp"

using namespace mds::database;
using namespace mds::sources::model;

bool SourceQueries::addSource(Database& db, const Source& source) {
    return db.exec("SourceQueries::addSource", [&](Transaction& txn) {
        if (txn.exec("source_exists", Params{source.id}).one_row()["present"].as<bool>()) return false;

        Params p;
        p.append(source.id);
        p.append(source.url);
        p.append(source.subdirectory);
        p.append(source.priority);
        p.append(source.enabled);
        p.append(source.last_sync_time);
        p.append(source.last_etag);
        p.append(util::nowSeconds());

        txn.exec("insert_source", p);
        return true;
    });
}

bool SourceQueries::updateSource(Database& db, const Source& source) {
    return db.exec("SourceQueries::updateSource", [&](Transaction& txn) {
        Params p;
        p.append(source.id);
        p.append(source.url);
        p.append(source.subdirectory);
        p.append(source.priority);
        p.append(source.enabled);
        return txn.exec("update_source", p).affected_rows() > 0;
    });
}

bool SourceQueries::updateSyncMetadata(Database& db, const std::string& id, const std::time_t syncedAt,
                                       const std::optional<std::string>& etag) {
    return db.exec("SourceQueries::updateSyncMetadata", [&](Transaction& txn) {
        return txn.exec("update_source_sync_metadata", Params{id, syncedAt, etag}).affected_rows() > 0;
    });
}

bool SourceQueries::deleteSource(Database& db, const std::string& id) {
    return db.exec("SourceQueries::deleteSource", [&](Transaction& txn) {
        return txn.exec("delete_source", Params{id}).affected_rows() > 0;
    });
}

std::shared_ptr<Source> SourceQueries::getSource(Database& db, const std::string& id) {
    return db.read("SourceQueries::getSource", [&](Transaction& txn) -> std::shared_ptr<Source> {
        const auto res = txn.exec("get_source", Params{id});
        if (res.empty()) return nullptr;
        return std::make_shared<Source>(res.one_row());
    });
}

std::vector<std::shared_ptr<Source>> SourceQueries::listSources(Database& db, const bool enabledOnly) {
    return db.read("SourceQueries::listSources", [&](Transaction& txn) {
        const auto res = txn.exec(enabledOnly ? "list_enabled_sources" : "list_sources");
        std::vector<std::shared_ptr<Source>> out;
        out.reserve(res.size());
        for (const auto& row : res) out.push_back(std::make_shared<Source>(row));
        return out;
    });
}

bool SourceQueries::sourceExists(Database& db, const std::string& id) {
    return db.read("SourceQueries::sourceExists", [&](Transaction& txn) {
        return txn.exec("source_exists", Params{id}).one_row()["present"].as<bool>();
    });
}
