#include "database/DBConnection.hpp"
#include "types/errors.hpp"

#include <fmt/format.h>
#include <sqlite3.h>

using namespace mds::database;
using namespace mds::types;

DBConnection::DBConnection(const std::filesystem::path& dbPath) {
    constexpr int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    if (sqlite3_open_v2(dbPath.string().c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        const std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError(fmt::format("Failed to open state store {}: {}", dbPath.string(), err));
    }

    sqlite3_busy_timeout(db_, 5000);

    try {
        execRaw("PRAGMA foreign_keys = ON;");
        execRaw("PRAGMA journal_mode = WAL;");
        execRaw("PRAGMA synchronous = NORMAL;");
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

DBConnection::~DBConnection() {
    for (const auto& [_, stmt] : prepared_) sqlite3_finalize(stmt);
    prepared_.clear();
    if (db_) sqlite3_close(db_);
}

sqlite3* DBConnection::get() const { return db_; }

void DBConnection::prepare(const std::string& name, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v3(db_, sql.c_str(), -1, SQLITE_PREPARE_PERSISTENT, &stmt, nullptr) != SQLITE_OK)
        throw StoreError(fmt::format("Failed to prepare '{}': {}", name, sqlite3_errmsg(db_)));

    if (const auto it = prepared_.find(name); it != prepared_.end()) {
        sqlite3_finalize(it->second);
        it->second = stmt;
    } else prepared_.emplace(name, stmt);
}

sqlite3_stmt* DBConnection::prepared(const std::string& name) const {
    const auto it = prepared_.find(name);
    if (it == prepared_.end()) throw StoreError("Unknown prepared statement: " + name);
    return it->second;
}

void DBConnection::execRaw(const std::string& sql) const {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        const std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw StoreError(msg);
    }
}

void DBConnection::initPrepared() {
    initPreparedSources();
    initPreparedArtifacts();
    initPreparedSyncRuns();
}
