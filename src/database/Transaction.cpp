#include "database/Transaction.hpp"
#include "database/DBConnection.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <sqlite3.h>

using namespace mds::database;
using namespace mds::types;

namespace {

struct StatementReset {
    sqlite3_stmt* stmt;
    ~StatementReset() {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
};

void bindValue(sqlite3_stmt* stmt, const int idx, const Value& value) {
    int rc = SQLITE_OK;
    if (std::holds_alternative<std::monostate>(value)) rc = sqlite3_bind_null(stmt, idx);
    else if (const auto* i = std::get_if<int64_t>(&value)) rc = sqlite3_bind_int64(stmt, idx, *i);
    else if (const auto* d = std::get_if<double>(&value)) rc = sqlite3_bind_double(stmt, idx, *d);
    else {
        const auto& s = std::get<std::string>(value);
        rc = sqlite3_bind_text(stmt, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
    }
    if (rc != SQLITE_OK) throw StoreError(fmt::format("Failed to bind parameter {}", idx));
}

Value columnValue(sqlite3_stmt* stmt, const int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER: return static_cast<int64_t>(sqlite3_column_int64(stmt, col));
        case SQLITE_FLOAT: return sqlite3_column_double(stmt, col);
        case SQLITE_NULL: return std::monostate{};
        default: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            const auto len = sqlite3_column_bytes(stmt, col);
            return std::string(text ? text : "", static_cast<size_t>(len));
        }
    }
}

}

Transaction::Transaction(DBConnection& conn, const bool write) : conn_(conn) {
    conn_.execRaw(write ? "BEGIN IMMEDIATE;" : "BEGIN;");
}

Transaction::~Transaction() {
    if (committed_) return;
    if (sqlite3_exec(conn_.get(), "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK && log::Registry::isInitialized())
        log::Registry::db()->warn("[Transaction] Rollback failed: {}", sqlite3_errmsg(conn_.get()));
}

Result Transaction::exec(const std::string& prepped, const Params& params) {
    sqlite3_stmt* stmt = conn_.prepared(prepped);
    const StatementReset reset{stmt};

    const auto& values = params.values();
    for (size_t i = 0; i < values.size(); ++i) bindValue(stmt, static_cast<int>(i) + 1, values[i]);

    const int nCols = sqlite3_column_count(stmt);
    auto columns = std::make_shared<std::vector<std::string>>();
    columns->reserve(static_cast<size_t>(nCols));
    for (int c = 0; c < nCols; ++c) columns->emplace_back(sqlite3_column_name(stmt, c));

    std::vector<Row> rows;
    for (;;) {
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW)
            throw StoreError(fmt::format("{}: {}", prepped, sqlite3_errmsg(conn_.get())));

        std::vector<Value> row;
        row.reserve(static_cast<size_t>(nCols));
        for (int c = 0; c < nCols; ++c) row.push_back(columnValue(stmt, c));
        rows.emplace_back(columns, std::move(row));
    }

    const int affected = nCols == 0 ? sqlite3_changes(conn_.get()) : 0;
    return {std::move(rows), affected};
}

int64_t Transaction::lastInsertId() const {
    return sqlite3_last_insert_rowid(conn_.get());
}

void Transaction::commit() {
    conn_.execRaw("COMMIT;");
    committed_ = true;
}
