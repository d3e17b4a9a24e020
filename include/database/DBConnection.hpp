#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>

struct sqlite3;
struct sqlite3_stmt;

namespace mds::database {

class DBConnection {
  public:
    explicit DBConnection(const std::filesystem::path& dbPath);
    ~DBConnection();

    DBConnection(const DBConnection&) = delete;
    DBConnection& operator=(const DBConnection&) = delete;

    [[nodiscard]] sqlite3* get() const;

    void prepare(const std::string& name, const std::string& sql);
    [[nodiscard]] sqlite3_stmt* prepared(const std::string& name) const;

    // Runs one or more statements that return no rows
    void execRaw(const std::string& sql) const;

    void initPrepared();

  private:
    sqlite3* db_ = nullptr;
    std::unordered_map<std::string, sqlite3_stmt*> prepared_;

    void initPreparedSources();
    void initPreparedArtifacts();
    void initPreparedSyncRuns();
};

}
