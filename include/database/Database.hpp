#pragma once

#include "database/DBPool.hpp"
#include "database/Transaction.hpp"
#include "log/Registry.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace mds::database {

// Owns the SQLite state file and its connection pool. Writes are serialized
// through one writer lock; reads run concurrently on pooled connections.
class Database {
  public:
    explicit Database(std::filesystem::path dbPath, size_t poolSize = 4);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Creates or repairs the schema. A corrupt or version-mismatched file is
    // deleted and recreated empty. Safe to call repeatedly.
    void open();

    // Callers must not hold transactions across close()
    void close();

    [[nodiscard]] bool isOpen() const;
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    template <typename Func>
    auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<Transaction&>())) {
        return run(ctx, std::forward<Func>(func), true);
    }

    template <typename Func>
    auto read(const std::string& ctx, Func&& func) -> decltype(func(std::declval<Transaction&>())) {
        return run(ctx, std::forward<Func>(func), false);
    }

  private:
    std::filesystem::path path_;
    size_t poolSize_;
    std::unique_ptr<DBPool> pool_;
    mutable std::mutex lifecycleMutex_;
    std::mutex writeMutex_;

    DBPool& pool();
    void bootstrap();
    void removeFiles() const;

    template <typename Func>
    auto run(const std::string& ctx, Func&& func, const bool write) -> decltype(func(std::declval<Transaction&>())) {
        auto& dbPool = pool();

        std::unique_lock writeLock(writeMutex_, std::defer_lock);
        if (write) writeLock.lock();

        log::Registry::db()->trace("[Database::exec] Starting transaction: {}", ctx);
        PooledConnection conn(dbPool);

        try {
            Transaction txn(*conn, write);
            if constexpr (std::is_void_v<decltype(func(txn))>) {
                func(txn);
                txn.commit();
                log::Registry::db()->trace("[Database::exec] Transaction committed: {}", ctx);
            } else {
                auto result = func(txn);
                txn.commit();
                log::Registry::db()->trace("[Database::exec] Transaction committed: {}", ctx);
                return result;
            }
        } catch (const std::exception& e) {
            log::Registry::db()->error("[Database::exec] Exception in transaction context '{}', rolling back: {}", ctx, e.what());
            throw;
        }

        if constexpr (!std::is_void_v<decltype(func(std::declval<Transaction&>()))>) {
            throw std::logic_error("Unreachable path in Database::exec");
        }
    }
};

}
