#include "database/Database.hpp"
#include "database/schema.hpp"
#include "types/errors.hpp"

#include <system_error>

using namespace mds::database;
using namespace mds::types;
namespace fs = std::filesystem;

Database::Database(fs::path dbPath, const size_t poolSize)
    : path_(std::move(dbPath)), poolSize_(poolSize == 0 ? 1 : poolSize) {}

Database::~Database() {
    std::scoped_lock lock(lifecycleMutex_);
    pool_.reset();
}

void Database::open() {
    std::scoped_lock lock(lifecycleMutex_);
    if (pool_) return;

    if (path_.has_parent_path()) fs::create_directories(path_.parent_path());

    try {
        bootstrap();
        pool_ = std::make_unique<DBPool>(path_, poolSize_);
    } catch (const StoreError& e) {
        log::Registry::db()->warn("[Database] State store at {} is unusable ({}), recreating it empty",
                                  path_.string(), e.what());
        removeFiles();
        bootstrap();
        pool_ = std::make_unique<DBPool>(path_, poolSize_);
    }

    log::Registry::db()->debug("[Database] Opened {} with {} connections", path_.string(), poolSize_);
}

void Database::close() {
    std::scoped_lock lock(lifecycleMutex_);
    if (!pool_) return;
    pool_.reset();
    log::Registry::db()->debug("[Database] Closed {}", path_.string());
}

bool Database::isOpen() const {
    std::scoped_lock lock(lifecycleMutex_);
    return pool_ != nullptr;
}

DBPool& Database::pool() {
    {
        std::scoped_lock lock(lifecycleMutex_);
        if (pool_) return *pool_;
    }
    open();
    std::scoped_lock lock(lifecycleMutex_);
    if (!pool_) throw StoreError("State store is not open: " + path_.string());
    return *pool_;
}

void Database::bootstrap() {
    DBConnection conn(path_);
    schema::ensure(conn);
    // Preparing every statement catches tables whose shape no longer matches
    conn.initPrepared();
}

void Database::removeFiles() const {
    for (const auto* suffix : {"", "-wal", "-shm", "-journal"}) {
        std::error_code ec;
        fs::remove(fs::path(path_.string() + suffix), ec);
        if (ec) log::Registry::db()->warn("[Database] Failed to remove {}{}: {}", path_.string(), suffix, ec.message());
    }
}
