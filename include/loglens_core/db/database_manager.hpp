#pragma once

#include "loglens_core/db/connection_pool.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace loglens_core {

// Owns the connection pool for one SQLite file. Each workspace opens its own manager;
// there is no process-wide instance.
class DatabaseManager {
public:
    // Creates the parent directory, applies the schema and opens the pool.
    DatabaseManager(const std::filesystem::path& db_path, int pool_size);
    ~DatabaseManager();

    // These methods are used by the PooledConnection guard
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    void shutdown();

    const std::filesystem::path& path() const { return db_path_; }

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    // A borrower stuck this long means a leaked connection, not contention.
    static constexpr std::chrono::milliseconds kAcquireTimeout{30000};

private:
    void setup_schema();

    std::filesystem::path db_path_;
    std::unique_ptr<ConnectionPool> pool_;
    bool is_initialized_ = false;
};

} // namespace loglens_core
