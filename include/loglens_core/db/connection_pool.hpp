#pragma once
#include <sqlite_modern_cpp.h>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace loglens_core {

// Fixed set of open connections to one database file. A borrower waits at most
// acquire_timeout for a free connection; zero means wait until one is returned.
class ConnectionPool {
public:
    ConnectionPool(const std::string& db_path, int pool_size,
                   std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds(0));

    // Throws std::runtime_error on shutdown or when the wait times out.
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);
    void shutdown();

    size_t available() const;
    size_t capacity() const { return capacity_; }

private:
    // WAL so queries read while a build writes; busy_timeout covers writer contention.
    std::unique_ptr<sqlite::database> open_connection() const;

    bool shutting_down_ = false;
    std::string db_path_;
    size_t capacity_;
    std::chrono::milliseconds acquire_timeout_;
    std::queue<std::unique_ptr<sqlite::database>> pool_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace loglens_core
