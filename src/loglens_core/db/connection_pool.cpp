#include "loglens_core/db/connection_pool.hpp"

#include <stdexcept>

namespace loglens_core {

ConnectionPool::ConnectionPool(const std::string& db_path, int pool_size,
                               std::chrono::milliseconds acquire_timeout)
    : db_path_(db_path), capacity_(0), acquire_timeout_(acquire_timeout) {
  if (pool_size <= 0) {
    throw std::invalid_argument("Connection pool size must be greater than 0");
  }
  capacity_ = static_cast<size_t>(pool_size);
  for (size_t i = 0; i < capacity_; ++i) {
    pool_.push(open_connection());
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::open_connection() const {
  auto db = std::make_unique<sqlite::database>(db_path_);
  if (!db->connection()) {
    throw std::runtime_error("Failed to open pooled connection to " + db_path_);
  }
  *db << "PRAGMA journal_mode = WAL;";
  *db << "PRAGMA synchronous = NORMAL;";
  *db << "PRAGMA busy_timeout = 5000;";
  return db;
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  auto ready = [this] { return shutting_down_ || !pool_.empty(); };
  if (acquire_timeout_.count() > 0) {
    if (!cv_.wait_for(lock, acquire_timeout_, ready)) {
      throw std::runtime_error("Timed out after " + std::to_string(acquire_timeout_.count()) +
                               "ms waiting for a connection to " + db_path_);
    }
  } else {
    cv_.wait(lock, ready);
  }

  if (shutting_down_) {
    throw std::runtime_error("Connection pool is shut down");
  }

  std::unique_ptr<sqlite::database> conn = std::move(pool_.front());
  pool_.pop();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (shutting_down_ || !conn) {
      return;
    }
    pool_.push(std::move(conn));
  }
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    shutting_down_ = true;
    std::queue<std::unique_ptr<sqlite::database>>().swap(pool_);
  }
  cv_.notify_all();
}

size_t ConnectionPool::available() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return pool_.size();
}

}  // namespace loglens_core
