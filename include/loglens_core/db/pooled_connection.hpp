#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include <sqlite_modern_cpp.h>

#include "loglens_core/db/database_manager.hpp"

namespace loglens_core {

// No connection could be borrowed: the pool is shut down or the wait timed out.
class DatabaseUnavailableError : public std::runtime_error {
 public:
  explicit DatabaseUnavailableError(const std::string &message) : std::runtime_error(message) {}
};

// Borrows one pooled connection for the duration of `operation` and hands it back on scope
// exit, also when the operation throws.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager &manager, const char *operation = "database access")
      : manager_(manager) {
    try {
      conn_ = manager_.get_connection();
    } catch (const std::runtime_error &e) {
      throw DatabaseUnavailableError(std::string(operation) + " on " + manager_.path().string() +
                                     ": " + e.what());
    }
  }

  ~PooledConnection() {
    if (conn_) {
      manager_.return_connection(std::move(conn_));
    }
  }

  PooledConnection(const PooledConnection &) = delete;
  PooledConnection &operator=(const PooledConnection &) = delete;

  sqlite::database *operator->() const {
    return conn_.get();
  }
  sqlite::database &operator*() const {
    return *conn_;
  }

 private:
  DatabaseManager &manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace loglens_core
