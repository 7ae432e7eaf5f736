#pragma once

#include <iostream>

#include <sqlite_modern_cpp.h>

namespace loglens_core {

// Immediate takes the write lock up front, so two cache writers queue on busy_timeout
// instead of failing with SQLITE_BUSY when the second one upgrades.
enum class TransactionMode { Deferred, Immediate };

// Rolls back on destruction unless commit() or rollback() already ended it.
class Transaction {
 public:
  explicit Transaction(sqlite::database& db, TransactionMode mode = TransactionMode::Deferred)
      : db_(db), active_(true) {
    db_ << (mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    if (!active_) {
      return;
    }
    db_ << "COMMIT;";
    active_ = false;
  }

  void rollback() {
    if (!active_) {
      return;
    }
    active_ = false;
    db_ << "ROLLBACK;";
  }

  bool active() const {
    return active_;
  }

  ~Transaction() noexcept {
    if (!active_) {
      return;
    }
    try {
      rollback();
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "[Transaction] rollback failed: " << e.errstr() << std::endl;
    }
  }

 private:
  sqlite::database& db_;
  bool active_;
};

}  // namespace loglens_core
