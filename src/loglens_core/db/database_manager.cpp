#include "loglens_core/db/database_manager.hpp"

#include <stdexcept>

namespace loglens_core {

DatabaseManager::DatabaseManager(const std::filesystem::path& db_path, int pool_size)
    : db_path_(db_path) {
  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // 1. Perform one-time schema setup before creating the pool
  setup_schema();

  // 2. Create the connection pool for builds and queries to share
  pool_ = std::make_unique<ConnectionPool>(db_path_.string(), pool_size, kAcquireTimeout);

  is_initialized_ = true;
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has been shut down.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema() {
  // Use a temporary, single-use connection just for schema setup.
  sqlite::database db(db_path_.string());
  if (!db.connection()) {
    throw std::runtime_error("Setup: Failed to get native database handle.");
  }
  db << "PRAGMA journal_mode = WAL;";

  // seq gives FIFO eviction order; the key is (content_hash, model_id), never the hash alone.
  db << R"(
      CREATE TABLE IF NOT EXISTS embedding_cache (
          seq INTEGER PRIMARY KEY AUTOINCREMENT,
          content_hash TEXT NOT NULL,
          model_id TEXT NOT NULL,
          dimension INTEGER NOT NULL,
          vector_blob BLOB NOT NULL,
          created_at TEXT NOT NULL,
          UNIQUE (content_hash, model_id)
      )
    )";
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_embedding_cache_model
      ON embedding_cache(model_id)
    )";
}

}  // namespace loglens_core
