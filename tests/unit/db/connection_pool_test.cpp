#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <string>
#include <thread>

#include "common/utilities_test.hpp"
#include "loglens_core/db/database_manager.hpp"
#include "loglens_core/db/pooled_connection.hpp"
#include "loglens_core/db/transaction.hpp"

namespace loglens_core {

class ConnectionPoolTest : public loglens_tests::TempDirectoryTestBase {
protected:
  void SetUp() override {
    TempDirectoryTestBase::SetUp();
    // Use a larger pool in this suite to validate multi-connection behavior
    manager_ = std::make_unique<DatabaseManager>(temp_dir_ / "nested" / "pool.db", /*pool_size*/ 4);
  }

  void TearDown() override {
    manager_.reset();
    TempDirectoryTestBase::TearDown();
  }

  std::unique_ptr<DatabaseManager> manager_;
};

TEST_F(ConnectionPoolTest, CreatesDatabaseAndSchema) {
  EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "nested" / "pool.db"));

  PooledConnection conn(*manager_);
  int tables = 0;
  *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = 'embedding_cache'" >>
      tables;
  EXPECT_EQ(tables, 1);
}

TEST_F(ConnectionPoolTest, CanBorrowAndReturnConnections) {
  ConnectionPool pool((temp_dir_ / "plain.db").string(), 2);
  EXPECT_EQ(pool.available(), 2u);

  auto c1 = pool.get_connection();
  auto c2 = pool.get_connection();
  EXPECT_EQ(pool.available(), 0u);

  pool.return_connection(std::move(c1));
  pool.return_connection(std::move(c2));
  EXPECT_EQ(pool.available(), 2u);
}

TEST_F(ConnectionPoolTest, BlocksWhenPoolExhaustedAndResumes) {
  // Exhaust pool (size=4 from SetUp)
  auto holder1 = std::make_unique<PooledConnection>(*manager_);
  auto holder2 = std::make_unique<PooledConnection>(*manager_);
  auto holder3 = std::make_unique<PooledConnection>(*manager_);
  auto holder4 = std::make_unique<PooledConnection>(*manager_);

  std::promise<void> start_promise;
  std::shared_future<void> start_future(start_promise.get_future());

  // Request another connection on another thread, which should block until one is returned
  std::atomic<bool> acquired{false};
  std::thread t([&]() {
    start_future.wait();
    PooledConnection c5(*manager_);
    int count = 0;
    *c5 << "SELECT COUNT(*) FROM sqlite_master" >> count;
    acquired.store(true);
  });

  start_promise.set_value();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(acquired.load());
  holder1.reset();  // returns connection to pool

  t.join();
  EXPECT_TRUE(acquired.load());
}

TEST_F(ConnectionPoolTest, TimedPoolGivesUpWhenExhausted) {
  ConnectionPool pool((temp_dir_ / "timed.db").string(), 1, std::chrono::milliseconds(20));
  EXPECT_EQ(pool.capacity(), 1u);

  auto held = pool.get_connection();
  EXPECT_THROW(pool.get_connection(), std::runtime_error);

  pool.return_connection(std::move(held));
  EXPECT_NO_THROW(pool.return_connection(pool.get_connection()));
}

TEST_F(ConnectionPoolTest, RejectsEmptyPool) {
  EXPECT_THROW(ConnectionPool((temp_dir_ / "none.db").string(), 0), std::invalid_argument);
}

TEST_F(ConnectionPoolTest, ShutdownRejectsBorrowers) {
  manager_->shutdown();

  EXPECT_THROW(PooledConnection conn(*manager_), DatabaseUnavailableError);
}

TEST_F(ConnectionPoolTest, TransactionRollsBackUnlessCommitted) {
  PooledConnection conn(*manager_);
  {
    Transaction tx(*conn);
    *conn << "INSERT INTO embedding_cache (content_hash, model_id, dimension, vector_blob, "
             "created_at) VALUES ('h1', 'm:n:1', 1, x'00000000', 'now')";
  }
  int count = -1;
  *conn << "SELECT COUNT(*) FROM embedding_cache" >> count;
  EXPECT_EQ(count, 0);

  {
    Transaction tx(*conn, TransactionMode::Immediate);
    *conn << "INSERT INTO embedding_cache (content_hash, model_id, dimension, vector_blob, "
             "created_at) VALUES ('h1', 'm:n:1', 1, x'00000000', 'now')";
    tx.commit();
    EXPECT_FALSE(tx.active());
  }
  *conn << "SELECT COUNT(*) FROM embedding_cache" >> count;
  EXPECT_EQ(count, 1);

  {
    Transaction tx(*conn);
    *conn << "DELETE FROM embedding_cache";
    tx.rollback();
  }
  *conn << "SELECT COUNT(*) FROM embedding_cache" >> count;
  EXPECT_EQ(count, 1);
}

} // namespace loglens_core
