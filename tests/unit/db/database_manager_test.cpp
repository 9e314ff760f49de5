#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>
#include <string>
#include <atomic>
#include <thread>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "recall_core/db/connection_pool.hpp"
#include "recall_core/db/pooled_connection.hpp"

namespace recall_core {

class DatabaseManagerTest : public recall_tests::ChunkStoreTestBase {};

TEST_F(DatabaseManagerTest, CreatesSchema_OnInitialization) {
  std::vector<std::string> required_tables = {"chunks", "ingestion_jobs", "job_progress"};

  PooledConnection conn(*db_manager_);
  for (const auto& table : required_tables) {
    int count = 0;
    *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?" << table >> count;
    EXPECT_EQ(count, 1) << "Missing table: " << table;
  }
}

TEST_F(DatabaseManagerTest, HasIndexesAndPragmas_Applied) {
  PooledConnection conn(*db_manager_);

  int idx_count = 0;
  *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='index' AND name='idx_ingestion_jobs_status_priority'" >> idx_count;
  EXPECT_EQ(idx_count, 1);
  EXPECT_TRUE(chunk_store_->has_owner_index());

  int fk_on = 0;
  *conn << "PRAGMA foreign_keys;" >> fk_on;
  EXPECT_EQ(fk_on, 1);
}

TEST_F(DatabaseManagerTest, ReopenWithWrongKey_Fails) {
  const std::string wrong_key = "incorrect_test_key";
  EXPECT_THROW({ recall_core::ConnectionPool bad_pool(temp_db_path_.string(), wrong_key, 1, 1000); },
               std::exception);
}

TEST_F(DatabaseManagerTest, GetConnection_AfterShutdownThrows) {
  db_manager_->shutdown();
  EXPECT_FALSE(db_manager_->is_initialized());
  EXPECT_THROW(db_manager_->get_connection(), std::runtime_error);
}

TEST_F(DatabaseManagerTest, PooledConnections_AreSharedAcrossThreads) {
  std::vector<std::thread> threads;
  std::atomic<int> total{0};
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      PooledConnection conn(*db_manager_);
      int one = 0;
      *conn << "SELECT 1;" >> one;
      total += one;
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(total.load(), 8);
}

}  // namespace recall_core
