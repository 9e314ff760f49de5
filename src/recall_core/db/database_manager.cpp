#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>

#include "recall_core/db/database_manager.hpp"

#include <iostream>
#include <stdexcept>

namespace recall_core {

DatabaseManager& DatabaseManager::get_instance() {
  static DatabaseManager instance;
  return instance;
}

void DatabaseManager::initialize(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 int pool_size,
                                 int busy_timeout_ms) {
  std::lock_guard<std::mutex> lock(init_mutex_);
  if (is_initialized_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  setup_schema(db_path, db_key);
  pool_ = std::make_unique<ConnectionPool>(db_path.string(), db_key, pool_size, busy_timeout_ms);

  is_initialized_ = true;
  std::cout << "DatabaseManager initialized at " << db_path << " with " << pool_size
            << " pooled connections." << std::endl;
}

void DatabaseManager::shutdown() {
  std::lock_guard<std::mutex> lock(init_mutex_);
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  pool_.reset();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has not been initialized.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_ || !pool_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path,
                                   const std::string& db_key) {
  // Single-use connection so table creation never races the pool.
  sqlite::database db(db_path.string());
  sqlite3* handle = db.connection().get();
  if (!handle) {
    throw std::runtime_error("Setup: Failed to get native database handle.");
  }
  if (sqlite3_key(handle, db_key.c_str(), static_cast<int>(db_key.length())) != SQLITE_OK) {
    throw std::runtime_error("Setup: Failed to key database: " +
                             std::string(sqlite3_errmsg(handle)));
  }
  db << "SELECT count(*) FROM sqlite_master;";
  db << "PRAGMA foreign_keys = ON;";
  db << "PRAGMA journal_mode = WAL;";

  // Content is zstd-compressed text; embedding is D packed floats.
  db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          chunk_id TEXT NOT NULL UNIQUE,
          owner_id TEXT NOT NULL,
          document_id TEXT NOT NULL,
          content BLOB NOT NULL,
          source_type TEXT NOT NULL,
          source_link TEXT,
          source_title TEXT NOT NULL DEFAULT '',
          page_number INTEGER,
          section_title TEXT NOT NULL DEFAULT '',
          embedding BLOB NOT NULL,
          embedding_degraded INTEGER NOT NULL DEFAULT 0,
          chunk_index INTEGER NOT NULL,
          chunk_size INTEGER NOT NULL,
          created_at INTEGER NOT NULL,
          updated_at INTEGER NOT NULL
      )
    )";

  db << R"(
      CREATE INDEX IF NOT EXISTS idx_chunks_owner
      ON chunks(owner_id, document_id, chunk_index)
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS ingestion_jobs (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          job_type TEXT NOT NULL,
          owner_id TEXT NOT NULL,
          document_id TEXT NOT NULL,
          status TEXT NOT NULL DEFAULT 'PENDING',
          priority INTEGER NOT NULL DEFAULT 10,
          payload TEXT NOT NULL,
          summary TEXT,
          error_message TEXT,
          retryable INTEGER NOT NULL DEFAULT 0,
          cancel_requested INTEGER NOT NULL DEFAULT 0,
          created_at TEXT NOT NULL,
          updated_at TEXT NOT NULL
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS job_progress (
          job_id INTEGER PRIMARY KEY,
          progress_percent REAL NOT NULL DEFAULT 0.0,
          status_message TEXT NOT NULL DEFAULT 'Initializing...',
          total_pages INTEGER NOT NULL DEFAULT 0,
          processed_pages INTEGER NOT NULL DEFAULT 0,
          total_chunks INTEGER NOT NULL DEFAULT 0,
          stored_chunks INTEGER NOT NULL DEFAULT 0,
          updated_at TEXT NOT NULL,
          FOREIGN KEY (job_id) REFERENCES ingestion_jobs(id) ON DELETE CASCADE
      )
    )";

  db << R"(
      CREATE INDEX IF NOT EXISTS idx_ingestion_jobs_status_priority
      ON ingestion_jobs(status, priority, created_at)
    )";
}

}  // namespace recall_core
