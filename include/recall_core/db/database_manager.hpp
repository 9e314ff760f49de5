#pragma once

#include "recall_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace recall_core {

class DatabaseManager {
 public:
  static DatabaseManager& get_instance();

  // Called once at startup. Creates the schema then the pool.
  void initialize(const std::filesystem::path& db_path,
                  const std::string& db_key,
                  int pool_size,
                  int busy_timeout_ms = 5000);

  // Used by the PooledConnection guard
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  bool is_initialized() const {
    return is_initialized_;
  }

  DatabaseManager(const DatabaseManager&) = delete;
  DatabaseManager& operator=(const DatabaseManager&) = delete;

 private:
  DatabaseManager() = default;
  void setup_schema(const std::filesystem::path& db_path, const std::string& db_key);

  std::mutex init_mutex_;
  std::unique_ptr<ConnectionPool> pool_;
  bool is_initialized_ = false;
};

}  // namespace recall_core
