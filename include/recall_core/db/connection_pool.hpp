#pragma once
#include <sqlite_modern_cpp.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace recall_core {

// Fixed set of keyed SQLCipher connections shared by request handlers and workers.
class ConnectionPool {
 public:
  ConnectionPool(const std::string& db_path,
                 const std::string& db_key,
                 int pool_size,
                 int busy_timeout_ms);

  // Blocks until a connection is free.
  std::unique_ptr<sqlite::database> get_connection();

  void return_connection(std::unique_ptr<sqlite::database> conn);
  void shutdown();

  int size() const {
    return pool_size_;
  }

 private:
  std::unique_ptr<sqlite::database> open_keyed_connection();

  bool shutting_down_ = false;
  std::string db_path_;
  std::string db_key_;
  int pool_size_;
  int busy_timeout_ms_;
  std::queue<std::unique_ptr<sqlite::database>> pool_;
  std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace recall_core
