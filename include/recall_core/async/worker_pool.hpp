#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include "recall_core/async/worker.hpp"

namespace recall_core::async {

/**
 * @class WorkerPool
 * @brief Owns a fixed set of Worker threads that drain the ingestion job queue.
 *
 * Workers only share the job queue, so unrelated jobs run side by side.
 * Destroying the pool stops and joins every worker.
 */
class WorkerPool {
 public:
  WorkerPool(size_t num_threads,
             std::shared_ptr<ServiceProvider> services,
             std::chrono::milliseconds poll_interval = std::chrono::milliseconds(1000));

  ~WorkerPool();

  void start();

  // Signals every worker to stop after its current job. Does not block.
  void stop();

  size_t size() const {
    return m_workers.size();
  }
  bool is_running() const {
    return m_is_running;
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

 private:
  std::vector<std::unique_ptr<Worker>> m_workers;
  bool m_is_running = false;
};

}  // namespace recall_core::async
