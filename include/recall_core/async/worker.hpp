#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace recall_core {
struct JobDTO;
class ServiceProvider;
}  // namespace recall_core

namespace recall_core {
namespace async {

/**
 * @class Worker
 * @brief A single background thread that claims ingestion jobs from the queue.
 *
 * The worker polls the persistent job queue, runs the claimed job's task and
 * records the outcome: COMPLETED with the summary, CANCELLED when the task
 * stopped on request, or FAILED with the error and whether a retry may help.
 *
 * Non-copyable and non-movable so the owned thread has a single owner.
 */
class Worker {
 public:
  Worker(int worker_id,
         std::shared_ptr<ServiceProvider> services,
         std::chrono::milliseconds poll_interval = std::chrono::milliseconds(1000));

  // Stops the loop and joins the thread.
  ~Worker();

  void start();

  // Signals the loop to exit after the current job. Does not block.
  void stop();

  // Claims and runs at most one job on the calling thread.
  // Returns false when the queue had nothing pending.
  bool run_one_task();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

 private:
  void run_loop();
  void process_job(const JobDTO& job);
  void record_failure(long long job_id, const std::string& error, bool retryable);

  int worker_id_;
  std::shared_ptr<ServiceProvider> services_;
  std::chrono::milliseconds poll_interval_;
  std::atomic<bool> should_stop_{false};
  std::thread thread_;
};

}  // namespace async
}  // namespace recall_core
