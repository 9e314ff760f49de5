#include "recall_core/async/worker.hpp"

#include <sqlite_modern_cpp.h>

#include <iostream>
#include <optional>
#include <stdexcept>

#include "recall_core/async/ITask.hpp"
#include "recall_core/async/service_provider.hpp"
#include "recall_core/async/task_factory.hpp"
#include "recall_core/db/chunk_store.hpp"
#include "recall_core/db/job_repo.hpp"

namespace recall_core {
namespace async {

Worker::Worker(int worker_id,
               std::shared_ptr<ServiceProvider> services,
               std::chrono::milliseconds poll_interval)
    : worker_id_(worker_id), services_(std::move(services)), poll_interval_(poll_interval) {
  if (!services_) {
    throw std::invalid_argument("Worker requires a ServiceProvider.");
  }
  std::cout << "Worker [" << worker_id_ << "] created." << std::endl;
}

Worker::~Worker() {
  std::cout << "Worker [" << worker_id_ << "] shutting down..." << std::endl;
  stop();
  if (thread_.joinable()) {
    thread_.join();
  }
  std::cout << "Worker [" << worker_id_ << "] joined and shut down." << std::endl;
}

void Worker::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop_.store(false);
  thread_ = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop_.store(true);
}

void Worker::run_loop() {
  std::cout << "Worker [" << worker_id_ << "] starting run loop." << std::endl;
  while (!should_stop_.load()) {
    bool found = false;
    try {
      found = run_one_task();
    } catch (const std::exception& e) {
      // Claiming failed (database busy or shutting down); back off and poll again.
      std::cerr << "Worker [" << worker_id_ << "] ERROR polling job queue: " << e.what()
                << std::endl;
    }
    if (!found) {
      // Sleep in short steps so stop() takes effect quickly.
      auto deadline = std::chrono::steady_clock::now() + poll_interval_;
      while (!should_stop_.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
      }
    }
  }
  std::cout << "Worker [" << worker_id_ << "] run loop terminated." << std::endl;
}

bool Worker::run_one_task() {
  std::optional<JobDTO> job = services_->get_job_repo().fetch_and_claim_next_job();
  if (!job) {
    return false;
  }
  std::cout << "Worker [" << worker_id_ << "] claimed job " << job->id << " (" << job->job_type
            << ") for document '" << job->document_id << "'." << std::endl;
  process_job(*job);
  return true;
}

void Worker::process_job(const JobDTO& job) {
  JobRepo& job_repo = services_->get_job_repo();
  try {
    ITaskPtr task = TaskFactory::create_task(job);

    ProgressUpdater on_progress = [&](float percent, const std::string& message,
                                      const JobCounters& counters) {
      job_repo.upsert_job_progress(job.id, percent, message, counters);
    };
    CancellationCheck is_cancelled = [&]() { return job_repo.is_cancel_requested(job.id); };

    nlohmann::json summary = task->execute(*services_, on_progress, is_cancelled);
    job_repo.mark_job_completed(job.id, summary.dump());
    std::cout << "Worker [" << worker_id_ << "] completed job " << job.id << "." << std::endl;
  } catch (const JobCancelled& e) {
    std::cout << "Worker [" << worker_id_ << "] job " << job.id << " cancelled." << std::endl;
    try {
      job_repo.mark_job_cancelled(job.id, e.partial_summary().dump());
    } catch (const JobRepoError& repo_error) {
      std::cerr << "Worker [" << worker_id_ << "] ERROR recording cancellation of job " << job.id
                << ": " << repo_error.what() << std::endl;
    }
  } catch (const ChunkStoreError& e) {
    record_failure(job.id, e.what(), true);
  } catch (const JobRepoError& e) {
    record_failure(job.id, e.what(), true);
  } catch (const sqlite::sqlite_exception& e) {
    record_failure(job.id, e.what(), true);
  } catch (const std::exception& e) {
    record_failure(job.id, e.what(), false);
  }
}

void Worker::record_failure(long long job_id, const std::string& error, bool retryable) {
  std::cerr << "Worker [" << worker_id_ << "] ERROR processing job " << job_id << ": " << error
            << (retryable ? " (retryable)" : "") << std::endl;
  try {
    services_->get_job_repo().mark_job_failed(job_id, error, retryable);
  } catch (const JobRepoError& e) {
    std::cerr << "Worker [" << worker_id_ << "] ERROR recording failure of job " << job_id << ": "
              << e.what() << std::endl;
  }
}

}  // namespace async
}  // namespace recall_core
