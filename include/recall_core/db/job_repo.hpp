#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "recall_core/db/database_manager.hpp"
#include "recall_core/db/models/job_dto.hpp"

namespace recall_core {

class JobRepoError : public std::exception {
 public:
  explicit JobRepoError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Persistent queue of ingestion jobs shared by the API and the worker pool.
class JobRepo {
 public:
  explicit JobRepo(DatabaseManager& db_manager);

  long long create_job(const std::string& job_type,
                       const std::string& owner_id,
                       const std::string& document_id,
                       const std::string& payload,
                       int priority = 10);

  // Atomically moves the oldest highest-priority PENDING job to PROCESSING.
  std::optional<JobDTO> fetch_and_claim_next_job();

  std::optional<JobDTO> get_job(long long job_id);
  std::vector<JobDTO> get_jobs_by_status(JobStatus status);

  void update_job_status(long long job_id, JobStatus new_status);
  void mark_job_completed(long long job_id, const std::string& summary);
  void mark_job_failed(long long job_id,
                       const std::string& error_message,
                       bool retryable,
                       const std::optional<std::string>& summary = std::nullopt);
  void mark_job_cancelled(long long job_id, const std::optional<std::string>& summary = std::nullopt);

  /**
   * Pending jobs are cancelled immediately; running jobs get a flag that the
   * task polls between pages and batches.
   * @return false when the job does not exist or already finished.
   */
  bool request_cancel(long long job_id);
  bool is_cancel_requested(long long job_id);

  void upsert_job_progress(long long job_id,
                           float percent,
                           const std::string& message,
                           const JobCounters& counters);
  std::optional<JobProgressDTO> get_job_progress(long long job_id);

  // Removes finished jobs last touched more than `older_than_days` ago.
  int clear_finished_jobs(int older_than_days = 7);

  static std::string time_point_to_string(const std::chrono::system_clock::time_point& tp);
  static std::chrono::system_clock::time_point string_to_time_point(const std::string& time_str);

 private:
  DatabaseManager& db_manager_;
};

}  // namespace recall_core
