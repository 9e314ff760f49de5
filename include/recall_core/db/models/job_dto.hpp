#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace recall_core {

enum class JobStatus { PENDING, PROCESSING, COMPLETED, FAILED, CANCELLED };

inline std::string to_string(JobStatus status) {
  switch (status) {
    case JobStatus::PENDING: return "PENDING";
    case JobStatus::PROCESSING: return "PROCESSING";
    case JobStatus::COMPLETED: return "COMPLETED";
    case JobStatus::FAILED: return "FAILED";
    case JobStatus::CANCELLED: return "CANCELLED";
  }
  return "UNKNOWN";
}

inline JobStatus job_status_from_string(const std::string &str) {
  if (str == "PENDING") return JobStatus::PENDING;
  if (str == "PROCESSING") return JobStatus::PROCESSING;
  if (str == "COMPLETED") return JobStatus::COMPLETED;
  if (str == "FAILED") return JobStatus::FAILED;
  if (str == "CANCELLED") return JobStatus::CANCELLED;
  throw std::invalid_argument("Invalid JobStatus string: " + str);
}

inline bool is_terminal(JobStatus status) {
  return status == JobStatus::COMPLETED || status == JobStatus::FAILED ||
         status == JobStatus::CANCELLED;
}

struct JobDTO {
  long long id = 0;
  std::string job_type;
  std::string owner_id;
  std::string document_id;
  JobStatus status = JobStatus::PENDING;
  int priority = 10;
  // Serialized IngestionRequest.
  std::string payload;
  // Serialized job summary, set once the job finished.
  std::optional<std::string> summary;
  std::optional<std::string> error_message;
  bool retryable = false;
  bool cancel_requested = false;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
};

struct JobProgressDTO {
  long long job_id = 0;
  float progress_percent = 0.0f;
  std::string status_message;
  int total_pages = 0;
  int processed_pages = 0;
  int total_chunks = 0;
  int stored_chunks = 0;
  std::string updated_at;
};

// Counters reported by a running job alongside its progress message.
struct JobCounters {
  int total_pages = 0;
  int processed_pages = 0;
  int total_chunks = 0;
  int stored_chunks = 0;
};

}  // namespace recall_core
