#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "recall_core/db/models/job_dto.hpp"

namespace recall_core {
class ServiceProvider;
}

namespace recall_core {

using ProgressUpdater = std::function<void(float, const std::string&, const JobCounters&)>;
// Returns true once the job owning the task has been asked to stop.
using CancellationCheck = std::function<bool()>;

// Thrown by a task that stopped early because its job was cancelled.
class JobCancelled : public std::exception {
 public:
  explicit JobCancelled(nlohmann::json partial_summary)
      : partial_summary_(std::move(partial_summary)) {}

  const char* what() const noexcept override {
    return "Job cancelled";
  }
  const nlohmann::json& partial_summary() const {
    return partial_summary_;
  }

 private:
  nlohmann::json partial_summary_;
};

class ITask {
 public:
  ITask(long long id,
        JobStatus status,
        std::chrono::system_clock::time_point created_at,
        std::chrono::system_clock::time_point updated_at)
      : id_(id), status_(status), created_at_(created_at), updated_at_(updated_at) {}

  virtual ~ITask() = default;

  // Runs the task to completion and returns its summary.
  virtual nlohmann::json execute(ServiceProvider& services,
                                 const ProgressUpdater& on_progress,
                                 const CancellationCheck& is_cancelled) = 0;

  virtual const char* get_type() const = 0;

  long long get_id() const {
    return id_;
  }
  JobStatus get_status() const {
    return status_;
  }

 protected:
  long long id_;
  JobStatus status_;
  std::chrono::system_clock::time_point created_at_;
  std::chrono::system_clock::time_point updated_at_;
};

using ITaskPtr = std::unique_ptr<ITask>;

}  // namespace recall_core
