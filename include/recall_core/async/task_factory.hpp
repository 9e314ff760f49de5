#pragma once

#include "recall_core/async/ITask.hpp"
#include "recall_core/db/models/job_dto.hpp"

namespace recall_core {

inline constexpr const char* kIngestDocumentJob = "INGEST_DOCUMENT";

class TaskFactory {
 public:
  // Throws std::runtime_error for unknown job types or an unreadable payload.
  static ITaskPtr create_task(const JobDTO& record);
};

}  // namespace recall_core
