#pragma once

#include <memory>
#include <optional>
#include <string>

#include "recall_core/db/models/job_dto.hpp"
#include "recall_core/types/document.hpp"
#include "recall_core/types/ingestion_settings.hpp"

namespace recall_core {
class JobRepo;
}

namespace recall_core {

class IngestionError : public std::exception {
 public:
  explicit IngestionError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// The document has no non-blank text on any page.
class EmptyDocument : public IngestionError {
 public:
  using IngestionError::IngestionError;
};

// The document exceeds max_document_chars or max_pages.
class DocumentTooLarge : public IngestionError {
 public:
  using IngestionError::IngestionError;
};

struct JobStatusView {
  JobDTO job;
  std::optional<JobProgressDTO> progress;
};

// Accepts ingestion requests and tracks the jobs that process them.
class IngestionService {
 public:
  IngestionService(std::shared_ptr<JobRepo> job_repo, IngestionSettings settings);

  // Validates the request and queues it. Nothing is written when validation fails.
  // @throws EmptyDocument, DocumentTooLarge, std::invalid_argument
  long long submit(const IngestionRequest& request, int priority = 10);

  std::optional<JobStatusView> get_status(long long job_id);

  // @return false when the job is unknown or already finished.
  bool cancel(long long job_id);

  void validate(const IngestionRequest& request) const;

 private:
  std::shared_ptr<JobRepo> job_repo_;
  IngestionSettings settings_;
};

}  // namespace recall_core
