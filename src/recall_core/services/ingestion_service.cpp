#include "recall_core/services/ingestion_service.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

#include "recall_core/async/task_factory.hpp"
#include "recall_core/db/job_repo.hpp"

namespace recall_core {

IngestionService::IngestionService(std::shared_ptr<JobRepo> job_repo, IngestionSettings settings)
    : job_repo_(std::move(job_repo)), settings_(settings) {
  if (!job_repo_) {
    throw std::invalid_argument("IngestionService requires a JobRepo.");
  }
}

void IngestionService::validate(const IngestionRequest& request) const {
  if (request.owner_id.empty()) {
    throw std::invalid_argument("owner_id is required");
  }
  if (request.document_id.empty()) {
    throw std::invalid_argument("document_id is required");
  }
  if (request.pages.size() > settings_.max_pages) {
    throw DocumentTooLarge("Document '" + request.document_id + "' has " +
                           std::to_string(request.pages.size()) + " pages, limit is " +
                           std::to_string(settings_.max_pages));
  }

  size_t total_chars = 0;
  bool has_text = false;
  for (const auto& page : request.pages) {
    total_chars += page.text.size();
    if (!has_text) {
      has_text = std::any_of(page.text.begin(), page.text.end(),
                             [](unsigned char c) { return std::isspace(c) == 0; });
    }
  }
  if (!has_text) {
    throw EmptyDocument("Document '" + request.document_id + "' contains no text");
  }
  if (total_chars > settings_.max_document_chars) {
    throw DocumentTooLarge("Document '" + request.document_id + "' has " +
                           std::to_string(total_chars) + " characters, limit is " +
                           std::to_string(settings_.max_document_chars));
  }
}

long long IngestionService::submit(const IngestionRequest& request, int priority) {
  validate(request);
  long long job_id = job_repo_->create_job(kIngestDocumentJob, request.owner_id,
                                           request.document_id, to_json(request).dump(), priority);
  std::cout << "Queued ingestion job " << job_id << " for document '" << request.document_id
            << "' (" << request.pages.size() << " pages)." << std::endl;
  return job_id;
}

std::optional<JobStatusView> IngestionService::get_status(long long job_id) {
  std::optional<JobDTO> job = job_repo_->get_job(job_id);
  if (!job) {
    return std::nullopt;
  }
  return JobStatusView{std::move(*job), job_repo_->get_job_progress(job_id)};
}

bool IngestionService::cancel(long long job_id) {
  return job_repo_->request_cancel(job_id);
}

}  // namespace recall_core
