#include "recall_core/async/task_factory.hpp"

#include <stdexcept>

#include "recall_core/async/ingest_document_task.hpp"

namespace recall_core {

ITaskPtr TaskFactory::create_task(const JobDTO& record) {
  if (record.job_type == kIngestDocumentJob) {
    IngestionRequest request;
    try {
      request = ingestion_request_from_json(nlohmann::json::parse(record.payload));
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error("INGEST_DOCUMENT job " + std::to_string(record.id) +
                               " has a malformed payload: " + e.what());
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error("INGEST_DOCUMENT job " + std::to_string(record.id) +
                               " has an invalid payload: " + e.what());
    }
    return std::make_unique<IngestDocumentTask>(record.id, record.status, record.created_at,
                                                record.updated_at, std::move(request));
  }

  throw std::runtime_error("Unknown job type: " + record.job_type);
}

}  // namespace recall_core
