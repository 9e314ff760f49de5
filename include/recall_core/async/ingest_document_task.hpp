#pragma once

#include <optional>
#include <string>
#include <vector>

#include "recall_core/async/ITask.hpp"
#include "recall_core/chunking/boundary_chunker.hpp"
#include "recall_core/types/chunk.hpp"
#include "recall_core/types/document.hpp"
#include "recall_core/types/ingestion_settings.hpp"

namespace recall_core {
class TextNormalizer;
}

namespace recall_core {

// Accumulates what happened to one document; serialized as the job summary.
struct IngestionSummary {
  struct PageError {
    int page = 0;
    std::string error;
  };

  int total_pages = 0;
  int processed_pages = 0;
  int total_chunks = 0;
  int stored_chunks = 0;
  std::vector<std::string> degraded_chunks;
  std::vector<std::string> warnings;
  std::vector<PageError> page_errors;

  nlohmann::json to_json() const;
};

class IngestDocumentTask : public ITask {
 public:
  IngestDocumentTask(long long id,
                     JobStatus status,
                     std::chrono::system_clock::time_point created_at,
                     std::chrono::system_clock::time_point updated_at,
                     IngestionRequest request);

  nlohmann::json execute(ServiceProvider& services,
                         const ProgressUpdater& on_progress,
                         const CancellationCheck& is_cancelled) override;
  const char* get_type() const override {
    return "INGEST_DOCUMENT";
  }

  const IngestionRequest& get_request() const {
    return request_;
  }

 private:
  struct PageOutcome {
    std::vector<TextChunk> chunks;
    bool processed = false;
    std::optional<std::string> error;
    std::optional<std::string> normalization_warning;
  };

  // Page number used in summaries: the page's own number or its 1-based position.
  int display_page(size_t page_index) const;

  PageOutcome process_page(size_t page_index,
                           const TextNormalizer& normalizer,
                           const BoundaryChunker& chunker,
                           const IngestionSettings& settings) const;

  std::vector<PageOutcome> process_pages(ServiceProvider& services,
                                         const CancellationCheck& is_cancelled,
                                         bool& cancelled) const;

  std::vector<Chunk> assemble_chunks(const std::vector<PageOutcome>& outcomes) const;

  IngestionRequest request_;
};

}  // namespace recall_core
