#pragma once

#include <cstddef>

namespace recall_core {

// Limits and knobs applied by the ingestion pipeline. Filled from Config.
struct IngestionSettings {
  size_t max_chunk_size = 2000;
  size_t chunk_overlap = 200;
  int page_parallelism = 4;
  size_t max_page_chars = 200000;
  size_t max_document_chars = 5000000;
  size_t max_pages = 2000;
  size_t embedding_batch_size = 64;
};

}  // namespace recall_core
