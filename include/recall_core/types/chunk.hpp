#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "recall_core/types/source.hpp"

namespace recall_core {

// A bounded piece of a document's text as persisted by the ChunkStore.
// Timestamps are milliseconds since the epoch.
struct Chunk {
  std::string chunk_id;
  std::string owner_id;
  std::string document_id;
  std::string text;
  SourceType source_type = SourceType::PlainText;
  std::optional<std::string> source_link;
  std::string source_title;
  std::optional<int> page_number;
  std::string section_title;
  std::vector<float> embedding;
  bool embedding_degraded = false;
  int chunk_index = 0;
  int chunk_size = 0;
  int64_t created_at = 0;
  int64_t updated_at = 0;
};

struct ChunkHit {
  Chunk chunk;
  float score = 0.0f;
};

// Scalar filters applied on top of the mandatory owner scope.
struct ChunkFilter {
  std::optional<std::string> document_id;
  std::optional<SourceType> source_type;
  std::optional<int> page_number;
};

struct DocumentSummary {
  std::string document_id;
  std::string source_title;
  SourceType source_type = SourceType::PlainText;
  int chunk_count = 0;
  int64_t updated_at = 0;
};

}  // namespace recall_core
