#pragma once

#include <memory>
#include <string>
#include <vector>

#include "recall_core/types/chunk.hpp"

namespace recall_core {
class ChunkStore;
class EmbeddingGenerator;
}  // namespace recall_core

namespace recall_core {

// Embeds a free-text query and runs an owner-scoped similarity search.
// Holds no per-query state; safe to call from many threads.
class Retriever {
 public:
  Retriever(std::shared_ptr<EmbeddingGenerator> embeddings, std::shared_ptr<ChunkStore> store);

  // Best hits first. A blank query or non-positive top_k yields no hits.
  std::vector<ChunkHit> retrieve(const std::string& owner_id,
                                 const std::string& query_text,
                                 int top_k,
                                 const ChunkFilter& filter = {}) const;

 private:
  std::shared_ptr<EmbeddingGenerator> embeddings_;
  std::shared_ptr<ChunkStore> store_;
};

}  // namespace recall_core
