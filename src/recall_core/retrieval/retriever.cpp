#include "recall_core/retrieval/retriever.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

#include "recall_core/db/chunk_store.hpp"
#include "recall_core/embedding/embedding_generator.hpp"

namespace recall_core {

Retriever::Retriever(std::shared_ptr<EmbeddingGenerator> embeddings,
                     std::shared_ptr<ChunkStore> store)
    : embeddings_(std::move(embeddings)), store_(std::move(store)) {
  if (!embeddings_ || !store_) {
    throw std::invalid_argument("Retriever requires an EmbeddingGenerator and a ChunkStore.");
  }
}

std::vector<ChunkHit> Retriever::retrieve(const std::string& owner_id,
                                          const std::string& query_text,
                                          int top_k,
                                          const ChunkFilter& filter) const {
  if (owner_id.empty()) {
    throw std::invalid_argument("owner_id is required for retrieval");
  }
  const bool blank = std::all_of(query_text.begin(), query_text.end(),
                                 [](unsigned char c) { return std::isspace(c) != 0; });
  if (blank || top_k <= 0) {
    return {};
  }

  EmbeddingResult query = embeddings_->embed_query(query_text);
  if (query.degraded()) {
    std::cerr << "Warning: query embedded with fallback backend '" << query.backend
              << "': " << query.reason << std::endl;
  }
  return store_->search(owner_id, query.vector, top_k, filter);
}

}  // namespace recall_core
