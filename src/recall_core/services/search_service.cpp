#include "recall_core/services/search_service.hpp"

#include <stdexcept>

#include "recall_core/db/chunk_store.hpp"
#include "recall_core/embedding/embedding_backend.hpp"

namespace recall_core {

SearchService::SearchService(std::shared_ptr<Retriever> retriever, int default_top_k)
    : retriever_(std::move(retriever)), default_top_k_(default_top_k) {
  if (!retriever_) {
    throw std::invalid_argument("SearchService requires a Retriever.");
  }
}

SearchResponse SearchService::search(const std::string& owner_id,
                                     const std::string& query,
                                     std::optional<int> top_k,
                                     bool highlight,
                                     const ChunkFilter& filter) {
  std::vector<ChunkHit> hits;
  try {
    hits = retriever_->retrieve(owner_id, query, top_k.value_or(default_top_k_), filter);
  } catch (const ChunkStoreError& e) {
    throw SearchServiceException("Search failed: " + std::string(e.what()));
  } catch (const EmbeddingBackendUnavailable& e) {
    throw SearchServiceException("Search failed: " + std::string(e.what()));
  }

  SearchResponse response;
  response.results = consolidator_.consolidate(hits, highlight ? query : std::string());
  response.total = response.results.size();
  return response;
}

}  // namespace recall_core
