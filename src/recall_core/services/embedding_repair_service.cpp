#include "recall_core/services/embedding_repair_service.hpp"

#include <iostream>
#include <stdexcept>
#include <vector>

#include "recall_core/db/chunk_store.hpp"
#include "recall_core/embedding/embedding_generator.hpp"

namespace recall_core {

EmbeddingRepairService::EmbeddingRepairService(std::shared_ptr<ChunkStore> store,
                                               std::shared_ptr<EmbeddingGenerator> embeddings)
    : store_(std::move(store)), embeddings_(std::move(embeddings)) {
  if (!store_ || !embeddings_) {
    throw std::invalid_argument("EmbeddingRepairService requires a ChunkStore and generator.");
  }
}

RepairStats EmbeddingRepairService::repair(const std::string& owner_id, int batch_size) {
  if (batch_size <= 0) {
    throw std::invalid_argument("Repair batch size must be greater than 0");
  }

  RepairStats stats;
  std::vector<Chunk> degraded = store_->list_degraded_chunks(owner_id, batch_size);
  if (!degraded.empty()) {
    std::vector<std::string> texts;
    texts.reserve(degraded.size());
    for (const auto& chunk : degraded) {
      texts.push_back(chunk.text);
    }

    std::vector<EmbeddingResult> results = embeddings_->embed(texts);
    for (size_t i = 0; i < degraded.size() && i < results.size(); ++i) {
      if (results[i].degraded()) {
        continue;
      }
      if (store_->update_embedding(owner_id, degraded[i].chunk_id, results[i].vector, false)) {
        ++stats.repaired;
      }
    }
    if (stats.repaired == 0) {
      std::cerr << "Warning: embedding repair for owner '" << owner_id
                << "' made no progress; primary backend still unavailable." << std::endl;
    }
  }

  stats.remaining = store_->count_degraded_chunks(owner_id);
  std::cout << "Embedding repair for owner '" << owner_id << "': " << stats.repaired
            << " repaired, " << stats.remaining << " remaining." << std::endl;
  return stats;
}

}  // namespace recall_core
