#pragma once

#include <memory>
#include <string>

namespace recall_core {
class ChunkStore;
class EmbeddingGenerator;
}  // namespace recall_core

namespace recall_core {

struct RepairStats {
  int repaired = 0;
  // Degraded chunks of the owner still waiting for a primary-backend vector.
  int remaining = 0;
};

// Re-embeds chunks that were stored with a fallback vector once the primary backend is back.
class EmbeddingRepairService {
 public:
  EmbeddingRepairService(std::shared_ptr<ChunkStore> store,
                         std::shared_ptr<EmbeddingGenerator> embeddings);

  RepairStats repair(const std::string& owner_id, int batch_size = 64);

 private:
  std::shared_ptr<ChunkStore> store_;
  std::shared_ptr<EmbeddingGenerator> embeddings_;
};

}  // namespace recall_core
