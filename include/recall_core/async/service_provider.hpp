#pragma once

#include <memory>

#include "recall_core/types/ingestion_settings.hpp"

namespace recall_core {
class ChunkStore;
class JobRepo;
class EmbeddingGenerator;
class TextNormalizer;
class BoundaryChunker;
}  // namespace recall_core

namespace recall_core {

class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<ChunkStore> store,
                  std::shared_ptr<JobRepo> repo,
                  std::shared_ptr<EmbeddingGenerator> embeddings,
                  std::shared_ptr<TextNormalizer> normalizer,
                  std::shared_ptr<BoundaryChunker> chunker,
                  IngestionSettings settings)
      : store_(std::move(store)),
        job_repo_(std::move(repo)),
        embeddings_(std::move(embeddings)),
        normalizer_(std::move(normalizer)),
        chunker_(std::move(chunker)),
        settings_(settings) {}

  ChunkStore& get_chunk_store() {
    return *store_;
  }
  JobRepo& get_job_repo() {
    return *job_repo_;
  }
  EmbeddingGenerator& get_embedding_generator() {
    return *embeddings_;
  }
  TextNormalizer& get_text_normalizer() {
    return *normalizer_;
  }
  BoundaryChunker& get_chunker() {
    return *chunker_;
  }
  const IngestionSettings& get_settings() const {
    return settings_;
  }

 private:
  std::shared_ptr<ChunkStore> store_;
  std::shared_ptr<JobRepo> job_repo_;
  std::shared_ptr<EmbeddingGenerator> embeddings_;
  std::shared_ptr<TextNormalizer> normalizer_;
  std::shared_ptr<BoundaryChunker> chunker_;
  IngestionSettings settings_;
};

}  // namespace recall_core
