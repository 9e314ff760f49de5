#pragma once

#include <memory>
#include <string>
#include <vector>

#include "recall_core/embedding/embedding_backend.hpp"

namespace recall_core {

enum class EmbeddingStatus { Ok, Degraded };

struct EmbeddingResult {
  std::vector<float> vector;
  EmbeddingStatus status = EmbeddingStatus::Ok;
  std::string backend;
  // Set for Degraded results: "EmbeddingBackendUnavailable: <cause>".
  std::string reason;

  bool degraded() const {
    return status == EmbeddingStatus::Degraded;
  }
};

/**
 * @brief Maps texts to fixed-dimension vectors through a chain of backends.
 *
 * Backends are tried in order for the whole batch; the first one that returns
 * one vector of the configured dimension per text wins. A deterministic hash
 * backend always terminates the chain, so embed() does not fail because a
 * backend is down. Results from anything but the first backend are tagged
 * Degraded.
 */
class EmbeddingGenerator {
 public:
  // `primary` may be null, in which case every result is Degraded.
  EmbeddingGenerator(EmbeddingBackendPtr primary, int dimension);
  EmbeddingGenerator(std::vector<EmbeddingBackendPtr> chain, int dimension);

  std::vector<EmbeddingResult> embed(const std::vector<std::string>& texts) const;
  EmbeddingResult embed_query(const std::string& text) const;

  int dimension() const {
    return dimension_;
  }

 private:
  bool valid_batch(const std::vector<std::vector<float>>& vectors, size_t expected) const;

  std::vector<EmbeddingBackendPtr> chain_;
  bool has_primary_;
  int dimension_;
};

}  // namespace recall_core
