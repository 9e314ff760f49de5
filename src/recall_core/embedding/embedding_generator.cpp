#include "recall_core/embedding/embedding_generator.hpp"

#include <iostream>
#include <stdexcept>

#include "recall_core/embedding/hash_embedding_backend.hpp"

namespace recall_core {

EmbeddingGenerator::EmbeddingGenerator(EmbeddingBackendPtr primary, int dimension)
    : has_primary_(primary != nullptr), dimension_(dimension) {
  if (dimension <= 0) {
    throw std::invalid_argument("Embedding dimension must be greater than 0");
  }
  if (primary) {
    chain_.push_back(std::move(primary));
  }
  chain_.push_back(std::make_shared<HashEmbeddingBackend>(dimension));
}

EmbeddingGenerator::EmbeddingGenerator(std::vector<EmbeddingBackendPtr> chain, int dimension)
    : dimension_(dimension) {
  if (dimension <= 0) {
    throw std::invalid_argument("Embedding dimension must be greater than 0");
  }
  for (auto& backend : chain) {
    if (backend) {
      chain_.push_back(std::move(backend));
    }
  }
  has_primary_ = !chain_.empty();
  chain_.push_back(std::make_shared<HashEmbeddingBackend>(dimension));
}

bool EmbeddingGenerator::valid_batch(const std::vector<std::vector<float>>& vectors,
                                     size_t expected) const {
  if (vectors.size() != expected) {
    return false;
  }
  for (const auto& vec : vectors) {
    if (vec.size() != static_cast<size_t>(dimension_)) {
      return false;
    }
  }
  return true;
}

std::vector<EmbeddingResult> EmbeddingGenerator::embed(const std::vector<std::string>& texts) const {
  if (texts.empty()) {
    return {};
  }

  std::string failures;
  for (size_t i = 0; i < chain_.size(); ++i) {
    const auto& backend = chain_[i];
    std::vector<std::vector<float>> vectors;
    try {
      vectors = backend->embed(texts);
    } catch (const std::exception& e) {
      std::cerr << "Warning: embedding backend '" << backend->name() << "' unavailable: "
                << e.what() << std::endl;
      failures += (failures.empty() ? "" : "; ") + backend->name() + ": " + e.what();
      continue;
    }
    if (!valid_batch(vectors, texts.size())) {
      std::cerr << "Warning: embedding backend '" << backend->name()
                << "' returned a malformed batch (expected " << texts.size() << " x "
                << dimension_ << ")." << std::endl;
      failures += (failures.empty() ? "" : "; ") + backend->name() + ": wrong dimension or count";
      continue;
    }

    const bool degraded = !(i == 0 && has_primary_);
    std::string reason;
    if (degraded) {
      reason = "EmbeddingBackendUnavailable: " +
               (failures.empty() ? std::string("no primary backend configured") : failures);
    }

    std::vector<EmbeddingResult> results;
    results.reserve(vectors.size());
    for (auto& vec : vectors) {
      results.push_back({std::move(vec),
                         degraded ? EmbeddingStatus::Degraded : EmbeddingStatus::Ok,
                         backend->name(), reason});
    }
    return results;
  }

  // Only reachable if the hash backend itself throws.
  throw EmbeddingBackendUnavailable("All embedding backends failed: " + failures);
}

EmbeddingResult EmbeddingGenerator::embed_query(const std::string& text) const {
  return embed({text}).front();
}

}  // namespace recall_core
