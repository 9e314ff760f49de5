#pragma once

#include "recall_core/embedding/embedding_backend.hpp"

namespace recall_core {

// Deterministic feature-hashing embedder: unigrams and bigrams hashed into
// `dimension` signed buckets, then L2-normalized. Needs no external service,
// so it is the last resort of every fallback chain.
class HashEmbeddingBackend : public EmbeddingBackend {
 public:
  explicit HashEmbeddingBackend(int dimension);

  std::string name() const override {
    return "hash";
  }

  std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override;

  std::vector<float> embed_one(const std::string& text) const;

 private:
  void add_feature(std::vector<float>& vec, const std::string& feature, float weight) const;

  int dimension_;
};

}  // namespace recall_core
