#pragma once

#include <memory>

#include "recall_core/embedding/embedding_backend.hpp"

namespace recall_core {

class OllamaClient;

class OllamaEmbeddingBackend : public EmbeddingBackend {
 public:
  explicit OllamaEmbeddingBackend(std::shared_ptr<OllamaClient> client);

  std::string name() const override;

  // Translates OllamaError into EmbeddingBackendUnavailable.
  std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override;

  // Lazily connecting backend: the Ollama server is only contacted on first use.
  static EmbeddingBackendPtr create_lazy(const std::string& ollama_url, const std::string& model);

 private:
  std::shared_ptr<OllamaClient> client_;
};

}  // namespace recall_core
