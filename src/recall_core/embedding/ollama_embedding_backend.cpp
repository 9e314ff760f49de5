#include "recall_core/embedding/ollama_embedding_backend.hpp"

#include "recall_core/llm/ollama_client.hpp"

namespace recall_core {

OllamaEmbeddingBackend::OllamaEmbeddingBackend(std::shared_ptr<OllamaClient> client)
    : client_(std::move(client)) {}

std::string OllamaEmbeddingBackend::name() const {
  return "ollama:" + client_->model();
}

std::vector<std::vector<float>> OllamaEmbeddingBackend::embed(
    const std::vector<std::string>& texts) {
  try {
    return client_->get_embeddings(texts);
  } catch (const OllamaError& e) {
    throw EmbeddingBackendUnavailable(e.what());
  }
}

EmbeddingBackendPtr OllamaEmbeddingBackend::create_lazy(const std::string& ollama_url,
                                                        const std::string& model) {
  return std::make_shared<LazyEmbeddingBackend>("ollama:" + model, [ollama_url, model]() {
    auto client = std::make_shared<OllamaClient>(ollama_url, model);
    return std::make_shared<OllamaEmbeddingBackend>(client);
  });
}

}  // namespace recall_core
