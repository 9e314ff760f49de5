#include "recall_core/embedding/embedding_backend.hpp"

#include <iostream>

namespace recall_core {

LazyEmbeddingBackend::LazyEmbeddingBackend(std::string name, Factory factory)
    : name_(std::move(name)), factory_(std::move(factory)) {}

bool LazyEmbeddingBackend::is_initialized() const {
  std::lock_guard<std::mutex> lock(init_mutex_);
  return backend_ != nullptr;
}

EmbeddingBackendPtr LazyEmbeddingBackend::get_or_create() {
  std::lock_guard<std::mutex> lock(init_mutex_);
  if (backend_) {
    return backend_;
  }
  attempts_.fetch_add(1);
  try {
    backend_ = factory_();
  } catch (const std::exception& e) {
    throw EmbeddingBackendUnavailable(name_ + " initialization failed: " + e.what());
  }
  if (!backend_) {
    throw EmbeddingBackendUnavailable(name_ + " initialization returned no backend");
  }
  std::cout << "Embedding backend '" << name_ << "' initialized." << std::endl;
  return backend_;
}

std::vector<std::vector<float>> LazyEmbeddingBackend::embed(
    const std::vector<std::string>& texts) {
  return get_or_create()->embed(texts);
}

}  // namespace recall_core
