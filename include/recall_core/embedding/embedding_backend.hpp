#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace recall_core {

class EmbeddingBackendUnavailable : public std::exception {
 public:
  explicit EmbeddingBackendUnavailable(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// A source of embedding vectors. Implementations must be safe to call from
// several threads at once.
class EmbeddingBackend {
 public:
  virtual ~EmbeddingBackend() = default;

  virtual std::string name() const = 0;

  // One vector per input text, in order. Throws EmbeddingBackendUnavailable
  // when the batch cannot be served.
  virtual std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) = 0;
};

using EmbeddingBackendPtr = std::shared_ptr<EmbeddingBackend>;

/**
 * @brief Defers construction of an expensive backend until the first embed call.
 *
 * The factory runs at most once successfully, even when several threads make
 * their first call together. A factory that throws leaves the backend
 * uninitialized and the next call tries again.
 */
class LazyEmbeddingBackend : public EmbeddingBackend {
 public:
  using Factory = std::function<EmbeddingBackendPtr()>;

  LazyEmbeddingBackend(std::string name, Factory factory);

  std::string name() const override {
    return name_;
  }

  std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override;

  bool is_initialized() const;
  int initialization_attempts() const {
    return attempts_.load();
  }

 private:
  EmbeddingBackendPtr get_or_create();

  std::string name_;
  Factory factory_;
  mutable std::mutex init_mutex_;
  EmbeddingBackendPtr backend_;
  std::atomic<int> attempts_{0};
};

}  // namespace recall_core
