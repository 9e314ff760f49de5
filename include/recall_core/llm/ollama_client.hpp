#pragma once

#include <string>
#include <vector>

namespace recall_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Thin wrapper over ollama-hpp for the embedding endpoint.
class OllamaClient {
 public:
  // Throws OllamaError when the server is not reachable.
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model);
  ~OllamaClient() = default;

  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> get_embedding(const std::string &text);
  std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts);

  bool is_server_available();

  const std::string &model() const {
    return embedding_model_;
  }

 private:
  std::string ollama_url_;
  std::string embedding_model_;

  void setup_server_connection();
};

}  // namespace recall_core
