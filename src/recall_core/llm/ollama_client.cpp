#include "recall_core/llm/ollama_client.hpp"
#include "ollama.hpp"

namespace recall_core {

OllamaClient::OllamaClient(const std::string &ollama_url, const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw OllamaError("Ollama server is not running at " + ollama_url_);
  }
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw OllamaError("Response does not contain embedding field");
    }

    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw OllamaError("Embeddings field is not an array");
    }
    if (embeddings.size() > 0 && embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed embedding response: " + std::string(e.what()));
  }
}

// TODO: switch to a single /api/embed request with an array input once ollama-hpp exposes it.
std::vector<std::vector<float>> OllamaClient::get_embeddings(
    const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    out.push_back(get_embedding(text));
  }
  return out;
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace recall_core
