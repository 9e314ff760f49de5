#include "recall_core/embedding/hash_embedding_backend.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>

#include "recall_core/utils/hashing.hpp"

namespace recall_core {

namespace {

// Lowercased ASCII alphanumerics; bytes >= 0x80 are kept so non-Latin words still form tokens.
std::vector<std::string> tokenize(const std::string& text) {
  std::vector<std::string> tokens;
  std::string current;
  for (char ch : text) {
    auto c = static_cast<unsigned char>(ch);
    if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c >= 0x80) {
      current.push_back(ch);
    } else if (c >= 'A' && c <= 'Z') {
      current.push_back(static_cast<char>(c - 'A' + 'a'));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

}  // namespace

HashEmbeddingBackend::HashEmbeddingBackend(int dimension) : dimension_(dimension) {
  if (dimension <= 0) {
    throw std::invalid_argument("Embedding dimension must be greater than 0");
  }
}

void HashEmbeddingBackend::add_feature(std::vector<float>& vec,
                                       const std::string& feature,
                                       float weight) const {
  Sha256Digest digest = sha256_digest(feature);
  uint32_t bucket = (static_cast<uint32_t>(digest[0]) << 24) |
                    (static_cast<uint32_t>(digest[1]) << 16) |
                    (static_cast<uint32_t>(digest[2]) << 8) | static_cast<uint32_t>(digest[3]);
  float sign = (digest[4] & 0x1) ? -1.0f : 1.0f;
  vec[bucket % static_cast<uint32_t>(dimension_)] += sign * weight;
}

std::vector<float> HashEmbeddingBackend::embed_one(const std::string& text) const {
  std::vector<float> vec(dimension_, 0.0f);
  std::vector<std::string> tokens = tokenize(text);

  if (tokens.empty()) {
    add_feature(vec, "\x02" + text, 1.0f);
  } else {
    for (size_t i = 0; i < tokens.size(); ++i) {
      add_feature(vec, tokens[i], 1.0f);
      if (i + 1 < tokens.size()) {
        add_feature(vec, tokens[i] + ' ' + tokens[i + 1], 0.5f);
      }
    }
  }

  float norm = 0.0f;
  for (float v : vec) {
    norm += v * v;
  }
  norm = std::sqrt(norm);
  if (norm > 0.0f) {
    for (float& v : vec) {
      v /= norm;
    }
  } else {
    // Every feature cancelled out.
    vec[0] = 1.0f;
  }
  return vec;
}

std::vector<std::vector<float>> HashEmbeddingBackend::embed(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto& text : texts) {
    out.push_back(embed_one(text));
  }
  return out;
}

}  // namespace recall_core
