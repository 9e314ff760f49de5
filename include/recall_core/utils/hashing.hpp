#pragma once

#include <array>
#include <exception>
#include <string>
#include <string_view>

namespace recall_core {

class HashingError : public std::exception {
 public:
  explicit HashingError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

using Sha256Digest = std::array<unsigned char, 32>;

Sha256Digest sha256_digest(std::string_view data);
std::string sha256_hex(std::string_view data);

// Stable chunk identity: the same (owner, document, index) always maps to the same id.
std::string make_chunk_id(const std::string& owner_id,
                          const std::string& document_id,
                          int chunk_index);

}  // namespace recall_core
