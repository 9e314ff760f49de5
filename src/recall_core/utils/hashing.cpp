#include "recall_core/utils/hashing.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <iomanip>
#include <memory>
#include <sstream>

namespace recall_core {

Sha256Digest sha256_digest(std::string_view data) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(),
                                                                &EVP_MD_CTX_free);
  if (!mdctx) {
    throw HashingError("Failed to create EVP context for hashing");
  }
  if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1) {
    throw HashingError("Failed to initialize SHA256 digest");
  }
  if (EVP_DigestUpdate(mdctx.get(), data.data(), data.size()) != 1) {
    throw HashingError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(mdctx.get(), hash, &hash_len) != 1 || hash_len != 32) {
    throw HashingError("Failed to finalize SHA256 digest");
  }

  Sha256Digest digest;
  std::copy(hash, hash + 32, digest.begin());
  return digest;
}

std::string sha256_hex(std::string_view data) {
  Sha256Digest digest = sha256_digest(data);
  std::stringstream ss;
  for (unsigned char byte : digest) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

std::string make_chunk_id(const std::string& owner_id,
                          const std::string& document_id,
                          int chunk_index) {
  // Unit separator keeps "a|b" + "c" distinct from "a" + "b|c".
  std::string key = owner_id + '\x1f' + document_id + '\x1f' + std::to_string(chunk_index);
  return sha256_hex(key);
}

}  // namespace recall_core
