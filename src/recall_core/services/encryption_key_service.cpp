#include "recall_core/services/encryption_key_service.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace recall_core {

namespace {
constexpr size_t kKeyBytes = 32;
}

std::string EncryptionKeyService::get_database_key(const std::filesystem::path& key_path) {
  try {
    if (std::filesystem::exists(key_path)) {
      std::string key = read_key_file(key_path);
      if (!key.empty()) {
        return key;
      }
    }

    std::string new_key = generate_new_key();
    write_key_file(key_path, new_key);
    return new_key;
  } catch (const std::filesystem::filesystem_error& e) {
    throw KeyServiceError("Failed to get or create database key: " + std::string(e.what()));
  }
}

std::string EncryptionKeyService::generate_new_key() {
  std::array<unsigned char, kKeyBytes> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw KeyServiceError("RAND_bytes failed to generate a key: " +
                          std::to_string(ERR_get_error()));
  }
  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  for (unsigned char byte : bytes) {
    ss << std::setw(2) << static_cast<int>(byte);
  }
  return ss.str();
}

std::string EncryptionKeyService::read_key_file(const std::filesystem::path& key_path) {
  std::ifstream in(key_path);
  if (!in) {
    throw KeyServiceError("Cannot open key file " + key_path.string());
  }
  std::string key;
  std::getline(in, key);
  while (!key.empty() && (key.back() == '\r' || key.back() == ' ')) {
    key.pop_back();
  }
  return key;
}

void EncryptionKeyService::write_key_file(const std::filesystem::path& key_path,
                                          const std::string& key) {
  if (key_path.has_parent_path()) {
    std::filesystem::create_directories(key_path.parent_path());
  }
  {
    std::ofstream out(key_path, std::ios::trunc);
    if (!out) {
      throw KeyServiceError("Cannot create key file " + key_path.string());
    }
    out << key << '\n';
    if (!out) {
      throw KeyServiceError("Failed to write key file " + key_path.string());
    }
  }
  std::filesystem::permissions(
      key_path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
      std::filesystem::perm_options::replace);
}

}  // namespace recall_core
