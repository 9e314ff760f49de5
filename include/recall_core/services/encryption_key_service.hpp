#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace recall_core {

class KeyServiceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Manages the database encryption key kept in an owner-only key file.
 */
class EncryptionKeyService {
 public:
  /**
   * @brief Gets the database encryption key stored at key_path.
   *
   * If the file does not exist, a new 256-bit key is generated, written
   * hex-encoded with 0600 permissions and returned.
   *
   * @throws KeyServiceError if the key cannot be read, generated or stored.
   */
  static std::string get_database_key(const std::filesystem::path& key_path);

 private:
  static std::string read_key_file(const std::filesystem::path& key_path);
  static void write_key_file(const std::filesystem::path& key_path, const std::string& key);
  static std::string generate_new_key();
};

}  // namespace recall_core
