#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace recall_core {

class CompressionService {
 public:
  /**
   * @brief Compresses chunk text with Zstandard before it is stored.
   * @param data The text to compress.
   * @param compression_level The zstd compression level (default is 3).
   * @return The compressed frame; empty for empty input.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = 3);

  /**
   * @brief Restores text stored by compress().
   * @throws std::runtime_error when the blob is not a zstd frame with a known size.
   */
  static std::string decompress(const std::vector<char>& compressed_data);
};

}  // namespace recall_core
