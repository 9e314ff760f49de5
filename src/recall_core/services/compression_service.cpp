#include "recall_core/services/compression_service.hpp"
#include <zstd.h>
#include <stdexcept>

namespace recall_core {

std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
  if (data.empty()) {
    return {};
  }
  const size_t bound = ZSTD_compressBound(data.size());
  std::vector<char> frame(bound);

  const size_t written =
      ZSTD_compress(frame.data(), frame.size(), data.data(), data.size(), compression_level);
  if (ZSTD_isError(written)) {
    throw std::runtime_error("ZSTD compression failed: " + std::string(ZSTD_getErrorName(written)));
  }
  frame.resize(written);
  return frame;
}

std::string CompressionService::decompress(const std::vector<char>& compressed_data) {
  if (compressed_data.empty()) {
    return "";
  }

  const unsigned long long original_size =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (original_size == ZSTD_CONTENTSIZE_ERROR || original_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw std::runtime_error("Stored chunk content is not a sized zstd frame.");
  }

  std::string text(original_size, '\0');
  const size_t restored =
      ZSTD_decompress(text.data(), text.size(), compressed_data.data(), compressed_data.size());
  if (ZSTD_isError(restored)) {
    throw std::runtime_error("ZSTD decompression failed: " +
                             std::string(ZSTD_getErrorName(restored)));
  }
  if (restored != original_size) {
    throw std::runtime_error("ZSTD decompression produced " + std::to_string(restored) +
                             " bytes, expected " + std::to_string(original_size));
  }
  return text;
}

}  // namespace recall_core
