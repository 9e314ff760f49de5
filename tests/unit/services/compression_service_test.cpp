#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "recall_core/services/compression_service.hpp"

namespace recall_core {

class CompressionServiceTest : public ::testing::Test {
 protected:
  // Chunk-like prose repeats a lot and should shrink
  std::string generate_chunk_text(size_t size) {
    std::string pattern = "Retrieval quality depends on where chunk boundaries fall. ";
    std::string data;
    while (data.size() < size) {
      data += pattern;
    }
    return data.substr(0, size);
  }
};

TEST_F(CompressionServiceTest, ChunkTextShrinksAndRestores) {
  std::string text = generate_chunk_text(2000);

  std::vector<char> compressed = CompressionService::compress(text);

  EXPECT_LT(compressed.size(), text.size());
  EXPECT_EQ(CompressionService::decompress(compressed), text);
}

TEST_F(CompressionServiceTest, Utf8TextRestoresByteForByte) {
  std::string text = "Überblick: naïve café, 日本語のテキスト, emoji \xF0\x9F\x93\x84.";
  EXPECT_EQ(CompressionService::decompress(CompressionService::compress(text, 19)), text);
}

TEST_F(CompressionServiceTest, EmptyInputIsEmptyBlob) {
  EXPECT_TRUE(CompressionService::compress("").empty());
  EXPECT_EQ(CompressionService::decompress({}), "");
}

TEST_F(CompressionServiceTest, GarbageBlobThrows) {
  std::vector<char> garbage = {'n', 'o', 't', ' ', 'z', 's', 't', 'd'};
  EXPECT_THROW(CompressionService::decompress(garbage), std::runtime_error);
}

TEST_F(CompressionServiceTest, TruncatedFrameThrows) {
  std::vector<char> compressed = CompressionService::compress(generate_chunk_text(5000));
  compressed.resize(compressed.size() / 2);
  EXPECT_THROW(CompressionService::decompress(compressed), std::runtime_error);
}

}  // namespace recall_core
