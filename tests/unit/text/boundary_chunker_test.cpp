#include <gtest/gtest.h>
#include <utf8.h>

#include <string>
#include <vector>

#include "recall_core/chunking/boundary_chunker.hpp"

namespace recall_core {

class BoundaryChunkerTest : public ::testing::Test {
 protected:
  static std::string numbered_sentences(int count) {
    std::string text;
    for (int i = 0; i < count; ++i) {
      if (!text.empty()) {
        text += ' ';
      }
      text += "Sentence number " + std::to_string(i) + " is here.";
    }
    return text;
  }

  BoundaryChunker chunker_;
};

TEST_F(BoundaryChunkerTest, RejectsInvalidSizes) {
  EXPECT_THROW(chunker_.chunk("text", 0, 0), std::invalid_argument);
  EXPECT_THROW(chunker_.chunk("text", 100, 50), std::invalid_argument);
  EXPECT_NO_THROW(chunker_.chunk("text", 100, 49));
}

TEST_F(BoundaryChunkerTest, EmptyTextYieldsNoChunks) {
  EXPECT_TRUE(chunker_.chunk("", 100, 10).empty());
  EXPECT_TRUE(chunker_.chunk("\n\n  \n", 100, 10).empty());
}

TEST_F(BoundaryChunkerTest, ShortTextIsOneChunk) {
  auto chunks = chunker_.chunk("Hello world.", 100, 10);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].text, "Hello world.");
  EXPECT_EQ(chunks[0].chunk_index, 0);
  EXPECT_EQ(chunks[0].section_title, "");
}

TEST_F(BoundaryChunkerTest, ParagraphsArePackedTogether) {
  auto chunks = chunker_.chunk("First paragraph.\n\nSecond paragraph.", 100, 10);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].text, "First paragraph.\n\nSecond paragraph.");
}

TEST_F(BoundaryChunkerTest, HeadingsStartNewChunksWithoutOverlap) {
  std::string text = "# Intro\nSome intro text.\n# Methods\nMethod text.";
  auto chunks = chunker_.chunk(text, 200, 20);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].text, "# Intro\n\nSome intro text.");
  EXPECT_EQ(chunks[0].section_title, "Intro");
  EXPECT_EQ(chunks[1].text, "# Methods\n\nMethod text.");
  EXPECT_EQ(chunks[1].section_title, "Methods");
  EXPECT_EQ(chunks[1].chunk_index, 1);
}

TEST_F(BoundaryChunkerTest, NoChunkExceedsMaxSize) {
  std::string text = "# Title\n\n" + numbered_sentences(40) + "\n\n" + numbered_sentences(7);
  for (size_t max_size : {60u, 100u, 333u}) {
    auto chunks = chunker_.chunk(text, max_size, 10);
    ASSERT_FALSE(chunks.empty());
    for (const auto& chunk : chunks) {
      EXPECT_LE(chunk.text.size(), max_size);
      EXPECT_FALSE(chunk.text.empty());
    }
  }
}

TEST_F(BoundaryChunkerTest, SizeDrivenSplitsCarryOverlap) {
  const size_t overlap = 10;
  auto chunks = chunker_.chunk(numbered_sentences(20), 100, overlap);

  ASSERT_GT(chunks.size(), 1u);
  for (size_t i = 1; i < chunks.size(); ++i) {
    std::string tail = BoundaryChunker::tail_on_char_boundary(chunks[i - 1].text, overlap);
    EXPECT_EQ(chunks[i].text.rfind(tail, 0), 0u) << "chunk " << i << " does not start with the overlap";
    EXPECT_EQ(chunks[i].chunk_index, static_cast<int>(i));
  }
}

TEST_F(BoundaryChunkerTest, LongParagraphsAreCutAtSentenceEnds) {
  auto chunks = chunker_.chunk(numbered_sentences(20), 100, 10);

  ASSERT_GT(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].text.back(), '.');
  for (int i = 0; i < 20; ++i) {
    std::string needle = "number " + std::to_string(i) + " is";
    bool found = false;
    for (const auto& chunk : chunks) {
      found = found || chunk.text.find(needle) != std::string::npos;
    }
    EXPECT_TRUE(found) << "lost sentence " << i;
  }
}

TEST_F(BoundaryChunkerTest, CutsNeverSplitMultibyteCharacters) {
  std::string text;
  for (int i = 0; i < 100; ++i) {
    text += "\xc3\xa9";  // é
  }
  auto chunks = chunker_.chunk(text, 15, 3);

  ASSERT_GT(chunks.size(), 1u);
  for (const auto& chunk : chunks) {
    EXPECT_LE(chunk.text.size(), 15u);
    EXPECT_TRUE(utf8::is_valid(chunk.text.begin(), chunk.text.end()));
  }
}

TEST_F(BoundaryChunkerTest, OutputIsDeterministic) {
  std::string text = "# A\n" + numbered_sentences(30) + "\n\nSECOND PART\n" + numbered_sentences(5);
  auto first = chunker_.chunk(text, 120, 15);
  auto second = chunker_.chunk(text, 120, 15);

  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].text, second[i].text);
    EXPECT_EQ(first[i].section_title, second[i].section_title);
  }
}

TEST_F(BoundaryChunkerTest, HeadingDetection) {
  EXPECT_EQ(BoundaryChunker::heading_title("## Results").value_or(""), "Results");
  EXPECT_EQ(BoundaryChunker::heading_title("2.1 Experimental Setup").value_or(""),
            "2.1 Experimental Setup");
  EXPECT_EQ(BoundaryChunker::heading_title("INTRODUCTION").value_or(""), "INTRODUCTION");
  EXPECT_FALSE(BoundaryChunker::heading_title("This is prose.").has_value());
  EXPECT_FALSE(BoundaryChunker::heading_title("").has_value());
}

TEST_F(BoundaryChunkerTest, NumberedListItemsAreNotHeadings) {
  std::string text = "# Setup\nSteps to follow:\n1. Install the package\n2. Run the tool";
  auto chunks = chunker_.chunk(text, 200, 20);

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].section_title, "Setup");
  EXPECT_EQ(chunks[0].text,
            "# Setup\n\nSteps to follow:\n1. Install the package\n2. Run the tool");
}

TEST_F(BoundaryChunkerTest, StandaloneNumberedLinesAreHeadings) {
  std::string text = "Intro text.\n\n2. Methods\n\nWe used tools.\n\n3. Results\nIt worked.";
  auto chunks = chunker_.chunk(text, 200, 20);

  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[1].section_title, "2. Methods");
  EXPECT_EQ(chunks[1].text, "2. Methods\n\nWe used tools.");
  EXPECT_EQ(chunks[2].section_title, "3. Results");

  std::vector<std::string> list = {"", "1. Install the package", "2. Run the tool"};
  EXPECT_FALSE(BoundaryChunker::heading_at(list, 1).has_value());
  EXPECT_FALSE(BoundaryChunker::heading_at(list, 2).has_value());
  EXPECT_FALSE(BoundaryChunker::heading_at(list, 3).has_value());
}

TEST_F(BoundaryChunkerTest, TailOnCharBoundary) {
  EXPECT_EQ(BoundaryChunker::tail_on_char_boundary("abc", 10), "abc");
  EXPECT_EQ(BoundaryChunker::tail_on_char_boundary("abcdef", 2), "ef");
  EXPECT_EQ(BoundaryChunker::tail_on_char_boundary("ab\xc3\xa9z", 3), "\xc3\xa9z");
  // 2 bytes back lands inside "é"; the partial character is dropped
  EXPECT_EQ(BoundaryChunker::tail_on_char_boundary("a\xc3\xa9z", 2), "z");
}

}  // namespace recall_core
