#include <gtest/gtest.h>

#include "recall_core/retrieval/result_consolidator.hpp"

namespace recall_tests {

using namespace recall_core;

namespace {

ChunkHit make_hit(const std::string& chunk_id,
                  std::optional<std::string> link,
                  const std::string& document_id,
                  float score,
                  const std::string& text = "") {
  ChunkHit hit;
  hit.chunk.chunk_id = chunk_id;
  hit.chunk.owner_id = "alice";
  hit.chunk.document_id = document_id;
  hit.chunk.source_link = std::move(link);
  hit.chunk.source_title = document_id.empty() ? "" : "Title of " + document_id;
  hit.chunk.text = text.empty() ? "text " + chunk_id : text;
  hit.score = score;
  return hit;
}

}  // namespace

class ResultConsolidatorTest : public ::testing::Test {
 protected:
  ResultConsolidator consolidator_;
};

TEST_F(ResultConsolidatorTest, GroupsHitsSharingALink) {
  std::vector<ChunkHit> hits = {make_hit("c1", "A", "doc1", 0.9f),
                                make_hit("c2", "A", "doc1", 0.7f),
                                make_hit("c3", "B", "doc2", 0.8f)};

  auto groups = consolidator_.consolidate(hits);

  ASSERT_EQ(groups.size(), 2u);
  EXPECT_EQ(groups[0].url.value_or(""), "A");
  EXPECT_EQ(groups[0].chunk_count, 2);
  EXPECT_FLOAT_EQ(groups[0].score, 0.9f);
  EXPECT_EQ(groups[0].chunk_ids, (std::vector<std::string>{"c1", "c2"}));
  EXPECT_EQ(groups[1].url.value_or(""), "B");
  EXPECT_EQ(groups[1].chunk_count, 1);
}

TEST_F(ResultConsolidatorTest, EmptyHitsGiveNoGroups) {
  EXPECT_TRUE(consolidator_.consolidate({}).empty());
}

TEST_F(ResultConsolidatorTest, RepresentativeTextUsesTwoBestChunks) {
  std::vector<ChunkHit> hits = {make_hit("c1", "A", "doc1", 0.5f, "third"),
                                make_hit("c2", "A", "doc1", 0.9f, "first"),
                                make_hit("c3", "A", "doc1", 0.7f, "second"),
                                make_hit("c4", "A", "doc1", 0.1f, "fourth")};

  auto groups = consolidator_.consolidate(hits);

  ASSERT_EQ(groups.size(), 1u);
  EXPECT_EQ(groups[0].text, "first | second (+2 more chunks)");
  EXPECT_EQ(groups[0].chunk_count, 4);
}

TEST_F(ResultConsolidatorTest, HighlightLeavesSeparatorAndSuffixAlone) {
  std::vector<ChunkHit> hits = {make_hit("c1", "A", "doc1", 0.9f, "more tests"),
                                make_hit("c2", "A", "doc1", 0.8f, "chunks | pipes"),
                                make_hit("c3", "A", "doc1", 0.7f, "third"),
                                make_hit("c4", "A", "doc1", 0.6f, "fourth")};

  auto groups = consolidator_.consolidate(hits, "more chunks");

  ASSERT_EQ(groups.size(), 1u);
  EXPECT_EQ(groups[0].text, "**more** tests | **chunks** | pipes (+2 more chunks)");
}

TEST_F(ResultConsolidatorTest, TwoChunksHaveNoSuffix) {
  std::vector<ChunkHit> hits = {make_hit("c1", std::nullopt, "doc1", 0.6f, "alpha"),
                                make_hit("c2", std::nullopt, "doc1", 0.8f, "beta")};

  auto groups = consolidator_.consolidate(hits);

  ASSERT_EQ(groups.size(), 1u);
  EXPECT_EQ(groups[0].text, "beta | alpha");
}

TEST_F(ResultConsolidatorTest, LinkTakesPrecedenceOverDocument) {
  // Two pages of one upload have distinct links and stay separate
  std::vector<ChunkHit> hits = {make_hit("c1", "scan.pdf#page=1", "doc1", 0.9f),
                                make_hit("c2", "scan.pdf#page=2", "doc1", 0.8f),
                                make_hit("c3", std::nullopt, "doc1", 0.7f)};

  auto groups = consolidator_.consolidate(hits);

  EXPECT_EQ(groups.size(), 3u);
}

TEST_F(ResultConsolidatorTest, UnidentifiableHitsNeverMerge) {
  std::vector<ChunkHit> hits = {make_hit("c1", std::nullopt, "", 0.9f),
                                make_hit("c2", std::nullopt, "", 0.8f)};

  auto groups = consolidator_.consolidate(hits);

  ASSERT_EQ(groups.size(), 2u);
  EXPECT_EQ(groups[0].chunk_count, 1);
  EXPECT_EQ(groups[1].chunk_count, 1);
}

TEST_F(ResultConsolidatorTest, EqualScoresPreferMoreChunksThenFirstSeen) {
  std::vector<ChunkHit> hits = {make_hit("c1", "solo", "d1", 0.8f),
                                make_hit("c2", "pair", "d2", 0.8f),
                                make_hit("c3", "pair", "d2", 0.3f),
                                make_hit("c4", "late", "d3", 0.8f)};

  auto groups = consolidator_.consolidate(hits);

  ASSERT_EQ(groups.size(), 3u);
  EXPECT_EQ(groups[0].url.value_or(""), "pair");
  EXPECT_EQ(groups[1].url.value_or(""), "solo");
  EXPECT_EQ(groups[2].url.value_or(""), "late");
}

TEST_F(ResultConsolidatorTest, SourceIdentityPrecedence) {
  EXPECT_EQ(ResultConsolidator::source_identity(make_hit("c", "L", "d", 1.0f), 0), "link:L");
  EXPECT_EQ(ResultConsolidator::source_identity(make_hit("c", "", "d", 1.0f), 0), "doc:d");
  EXPECT_EQ(ResultConsolidator::source_identity(make_hit("c", std::nullopt, "", 1.0f), 4),
            "hit:4");
}

TEST_F(ResultConsolidatorTest, DisplayNameFallsBackToShortDocumentId) {
  Chunk chunk;
  chunk.document_id = "0123456789abcdef";
  EXPECT_EQ(ResultConsolidator::display_name_for(chunk), "Document (01234567...)");
  chunk.source_title = "Quarterly report";
  EXPECT_EQ(ResultConsolidator::display_name_for(chunk), "Quarterly report");
}

TEST_F(ResultConsolidatorTest, PartitionShowsFirstTwo) {
  std::vector<SourceGroup> groups(5);
  for (size_t i = 0; i < groups.size(); ++i) {
    groups[i].display_name = "g" + std::to_string(i);
  }

  auto partition = ResultConsolidator::partition_for_display(groups);

  ASSERT_EQ(partition.shown.size(), 2u);
  EXPECT_EQ(partition.shown[1].display_name, "g1");
  ASSERT_EQ(partition.expandable.size(), 3u);
  EXPECT_EQ(partition.expandable[0].display_name, "g2");

  auto small = ResultConsolidator::partition_for_display({groups[0]});
  EXPECT_EQ(small.shown.size(), 1u);
  EXPECT_TRUE(small.expandable.empty());
}

TEST_F(ResultConsolidatorTest, HighlightIsCaseInsensitiveAndKeepsOriginalCase) {
  EXPECT_EQ(ResultConsolidator::highlight("Vector search beats keyword Search.", "search"),
            "Vector **search** beats keyword **Search**.");
}

TEST_F(ResultConsolidatorTest, HighlightMarksEveryQueryWord) {
  EXPECT_EQ(ResultConsolidator::highlight("fast vector index", "Vector, index?", "<b>", "</b>"),
            "fast <b>vector</b> <b>index</b>");
}

TEST_F(ResultConsolidatorTest, HighlightIgnoresSingleCharacterWords) {
  EXPECT_EQ(ResultConsolidator::highlight("a cat", "a"), "a cat");
  EXPECT_EQ(ResultConsolidator::highlight("text", "   "), "text");
}

TEST_F(ResultConsolidatorTest, HighlightPrefersLongerOverlappingWord) {
  EXPECT_EQ(ResultConsolidator::highlight("embedding", "embed embedding"), "**embedding**");
}

}  // namespace recall_tests
