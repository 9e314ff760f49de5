#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "recall_core/utils/hashing.hpp"

namespace recall_tests {

using recall_core::Chunk;
using recall_core::ChunkFilter;
using recall_core::InvalidChunkError;
using recall_core::OwnerIsolationViolation;
using recall_core::SourceType;

class ChunkStoreTest : public ChunkStoreTestBase {
 protected:
  std::vector<Chunk> make_document(const std::string& owner,
                                   const std::string& document,
                                   int count,
                                   int first_axis = 0) {
    std::vector<Chunk> chunks;
    for (int i = 0; i < count; ++i) {
      chunks.push_back(TestUtilities::create_test_chunk(
          owner, document, i, document + " part " + std::to_string(i),
          TestUtilities::create_axis_vector(first_axis + i)));
    }
    return chunks;
  }
};

TEST_F(ChunkStoreTest, Upsert_InsertsAndDerivesChunkIds) {
  auto stats = chunk_store_->upsert("alice", make_document("alice", "doc1", 3));

  EXPECT_EQ(stats.inserted, 3);
  EXPECT_EQ(stats.updated, 0);
  EXPECT_EQ(chunk_store_->count_chunks("alice"), 3);

  auto chunk = chunk_store_->get_chunk("alice", recall_core::make_chunk_id("alice", "doc1", 1));
  ASSERT_TRUE(chunk.has_value());
  EXPECT_EQ(chunk->text, "doc1 part 1");
  EXPECT_EQ(chunk->chunk_index, 1);
  EXPECT_EQ(chunk->chunk_size, static_cast<int>(chunk->text.size()));
  EXPECT_EQ(chunk->embedding.size(), static_cast<size_t>(kTestDimension));
}

TEST_F(ChunkStoreTest, Upsert_SameChunksTwiceIsIdempotent) {
  chunk_store_->upsert("alice", make_document("alice", "doc1", 3));
  auto stats = chunk_store_->upsert("alice", make_document("alice", "doc1", 3));

  EXPECT_EQ(stats.inserted, 0);
  EXPECT_EQ(stats.updated, 3);
  EXPECT_EQ(chunk_store_->count_chunks("alice"), 3);
  EXPECT_EQ(chunk_store_->count_chunks("alice", std::string("doc1")), 3);
}

TEST_F(ChunkStoreTest, Upsert_KeepsCreatedAtAndAdvancesUpdatedAt) {
  chunk_store_->upsert("alice", make_document("alice", "doc1", 1));
  const std::string id = recall_core::make_chunk_id("alice", "doc1", 0);
  auto first = chunk_store_->get_chunk("alice", id);
  ASSERT_TRUE(first.has_value());

  // Same millisecond on purpose: updated_at must still move forward
  auto replacement = make_document("alice", "doc1", 1);
  replacement[0].text = "rewritten text";
  chunk_store_->upsert("alice", replacement);

  auto second = chunk_store_->get_chunk("alice", id);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->created_at, first->created_at);
  EXPECT_GT(second->updated_at, first->updated_at);
  EXPECT_EQ(second->text, "rewritten text");
}

TEST_F(ChunkStoreTest, Upsert_RejectsWrongDimensionWithoutWriting) {
  auto chunks = make_document("alice", "doc1", 2);
  chunks[1].embedding = std::vector<float>(kTestDimension + 1, 0.5f);

  EXPECT_THROW(chunk_store_->upsert("alice", chunks), InvalidChunkError);
  EXPECT_EQ(chunk_store_->count_chunks("alice"), 0);
}

TEST_F(ChunkStoreTest, Upsert_RejectsEmptyTextAndMissingDocument) {
  auto empty_text = make_document("alice", "doc1", 1);
  empty_text[0].text.clear();
  EXPECT_THROW(chunk_store_->upsert("alice", empty_text), InvalidChunkError);

  auto no_document = make_document("alice", "doc1", 1);
  no_document[0].document_id.clear();
  EXPECT_THROW(chunk_store_->upsert("alice", no_document), InvalidChunkError);

  EXPECT_THROW(chunk_store_->upsert("", make_document("", "doc1", 1)), InvalidChunkError);
}

TEST_F(ChunkStoreTest, Upsert_ChunkOfAnotherOwnerInBatchIsRejected) {
  auto chunks = make_document("alice", "doc1", 2);
  chunks[1].owner_id = "bob";

  EXPECT_THROW(chunk_store_->upsert("alice", chunks), OwnerIsolationViolation);
  EXPECT_EQ(chunk_store_->count_chunks("alice"), 0);
  EXPECT_EQ(chunk_store_->count_chunks("bob"), 0);
}

TEST_F(ChunkStoreTest, Upsert_ChunkIdOwnedByAnotherOwnerRollsBackBatch) {
  auto bob_chunks = make_document("bob", "doc1", 1);
  bob_chunks[0].chunk_id = "shared-id";
  chunk_store_->upsert("bob", bob_chunks);

  auto alice_chunks = make_document("alice", "doc1", 2);
  alice_chunks[1].chunk_id = "shared-id";

  EXPECT_THROW(chunk_store_->upsert("alice", alice_chunks), OwnerIsolationViolation);
  EXPECT_EQ(chunk_store_->count_chunks("alice"), 0);
  auto bob_chunk = chunk_store_->get_chunk("bob", "shared-id");
  ASSERT_TRUE(bob_chunk.has_value());
  EXPECT_EQ(bob_chunk->owner_id, "bob");
}

TEST_F(ChunkStoreTest, Search_ReturnsOnlyOwnersChunksBestFirst) {
  chunk_store_->upsert("alice", make_document("alice", "doc1", 3, 0));
  chunk_store_->upsert("bob", make_document("bob", "doc1", 3, 0));

  auto hits = chunk_store_->search("alice", TestUtilities::create_axis_vector(1), 10);

  ASSERT_EQ(hits.size(), 3u);
  EXPECT_EQ(hits[0].chunk.chunk_index, 1);
  EXPECT_NEAR(hits[0].score, 1.0f, 1e-5);
  EXPECT_EQ(hits[0].chunk.text, "doc1 part 1");
  for (const auto& hit : hits) {
    EXPECT_EQ(hit.chunk.owner_id, "alice");
  }
  for (size_t i = 1; i < hits.size(); ++i) {
    EXPECT_GE(hits[i - 1].score, hits[i].score);
  }
}

TEST_F(ChunkStoreTest, Search_UnknownOwnerAndNonPositiveTopKReturnNothing) {
  chunk_store_->upsert("alice", make_document("alice", "doc1", 2));

  EXPECT_TRUE(chunk_store_->search("carol", TestUtilities::create_axis_vector(0), 5).empty());
  EXPECT_TRUE(chunk_store_->search("alice", TestUtilities::create_axis_vector(0), 0).empty());
}

TEST_F(ChunkStoreTest, Search_RejectsQueryOfWrongDimension) {
  EXPECT_THROW(chunk_store_->search("alice", std::vector<float>(3, 1.0f), 5), InvalidChunkError);
}

TEST_F(ChunkStoreTest, Search_TruncatesToTopK) {
  chunk_store_->upsert("alice", make_document("alice", "doc1", 8));

  auto hits = chunk_store_->search("alice", TestUtilities::create_axis_vector(2), 3);
  EXPECT_EQ(hits.size(), 3u);
}

TEST_F(ChunkStoreTest, Search_EqualScoresPreferNewerChunks) {
  auto older = TestUtilities::create_test_chunk("alice", "old", 0, "older text",
                                                TestUtilities::create_axis_vector(4));
  chunk_store_->upsert("alice", {older});
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  auto newer = TestUtilities::create_test_chunk("alice", "new", 0, "newer text",
                                                TestUtilities::create_axis_vector(4));
  chunk_store_->upsert("alice", {newer});

  auto hits = chunk_store_->search("alice", TestUtilities::create_axis_vector(4), 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].chunk.document_id, "new");
}

TEST_F(ChunkStoreTest, Search_ManyEqualScoresReturnTheNewest) {
  for (int i = 0; i < 30; ++i) {
    std::string document = "doc" + std::to_string(i);
    chunk_store_->upsert("alice", {TestUtilities::create_test_chunk(
                                      "alice", document, 0, "same boilerplate",
                                      TestUtilities::create_axis_vector(4))});
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  auto hits = chunk_store_->search("alice", TestUtilities::create_axis_vector(4), 5);
  ASSERT_EQ(hits.size(), 5u);
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(hits[i].chunk.document_id, "doc" + std::to_string(29 - i));
  }
}

TEST_F(ChunkStoreTest, Search_AppliesScalarFilters) {
  auto doc1 = make_document("alice", "doc1", 2);
  doc1[0].page_number = 1;
  doc1[1].page_number = 2;
  auto doc2 = make_document("alice", "doc2", 2);
  for (auto& chunk : doc2) {
    chunk.source_type = SourceType::SyncedPage;
  }
  chunk_store_->upsert("alice", doc1);
  chunk_store_->upsert("alice", doc2);

  ChunkFilter by_document;
  by_document.document_id = "doc2";
  auto hits = chunk_store_->search("alice", TestUtilities::create_axis_vector(0), 10, by_document);
  ASSERT_EQ(hits.size(), 2u);
  for (const auto& hit : hits) {
    EXPECT_EQ(hit.chunk.document_id, "doc2");
  }

  ChunkFilter by_type;
  by_type.source_type = SourceType::PlainText;
  hits = chunk_store_->search("alice", TestUtilities::create_axis_vector(0), 10, by_type);
  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].chunk.document_id, "doc1");

  ChunkFilter by_page;
  by_page.page_number = 2;
  hits = chunk_store_->search("alice", TestUtilities::create_axis_vector(0), 10, by_page);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].chunk.chunk_index, 1);
}

TEST_F(ChunkStoreTest, Search_FallsBackToFullScanWhenOwnerIndexIsMissing) {
  chunk_store_->upsert("alice", make_document("alice", "doc1", 2));
  chunk_store_->upsert("bob", make_document("bob", "doc1", 2));
  {
    recall_core::PooledConnection conn(*db_manager_);
    *conn << "DROP INDEX idx_chunks_owner;";
  }
  ASSERT_FALSE(chunk_store_->has_owner_index());

  auto hits = chunk_store_->search("alice", TestUtilities::create_axis_vector(0), 10);

  EXPECT_EQ(chunk_store_->full_scan_count(), 1u);
  ASSERT_EQ(hits.size(), 2u);
  for (const auto& hit : hits) {
    EXPECT_EQ(hit.chunk.owner_id, "alice");
  }
}

TEST_F(ChunkStoreTest, DeleteByDocument_OnlyTouchesThatDocument) {
  chunk_store_->upsert("alice", make_document("alice", "doc1", 2));
  chunk_store_->upsert("alice", make_document("alice", "doc2", 3));
  chunk_store_->upsert("bob", make_document("bob", "doc1", 2));

  EXPECT_EQ(chunk_store_->delete_by_document("alice", "doc1"), 2);
  EXPECT_EQ(chunk_store_->count_chunks("alice"), 3);
  EXPECT_EQ(chunk_store_->count_chunks("bob"), 2);
  EXPECT_EQ(chunk_store_->delete_by_document("alice", "doc1"), 0);
}

TEST_F(ChunkStoreTest, DeleteStaleChunks_RemovesTailOfShorterVersion) {
  chunk_store_->upsert("alice", make_document("alice", "doc1", 5));

  EXPECT_EQ(chunk_store_->delete_stale_chunks("alice", "doc1", 2), 3);
  EXPECT_EQ(chunk_store_->count_chunks("alice", std::string("doc1")), 2);
}

TEST_F(ChunkStoreTest, DeleteByOwner_LeavesOtherOwnersAlone) {
  chunk_store_->upsert("alice", make_document("alice", "doc1", 2));
  chunk_store_->upsert("bob", make_document("bob", "doc1", 2));

  EXPECT_EQ(chunk_store_->delete_by_owner("alice"), 2);
  EXPECT_EQ(chunk_store_->count_chunks("alice"), 0);
  EXPECT_EQ(chunk_store_->count_chunks("bob"), 2);
}

TEST_F(ChunkStoreTest, GetChunk_IsOwnerScoped) {
  chunk_store_->upsert("alice", make_document("alice", "doc1", 1));
  const std::string id = recall_core::make_chunk_id("alice", "doc1", 0);

  EXPECT_TRUE(chunk_store_->get_chunk("alice", id).has_value());
  EXPECT_FALSE(chunk_store_->get_chunk("bob", id).has_value());
}

TEST_F(ChunkStoreTest, ListDocuments_GroupsChunksPerDocument) {
  chunk_store_->upsert("alice", make_document("alice", "doc1", 2));
  chunk_store_->upsert("alice", make_document("alice", "doc2", 3));

  auto documents = chunk_store_->list_documents("alice");
  ASSERT_EQ(documents.size(), 2u);
  EXPECT_EQ(documents[0].document_id, "doc1");
  EXPECT_EQ(documents[0].chunk_count, 2);
  EXPECT_EQ(documents[1].document_id, "doc2");
  EXPECT_EQ(documents[1].chunk_count, 3);
  EXPECT_EQ(documents[1].source_type, SourceType::PlainText);
}

TEST_F(ChunkStoreTest, DegradedChunks_CanBeListedAndRepaired) {
  auto chunks = make_document("alice", "doc1", 3);
  chunks[0].embedding_degraded = true;
  chunks[2].embedding_degraded = true;
  chunk_store_->upsert("alice", chunks);

  EXPECT_EQ(chunk_store_->count_degraded_chunks("alice"), 2);
  auto degraded = chunk_store_->list_degraded_chunks("alice", 1);
  ASSERT_EQ(degraded.size(), 1u);
  EXPECT_EQ(degraded[0].chunk_index, 0);
  EXPECT_EQ(degraded[0].text, "doc1 part 0");

  EXPECT_TRUE(chunk_store_->update_embedding("alice", degraded[0].chunk_id,
                                             TestUtilities::create_axis_vector(9), false));
  EXPECT_EQ(chunk_store_->count_degraded_chunks("alice"), 1);
  EXPECT_FALSE(chunk_store_->update_embedding("bob", degraded[0].chunk_id,
                                              TestUtilities::create_axis_vector(9), false));
  EXPECT_THROW(chunk_store_->update_embedding("alice", degraded[0].chunk_id, {1.0f}, false),
               InvalidChunkError);
}

}  // namespace recall_tests
