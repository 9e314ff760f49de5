#include <gtest/gtest.h>

#include "recall_core/services/document_service.hpp"
#include "utilities_test.hpp"

namespace recall_tests {

using namespace recall_core;

class DocumentServiceTest : public ChunkStoreTestBase {
 protected:
  void SetUp() override {
    ChunkStoreTestBase::SetUp();
    document_service_ = std::make_unique<DocumentService>(chunk_store_);

    chunk_store_->upsert("alice", {TestUtilities::create_test_chunk("alice", "guide", 0, "a"),
                                   TestUtilities::create_test_chunk("alice", "guide", 1, "b"),
                                   TestUtilities::create_test_chunk("alice", "notes", 0, "c")});
    chunk_store_->upsert("bob", {TestUtilities::create_test_chunk("bob", "guide", 0, "d")});
  }

  std::unique_ptr<DocumentService> document_service_;
};

TEST_F(DocumentServiceTest, ListsOwnersDocumentsWithCounts) {
  auto documents = document_service_->list_documents("alice");

  ASSERT_EQ(documents.size(), 2u);
  int guide_chunks = 0;
  for (const auto& doc : documents) {
    if (doc.document_id == "guide") {
      guide_chunks = doc.chunk_count;
      EXPECT_EQ(doc.source_title, "guide");
      EXPECT_EQ(doc.source_type, SourceType::PlainText);
    }
  }
  EXPECT_EQ(guide_chunks, 2);
}

TEST_F(DocumentServiceTest, DeleteDocumentStaysInsideOwner) {
  EXPECT_EQ(document_service_->delete_document("alice", "guide"), 2);

  EXPECT_EQ(chunk_store_->count_chunks("alice"), 1);
  EXPECT_EQ(chunk_store_->count_chunks("bob", std::string("guide")), 1);
  EXPECT_EQ(document_service_->delete_document("alice", "guide"), 0);
}

TEST_F(DocumentServiceTest, DeleteOwnerRemovesEverything) {
  EXPECT_EQ(document_service_->delete_owner("alice"), 3);

  EXPECT_TRUE(document_service_->list_documents("alice").empty());
  EXPECT_EQ(chunk_store_->count_chunks("bob"), 1);
}

TEST_F(DocumentServiceTest, UnknownOwnerHasNoDocuments) {
  EXPECT_TRUE(document_service_->list_documents("carol").empty());
  EXPECT_EQ(document_service_->delete_owner("carol"), 0);
}

}  // namespace recall_tests
