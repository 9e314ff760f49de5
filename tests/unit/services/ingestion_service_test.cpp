#include <gtest/gtest.h>

#include "recall_core/async/task_factory.hpp"
#include "recall_core/services/ingestion_service.hpp"
#include "utilities_test.hpp"

namespace recall_tests {

using namespace recall_core;

class IngestionServiceTest : public ChunkStoreTestBase {
 protected:
  void SetUp() override {
    ChunkStoreTestBase::SetUp();
    settings_.max_pages = 3;
    settings_.max_document_chars = 50;
    ingestion_service_ = std::make_unique<IngestionService>(job_repo_, settings_);
  }

  IngestionSettings settings_;
  std::unique_ptr<IngestionService> ingestion_service_;
};

TEST_F(IngestionServiceTest, SubmitQueuesPendingJob) {
  auto request = TestUtilities::create_test_request("alice", "doc1", {"Hello world."});

  long long job_id = ingestion_service_->submit(request);

  auto view = ingestion_service_->get_status(job_id);
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->job.status, JobStatus::PENDING);
  EXPECT_EQ(view->job.job_type, kIngestDocumentJob);
  EXPECT_EQ(view->job.owner_id, "alice");
  EXPECT_EQ(view->job.document_id, "doc1");
  EXPECT_FALSE(view->progress.has_value());

  IngestionRequest queued = ingestion_request_from_json(nlohmann::json::parse(view->job.payload));
  ASSERT_EQ(queued.pages.size(), 1u);
  EXPECT_EQ(queued.pages[0].text, "Hello world.");
}

TEST_F(IngestionServiceTest, MissingIdentityIsRejected) {
  EXPECT_THROW(ingestion_service_->submit(TestUtilities::create_test_request("", "doc1", {"x"})),
               std::invalid_argument);
  EXPECT_THROW(ingestion_service_->submit(TestUtilities::create_test_request("alice", "", {"x"})),
               std::invalid_argument);
}

TEST_F(IngestionServiceTest, BlankDocumentIsEmpty) {
  EXPECT_THROW(ingestion_service_->validate(TestUtilities::create_test_request("a", "d", {})),
               EmptyDocument);
  EXPECT_THROW(
      ingestion_service_->validate(TestUtilities::create_test_request("a", "d", {"  ", "\n\t"})),
      EmptyDocument);
}

TEST_F(IngestionServiceTest, SizeLimitsAreEnforced) {
  EXPECT_THROW(ingestion_service_->validate(
                   TestUtilities::create_test_request("a", "d", {"1", "2", "3", "4"})),
               DocumentTooLarge);
  EXPECT_THROW(ingestion_service_->validate(
                   TestUtilities::create_test_request("a", "d", {std::string(51, 'x')})),
               DocumentTooLarge);
  EXPECT_NO_THROW(ingestion_service_->validate(
      TestUtilities::create_test_request("a", "d", {std::string(25, 'x'), std::string(25, 'y')})));
}

TEST_F(IngestionServiceTest, RejectedRequestWritesNothing) {
  EXPECT_THROW(ingestion_service_->submit(TestUtilities::create_test_request("a", "d", {" "})),
               EmptyDocument);
  EXPECT_TRUE(job_repo_->get_jobs_by_status(JobStatus::PENDING).empty());
}

TEST_F(IngestionServiceTest, CancelPendingJob) {
  long long job_id =
      ingestion_service_->submit(TestUtilities::create_test_request("alice", "doc1", {"text"}));

  EXPECT_TRUE(ingestion_service_->cancel(job_id));
  EXPECT_EQ(ingestion_service_->get_status(job_id)->job.status, JobStatus::CANCELLED);
  EXPECT_FALSE(ingestion_service_->cancel(job_id));
}

TEST_F(IngestionServiceTest, UnknownJob) {
  EXPECT_FALSE(ingestion_service_->get_status(9999).has_value());
  EXPECT_FALSE(ingestion_service_->cancel(9999));
}

TEST_F(IngestionServiceTest, StatusIncludesProgress) {
  long long job_id =
      ingestion_service_->submit(TestUtilities::create_test_request("alice", "doc1", {"text"}));
  job_repo_->upsert_job_progress(job_id, 0.25f, "Chunking pages", JobCounters{4, 1, 0, 0});

  auto view = ingestion_service_->get_status(job_id);

  ASSERT_TRUE(view.has_value());
  ASSERT_TRUE(view->progress.has_value());
  EXPECT_FLOAT_EQ(view->progress->progress_percent, 0.25f);
  EXPECT_EQ(view->progress->status_message, "Chunking pages");
  EXPECT_EQ(view->progress->total_pages, 4);
}

TEST_F(IngestionServiceTest, RequiresJobRepo) {
  EXPECT_THROW(IngestionService(nullptr, settings_), std::invalid_argument);
}

}  // namespace recall_tests
