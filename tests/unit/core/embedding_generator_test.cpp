#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "mocks_test.hpp"
#include "recall_core/embedding/embedding_generator.hpp"
#include "recall_core/embedding/hash_embedding_backend.hpp"

namespace recall_tests {

using namespace recall_core;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

constexpr int kDim = 8;

class EmbeddingGeneratorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    primary_ = std::make_shared<NiceMock<MockEmbeddingBackend>>();
    ON_CALL(*primary_, name()).WillByDefault(Return("primary"));
  }

  std::shared_ptr<NiceMock<MockEmbeddingBackend>> primary_;
};

TEST_F(EmbeddingGeneratorTest, PrimaryResultsAreOk) {
  EXPECT_CALL(*primary_, embed(_)).WillOnce(Return(MockUtilities::create_test_embeddings(2, kDim)));
  EmbeddingGenerator generator(primary_, kDim);

  auto results = generator.embed({"one", "two"});

  ASSERT_EQ(results.size(), 2u);
  for (const auto& result : results) {
    EXPECT_FALSE(result.degraded());
    EXPECT_EQ(result.backend, "primary");
    EXPECT_TRUE(result.reason.empty());
    EXPECT_EQ(result.vector.size(), static_cast<size_t>(kDim));
  }
}

TEST_F(EmbeddingGeneratorTest, UnavailablePrimaryFallsBackToHashAndIsDegraded) {
  EXPECT_CALL(*primary_, embed(_))
      .WillOnce(Throw(EmbeddingBackendUnavailable("connection refused")));
  EmbeddingGenerator generator(primary_, kDim);

  auto results = generator.embed({"alpha", "beta", "gamma"});

  ASSERT_EQ(results.size(), 3u);
  HashEmbeddingBackend hash(kDim);
  for (size_t i = 0; i < results.size(); ++i) {
    EXPECT_TRUE(results[i].degraded());
    EXPECT_EQ(results[i].backend, "hash");
    EXPECT_NE(results[i].reason.find("EmbeddingBackendUnavailable"), std::string::npos);
    EXPECT_NE(results[i].reason.find("connection refused"), std::string::npos);
  }
  EXPECT_EQ(results[1].vector, hash.embed_one("beta"));
}

TEST_F(EmbeddingGeneratorTest, WrongDimensionFromPrimaryIsTreatedAsFailure) {
  EXPECT_CALL(*primary_, embed(_))
      .WillOnce(Return(MockUtilities::create_test_embeddings(1, kDim + 3)));
  EmbeddingGenerator generator(primary_, kDim);

  auto result = generator.embed_query("query");

  EXPECT_TRUE(result.degraded());
  EXPECT_EQ(result.vector.size(), static_cast<size_t>(kDim));
}

TEST_F(EmbeddingGeneratorTest, WrongCountFromPrimaryIsTreatedAsFailure) {
  EXPECT_CALL(*primary_, embed(_)).WillOnce(Return(MockUtilities::create_test_embeddings(1, kDim)));
  EmbeddingGenerator generator(primary_, kDim);

  auto results = generator.embed({"a", "b"});

  ASSERT_EQ(results.size(), 2u);
  EXPECT_TRUE(results[0].degraded());
  EXPECT_TRUE(results[1].degraded());
}

TEST_F(EmbeddingGeneratorTest, ChainTriesBackendsInOrder) {
  auto secondary = std::make_shared<NiceMock<MockEmbeddingBackend>>();
  ON_CALL(*secondary, name()).WillByDefault(Return("secondary"));
  EXPECT_CALL(*primary_, embed(_)).WillOnce(Throw(std::runtime_error("down")));
  EXPECT_CALL(*secondary, embed(_)).WillOnce(Return(MockUtilities::create_test_embeddings(1, kDim)));
  EmbeddingGenerator generator(std::vector<EmbeddingBackendPtr>{primary_, secondary}, kDim);

  auto result = generator.embed_query("text");

  EXPECT_TRUE(result.degraded());
  EXPECT_EQ(result.backend, "secondary");
}

TEST_F(EmbeddingGeneratorTest, NoPrimaryMeansEveryResultIsDegraded) {
  EmbeddingGenerator generator(nullptr, kDim);

  auto result = generator.embed_query("text");

  EXPECT_TRUE(result.degraded());
  EXPECT_EQ(result.backend, "hash");
  EXPECT_NE(result.reason.find("no primary backend"), std::string::npos);
}

TEST_F(EmbeddingGeneratorTest, EmptyBatchSkipsBackends) {
  EXPECT_CALL(*primary_, embed(_)).Times(0);
  EmbeddingGenerator generator(primary_, kDim);
  EXPECT_TRUE(generator.embed({}).empty());
}

TEST_F(EmbeddingGeneratorTest, RejectsNonPositiveDimension) {
  EXPECT_THROW(EmbeddingGenerator(primary_, 0), std::invalid_argument);
}

TEST(LazyEmbeddingBackendTest, FactoryRunsOnceUnderConcurrentFirstUse) {
  std::atomic<int> factory_calls{0};
  LazyEmbeddingBackend lazy("lazy-hash", [&factory_calls]() -> EmbeddingBackendPtr {
    factory_calls++;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    return std::make_shared<HashEmbeddingBackend>(kDim);
  });
  EXPECT_FALSE(lazy.is_initialized());

  std::vector<std::thread> threads;
  std::atomic<int> served{0};
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&lazy, &served, i] {
      auto vectors = lazy.embed({"text " + std::to_string(i)});
      if (vectors.size() == 1 && vectors[0].size() == static_cast<size_t>(kDim)) {
        served++;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(factory_calls.load(), 1);
  EXPECT_EQ(lazy.initialization_attempts(), 1);
  EXPECT_EQ(served.load(), 8);
  EXPECT_TRUE(lazy.is_initialized());
}

TEST(LazyEmbeddingBackendTest, FailedFactoryIsRetriedOnNextCall) {
  int calls = 0;
  LazyEmbeddingBackend lazy("flaky", [&calls]() -> EmbeddingBackendPtr {
    if (++calls == 1) {
      throw std::runtime_error("model not pulled");
    }
    return std::make_shared<HashEmbeddingBackend>(kDim);
  });

  EXPECT_THROW(lazy.embed({"x"}), EmbeddingBackendUnavailable);
  EXPECT_FALSE(lazy.is_initialized());
  EXPECT_EQ(lazy.embed({"x"}).size(), 1u);
  EXPECT_EQ(lazy.initialization_attempts(), 2);
}

TEST(LazyEmbeddingBackendTest, GeneratorDegradesWhileLazyBackendCannotStart) {
  auto lazy = std::make_shared<LazyEmbeddingBackend>(
      "broken", []() -> EmbeddingBackendPtr { throw std::runtime_error("no server"); });
  EmbeddingGenerator generator(lazy, kDim);

  auto result = generator.embed_query("hello");
  EXPECT_TRUE(result.degraded());
  EXPECT_NE(result.reason.find("no server"), std::string::npos);
}

}  // namespace recall_tests
