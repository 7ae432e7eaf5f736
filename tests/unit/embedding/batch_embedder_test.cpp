#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "common/mocks_test.hpp"
#include "loglens_core/embedding/batch_embedder.hpp"
#include "loglens_core/types/errors.hpp"

namespace loglens_core {

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Throw;

class BatchEmbedderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    provider_ = std::make_shared<NiceMock<loglens_tests::MockEmbeddingProvider>>(model_);
    registry_.register_factory("test", [this](const ModelId &) { return provider_; });
    embedder_ = std::make_unique<BatchEmbedder>(registry_, 2);

    options_.batch_size = 2;
    options_.max_attempts = 3;
    options_.retry_base_delay = std::chrono::milliseconds(0);
    options_.retry_max_delay = std::chrono::milliseconds(0);
  }

  static std::vector<std::string> texts(size_t count) {
    std::vector<std::string> result;
    for (size_t i = 0; i < count; ++i) {
      result.push_back("text " + std::to_string(i));
    }
    return result;
  }

  auto real_embed() {
    return Invoke(provider_.get(), &loglens_tests::MockEmbeddingProvider::embed_for_real);
  }

  ModelId model_ = ModelId::parse("test:mock:8");
  ProviderRegistry registry_;
  std::shared_ptr<NiceMock<loglens_tests::MockEmbeddingProvider>> provider_;
  std::unique_ptr<BatchEmbedder> embedder_;
  EmbeddingOptions options_;
};

TEST_F(BatchEmbedderTest, EmbedsAllTextsInBatches) {
  EXPECT_CALL(*provider_, embed(_)).Times(3);
  std::vector<size_t> batch_starts;

  auto report = embedder_->embed_batch(
      texts(5), model_, options_,
      [&](size_t first, const std::vector<std::vector<float>> &) { batch_starts.push_back(first); });

  EXPECT_TRUE(report.complete());
  EXPECT_EQ(report.batches_total, 3u);
  EXPECT_EQ(report.batches_succeeded, 3u);
  EXPECT_EQ(batch_starts, (std::vector<size_t>{0, 2, 4}));
  ASSERT_EQ(report.vectors.size(), 5u);
  for (const auto &vector : report.vectors) {
    EXPECT_EQ(vector.size(), 8u);
  }
  EXPECT_EQ(report.vectors[3], provider_->embed_for_real({"text 3"})[0]);
}

TEST_F(BatchEmbedderTest, EmptyInputCallsNothing) {
  EXPECT_CALL(*provider_, embed(_)).Times(0);

  auto report = embedder_->embed_batch({}, model_, options_);

  EXPECT_TRUE(report.complete());
  EXPECT_EQ(report.batches_total, 0u);
}

TEST_F(BatchEmbedderTest, TransientErrorsAreRetried) {
  EXPECT_CALL(*provider_, embed(_))
      .WillOnce(Throw(ProviderError("connection refused", true)))
      .WillOnce(Throw(ProviderError("rate limited", true)))
      .WillOnce(real_embed());

  auto report = embedder_->embed_batch(texts(2), model_, options_);

  EXPECT_TRUE(report.complete());
  EXPECT_EQ(report.retries, 2u);
  EXPECT_EQ(report.batches_succeeded, 1u);
}

TEST_F(BatchEmbedderTest, ExhaustedRetriesFailTheBatchAndSkipTheRest) {
  // Batch 1 succeeds, batch 2 keeps failing, batch 3 is never sent.
  EXPECT_CALL(*provider_, embed(_))
      .WillOnce(real_embed())
      .WillRepeatedly(Throw(ProviderError("timeout", true)));

  auto report = embedder_->embed_batch(texts(6), model_, options_);

  EXPECT_FALSE(report.complete());
  EXPECT_EQ(report.batches_succeeded, 1u);
  EXPECT_EQ(report.batches_failed, 1u);
  EXPECT_EQ(report.failed_indices, (std::vector<size_t>{2, 3, 4, 5}));
  EXPECT_EQ(report.last_error, "timeout");
  EXPECT_EQ(report.retries, 2u);
  EXPECT_FALSE(report.vectors[0].empty());
  EXPECT_TRUE(report.vectors[2].empty());
}

TEST_F(BatchEmbedderTest, PermanentErrorsAreNotRetried) {
  EXPECT_CALL(*provider_, embed(_)).WillOnce(Throw(ProviderError("bad request", false)));

  auto report = embedder_->embed_batch(texts(2), model_, options_);

  EXPECT_FALSE(report.complete());
  EXPECT_EQ(report.retries, 0u);
  EXPECT_EQ(report.failed_indices.size(), 2u);
}

TEST_F(BatchEmbedderTest, WrongVectorLengthFailsTheBatch) {
  EXPECT_CALL(*provider_, embed(_))
      .WillOnce(::testing::Return(std::vector<std::vector<float>>{{1, 2}, {3, 4}}));

  auto report = embedder_->embed_batch(texts(2), model_, options_);

  EXPECT_FALSE(report.complete());
  EXPECT_THAT(report.last_error, ::testing::HasSubstr("length 2"));
}

TEST_F(BatchEmbedderTest, WrongVectorCountFailsTheBatch) {
  EXPECT_CALL(*provider_, embed(_))
      .WillOnce(::testing::Return(std::vector<std::vector<float>>(1, std::vector<float>(8, 1.0f))));

  auto report = embedder_->embed_batch(texts(2), model_, options_);

  EXPECT_FALSE(report.complete());
  EXPECT_EQ(report.retries, 0u);
}

TEST_F(BatchEmbedderTest, CancellationStopsBeforeTheNextBatch) {
  auto cancel = std::make_shared<CancellationToken>();
  EXPECT_CALL(*provider_, embed(_)).Times(1);

  auto report = embedder_->embed_batch(
      texts(6), model_, options_,
      [&](size_t, const std::vector<std::vector<float>> &) { cancel->cancel(); }, cancel);

  EXPECT_TRUE(report.cancelled);
  EXPECT_FALSE(report.complete());
  EXPECT_EQ(report.batches_succeeded, 1u);
}

TEST_F(BatchEmbedderTest, CancellationInterruptsBackoff) {
  options_.retry_base_delay = std::chrono::milliseconds(60000);
  options_.retry_max_delay = std::chrono::milliseconds(60000);
  auto cancel = std::make_shared<CancellationToken>();
  ON_CALL(*provider_, embed(_)).WillByDefault(Throw(ProviderError("unavailable", true)));

  std::thread canceller([cancel]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    cancel->cancel();
  });
  auto started = std::chrono::steady_clock::now();
  auto report = embedder_->embed_batch(texts(2), model_, options_, nullptr, cancel);
  canceller.join();

  EXPECT_TRUE(report.cancelled);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST_F(BatchEmbedderTest, EmbedQueryReturnsOneVectorOrThrows) {
  auto vector = embedder_->embed_query("disk error", model_, options_);
  EXPECT_EQ(vector.size(), 8u);

  ON_CALL(*provider_, embed(_)).WillByDefault(Throw(ProviderError("down", true)));
  EXPECT_THROW(embedder_->embed_query("disk error", model_, options_), ProviderError);
}

TEST_F(BatchEmbedderTest, UnknownProviderIsConfigurationError) {
  EXPECT_THROW(embedder_->embed_batch(texts(1), ModelId::parse("nope:model:8"), options_),
               ConfigurationError);
}

TEST_F(BatchEmbedderTest, InvalidOptionsAreRejected) {
  options_.batch_size = 0;
  EXPECT_THROW(embedder_->embed_batch(texts(1), model_, options_), ConfigurationError);
  EXPECT_THROW(BatchEmbedder(registry_, 0), ConfigurationError);
}

TEST(RequestLimiterTest, BoundsConcurrentCalls) {
  RequestLimiter limiter(2);
  std::atomic<int> peak{0};
  std::atomic<int> active{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&]() {
      RequestLimiter::Slot slot(limiter);
      int now = ++active;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      --active;
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_LE(peak.load(), 2);
  EXPECT_EQ(limiter.in_flight(), 0);
  EXPECT_EQ(limiter.max_concurrent(), 2);
}

}  // namespace loglens_core
