#include <gtest/gtest.h>

#include "loglens_core/types/errors.hpp"
#include "loglens_core/types/options.hpp"

namespace loglens_core {

TEST(ChunkingOptionsTest, OverlapMustBeBelowChunkSize) {
  EXPECT_NO_THROW((ChunkingOptions{40, 10}.validate()));
  EXPECT_NO_THROW((ChunkingOptions{40, 0}.validate()));
  EXPECT_NO_THROW((ChunkingOptions{40, 39}.validate()));
  EXPECT_THROW((ChunkingOptions{40, 40}.validate()), ConfigurationError);
  EXPECT_THROW((ChunkingOptions{40, 50}.validate()), ConfigurationError);
  EXPECT_THROW((ChunkingOptions{0, 0}.validate()), ConfigurationError);
  EXPECT_THROW((ChunkingOptions{40, -1}.validate()), ConfigurationError);
}

TEST(EmbeddingOptionsTest, ValidatesBatchAndRetryLimits) {
  EmbeddingOptions options;
  EXPECT_NO_THROW(options.validate());

  options.batch_size = 0;
  EXPECT_THROW(options.validate(), ConfigurationError);

  options = EmbeddingOptions{};
  options.max_attempts = 0;
  EXPECT_THROW(options.validate(), ConfigurationError);

  options = EmbeddingOptions{};
  options.retry_base_delay = std::chrono::milliseconds(-1);
  EXPECT_THROW(options.validate(), ConfigurationError);
}

}  // namespace loglens_core
