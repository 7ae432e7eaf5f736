#pragma once

#include <chrono>
#include <cstddef>

namespace loglens_core {

struct ChunkingOptions {
  int chunk_size = 800;  // characters (code points)
  int overlap = 100;

  // Throws ConfigurationError when overlap >= chunk_size or either is out of range.
  void validate() const;
};

struct EmbeddingOptions {
  size_t batch_size = 32;
  int max_attempts = 3;  // provider calls per batch, including the first
  std::chrono::milliseconds retry_base_delay{500};
  std::chrono::milliseconds retry_max_delay{8000};

  void validate() const;
};

}  // namespace loglens_core
