#include "loglens_core/types/options.hpp"

#include <string>

#include "loglens_core/types/errors.hpp"

namespace loglens_core {

void ChunkingOptions::validate() const {
  if (chunk_size <= 0) {
    throw ConfigurationError("chunk_size must be greater than 0, got " +
                             std::to_string(chunk_size));
  }
  if (overlap < 0) {
    throw ConfigurationError("overlap must not be negative, got " + std::to_string(overlap));
  }
  if (overlap >= chunk_size) {
    throw ConfigurationError("overlap (" + std::to_string(overlap) +
                             ") must be strictly less than chunk_size (" +
                             std::to_string(chunk_size) + ")");
  }
}

void EmbeddingOptions::validate() const {
  if (batch_size == 0) {
    throw ConfigurationError("embedding batch size must be greater than 0");
  }
  if (max_attempts < 1) {
    throw ConfigurationError("max_attempts must be at least 1");
  }
  if (retry_base_delay.count() < 0 || retry_max_delay.count() < 0) {
    throw ConfigurationError("retry delays must not be negative");
  }
}

}  // namespace loglens_core
