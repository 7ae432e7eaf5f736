#pragma once

#include <gmock/gmock.h>

#include <string>
#include <vector>

#include "loglens_core/embedding/embedding_provider.hpp"
#include "loglens_core/embedding/hashing_embedding_provider.hpp"
#include "loglens_core/llm/text_generator.hpp"
#include "loglens_core/types/chunk.hpp"

namespace loglens_tests {

/**
 * Mock embedding provider. By default it answers like the hashing embedder, so texts that
 * share words get similar vectors and results are reproducible.
 */
class MockEmbeddingProvider : public loglens_core::EmbeddingProvider {
 public:
  explicit MockEmbeddingProvider(loglens_core::ModelId model)
      : model_(model), hashing_(std::move(model)) {
    ON_CALL(*this, embed(testing::_))
        .WillByDefault([this](const std::vector<std::string> &texts) {
          return hashing_.embed(texts);
        });
  }

  const loglens_core::ModelId &model() const override {
    return model_;
  }

  MOCK_METHOD(std::vector<std::vector<float>>, embed, (const std::vector<std::string> &texts),
              (override));

  // Delegates to the default behaviour; handy inside WillOnce chains.
  std::vector<std::vector<float>> embed_for_real(const std::vector<std::string> &texts) {
    return hashing_.embed(texts);
  }

 private:
  loglens_core::ModelId model_;
  loglens_core::HashingEmbeddingProvider hashing_;
};

/**
 * Mock text generator for the question answering path
 */
class MockTextGenerator : public loglens_core::TextGenerator {
 public:
  MockTextGenerator() {
    ON_CALL(*this, model_name()).WillByDefault(testing::Return("mock-llm"));
  }

  MOCK_METHOD(std::string, generate, (const std::string &prompt), (override));
  MOCK_METHOD(std::string, model_name, (), (const, override));
};

/**
 * Utility functions for creating test data in tests
 */
namespace MockUtilities {

inline loglens_core::Chunk create_test_chunk(const std::string &source_file, int line_start,
                                             int line_end, const std::string &text) {
  loglens_core::Chunk chunk;
  chunk.chunk_id = source_file + ":" + std::to_string(line_start) + "-" + std::to_string(line_end);
  chunk.source_file = source_file;
  chunk.line_start = line_start;
  chunk.line_end = line_end;
  chunk.text = text;
  chunk.content_hash = "hash-" + chunk.chunk_id;
  return chunk;
}

inline loglens_core::RetrievedChunk create_retrieved_chunk(const std::string &source_file,
                                                           int line_start, int line_end,
                                                           const std::string &text,
                                                           float score = 0.5f) {
  loglens_core::RetrievedChunk retrieved;
  retrieved.chunk = create_test_chunk(source_file, line_start, line_end, text);
  retrieved.score = score;
  return retrieved;
}

}  // namespace MockUtilities

}  // namespace loglens_tests
