#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace loglens_core {

struct Chunk {
  std::string chunk_id;
  std::string text;
  std::string source_file;
  int line_start = 0;  // 1-based, inclusive
  int line_end = 0;
  size_t byte_start = 0;  // offsets into the raw file, end exclusive
  size_t byte_end = 0;
  std::string content_hash;
  std::optional<std::pair<std::string, std::string>> timestamp_range;

  bool operator==(const Chunk &other) const = default;
};

struct ChunkWithVector {
  Chunk chunk;
  std::vector<float> vector;
};

// A search hit: the chunk, its cosine similarity to the query and its index position.
struct RetrievedChunk {
  Chunk chunk;
  float score = 0.0f;
  size_t position = 0;

  // "<file>: lines <start>-<end>"
  std::string citation() const {
    return chunk.source_file + ": lines " + std::to_string(chunk.line_start) + "-" +
           std::to_string(chunk.line_end);
  }
};

void to_json(nlohmann::json &j, const Chunk &chunk);
void from_json(const nlohmann::json &j, Chunk &chunk);

}  // namespace loglens_core
