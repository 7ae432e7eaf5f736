#include "loglens_core/types/chunk.hpp"

namespace loglens_core {

void to_json(nlohmann::json &j, const Chunk &chunk) {
  j = nlohmann::json{{"chunk_id", chunk.chunk_id},
                     {"source_file", chunk.source_file},
                     {"line_start", chunk.line_start},
                     {"line_end", chunk.line_end},
                     {"byte_start", chunk.byte_start},
                     {"byte_end", chunk.byte_end},
                     {"text", chunk.text},
                     {"content_hash", chunk.content_hash}};
  if (chunk.timestamp_range) {
    j["timestamp_range"] = {chunk.timestamp_range->first, chunk.timestamp_range->second};
  }
}

void from_json(const nlohmann::json &j, Chunk &chunk) {
  j.at("chunk_id").get_to(chunk.chunk_id);
  j.at("source_file").get_to(chunk.source_file);
  j.at("line_start").get_to(chunk.line_start);
  j.at("line_end").get_to(chunk.line_end);
  chunk.byte_start = j.value("byte_start", static_cast<size_t>(0));
  chunk.byte_end = j.value("byte_end", static_cast<size_t>(0));
  j.at("text").get_to(chunk.text);
  j.at("content_hash").get_to(chunk.content_hash);

  chunk.timestamp_range.reset();
  if (j.contains("timestamp_range") && j["timestamp_range"].is_array() &&
      j["timestamp_range"].size() == 2) {
    chunk.timestamp_range = std::make_pair(j["timestamp_range"][0].get<std::string>(),
                                           j["timestamp_range"][1].get<std::string>());
  }
}

}  // namespace loglens_core
