#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "loglens_core/index/vector_index.hpp"
#include "loglens_core/types/build_report.hpp"

namespace loglens_core {

struct SourceFileRecord {
  std::string name;
  uint64_t size = 0;
  std::string sha256;
  size_t chunk_count = 0;
};

struct ModelHistoryEntry {
  std::string model_id;
  uint64_t generation = 0;  // first generation built with this model
  std::string built_at;
};

struct KnowledgeBaseMetadata {
  std::string issue_id;
  std::string model_id;
  size_t dimension = 0;
  size_t chunk_count = 0;
  std::string built_at;
  uint64_t generation = 0;
  CommitMode commit_mode = CommitMode::Rebuild;
  std::vector<SourceFileRecord> source_files;
  std::vector<ModelHistoryEntry> models_history;
};

void to_json(nlohmann::json &j, const SourceFileRecord &record);
void from_json(const nlohmann::json &j, SourceFileRecord &record);
void to_json(nlohmann::json &j, const ModelHistoryEntry &entry);
void from_json(const nlohmann::json &j, ModelHistoryEntry &entry);
void to_json(nlohmann::json &j, const KnowledgeBaseMetadata &metadata);
void from_json(const nlohmann::json &j, KnowledgeBaseMetadata &metadata);

// One committed generation of an issue's knowledge base. Immutable once published.
struct KnowledgeBase {
  KnowledgeBaseMetadata metadata;
  VectorIndex index;
  std::filesystem::path directory;
};

}  // namespace loglens_core
