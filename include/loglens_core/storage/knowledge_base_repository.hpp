#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "loglens_core/storage/knowledge_base.hpp"
#include "loglens_core/types/build_report.hpp"

namespace loglens_core {

/**
 * @brief On-disk generations of each issue's knowledge base.
 *
 * Layout under <root>/issues/<issue_id>/kb/:
 *   CURRENT              name of the committed generation directory
 *   gen-000001/          vectors.bin, chunks.jsonl, metadata.json
 *   build_status.json    outcome of the last build attempt
 *
 * A commit writes a complete gen-NNNNNN.tmp directory, renames it into place and then
 * replaces CURRENT through a rename, so readers see either the old or the new generation.
 */
class KnowledgeBaseRepository {
 public:
  explicit KnowledgeBaseRepository(std::filesystem::path root_directory);

  std::filesystem::path kb_directory(const std::string &issue_id) const;

  // Generation named by CURRENT, if any.
  std::optional<uint64_t> current_generation(const std::string &issue_id) const;

  // nullptr when the issue has no committed knowledge base. Throws IndexFormatError if the
  // committed generation cannot be read.
  std::shared_ptr<const KnowledgeBase> load(const std::string &issue_id, bool mapped) const;

  std::optional<KnowledgeBaseMetadata> load_metadata(const std::string &issue_id) const;

  // Publishes `index` as the next generation. Fills in the generation, the index-derived
  // fields and a models_history entry when the model changed; returns the generation.
  uint64_t commit(const std::string &issue_id, const VectorIndex &index,
                  KnowledgeBaseMetadata &metadata);

  void write_build_status(const std::string &issue_id, const BuildReport &report);
  std::optional<BuildReport> read_build_status(const std::string &issue_id) const;

  static std::string generation_name(uint64_t generation);

  static constexpr const char *kCurrentFile = "CURRENT";
  static constexpr const char *kMetadataFile = "metadata.json";
  static constexpr const char *kBuildStatusFile = "build_status.json";

 private:
  static std::optional<uint64_t> parse_generation_name(const std::string &name);
  uint64_t next_generation(const std::filesystem::path &kb_dir) const;
  void remove_stale_generations(const std::filesystem::path &kb_dir, uint64_t keep_from) const;

  std::filesystem::path root_directory_;
};

}  // namespace loglens_core
