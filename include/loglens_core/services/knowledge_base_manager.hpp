#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "loglens_core/chunking/chunker.hpp"
#include "loglens_core/db/embedding_cache.hpp"
#include "loglens_core/embedding/batch_embedder.hpp"
#include "loglens_core/embedding/cancellation_token.hpp"
#include "loglens_core/storage/knowledge_base_repository.hpp"
#include "loglens_core/storage/log_file_store.hpp"
#include "loglens_core/types/build_report.hpp"
#include "loglens_core/types/options.hpp"

namespace loglens_core {

class Config;

enum class BuildStage { Collect, Chunk, Resolve, Embed, Commit };
std::string to_string(BuildStage stage);

// done/total are stage specific: files for Chunk, batches for Embed.
using BuildProgressCallback = std::function<void(BuildStage stage, size_t done, size_t total)>;

struct BuildOptions {
  std::string model_id;
  bool force_rebuild = false;
  ChunkingOptions chunking;
  EmbeddingOptions embedding;
  CancellationTokenPtr cancel;
  BuildProgressCallback progress;

  static BuildOptions from_config(const Config &config);
};

struct ManagerSettings {
  bool use_memory_map = true;
  size_t max_cache_entries = 0;  // 0 disables pruning
};

struct KnowledgeBaseStatus {
  std::optional<KnowledgeBaseMetadata> committed;
  std::optional<BuildReport> last_build;
};

/**
 * @brief Builds and publishes the knowledge base of each issue.
 *
 * update() runs collect, chunk, resolve (cache lookup), embed and commit. Nothing becomes
 * visible before the commit succeeds: readers keep the previous snapshot until it is swapped,
 * and a failed or cancelled build only records its outcome in build_status.json.
 *
 * Updates of one issue are serialised; updates of different issues may run concurrently.
 */
class KnowledgeBaseManager {
 public:
  // `cache` may be null to build without an embedding cache.
  KnowledgeBaseManager(LogFileStore &log_store, KnowledgeBaseRepository &repository,
                       EmbeddingCache *cache, BatchEmbedder &embedder, ManagerSettings settings);

  KnowledgeBaseManager(const KnowledgeBaseManager &) = delete;
  KnowledgeBaseManager &operator=(const KnowledgeBaseManager &) = delete;

  // Invalid options throw ConfigurationError and an invalid or unknown issue id throws
  // LogStoreError, both before anything is read or recorded. Provider exhaustion and
  // cancellation come back as Failed/Cancelled reports; any other failure throws BuildFailure.
  BuildReport update(const std::string &issue_id, const BuildOptions &options);

  // The committed knowledge base, or nullptr when the issue has none.
  std::shared_ptr<const KnowledgeBase> snapshot(const std::string &issue_id);

  KnowledgeBaseStatus status(const std::string &issue_id);

 private:
  struct ChunkedFile {
    SourceFileRecord record;
    std::vector<Chunk> chunks;
  };

  std::mutex &issue_mutex(const std::string &issue_id);
  void publish(const std::string &issue_id, std::shared_ptr<const KnowledgeBase> kb);
  std::shared_ptr<const KnowledgeBase> load_current(const std::string &issue_id,
                                                    bool force_rebuild);

  std::vector<ChunkedFile> chunk_files(const std::string &issue_id,
                                       const std::vector<LogFileInfo> &files,
                                       const Chunker &chunker, const BuildOptions &options);

  BuildReport finish(BuildReport report);

  LogFileStore &log_store_;
  KnowledgeBaseRepository &repository_;
  EmbeddingCache *cache_;
  BatchEmbedder &embedder_;
  ManagerSettings settings_;

  std::mutex issue_locks_mutex_;
  std::map<std::string, std::unique_ptr<std::mutex>> issue_locks_;

  std::mutex snapshots_mutex_;
  std::unordered_map<std::string, std::shared_ptr<const KnowledgeBase>> snapshots_;
};

}  // namespace loglens_core
