#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace loglens_core {

enum class BuildStatus { Succeeded, UpToDate, Failed, Cancelled };
enum class CommitMode { None, Rebuild, Append };

std::string to_string(BuildStatus status);
BuildStatus build_status_from_string(const std::string &str);
std::string to_string(CommitMode mode);
CommitMode commit_mode_from_string(const std::string &str);

struct BuildReport {
  std::string issue_id;
  BuildStatus status = BuildStatus::Failed;
  CommitMode commit_mode = CommitMode::None;
  // Chunks in the index this build produced (or would have produced).
  size_t chunks_processed = 0;
  size_t cache_hits = 0;
  size_t cache_misses = 0;
  // Chunks left without a vector because their batch failed.
  size_t embedding_failures = 0;
  size_t cache_rejections = 0;
  std::vector<std::string> new_files;
  std::string model_id;
  uint64_t generation = 0;  // committed generation, 0 when nothing was committed
  std::string started_at;
  std::string finished_at;
  std::string error;

  bool ok() const {
    return status == BuildStatus::Succeeded || status == BuildStatus::UpToDate;
  }
};

void to_json(nlohmann::json &j, const BuildReport &report);
void from_json(const nlohmann::json &j, BuildReport &report);

// A build step failed for a reason other than the embedding provider (unreadable log file,
// cache I/O, index write). Nothing was committed.
class BuildFailure : public std::runtime_error {
 public:
  explicit BuildFailure(BuildReport report)
      : std::runtime_error("Knowledge base build for issue '" + report.issue_id +
                           "' failed: " + report.error),
        report_(std::move(report)) {}

  const BuildReport &report() const {
    return report_;
  }

 private:
  BuildReport report_;
};

}  // namespace loglens_core
