#include "loglens_core/storage/knowledge_base.hpp"

#include "loglens_core/types/build_report.hpp"

namespace loglens_core {

std::string to_string(BuildStatus status) {
  switch (status) {
    case BuildStatus::Succeeded:
      return "succeeded";
    case BuildStatus::UpToDate:
      return "up_to_date";
    case BuildStatus::Failed:
      return "failed";
    case BuildStatus::Cancelled:
      return "cancelled";
    default:
      return "unknown";
  }
}

BuildStatus build_status_from_string(const std::string &str) {
  if (str == "succeeded")
    return BuildStatus::Succeeded;
  if (str == "up_to_date")
    return BuildStatus::UpToDate;
  if (str == "failed")
    return BuildStatus::Failed;
  if (str == "cancelled")
    return BuildStatus::Cancelled;
  throw std::invalid_argument("Unknown BuildStatus: " + str);
}

std::string to_string(CommitMode mode) {
  switch (mode) {
    case CommitMode::Rebuild:
      return "rebuild";
    case CommitMode::Append:
      return "append";
    default:
      return "none";
  }
}

CommitMode commit_mode_from_string(const std::string &str) {
  if (str == "rebuild")
    return CommitMode::Rebuild;
  if (str == "append")
    return CommitMode::Append;
  if (str == "none")
    return CommitMode::None;
  throw std::invalid_argument("Unknown CommitMode: " + str);
}

void to_json(nlohmann::json &j, const BuildReport &report) {
  j = nlohmann::json{{"issue_id", report.issue_id},
                     {"status", to_string(report.status)},
                     {"commit_mode", to_string(report.commit_mode)},
                     {"chunks_processed", report.chunks_processed},
                     {"cache_hits", report.cache_hits},
                     {"cache_misses", report.cache_misses},
                     {"embedding_failures", report.embedding_failures},
                     {"cache_rejections", report.cache_rejections},
                     {"new_files", report.new_files},
                     {"model_id", report.model_id},
                     {"generation", report.generation},
                     {"started_at", report.started_at},
                     {"finished_at", report.finished_at},
                     {"error", report.error}};
}

void from_json(const nlohmann::json &j, BuildReport &report) {
  report.issue_id = j.value("issue_id", std::string());
  report.status = build_status_from_string(j.at("status").get<std::string>());
  report.commit_mode = commit_mode_from_string(j.value("commit_mode", std::string("none")));
  report.chunks_processed = j.value("chunks_processed", static_cast<size_t>(0));
  report.cache_hits = j.value("cache_hits", static_cast<size_t>(0));
  report.cache_misses = j.value("cache_misses", static_cast<size_t>(0));
  report.embedding_failures = j.value("embedding_failures", static_cast<size_t>(0));
  report.cache_rejections = j.value("cache_rejections", static_cast<size_t>(0));
  report.new_files = j.value("new_files", std::vector<std::string>{});
  report.model_id = j.value("model_id", std::string());
  report.generation = j.value("generation", static_cast<uint64_t>(0));
  report.started_at = j.value("started_at", std::string());
  report.finished_at = j.value("finished_at", std::string());
  report.error = j.value("error", std::string());
}

void to_json(nlohmann::json &j, const SourceFileRecord &record) {
  j = nlohmann::json{{"name", record.name},
                     {"size", record.size},
                     {"sha256", record.sha256},
                     {"chunk_count", record.chunk_count}};
}

void from_json(const nlohmann::json &j, SourceFileRecord &record) {
  j.at("name").get_to(record.name);
  record.size = j.value("size", static_cast<uint64_t>(0));
  record.sha256 = j.value("sha256", std::string());
  record.chunk_count = j.value("chunk_count", static_cast<size_t>(0));
}

void to_json(nlohmann::json &j, const ModelHistoryEntry &entry) {
  j = nlohmann::json{
      {"model_id", entry.model_id}, {"generation", entry.generation}, {"built_at", entry.built_at}};
}

void from_json(const nlohmann::json &j, ModelHistoryEntry &entry) {
  j.at("model_id").get_to(entry.model_id);
  entry.generation = j.value("generation", static_cast<uint64_t>(0));
  entry.built_at = j.value("built_at", std::string());
}

void to_json(nlohmann::json &j, const KnowledgeBaseMetadata &metadata) {
  j = nlohmann::json{{"issue_id", metadata.issue_id},
                     {"model_id", metadata.model_id},
                     {"dimension", metadata.dimension},
                     {"chunk_count", metadata.chunk_count},
                     {"built_at", metadata.built_at},
                     {"generation", metadata.generation},
                     {"commit_mode", to_string(metadata.commit_mode)},
                     {"source_files", metadata.source_files},
                     {"models_history", metadata.models_history}};
}

void from_json(const nlohmann::json &j, KnowledgeBaseMetadata &metadata) {
  j.at("issue_id").get_to(metadata.issue_id);
  j.at("model_id").get_to(metadata.model_id);
  j.at("dimension").get_to(metadata.dimension);
  j.at("chunk_count").get_to(metadata.chunk_count);
  metadata.built_at = j.value("built_at", std::string());
  metadata.generation = j.value("generation", static_cast<uint64_t>(0));
  metadata.commit_mode = commit_mode_from_string(j.value("commit_mode", std::string("rebuild")));
  metadata.source_files = j.value("source_files", std::vector<SourceFileRecord>{});
  metadata.models_history = j.value("models_history", std::vector<ModelHistoryEntry>{});
}

}  // namespace loglens_core
