#include "loglens_core/storage/knowledge_base_repository.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

#include "loglens_core/storage/log_file_store.hpp"
#include "loglens_core/types/errors.hpp"

namespace fs = std::filesystem;

namespace loglens_core {

namespace {

void write_text_file(const fs::path &path, const std::string &content) {
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    throw IndexFormatError("Cannot write " + path.string());
  }
  out << content;
  out.flush();
  if (!out) {
    throw IndexFormatError("Failed writing " + path.string());
  }
}

std::optional<std::string> read_text_file(const fs::path &path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

}  // namespace

KnowledgeBaseRepository::KnowledgeBaseRepository(fs::path root_directory)
    : root_directory_(std::move(root_directory)) {}

fs::path KnowledgeBaseRepository::kb_directory(const std::string &issue_id) const {
  validate_storage_name(issue_id, "issue id");
  return root_directory_ / "issues" / issue_id / "kb";
}

std::string KnowledgeBaseRepository::generation_name(uint64_t generation) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "gen-%06llu", static_cast<unsigned long long>(generation));
  return buffer;
}

std::optional<uint64_t> KnowledgeBaseRepository::parse_generation_name(const std::string &name) {
  const std::string prefix = "gen-";
  if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
    return std::nullopt;
  }
  const std::string digits = name.substr(prefix.size());
  if (digits.size() > 18 ||
      !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return std::nullopt;
  }
  return std::stoull(digits);
}

std::optional<uint64_t> KnowledgeBaseRepository::current_generation(
    const std::string &issue_id) const {
  auto content = read_text_file(kb_directory(issue_id) / kCurrentFile);
  if (!content) {
    return std::nullopt;
  }
  std::string name = *content;
  name.erase(std::remove_if(name.begin(), name.end(),
                            [](unsigned char c) { return std::isspace(c); }),
             name.end());
  auto generation = parse_generation_name(name);
  if (!generation) {
    throw IndexFormatError("CURRENT of issue '" + issue_id + "' names no generation: '" + name +
                           "'");
  }
  return generation;
}

std::optional<KnowledgeBaseMetadata> KnowledgeBaseRepository::load_metadata(
    const std::string &issue_id) const {
  auto generation = current_generation(issue_id);
  if (!generation) {
    return std::nullopt;
  }
  const fs::path path = kb_directory(issue_id) / generation_name(*generation) / kMetadataFile;
  auto content = read_text_file(path);
  if (!content) {
    throw IndexFormatError("Missing " + path.string());
  }
  try {
    return nlohmann::json::parse(*content).get<KnowledgeBaseMetadata>();
  } catch (const nlohmann::json::exception &e) {
    throw IndexFormatError("Malformed " + path.string() + ": " + e.what());
  } catch (const std::invalid_argument &e) {
    throw IndexFormatError("Malformed " + path.string() + ": " + e.what());
  }
}

std::shared_ptr<const KnowledgeBase> KnowledgeBaseRepository::load(const std::string &issue_id,
                                                                   bool mapped) const {
  auto metadata = load_metadata(issue_id);
  if (!metadata) {
    return nullptr;
  }
  const fs::path directory = kb_directory(issue_id) / generation_name(metadata->generation);
  VectorIndex index = VectorIndex::load(directory, mapped);

  if (index.model().str() != metadata->model_id) {
    throw IndexFormatError("Generation " + directory.string() + " holds vectors of " +
                           index.model().str() + " but metadata names " + metadata->model_id);
  }
  if (index.size() != metadata->chunk_count) {
    throw IndexFormatError("Generation " + directory.string() + " holds " +
                           std::to_string(index.size()) + " chunks but metadata names " +
                           std::to_string(metadata->chunk_count));
  }

  return std::make_shared<const KnowledgeBase>(
      KnowledgeBase{std::move(*metadata), std::move(index), directory});
}

uint64_t KnowledgeBaseRepository::next_generation(const fs::path &kb_dir) const {
  uint64_t highest = 0;
  std::error_code ec;
  if (fs::is_directory(kb_dir, ec)) {
    for (const auto &entry : fs::directory_iterator(kb_dir)) {
      auto generation = parse_generation_name(entry.path().filename().string());
      if (generation) {
        highest = std::max(highest, *generation);
      }
    }
  }
  return highest + 1;
}

void KnowledgeBaseRepository::remove_stale_generations(const fs::path &kb_dir,
                                                       uint64_t keep_from) const {
  std::vector<fs::path> doomed;
  for (const auto &entry : fs::directory_iterator(kb_dir)) {
    const std::string name = entry.path().filename().string();
    bool stale_temp = name.size() > 4 && name.compare(name.size() - 4, 4, ".tmp") == 0 &&
                      name.compare(0, 4, "gen-") == 0;
    auto generation = parse_generation_name(name);
    if (stale_temp || (generation && *generation < keep_from)) {
      doomed.push_back(entry.path());
    }
  }
  for (const auto &path : doomed) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
      std::cerr << "[KnowledgeBaseRepository] Could not remove " << path << ": " << ec.message()
                << std::endl;
    }
  }
}

uint64_t KnowledgeBaseRepository::commit(const std::string &issue_id, const VectorIndex &index,
                                         KnowledgeBaseMetadata &metadata) {
  const fs::path kb_dir = kb_directory(issue_id);
  fs::create_directories(kb_dir);

  const uint64_t generation = next_generation(kb_dir);
  const std::string name = generation_name(generation);
  const fs::path temp_dir = kb_dir / (name + ".tmp");
  const fs::path final_dir = kb_dir / name;

  fs::remove_all(temp_dir);
  metadata.generation = generation;
  metadata.issue_id = issue_id;
  metadata.model_id = index.model().str();
  metadata.dimension = index.model().dimension;
  metadata.chunk_count = index.size();
  if (metadata.models_history.empty() ||
      metadata.models_history.back().model_id != metadata.model_id) {
    metadata.models_history.push_back({metadata.model_id, generation, metadata.built_at});
  }

  index.save(temp_dir);
  write_text_file(temp_dir / kMetadataFile, nlohmann::json(metadata).dump(2));
  fs::rename(temp_dir, final_dir);

  // Publishing point: until this rename, readers still resolve the previous generation.
  const fs::path current_temp = kb_dir / (std::string(kCurrentFile) + ".tmp");
  write_text_file(current_temp, name + "\n");
  fs::rename(current_temp, kb_dir / kCurrentFile);

  // Keep the previous generation for readers that resolved CURRENT just before the swap.
  remove_stale_generations(kb_dir, generation > 1 ? generation - 1 : generation);
  return generation;
}

void KnowledgeBaseRepository::write_build_status(const std::string &issue_id,
                                                 const BuildReport &report) {
  const fs::path kb_dir = kb_directory(issue_id);
  fs::create_directories(kb_dir);
  const fs::path temp = kb_dir / (std::string(kBuildStatusFile) + ".tmp");
  write_text_file(temp, nlohmann::json(report).dump(2));
  fs::rename(temp, kb_dir / kBuildStatusFile);
}

std::optional<BuildReport> KnowledgeBaseRepository::read_build_status(
    const std::string &issue_id) const {
  const fs::path path = kb_directory(issue_id) / kBuildStatusFile;
  auto content = read_text_file(path);
  if (!content) {
    return std::nullopt;
  }
  try {
    return nlohmann::json::parse(*content).get<BuildReport>();
  } catch (const nlohmann::json::exception &e) {
    throw IndexFormatError("Malformed " + path.string() + ": " + e.what());
  } catch (const std::invalid_argument &e) {
    throw IndexFormatError("Malformed " + path.string() + ": " + e.what());
  }
}

}  // namespace loglens_core
