#include "loglens_core/storage/log_file_store.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include "loglens_core/types/errors.hpp"

namespace fs = std::filesystem;

namespace loglens_core {

FilesystemLogFileStore::FilesystemLogFileStore(fs::path root_directory,
                                               std::vector<std::string> log_extensions)
    : root_directory_(std::move(root_directory)), log_extensions_(std::move(log_extensions)) {
  for (auto &extension : log_extensions_) {
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  }
}

void validate_storage_name(const std::string &name, const char *what) {
  bool valid = !name.empty() && name != "." && name != ".." &&
               std::all_of(name.begin(), name.end(), [](unsigned char c) {
                 return std::isalnum(c) || c == '.' || c == '_' || c == '-';
               });
  if (!valid) {
    throw LogStoreError(std::string("Invalid ") + what + " '" + name +
                        "': use letters, digits, '.', '_' or '-'");
  }
}

fs::path FilesystemLogFileStore::issue_directory(const std::string &issue_id) const {
  validate_storage_name(issue_id, "issue id");
  return root_directory_ / "issues" / issue_id;
}

fs::path FilesystemLogFileStore::raw_logs_directory(const std::string &issue_id) const {
  return issue_directory(issue_id) / "raw_logs";
}

bool FilesystemLogFileStore::is_log_file(const fs::path &path) const {
  std::string extension = path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return std::find(log_extensions_.begin(), log_extensions_.end(), extension) !=
         log_extensions_.end();
}

std::vector<std::string> FilesystemLogFileStore::list_issues() const {
  std::vector<std::string> issues;
  const fs::path issues_root = root_directory_ / "issues";
  std::error_code ec;
  if (!fs::is_directory(issues_root, ec)) {
    return issues;
  }
  for (const auto &entry : fs::directory_iterator(issues_root)) {
    // Same test as issue_exists: a stray kb/ directory alone is not an issue.
    if (entry.is_directory() && fs::is_directory(entry.path() / "raw_logs", ec)) {
      issues.push_back(entry.path().filename().string());
    }
  }
  std::sort(issues.begin(), issues.end());
  return issues;
}

bool FilesystemLogFileStore::issue_exists(const std::string &issue_id) const {
  std::error_code ec;
  return fs::is_directory(raw_logs_directory(issue_id), ec);
}

void FilesystemLogFileStore::create_issue(const std::string &issue_id) {
  std::error_code ec;
  fs::create_directories(raw_logs_directory(issue_id), ec);
  if (ec) {
    throw LogStoreError("Failed to create issue '" + issue_id + "': " + ec.message());
  }
}

std::vector<LogFileInfo> FilesystemLogFileStore::list_files(const std::string &issue_id) const {
  if (!issue_exists(issue_id)) {
    throw LogStoreError("Issue '" + issue_id + "' does not exist");
  }
  std::vector<LogFileInfo> files;
  try {
    for (const auto &entry : fs::directory_iterator(raw_logs_directory(issue_id))) {
      if (entry.is_regular_file() && is_log_file(entry.path())) {
        files.push_back({entry.path().filename().string(), entry.file_size()});
      }
    }
  } catch (const fs::filesystem_error &e) {
    throw LogStoreError("Failed to list logs of issue '" + issue_id + "': " + e.what());
  }
  std::sort(files.begin(), files.end(),
            [](const LogFileInfo &a, const LogFileInfo &b) { return a.name < b.name; });
  return files;
}

std::string FilesystemLogFileStore::read_file(const std::string &issue_id,
                                              const std::string &name) const {
  validate_storage_name(name, "file name");
  const fs::path path = raw_logs_directory(issue_id) / name;
  std::ifstream file_stream(path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw LogStoreError("Could not open file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw LogStoreError("Failed reading file: " + path.string());
  }
  return buffer.str();
}

void FilesystemLogFileStore::add_file(const std::string &issue_id, const std::string &name,
                                      const std::string &content) {
  validate_storage_name(name, "file name");
  if (!is_log_file(name)) {
    throw LogStoreError("'" + name + "' does not have a log file extension");
  }
  create_issue(issue_id);

  const fs::path path = raw_logs_directory(issue_id) / name;
  if (fs::exists(path)) {
    throw LogStoreError("File '" + name + "' already exists in issue '" + issue_id + "'");
  }

  // Written under a temporary name so a listing never sees a partial file.
  const fs::path temp_path = raw_logs_directory(issue_id) / ("." + name + ".upload");
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw LogStoreError("Could not create file: " + temp_path.string());
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
      throw LogStoreError("Failed writing file: " + temp_path.string());
    }
  }
  std::error_code ec;
  fs::rename(temp_path, path, ec);
  if (ec) {
    const std::string reason = ec.message();
    fs::remove(temp_path, ec);
    throw LogStoreError("Failed to store '" + name + "': " + reason);
  }
}

std::string FilesystemLogFileStore::import_file(const std::string &issue_id,
                                                const fs::path &source) {
  std::ifstream file_stream(source, std::ios::binary);
  if (!file_stream.is_open()) {
    throw LogStoreError("Could not open file: " + source.string());
  }
  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  const std::string name = source.filename().string();
  add_file(issue_id, name, buffer.str());
  return name;
}

}  // namespace loglens_core
