#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace loglens_core {

// Issue ids and file names become path components under the workspace root. Letters,
// digits, '.', '_' and '-'; not "." or "..". Throws LogStoreError otherwise.
void validate_storage_name(const std::string &name, const char *what);

struct LogFileInfo {
  std::string name;
  uint64_t size = 0;
};

// Raw log files grouped by issue. Files are only ever added, never modified or removed.
class LogFileStore {
 public:
  virtual ~LogFileStore() = default;

  virtual std::vector<std::string> list_issues() const = 0;
  virtual bool issue_exists(const std::string &issue_id) const = 0;
  virtual void create_issue(const std::string &issue_id) = 0;

  // Sorted by name.
  virtual std::vector<LogFileInfo> list_files(const std::string &issue_id) const = 0;
  virtual std::string read_file(const std::string &issue_id, const std::string &name) const = 0;

  // Throws LogStoreError if a file with that name already exists.
  virtual void add_file(const std::string &issue_id, const std::string &name,
                        const std::string &content) = 0;
};

// <root>/issues/<issue_id>/raw_logs/<name>, filtered by extension.
class FilesystemLogFileStore : public LogFileStore {
 public:
  FilesystemLogFileStore(std::filesystem::path root_directory,
                         std::vector<std::string> log_extensions);

  std::vector<std::string> list_issues() const override;
  bool issue_exists(const std::string &issue_id) const override;
  void create_issue(const std::string &issue_id) override;

  std::vector<LogFileInfo> list_files(const std::string &issue_id) const override;
  std::string read_file(const std::string &issue_id, const std::string &name) const override;
  void add_file(const std::string &issue_id, const std::string &name,
                const std::string &content) override;

  // Copies a file from anywhere on disk into the issue, keeping its file name.
  std::string import_file(const std::string &issue_id, const std::filesystem::path &source);

  bool is_log_file(const std::filesystem::path &path) const;

  std::filesystem::path issue_directory(const std::string &issue_id) const;
  std::filesystem::path raw_logs_directory(const std::string &issue_id) const;

 private:
  std::filesystem::path root_directory_;
  std::vector<std::string> log_extensions_;
};

}  // namespace loglens_core
