#pragma once

#include <stdexcept>
#include <string>

namespace loglens_core {

// Invalid chunking parameters, invalid top_k, malformed model ids, bad config files.
// Raised before any build or query work starts.
class ConfigurationError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

class ProviderError : public std::exception {
 public:
  ProviderError(const std::string &message, bool transient)
      : message_(message), transient_(transient) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  // Network failures, timeouts and rate limits are transient and worth retrying.
  // A malformed response or a wrong vector length is not.
  bool transient() const noexcept {
    return transient_;
  }

 private:
  std::string message_;
  bool transient_;
};

class ModelMismatchError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Querying an issue that has never been built successfully.
class KnowledgeBaseNotFoundError : public ModelMismatchError {
 public:
  explicit KnowledgeBaseNotFoundError(const std::string &issue_id)
      : ModelMismatchError("No knowledge base has been built for issue '" + issue_id + "'"),
        issue_id_(issue_id) {}

  const std::string &issue_id() const {
    return issue_id_;
  }

 private:
  std::string issue_id_;
};

// A cached (content_hash, model_id) key was offered a different vector.
class ConsistencyViolation : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class IndexFormatError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class LogStoreError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace loglens_core
