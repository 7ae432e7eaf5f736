#pragma once

#include <sqlite_modern_cpp.h>

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "loglens_core/db/database_manager.hpp"
#include "loglens_core/model_id.hpp"

namespace loglens_core {

class EmbeddingCacheError : public std::exception {
 public:
  explicit EmbeddingCacheError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

enum class CachePutResult {
  Inserted,
  Unchanged,  // the same vector was already stored
  Rejected    // a different vector is stored for the key; the stored one wins
};

inline std::string to_string(CachePutResult result) {
  switch (result) {
    case CachePutResult::Inserted:
      return "inserted";
    case CachePutResult::Unchanged:
      return "unchanged";
    case CachePutResult::Rejected:
      return "rejected";
    default:
      return "unknown";
  }
}

/**
 * @brief Content-addressed vector store keyed by (content_hash, model_id).
 *
 * Entries are never overwritten. The cache is not scoped to an issue, so identical text in
 * two issues embedded by the same model shares one row.
 */
class EmbeddingCache {
 public:
  explicit EmbeddingCache(DatabaseManager &db_manager);

  EmbeddingCache(const EmbeddingCache &) = delete;
  EmbeddingCache &operator=(const EmbeddingCache &) = delete;

  std::optional<std::vector<float>> get(const std::string &content_hash, const ModelId &model);

  // Hits only; hashes without an entry are absent from the result.
  std::unordered_map<std::string, std::vector<float>> get_many(
      const std::vector<std::string> &content_hashes, const ModelId &model);

  // Throws ModelMismatchError when the vector length differs from the model's dimension.
  CachePutResult put(const std::string &content_hash, const ModelId &model,
                     const std::vector<float> &vector);

  // All entries are written in one transaction. Results are in input order.
  std::vector<CachePutResult> put_many(
      const std::vector<std::pair<std::string, std::vector<float>>> &entries, const ModelId &model);

  size_t count();
  size_t count(const ModelId &model);

  // Evicts the oldest rows until at most max_entries remain. 0 disables pruning.
  size_t prune(size_t max_entries);

 private:
  CachePutResult put_in_transaction(sqlite::database &db, const std::string &content_hash,
                                    const ModelId &model, const std::vector<float> &vector);
  static void check_dimension(const ModelId &model, const std::vector<float> &vector);

  static std::vector<char> to_blob(const std::vector<float> &vector);
  static std::vector<float> from_blob(const std::vector<char> &blob);

  DatabaseManager &db_manager_;
};

}  // namespace loglens_core
