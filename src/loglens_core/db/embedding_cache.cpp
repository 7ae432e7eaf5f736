#include "loglens_core/db/embedding_cache.hpp"

#include <cstdint>
#include <cstring>
#include <iostream>

#include "loglens_core/db/pooled_connection.hpp"
#include "loglens_core/db/sqlite_error_utils.hpp"
#include "loglens_core/db/transaction.hpp"
#include "loglens_core/time_utils.hpp"
#include "loglens_core/types/errors.hpp"

namespace loglens_core {

EmbeddingCache::EmbeddingCache(DatabaseManager &db_manager) : db_manager_(db_manager) {}

std::vector<char> EmbeddingCache::to_blob(const std::vector<float> &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  std::memcpy(blob.data(), vector.data(), blob.size());
  return blob;
}

std::vector<float> EmbeddingCache::from_blob(const std::vector<char> &blob) {
  std::vector<float> vector(blob.size() / sizeof(float));
  std::memcpy(vector.data(), blob.data(), vector.size() * sizeof(float));
  return vector;
}

void EmbeddingCache::check_dimension(const ModelId &model, const std::vector<float> &vector) {
  if (vector.size() != model.dimension) {
    throw ModelMismatchError("Vector of length " + std::to_string(vector.size()) +
                             " does not match dimension " + std::to_string(model.dimension) +
                             " of model " + model.str());
  }
}

std::optional<std::vector<float>> EmbeddingCache::get(const std::string &content_hash,
                                                      const ModelId &model) {
  try {
    PooledConnection conn(db_manager_, "embedding_cache.get");
    std::optional<std::vector<float>> result;
    *conn << "SELECT vector_blob FROM embedding_cache WHERE content_hash = ? AND model_id = ?"
          << content_hash << model.str() >>
        [&](std::vector<char> blob) { result = from_blob(blob); };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw EmbeddingCacheError(format_db_error("embedding_cache.get", e));
  } catch (const DatabaseUnavailableError &e) {
    throw EmbeddingCacheError(e.what());
  }
}

std::unordered_map<std::string, std::vector<float>> EmbeddingCache::get_many(
    const std::vector<std::string> &content_hashes, const ModelId &model) {
  std::unordered_map<std::string, std::vector<float>> hits;
  if (content_hashes.empty()) {
    return hits;
  }
  try {
    PooledConnection conn(db_manager_, "embedding_cache.get_many");
    Transaction tx(*conn);
    const std::string model_key = model.str();
    for (const auto &hash : content_hashes) {
      if (hits.count(hash)) {
        continue;
      }
      *conn << "SELECT vector_blob FROM embedding_cache WHERE content_hash = ? AND model_id = ?"
            << hash << model_key >>
          [&](std::vector<char> blob) { hits.emplace(hash, from_blob(blob)); };
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw EmbeddingCacheError(format_db_error("embedding_cache.get_many", e));
  } catch (const DatabaseUnavailableError &e) {
    throw EmbeddingCacheError(e.what());
  }
  return hits;
}

CachePutResult EmbeddingCache::put_in_transaction(sqlite::database &db,
                                                  const std::string &content_hash,
                                                  const ModelId &model,
                                                  const std::vector<float> &vector) {
  const std::string model_key = model.str();
  const std::vector<char> blob = to_blob(vector);

  std::optional<std::vector<char>> existing;
  db << "SELECT vector_blob FROM embedding_cache WHERE content_hash = ? AND model_id = ?"
     << content_hash << model_key >>
      [&](std::vector<char> stored) { existing = std::move(stored); };

  if (!existing) {
    db << "INSERT INTO embedding_cache (content_hash, model_id, dimension, vector_blob, "
          "created_at) VALUES (?, ?, ?, ?, ?)"
       << content_hash << model_key << static_cast<int64_t>(model.dimension) << blob
       << utc_now_string();
    return CachePutResult::Inserted;
  }

  if (*existing == blob) {
    return CachePutResult::Unchanged;
  }

  ConsistencyViolation violation("Embedding for content " + content_hash + " under " + model_key +
                                 " differs from the cached vector; keeping the cached one");
  std::cerr << "[EmbeddingCache] " << violation.what() << std::endl;
  return CachePutResult::Rejected;
}

CachePutResult EmbeddingCache::put(const std::string &content_hash, const ModelId &model,
                                   const std::vector<float> &vector) {
  check_dimension(model, vector);
  try {
    PooledConnection conn(db_manager_, "embedding_cache.put");
    Transaction tx(*conn, TransactionMode::Immediate);
    CachePutResult result = put_in_transaction(*conn, content_hash, model, vector);
    tx.commit();
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw EmbeddingCacheError(format_db_error("embedding_cache.put", e));
  } catch (const DatabaseUnavailableError &e) {
    throw EmbeddingCacheError(e.what());
  }
}

std::vector<CachePutResult> EmbeddingCache::put_many(
    const std::vector<std::pair<std::string, std::vector<float>>> &entries, const ModelId &model) {
  for (const auto &[hash, vector] : entries) {
    check_dimension(model, vector);
  }

  std::vector<CachePutResult> results;
  results.reserve(entries.size());
  try {
    PooledConnection conn(db_manager_, "embedding_cache.put_many");
    Transaction tx(*conn, TransactionMode::Immediate);
    for (const auto &[hash, vector] : entries) {
      results.push_back(put_in_transaction(*conn, hash, model, vector));
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw EmbeddingCacheError(format_db_error("embedding_cache.put_many", e));
  } catch (const DatabaseUnavailableError &e) {
    throw EmbeddingCacheError(e.what());
  }
  return results;
}

size_t EmbeddingCache::count() {
  try {
    PooledConnection conn(db_manager_, "embedding_cache.count");
    int64_t total = 0;
    *conn << "SELECT COUNT(*) FROM embedding_cache" >> total;
    return static_cast<size_t>(total);
  } catch (const sqlite::sqlite_exception &e) {
    throw EmbeddingCacheError(format_db_error("embedding_cache.count", e));
  } catch (const DatabaseUnavailableError &e) {
    throw EmbeddingCacheError(e.what());
  }
}

size_t EmbeddingCache::count(const ModelId &model) {
  try {
    PooledConnection conn(db_manager_, "embedding_cache.count");
    int64_t total = 0;
    *conn << "SELECT COUNT(*) FROM embedding_cache WHERE model_id = ?" << model.str() >> total;
    return static_cast<size_t>(total);
  } catch (const sqlite::sqlite_exception &e) {
    throw EmbeddingCacheError(format_db_error("embedding_cache.count", e));
  } catch (const DatabaseUnavailableError &e) {
    throw EmbeddingCacheError(e.what());
  }
}

size_t EmbeddingCache::prune(size_t max_entries) {
  if (max_entries == 0) {
    return 0;
  }
  try {
    PooledConnection conn(db_manager_, "embedding_cache.prune");
    Transaction tx(*conn, TransactionMode::Immediate);
    int64_t total = 0;
    *conn << "SELECT COUNT(*) FROM embedding_cache" >> total;
    if (static_cast<size_t>(total) <= max_entries) {
      return 0;
    }
    const int64_t excess = total - static_cast<int64_t>(max_entries);
    *conn << "DELETE FROM embedding_cache WHERE seq IN "
             "(SELECT seq FROM embedding_cache ORDER BY seq ASC LIMIT ?)"
          << excess;
    tx.commit();
    std::cout << "[EmbeddingCache] Pruned " << excess << " oldest entries" << std::endl;
    return static_cast<size_t>(excess);
  } catch (const sqlite::sqlite_exception &e) {
    throw EmbeddingCacheError(format_db_error("embedding_cache.prune", e));
  } catch (const DatabaseUnavailableError &e) {
    throw EmbeddingCacheError(e.what());
  }
}

}  // namespace loglens_core
