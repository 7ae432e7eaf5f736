#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "loglens_core/index/vector_storage.hpp"
#include "loglens_core/model_id.hpp"
#include "loglens_core/types/chunk.hpp"

namespace loglens_core {

/**
 * @brief Chunks and their vectors as two positionally aligned sequences.
 *
 * Every vector belongs to the index's single model and is L2-normalised on insertion, so a
 * search is an inner product against the normalised query. Positions never change for the
 * lifetime of an index; append only adds to the end.
 *
 * An index loaded with mapped=true reads vectors straight from the mmap'd vectors.bin.
 * Appending to it first copies the vectors into memory; the file is never written.
 */
class VectorIndex {
 public:
  explicit VectorIndex(ModelId model);

  VectorIndex(VectorIndex &&) noexcept = default;
  VectorIndex &operator=(VectorIndex &&) noexcept = default;
  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  // Full rebuild: a fresh index holding exactly `entries`.
  static VectorIndex build(const ModelId &model, const std::vector<ChunkWithVector> &entries);

  // Throws ModelMismatchError when a vector's length differs from the model dimension and
  // ConsistencyViolation when a chunk id is already present. Nothing is added on error.
  void append(const std::vector<ChunkWithVector> &entries);

  // At most k results, best first; equal scores keep insertion order. k <= 0 throws
  // ConfigurationError, a query of the wrong length throws ModelMismatchError.
  std::vector<RetrievedChunk> search(const std::vector<float> &query, int k) const;

  // Independent in-memory copy.
  VectorIndex clone() const;

  void save(const std::filesystem::path &directory) const;
  // Throws IndexFormatError when the files are missing, damaged or disagree in length.
  static VectorIndex load(const std::filesystem::path &directory, bool mapped);

  const ModelId &model() const {
    return model_;
  }
  size_t size() const {
    return chunks_.size();
  }
  bool empty() const {
    return chunks_.empty();
  }
  bool is_mapped() const {
    return mapped_;
  }
  const std::vector<Chunk> &chunks() const {
    return chunks_;
  }
  std::vector<float> vector(size_t position) const;

  static constexpr const char *kVectorsFile = "vectors.bin";
  static constexpr const char *kChunksFile = "chunks.jsonl";

 private:
  InMemoryVectorStorage &writable_storage();

  ModelId model_;
  std::vector<Chunk> chunks_;
  std::unique_ptr<VectorStorage> storage_;
  bool mapped_ = false;
};

}  // namespace loglens_core
