#include "loglens_core/index/vector_index.hpp"

#include <faiss/utils/distances.h>

#include <algorithm>
#include <fstream>
#include <numeric>
#include <unordered_set>

#include "loglens_core/types/errors.hpp"

namespace loglens_core {

VectorIndex::VectorIndex(ModelId model)
    : model_(std::move(model)), storage_(std::make_unique<InMemoryVectorStorage>(model_.dimension)) {}

VectorIndex VectorIndex::build(const ModelId &model, const std::vector<ChunkWithVector> &entries) {
  VectorIndex index(model);
  index.append(entries);
  return index;
}

InMemoryVectorStorage &VectorIndex::writable_storage() {
  if (mapped_) {
    storage_ = InMemoryVectorStorage::copy_of(*storage_);
    mapped_ = false;
  }
  return static_cast<InMemoryVectorStorage &>(*storage_);
}

void VectorIndex::append(const std::vector<ChunkWithVector> &entries) {
  std::unordered_set<std::string> ids;
  ids.reserve(chunks_.size() + entries.size());
  for (const auto &chunk : chunks_) {
    ids.insert(chunk.chunk_id);
  }
  for (const auto &entry : entries) {
    if (entry.vector.size() != model_.dimension) {
      throw ModelMismatchError("Cannot add a vector of length " +
                               std::to_string(entry.vector.size()) + " to an index of model " +
                               model_.str());
    }
    if (!ids.insert(entry.chunk.chunk_id).second) {
      throw ConsistencyViolation("Chunk " + entry.chunk.chunk_id + " is already indexed");
    }
  }

  InMemoryVectorStorage &storage = writable_storage();
  storage.reserve(chunks_.size() + entries.size());
  std::vector<float> normalised(model_.dimension);
  for (const auto &entry : entries) {
    std::copy(entry.vector.begin(), entry.vector.end(), normalised.begin());
    faiss::fvec_renorm_L2(normalised.size(), 1, normalised.data());
    storage.append(normalised.data());
    chunks_.push_back(entry.chunk);
  }
}

std::vector<RetrievedChunk> VectorIndex::search(const std::vector<float> &query, int k) const {
  if (k <= 0) {
    throw ConfigurationError("k must be greater than 0, got " + std::to_string(k));
  }
  if (query.size() != model_.dimension) {
    throw ModelMismatchError("Query vector of length " + std::to_string(query.size()) +
                             " does not match index model " + model_.str());
  }
  if (chunks_.empty()) {
    return {};
  }

  std::vector<float> normalised_query(query);
  faiss::fvec_renorm_L2(normalised_query.size(), 1, normalised_query.data());

  const size_t count = chunks_.size();
  std::vector<float> scores(count);
  faiss::fvec_inner_products_ny(scores.data(), normalised_query.data(), storage_->data(),
                                model_.dimension, count);

  std::vector<size_t> order(count);
  std::iota(order.begin(), order.end(), 0);
  const size_t top = std::min(static_cast<size_t>(k), count);
  std::partial_sort(order.begin(), order.begin() + top, order.end(),
                    [&scores](size_t a, size_t b) {
                      if (scores[a] != scores[b]) {
                        return scores[a] > scores[b];
                      }
                      return a < b;
                    });

  std::vector<RetrievedChunk> results;
  results.reserve(top);
  for (size_t i = 0; i < top; ++i) {
    results.push_back({chunks_[order[i]], scores[order[i]], order[i]});
  }
  return results;
}

VectorIndex VectorIndex::clone() const {
  VectorIndex copy(model_);
  copy.chunks_ = chunks_;
  copy.storage_ = InMemoryVectorStorage::copy_of(*storage_);
  return copy;
}

std::vector<float> VectorIndex::vector(size_t position) const {
  const float *row = storage_->row(position);
  return std::vector<float>(row, row + model_.dimension);
}

void VectorIndex::save(const std::filesystem::path &directory) const {
  std::filesystem::create_directories(directory);
  write_vector_file(directory / kVectorsFile, model_.str(), *storage_);

  std::ofstream out(directory / kChunksFile, std::ios::trunc);
  if (!out.is_open()) {
    throw IndexFormatError("Cannot write " + (directory / kChunksFile).string());
  }
  for (const auto &chunk : chunks_) {
    out << nlohmann::json(chunk).dump() << '\n';
  }
  out.flush();
  if (!out) {
    throw IndexFormatError("Failed writing " + (directory / kChunksFile).string());
  }
}

VectorIndex VectorIndex::load(const std::filesystem::path &directory, bool mapped) {
  std::unique_ptr<VectorStorage> storage;
  std::string model_id;
  if (mapped) {
    auto mapped_storage = MappedVectorStorage::open(directory / kVectorsFile);
    model_id = mapped_storage->header().model_id;
    storage = std::move(mapped_storage);
  } else {
    VectorFileHeader header;
    storage = read_vector_file(directory / kVectorsFile, &header);
    model_id = header.model_id;
  }

  ModelId model;
  try {
    model = ModelId::parse(model_id);
  } catch (const ConfigurationError &e) {
    throw IndexFormatError("Vector file carries an invalid model id: " + std::string(e.what()));
  }
  if (model.dimension != storage->dimension()) {
    throw IndexFormatError("Vector file dimension " + std::to_string(storage->dimension()) +
                           " disagrees with model " + model_id);
  }

  std::ifstream in(directory / kChunksFile);
  if (!in.is_open()) {
    throw IndexFormatError("Cannot open " + (directory / kChunksFile).string());
  }
  std::vector<Chunk> chunks;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    try {
      chunks.push_back(nlohmann::json::parse(line).get<Chunk>());
    } catch (const nlohmann::json::exception &e) {
      throw IndexFormatError("Malformed chunk record " + std::to_string(chunks.size() + 1) +
                             " in " + (directory / kChunksFile).string() + ": " + e.what());
    }
  }

  if (chunks.size() != storage->size()) {
    throw IndexFormatError("chunks.jsonl has " + std::to_string(chunks.size()) +
                           " records but vectors.bin has " + std::to_string(storage->size()));
  }

  VectorIndex index(model);
  index.chunks_ = std::move(chunks);
  index.storage_ = std::move(storage);
  index.mapped_ = mapped;
  return index;
}

}  // namespace loglens_core
