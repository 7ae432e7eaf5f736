#include "loglens_core/embedding/hashing_embedding_provider.hpp"

#include <faiss/utils/distances.h>

#include <cctype>
#include <cstdint>

#include "loglens_core/types/errors.hpp"

namespace loglens_core {

namespace {

uint64_t fnv1a(const std::string &token) {
  uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : token) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

}  // namespace

HashingEmbeddingProvider::HashingEmbeddingProvider(ModelId model) : model_(std::move(model)) {
  if (model_.dimension == 0) {
    throw ConfigurationError("Hashing embedder needs a positive dimension");
  }
}

std::vector<std::string> HashingEmbeddingProvider::tokenize(const std::string &text) {
  std::vector<std::string> tokens;
  std::string current;
  for (unsigned char c : text) {
    // Bytes >= 0x80 belong to multi-byte UTF-8 sequences and stay inside tokens.
    if (std::isalnum(c) || c >= 0x80) {
      current += static_cast<char>(std::tolower(c));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

std::vector<float> HashingEmbeddingProvider::embed_text(const std::string &text) const {
  std::vector<float> vector(model_.dimension, 0.0f);
  for (const auto &token : tokenize(text)) {
    uint64_t hash = fnv1a(token);
    size_t bucket = static_cast<size_t>(hash % model_.dimension);
    vector[bucket] += (hash >> 63) ? -1.0f : 1.0f;
  }
  faiss::fvec_renorm_L2(vector.size(), 1, vector.data());
  return vector;
}

std::vector<std::vector<float>> HashingEmbeddingProvider::embed(
    const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  for (const auto &text : texts) {
    vectors.push_back(embed_text(text));
  }
  return vectors;
}

}  // namespace loglens_core
