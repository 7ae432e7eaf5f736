#pragma once

#include <string>
#include <vector>

#include "loglens_core/embedding/embedding_provider.hpp"

namespace loglens_core {

/**
 * @brief In-process embedder based on feature hashing.
 *
 * Text is lowercased and split into alphanumeric tokens; each token adds +1 or -1 to the
 * bucket picked by its FNV-1a hash, and the result is L2-normalised. Two texts sharing
 * tokens therefore score positively under cosine similarity. Output is identical on every
 * platform and run, and it never fails for transient reasons.
 */
class HashingEmbeddingProvider : public EmbeddingProvider {
 public:
  explicit HashingEmbeddingProvider(ModelId model);

  const ModelId &model() const override {
    return model_;
  }

  std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) override;

  std::vector<float> embed_text(const std::string &text) const;

  static std::vector<std::string> tokenize(const std::string &text);

 private:
  ModelId model_;
};

}  // namespace loglens_core
