#pragma once

#include <memory>
#include <string>
#include <vector>

#include "loglens_core/model_id.hpp"

namespace loglens_core {

// A backend that turns text into vectors of model().dimension floats.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual const ModelId &model() const = 0;

  // One vector per input text, in input order. Throws ProviderError.
  virtual std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) = 0;
};

using EmbeddingProviderPtr = std::shared_ptr<EmbeddingProvider>;

}  // namespace loglens_core
