#pragma once

#include <cstddef>
#include <string>

namespace loglens_core {

/**
 * @brief Identity of an embedding model: "<provider>:<name>:<dimension>".
 *
 * The provider prefix selects the backend, the trailing integer is the vector
 * dimension the backend must produce. Vectors are only comparable under the same
 * full model id.
 */
struct ModelId {
  std::string provider;
  std::string name;
  size_t dimension = 0;

  // Throws ConfigurationError on malformed input.
  static ModelId parse(const std::string &model_id);

  std::string str() const;

  bool operator==(const ModelId &other) const = default;
};

}  // namespace loglens_core
