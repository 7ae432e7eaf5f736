#include "loglens_core/model_id.hpp"

#include <cctype>

#include "loglens_core/types/errors.hpp"

namespace loglens_core {

ModelId ModelId::parse(const std::string &model_id) {
  const size_t first = model_id.find(':');
  const size_t last = model_id.rfind(':');
  if (first == std::string::npos || first == last) {
    throw ConfigurationError("Invalid model id '" + model_id +
                             "'. Expected <provider>:<name>:<dimension>");
  }

  ModelId result;
  result.provider = model_id.substr(0, first);
  result.name = model_id.substr(first + 1, last - first - 1);
  const std::string dimension_str = model_id.substr(last + 1);

  if (result.provider.empty() || result.name.empty()) {
    throw ConfigurationError("Invalid model id '" + model_id +
                             "'. Provider and name must not be empty");
  }
  if (dimension_str.empty() || dimension_str.size() > 9) {
    throw ConfigurationError("Invalid dimension in model id '" + model_id + "'");
  }
  for (char c : dimension_str) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw ConfigurationError("Invalid dimension in model id '" + model_id + "'");
    }
  }
  result.dimension = std::stoul(dimension_str);
  if (result.dimension == 0) {
    throw ConfigurationError("Dimension must be positive in model id '" + model_id + "'");
  }
  return result;
}

std::string ModelId::str() const {
  return provider + ":" + name + ":" + std::to_string(dimension);
}

}  // namespace loglens_core
