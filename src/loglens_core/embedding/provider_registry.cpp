#include "loglens_core/embedding/provider_registry.hpp"

#include <memory>

#include "loglens_core/config.hpp"
#include "loglens_core/embedding/hashing_embedding_provider.hpp"
#include "loglens_core/embedding/ollama_embedding_provider.hpp"
#include "loglens_core/types/errors.hpp"

namespace loglens_core {

void ProviderRegistry::register_factory(const std::string &provider, ProviderFactory factory) {
  std::lock_guard<std::mutex> lock(mutex_);
  factories_[provider] = std::move(factory);
  for (auto it = instances_.begin(); it != instances_.end();) {
    if (it->first.rfind(provider + ":", 0) == 0) {
      it = instances_.erase(it);
    } else {
      ++it;
    }
  }
}

bool ProviderRegistry::has_provider(const std::string &provider) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return factories_.count(provider) > 0;
}

EmbeddingProviderPtr ProviderRegistry::get(const ModelId &model) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string key = model.str();
  auto cached = instances_.find(key);
  if (cached != instances_.end()) {
    return cached->second;
  }

  auto factory = factories_.find(model.provider);
  if (factory == factories_.end()) {
    throw ConfigurationError("No embedding provider registered for '" + model.provider +
                             "' (model " + key + ")");
  }
  EmbeddingProviderPtr provider = factory->second(model);
  if (!provider) {
    throw ConfigurationError("Embedding provider factory for '" + model.provider +
                             "' returned nothing");
  }
  instances_.emplace(key, provider);
  return provider;
}

void register_default_providers(ProviderRegistry &registry, const Config &config) {
  const std::string url = config.ollama_url;
  const int timeout = config.request_timeout_seconds;
  registry.register_factory("ollama", [url, timeout](const ModelId &model) {
    return std::make_shared<OllamaEmbeddingProvider>(model, url, timeout);
  });
  registry.register_factory("hash", [](const ModelId &model) {
    return std::make_shared<HashingEmbeddingProvider>(model);
  });
}

}  // namespace loglens_core
