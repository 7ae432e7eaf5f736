#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>

#include "loglens_core/embedding/embedding_provider.hpp"

namespace loglens_core {

class Config;

using ProviderFactory = std::function<EmbeddingProviderPtr(const ModelId &)>;

// Dispatch table from the provider prefix of a model id ("ollama", "hash", ...) to a factory.
// Instances are created on first use and shared for the same full model id.
class ProviderRegistry {
 public:
  ProviderRegistry() = default;

  ProviderRegistry(const ProviderRegistry &) = delete;
  ProviderRegistry &operator=(const ProviderRegistry &) = delete;

  // Replaces an existing factory for the same prefix and drops its cached instances.
  void register_factory(const std::string &provider, ProviderFactory factory);

  bool has_provider(const std::string &provider) const;

  // Throws ConfigurationError for an unknown prefix.
  EmbeddingProviderPtr get(const ModelId &model);

 private:
  mutable std::mutex mutex_;
  std::map<std::string, ProviderFactory> factories_;
  std::map<std::string, EmbeddingProviderPtr> instances_;
};

// "ollama" -> OllamaEmbeddingProvider against config.ollama_url,
// "hash"   -> HashingEmbeddingProvider.
void register_default_providers(ProviderRegistry &registry, const Config &config);

}  // namespace loglens_core
