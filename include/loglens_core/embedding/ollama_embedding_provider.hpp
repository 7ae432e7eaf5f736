#pragma once

#include <memory>
#include <string>
#include <vector>

#include "loglens_core/embedding/embedding_provider.hpp"

class Ollama;

namespace loglens_core {

// Embeds through a local or remote Ollama server. Each text is one request; the
// read/write timeout bounds a single request, not the whole batch.
class OllamaEmbeddingProvider : public EmbeddingProvider {
 public:
  OllamaEmbeddingProvider(ModelId model, const std::string &ollama_url, int timeout_seconds);
  ~OllamaEmbeddingProvider() override;

  OllamaEmbeddingProvider(const OllamaEmbeddingProvider &) = delete;
  OllamaEmbeddingProvider &operator=(const OllamaEmbeddingProvider &) = delete;

  const ModelId &model() const override {
    return model_;
  }

  std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) override;

  bool is_server_available();

 private:
  std::vector<float> embed_one(const std::string &text);

  ModelId model_;
  std::string ollama_url_;
  std::unique_ptr<Ollama> server_;
};

}  // namespace loglens_core
