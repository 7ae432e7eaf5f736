#include "loglens_core/embedding/ollama_embedding_provider.hpp"

#include "ollama.hpp"

#include "loglens_core/types/errors.hpp"

namespace loglens_core {

OllamaEmbeddingProvider::OllamaEmbeddingProvider(ModelId model, const std::string &ollama_url,
                                                 int timeout_seconds)
    : model_(std::move(model)), ollama_url_(ollama_url), server_(std::make_unique<Ollama>(ollama_url)) {
  server_->setReadTimeout(timeout_seconds);
  server_->setWriteTimeout(timeout_seconds);
}

OllamaEmbeddingProvider::~OllamaEmbeddingProvider() = default;

bool OllamaEmbeddingProvider::is_server_available() {
  return server_->is_running();
}

// One request per text. Only the first vector of the response is used.
std::vector<float> OllamaEmbeddingProvider::embed_one(const std::string &text) {
  nlohmann::json json_response;
  try {
    ollama::response response = server_->generate_embeddings(model_.name, text);
    json_response = response.as_json();
  } catch (const ollama::exception &e) {
    // Connection refused, timeouts and server-side overload all land here.
    throw ProviderError("Embedding request to " + ollama_url_ + " failed: " + e.what(), true);
  }

  if (!json_response.contains("embeddings")) {
    throw ProviderError("Response does not contain embedding field", false);
  }

  std::vector<float> vector;
  auto embeddings = json_response["embeddings"];
  try {
    if (!embeddings.is_array()) {
      throw ProviderError("Embeddings field is not an array", false);
    }
    if (embeddings.size() > 0 && embeddings[0].is_array()) {
      vector = embeddings[0].get<std::vector<float>>();
    } else {
      vector = embeddings.get<std::vector<float>>();
    }
  } catch (const nlohmann::json::exception &e) {
    throw ProviderError(std::string("Malformed embedding response: ") + e.what(), false);
  }

  if (vector.size() != model_.dimension) {
    throw ProviderError("Model " + model_.str() + " returned a vector of length " +
                            std::to_string(vector.size()),
                        false);
  }
  return vector;
}

std::vector<std::vector<float>> OllamaEmbeddingProvider::embed(
    const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  for (const auto &text : texts) {
    vectors.push_back(embed_one(text));
  }
  return vectors;
}

}  // namespace loglens_core
