#include "loglens_core/llm/ollama_text_generator.hpp"

#include "ollama.hpp"

namespace loglens_core {

OllamaTextGenerator::OllamaTextGenerator(const std::string &ollama_url, const std::string &model,
                                         int timeout_seconds)
    : ollama_url_(ollama_url), model_(model), server_(std::make_unique<Ollama>(ollama_url)) {
  server_->setReadTimeout(timeout_seconds);
  server_->setWriteTimeout(timeout_seconds);
}

OllamaTextGenerator::~OllamaTextGenerator() = default;

std::string OllamaTextGenerator::generate(const std::string &prompt) {
  try {
    ollama::response response = server_->generate(model_, prompt);
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw GenerationError("Generation with " + model_ + " at " + ollama_url_ +
                          " failed: " + e.what());
  }
}

}  // namespace loglens_core
