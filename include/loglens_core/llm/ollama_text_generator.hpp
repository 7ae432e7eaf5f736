#pragma once

#include <memory>
#include <string>

#include "loglens_core/llm/text_generator.hpp"

class Ollama;

namespace loglens_core {

class OllamaTextGenerator : public TextGenerator {
 public:
  OllamaTextGenerator(const std::string &ollama_url, const std::string &model, int timeout_seconds);
  ~OllamaTextGenerator() override;

  OllamaTextGenerator(const OllamaTextGenerator &) = delete;
  OllamaTextGenerator &operator=(const OllamaTextGenerator &) = delete;

  std::string generate(const std::string &prompt) override;

  std::string model_name() const override {
    return model_;
  }

 private:
  std::string ollama_url_;
  std::string model_;
  std::unique_ptr<Ollama> server_;
};

}  // namespace loglens_core
