#pragma once

#include <memory>
#include <string>

namespace loglens_core {

class GenerationError : public std::exception {
 public:
  explicit GenerationError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Prompt in, completion out. The caller owns prompt assembly and response parsing.
class TextGenerator {
 public:
  virtual ~TextGenerator() = default;

  // Throws GenerationError.
  virtual std::string generate(const std::string &prompt) = 0;

  virtual std::string model_name() const = 0;
};

}  // namespace loglens_core
