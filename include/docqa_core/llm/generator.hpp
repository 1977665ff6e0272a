#pragma once

#include <string>

#include "docqa_core/prompt/prompt_builder.hpp"

namespace docqa_core {

class GenerationError : public std::exception {
 public:
  explicit GenerationError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Produces a raw answer for a prompt. Implementations block until the backend
// answers or their timeout expires, and throw GenerationError on any failure.
class Generator {
 public:
  virtual ~Generator() = default;

  virtual std::string generate(const Prompt &prompt) = 0;

  virtual std::string name() const = 0;
};

}  // namespace docqa_core
