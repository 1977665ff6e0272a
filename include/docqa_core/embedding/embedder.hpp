#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docqa_core {

class EmbeddingError : public std::exception {
 public:
  explicit EmbeddingError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Maps passages and queries into one metric space. The same instance embeds
// both sides, so implementations must be deterministic for a given
// configuration and must throw EmbeddingError rather than return an empty or
// zero vector.
class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual std::vector<float> embed(const std::string &text) = 0;

  // Vector length; 0 while not yet known (remote models report it on first use)
  virtual size_t dimension() const = 0;

  // Identifies the model and its configuration
  virtual std::string model_id() const = 0;
};

}  // namespace docqa_core
