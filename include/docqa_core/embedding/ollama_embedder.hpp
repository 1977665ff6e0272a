#pragma once

#include <atomic>
#include <string>
#include <vector>

#include "docqa_core/embedding/embedder.hpp"

namespace docqa_core {

class OllamaEmbedder : public Embedder {
 public:
  // Throws EmbeddingError if the Ollama server is not reachable
  OllamaEmbedder(const std::string &ollama_url, const std::string &embedding_model);
  ~OllamaEmbedder() override = default;

  // Disable copy constructor and assignment
  OllamaEmbedder(const OllamaEmbedder &) = delete;
  OllamaEmbedder &operator=(const OllamaEmbedder &) = delete;

  std::vector<float> embed(const std::string &text) override;

  size_t dimension() const override {
    return dimension_.load();
  }

  std::string model_id() const override {
    return "ollama:" + embedding_model_;
  }

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  // Learned from the first response; every later vector must match it
  std::atomic<size_t> dimension_{0};

  void setup_server_connection();
};

}  // namespace docqa_core
