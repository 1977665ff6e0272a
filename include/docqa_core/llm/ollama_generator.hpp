#pragma once

#include <string>

#include "docqa_core/llm/generator.hpp"

namespace docqa_core {

// Local-inference backend: a model served by the Ollama runtime on this host,
// called synchronously through ollama-hpp with sampling temperature 0.
class OllamaGenerator : public Generator {
 public:
  OllamaGenerator(const std::string &ollama_url, const std::string &model, long timeout_ms);

  // Disable copy constructor and assignment
  OllamaGenerator(const OllamaGenerator &) = delete;
  OllamaGenerator &operator=(const OllamaGenerator &) = delete;

  std::string generate(const Prompt &prompt) override;

  std::string name() const override {
    return "ollama:" + model_;
  }

 private:
  std::string ollama_url_;
  std::string model_;
  long timeout_ms_;
};

}  // namespace docqa_core
