#include "docqa_core/llm/ollama_generator.hpp"

#include <algorithm>

#include "ollama.hpp"

namespace docqa_core {

OllamaGenerator::OllamaGenerator(const std::string &ollama_url, const std::string &model,
                                 long timeout_ms)
    : ollama_url_(ollama_url), model_(model), timeout_ms_(timeout_ms) {
  ollama::setServerURL(ollama_url_);
  // ollama-hpp works in whole seconds
  const int timeout_seconds = static_cast<int>(std::max(1L, (timeout_ms_ + 999) / 1000));
  ollama::setReadTimeout(timeout_seconds);
  ollama::setWriteTimeout(timeout_seconds);
}

std::string OllamaGenerator::generate(const Prompt &prompt) {
  try {
    ollama::options options;
    options["temperature"] = 0;

    ollama::response response = ollama::generate(model_, prompt.text, options);
    std::string answer = response.as_simple_string();
    if (answer.empty()) {
      throw GenerationError("Model " + model_ + " returned an empty response");
    }
    return answer;
  } catch (const ollama::exception &e) {
    throw GenerationError("Local generation with " + model_ + " failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw GenerationError("Malformed response from " + model_ + ": " + std::string(e.what()));
  }
}

}  // namespace docqa_core
