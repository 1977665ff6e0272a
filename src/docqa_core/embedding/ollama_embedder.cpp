#include "docqa_core/embedding/ollama_embedder.hpp"

#include "ollama.hpp"

namespace docqa_core {

OllamaEmbedder::OllamaEmbedder(const std::string &ollama_url, const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {
  setup_server_connection();
}

void OllamaEmbedder::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw EmbeddingError("Ollama server is not running at " + ollama_url_);
  }
}

std::vector<float> OllamaEmbedder::embed(const std::string &text) {
  if (text.find_first_not_of(" \t\n\r\f\v") == std::string::npos) {
    throw EmbeddingError("Cannot embed empty text");
  }

  std::vector<float> vector;
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    auto json_response = response.as_json();

    // Newer servers answer with "embeddings" (one array per input), older ones with "embedding"
    if (json_response.contains("embeddings")) {
      auto embeddings = json_response["embeddings"];
      if (!embeddings.is_array()) {
        throw EmbeddingError("Embeddings field is not an array");
      }
      if (!embeddings.empty() && embeddings[0].is_array()) {
        vector = embeddings[0].get<std::vector<float>>();
      } else {
        vector = embeddings.get<std::vector<float>>();
      }
    } else if (json_response.contains("embedding")) {
      vector = json_response["embedding"].get<std::vector<float>>();
    } else {
      throw EmbeddingError("Response does not contain embedding field");
    }
  } catch (const ollama::exception &e) {
    throw EmbeddingError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingError("Malformed embedding response: " + std::string(e.what()));
  }

  if (vector.empty()) {
    throw EmbeddingError("Received empty embedding from model " + embedding_model_);
  }

  size_t expected = 0;
  if (!dimension_.compare_exchange_strong(expected, vector.size()) && expected != vector.size()) {
    throw EmbeddingError("Embedding dimension changed from " + std::to_string(expected) + " to " +
                         std::to_string(vector.size()));
  }
  return vector;
}

}  // namespace docqa_core
