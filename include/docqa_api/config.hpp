#pragma once

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

class Config {
 public:
  std::string api_base_url;

  // Generation backend: "remote" answering service or a local "ollama" model
  std::string generator_backend;
  std::string answer_service_url;
  std::string answer_service_token;
  int generation_timeout_ms;
  int download_timeout_ms;
  std::string ollama_url;
  std::string generation_model;

  // Embedding backend: offline "hashing" or "ollama"
  std::string embedding_backend;
  std::string embedding_model;
  int hashing_dimension;

  // Pipeline tuning
  int chunk_size;
  int chunk_overlap;
  int top_k;
  int max_prompt_chars;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Configuration must be a JSON object");
    }
    Config config;

    // Apply defaults when keys are missing
    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:8000"));
      config.generator_backend = json_config.value("generator_backend", std::string("remote"));
      config.answer_service_url = json_config.value("answer_service_url", std::string(""));
      config.answer_service_token = json_config.value("answer_service_token", std::string(""));
      config.generation_timeout_ms = json_config.value("generation_timeout_ms", 30000);
      config.download_timeout_ms = json_config.value("download_timeout_ms", 10000);
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.generation_model = json_config.value("generation_model", std::string("llama3.2"));
      config.embedding_backend = json_config.value("embedding_backend", std::string("hashing"));
      config.embedding_model = json_config.value("embedding_model", std::string("mxbai-embed-large"));
      config.hashing_dimension = json_config.value("hashing_dimension", 384);
      config.chunk_size = json_config.value("chunk_size", 1000);
      config.chunk_overlap = json_config.value("chunk_overlap", 200);
      config.top_k = json_config.value("top_k", 1);
      config.max_prompt_chars = json_config.value("max_prompt_chars", 6000);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid configuration value: ") + e.what());
    }

    return config;
  }

  // Environment variables win over the file
  void apply_environment() {
    override_from_env("DOCQA_API_BASE_URL", api_base_url);
    override_from_env("DOCQA_GENERATOR_BACKEND", generator_backend);
    override_from_env("DEEPSEEK_API_URL", answer_service_url);
    override_from_env("DEEPSEEK_API_KEY", answer_service_token);
    override_from_env("OLLAMA_URL", ollama_url);
    override_from_env("DOCQA_EMBEDDING_BACKEND", embedding_backend);
    override_from_env("DOCQA_EMBEDDING_MODEL", embedding_model);
  }

  // Reads $DOCQA_CONFIG (default docqarc.json). A missing default file means
  // all defaults; a missing explicitly named file is an error.
  static Config load() {
    const char* configured_path = std::getenv("DOCQA_CONFIG");
    Config config;
    if (configured_path && *configured_path) {
      config = from_file(configured_path);
    } else if (std::ifstream("docqarc.json").good()) {
      config = from_file("docqarc.json");
    } else {
      config = from_json(nlohmann::json::object());
    }
    config.apply_environment();
    config.validate();
    return config;
  }

  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must be of the form host:port");
    }
    if (generator_backend != "remote" && generator_backend != "ollama") {
      throw std::runtime_error("generator_backend must be \"remote\" or \"ollama\"");
    }
    if (generator_backend == "remote" && answer_service_url.empty()) {
      throw std::runtime_error("answer_service_url cannot be empty when generator_backend is remote");
    }
    if (embedding_backend != "hashing" && embedding_backend != "ollama") {
      throw std::runtime_error("embedding_backend must be \"hashing\" or \"ollama\"");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (generation_model.empty()) {
      throw std::runtime_error("generation_model cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (generation_timeout_ms < 100) {
      throw std::runtime_error("generation_timeout_ms must be at least 100ms");
    }
    if (download_timeout_ms < 100) {
      throw std::runtime_error("download_timeout_ms must be at least 100ms");
    }
    if (hashing_dimension < 16) {
      throw std::runtime_error("hashing_dimension must be at least 16");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be at least 0 and smaller than chunk_size");
    }
    if (top_k < 1) {
      throw std::runtime_error("top_k must be at least 1");
    }
    if (max_prompt_chars < 256) {
      throw std::runtime_error("max_prompt_chars must be at least 256");
    }
  }

 private:
  static void override_from_env(const char* name, std::string& field) {
    const char* value = std::getenv(name);
    if (value && *value) {
      field = value;
    }
  }
};
