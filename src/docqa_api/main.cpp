#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#include "docqa_api/config.hpp"
#include "docqa_api/routes.hpp"
#include "docqa_api/server.hpp"
#include "docqa_core/embedding/hashing_embedder.hpp"
#include "docqa_core/embedding/ollama_embedder.hpp"
#include "docqa_core/extractors/content_extractor_factory.hpp"
#include "docqa_core/llm/ollama_generator.hpp"
#include "docqa_core/llm/remote_generator.hpp"
#include "docqa_core/net/document_fetcher.hpp"
#include "docqa_core/net/http_client.hpp"
#include "docqa_core/pipeline.hpp"
#include "docqa_core/session.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

namespace {

std::shared_ptr<docqa_core::Embedder> make_embedder(const Config& config) {
  if (config.embedding_backend == "ollama") {
    return std::make_shared<docqa_core::OllamaEmbedder>(config.ollama_url, config.embedding_model);
  }
  return std::make_shared<docqa_core::HashingEmbedder>(
      static_cast<size_t>(config.hashing_dimension));
}

std::shared_ptr<docqa_core::Generator> make_generator(
    const Config& config, std::shared_ptr<docqa_core::HttpClient> http_client) {
  if (config.generator_backend == "ollama") {
    return std::make_shared<docqa_core::OllamaGenerator>(config.ollama_url, config.generation_model,
                                                         config.generation_timeout_ms);
  }
  return std::make_shared<docqa_core::RemoteAnswerGenerator>(
      std::move(http_client), config.answer_service_url, config.answer_service_token,
      config.generation_timeout_ms);
}

}  // namespace

int main() {
  try {
    Config config = Config::load();

    std::cout << "Starting DocQA API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Generator Backend: " << config.generator_backend << std::endl;
    if (config.generator_backend == "remote") {
      std::cout << "Answer Service URL: " << config.answer_service_url << std::endl;
    } else {
      std::cout << "Ollama URL: " << config.ollama_url << std::endl;
      std::cout << "Generation Model: " << config.generation_model << std::endl;
    }
    std::cout << "Embedding Backend: " << config.embedding_backend << std::endl;
    std::cout << "Chunk Size / Overlap: " << config.chunk_size << " / " << config.chunk_overlap
              << std::endl;
    std::cout << "Top K: " << config.top_k << std::endl;

    // Initialize core components
    auto http_client = std::make_shared<docqa_core::HttpClient>();
    auto fetcher =
        std::make_shared<docqa_core::CurlDocumentFetcher>(http_client, config.download_timeout_ms);
    auto content_extractor_factory = std::make_shared<docqa_core::ContentExtractorFactory>();
    auto embedder = make_embedder(config);
    auto generator = make_generator(config, http_client);
    std::cout << "Embedding Model: " << embedder->model_id() << std::endl;

    docqa_core::PipelineConfig pipeline_config;
    pipeline_config.chunk_size = static_cast<size_t>(config.chunk_size);
    pipeline_config.chunk_overlap = static_cast<size_t>(config.chunk_overlap);
    pipeline_config.top_k = static_cast<size_t>(config.top_k);
    pipeline_config.max_prompt_chars = static_cast<size_t>(config.max_prompt_chars);

    auto pipeline = std::make_shared<docqa_core::Pipeline>(
        pipeline_config, content_extractor_factory, embedder, generator, fetcher);
    auto session = std::make_shared<docqa_core::Session>();

    auto [host, port] = docqa_api::Server::parse_address(config.api_base_url);
    docqa_api::Server server(host, port);
    docqa_api::Routes routes(pipeline, session);
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "Stopping API server..." << std::endl;
    server.stop();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
