#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docqa_core/chunking/chunker.hpp"
#include "docqa_core/embedding/embedder.hpp"
#include "docqa_core/extractors/content_extractor_factory.hpp"
#include "docqa_core/index/retriever.hpp"
#include "docqa_core/llm/generator.hpp"
#include "docqa_core/llm/response_sanitizer.hpp"
#include "docqa_core/net/document_fetcher.hpp"
#include "docqa_core/prompt/prompt_builder.hpp"
#include "docqa_core/session.hpp"
#include "docqa_core/types.hpp"

namespace docqa_core {

struct PipelineConfig {
  size_t chunk_size = 1000;
  size_t chunk_overlap = 200;
  size_t top_k = 1;
  size_t max_prompt_chars = PromptBuilder::DEFAULT_MAX_PROMPT_CHARS;
};

enum class IngestError { None, Extraction, EmptyCorpus, Embedding, Download };

std::string to_string(IngestError error);

struct IngestStatus {
  bool success;
  IngestError error;
  std::string message;
  // Ordered, human-readable stage descriptions
  std::vector<std::string> trail;
  size_t passage_count;

  // Newline-joined trail
  std::string to_string() const;

  static IngestStatus success_response(std::vector<std::string> trail, size_t passage_count) {
    return {true, IngestError::None, "", std::move(trail), passage_count};
  }

  static IngestStatus failure_response(IngestError error,
                                       const std::string& message,
                                       std::vector<std::string> trail) {
    return {false, error, message, std::move(trail), 0};
  }
};

class EmptyCorpusError : public std::exception {
 public:
  explicit EmptyCorpusError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class Pipeline
 * @brief Orchestrates ingestion and question answering over a Session.
 *
 * Ingestion runs Extractor -> normalize -> Chunker -> Embedder -> Index build
 * under the session's exclusive lock and either publishes a complete corpus or
 * leaves the previous one untouched. Answering embeds and retrieves under the
 * shared lock, then builds the prompt, generates and sanitizes without holding
 * any lock.
 */
class Pipeline {
 public:
  Pipeline(PipelineConfig config,
           std::shared_ptr<ContentExtractorFactory> extractor_factory,
           std::shared_ptr<Embedder> embedder,
           std::shared_ptr<Generator> generator,
           std::shared_ptr<DocumentFetcher> fetcher);

  virtual ~Pipeline() = default;

  // Stage failures are reported in the returned status, never thrown
  virtual IngestStatus ingest(Session& session, const std::vector<Document>& documents);

  // Downloads the URL before taking the session lock, then ingests it
  virtual IngestStatus ingest_url(Session& session, const std::string& url);

  /**
   * @brief Answers a question from the active corpus.
   *
   * @throw std::invalid_argument if the question is blank.
   * @throw NotIngestedError if the session holds no corpus.
   * @throw EmbeddingError if the question cannot be embedded.
   * @throw GenerationError if the generator fails or times out.
   */
  virtual Answer answer(Session& session, const std::string& question);

  // CRLF/CR to LF, C0 controls except \n and \t dropped, trailing blanks before
  // newlines removed, 3+ newlines collapsed to 2, outer whitespace trimmed
  static std::string normalize_text(const std::string& text);

  const PipelineConfig& config() const {
    return config_;
  }

 private:
  struct ExtractedText {
    std::string source;
    std::string text;
  };

  PipelineConfig config_;
  std::shared_ptr<ContentExtractorFactory> extractor_factory_;
  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<Generator> generator_;
  std::shared_ptr<DocumentFetcher> fetcher_;
  Chunker chunker_;
  Retriever retriever_;
  PromptBuilder prompt_builder_;
  ResponseSanitizer sanitizer_;

  IngestStatus ingest_documents(Session& session,
                                const std::vector<Document>& documents,
                                std::vector<std::string> trail);
  IngestStatus build_corpus(Session& session,
                            const std::vector<Document>& documents,
                            std::vector<std::string>& trail);
  std::vector<ExtractedText> extract_all(const std::vector<Document>& documents,
                                         std::vector<std::string>& trail,
                                         size_t& failed_extractions) const;
  std::string extract_one(const Document& document, DocumentType& type) const;

  static size_t code_points(const std::string& text);
};

}  // namespace docqa_core
