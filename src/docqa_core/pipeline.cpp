#include "docqa_core/pipeline.hpp"

#include <iostream>
#include <stdexcept>
#include <unordered_set>

#include "docqa_core/index/vector_index.hpp"

namespace docqa_core {

std::string to_string(IngestError error) {
  switch (error) {
    case IngestError::None:
      return "None";
    case IngestError::Extraction:
      return "Extraction";
    case IngestError::EmptyCorpus:
      return "EmptyCorpus";
    case IngestError::Embedding:
      return "Embedding";
    case IngestError::Download:
      return "Download";
  }
  return "None";
}

std::string IngestStatus::to_string() const {
  std::string joined;
  for (size_t i = 0; i < trail.size(); ++i) {
    if (i > 0) {
      joined += '\n';
    }
    joined += trail[i];
  }
  return joined;
}

Pipeline::Pipeline(PipelineConfig config,
                   std::shared_ptr<ContentExtractorFactory> extractor_factory,
                   std::shared_ptr<Embedder> embedder,
                   std::shared_ptr<Generator> generator,
                   std::shared_ptr<DocumentFetcher> fetcher)
    : config_(config),
      extractor_factory_(std::move(extractor_factory)),
      embedder_(std::move(embedder)),
      generator_(std::move(generator)),
      fetcher_(std::move(fetcher)),
      chunker_(config.chunk_size, config.chunk_overlap),
      retriever_(embedder_),
      prompt_builder_(config.max_prompt_chars) {
  if (!extractor_factory_ || !embedder_ || !generator_ || !fetcher_) {
    throw std::invalid_argument("Pipeline requires an extractor factory, embedder, generator "
                                "and document fetcher");
  }
  if (config_.top_k == 0) {
    throw std::invalid_argument("top_k must be at least 1");
  }
}

IngestStatus Pipeline::ingest(Session& session, const std::vector<Document>& documents) {
  return ingest_documents(session, documents, {"Processing uploaded files..."});
}

IngestStatus Pipeline::ingest_url(Session& session, const std::string& url) {
  std::vector<std::string> trail{"Downloading " + url + "..."};
  std::cout << "[pipeline] Downloading " << url << std::endl;

  Document document;
  try {
    document = fetcher_->fetch(url);
  } catch (const DownloadError& e) {
    std::cerr << "[pipeline] Download stage failed for " << url << ": " << e.what() << std::endl;
    if (e.status() != 0) {
      trail.push_back("Error: Failed to download (Status " + std::to_string(e.status()) + ")");
    } else {
      trail.push_back(std::string("Error: ") + e.what());
    }
    return IngestStatus::failure_response(IngestError::Download, e.what(), std::move(trail));
  }

  trail.push_back("Downloaded " + std::to_string(document.bytes.size()) + " bytes from " + url);
  return ingest_documents(session, {document}, std::move(trail));
}

IngestStatus Pipeline::ingest_documents(Session& session,
                                        const std::vector<Document>& documents,
                                        std::vector<std::string> trail) {
  auto lock = session.acquire_exclusive();
  session.begin_ingestion();
  try {
    IngestStatus status = build_corpus(session, documents, trail);
    if (!status.success) {
      session.abandon_ingestion();
    }
    return status;
  } catch (...) {
    session.abandon_ingestion();
    throw;
  }
}

IngestStatus Pipeline::build_corpus(Session& session,
                                    const std::vector<Document>& documents,
                                    std::vector<std::string>& trail) {
  // 1. Extract and normalize every document
  size_t failed_extractions = 0;
  std::vector<ExtractedText> texts = extract_all(documents, trail, failed_extractions);
  if (texts.empty()) {
    trail.push_back("Error: No text found in the documents.");
    if (failed_extractions > 0) {
      return IngestStatus::failure_response(
          IngestError::Extraction, "None of the documents could be extracted", std::move(trail));
    }
    EmptyCorpusError error("No text found in the documents.");
    std::cerr << "[pipeline] Ingestion failed: " << error.what() << std::endl;
    return IngestStatus::failure_response(IngestError::EmptyCorpus, error.what(),
                                          std::move(trail));
  }

  // 2. Chunk into passages with dense ids across the whole corpus
  std::vector<Passage> passages;
  for (const auto& extracted : texts) {
    std::vector<TextChunk> chunks;
    try {
      chunks = chunker_.split_with_offsets(extracted.text);
    } catch (const std::invalid_argument& e) {
      std::cerr << "[pipeline] Chunking stage failed for " << extracted.source << ": " << e.what()
                << std::endl;
      trail.push_back("Error: Failed to split " + extracted.source + ": " + e.what());
      return IngestStatus::failure_response(IngestError::Extraction, e.what(), std::move(trail));
    }
    for (auto& chunk : chunks) {
      Passage passage;
      passage.id = static_cast<int>(passages.size());
      passage.text = std::move(chunk.text);
      passage.source_document = extracted.source;
      passage.offset = chunk.offset;
      passages.push_back(std::move(passage));
    }
  }
  trail.push_back("Split text into " + std::to_string(passages.size()) + " passages");

  // 3. Embed every passage
  std::vector<IndexEntry> entries;
  entries.reserve(passages.size());
  for (auto& passage : passages) {
    try {
      std::vector<float> vector = embedder_->embed(passage.text);
      entries.push_back({std::move(passage), std::move(vector)});
    } catch (const EmbeddingError& e) {
      std::cerr << "[pipeline] Embedding stage failed for " << passage.source_document
                << " (passage " << passage.id << "): " << e.what() << std::endl;
      trail.push_back("Error: Failed to embed passages from " + passage.source_document + ": " +
                      e.what());
      return IngestStatus::failure_response(IngestError::Embedding, e.what(), std::move(trail));
    }
  }
  trail.push_back("Embedded " + std::to_string(entries.size()) + " passages with " +
                  embedder_->model_id());

  // 4. Build the index and publish
  auto corpus = std::make_shared<Corpus>();
  try {
    corpus->index = VectorIndex::build(std::move(entries));
  } catch (const VectorIndexError& e) {
    std::cerr << "[pipeline] Index stage failed: " << e.what() << std::endl;
    trail.push_back(std::string("Error: Failed to index passages: ") + e.what());
    return IngestStatus::failure_response(IngestError::Embedding, e.what(), std::move(trail));
  }
  corpus->embedding_model = embedder_->model_id();
  for (const auto& extracted : texts) {
    corpus->sources.push_back(extracted.source);
  }
  size_t passage_count = corpus->passage_count();
  trail.push_back("Indexed " + std::to_string(passage_count) + " passages");

  session.publish(std::move(corpus));
  trail.push_back("Documents processed successfully. Ask your questions!");
  std::cout << "[pipeline] Corpus ready: " << passage_count << " passages from "
            << texts.size() << " document(s)" << std::endl;
  return IngestStatus::success_response(std::move(trail), passage_count);
}

std::vector<Pipeline::ExtractedText> Pipeline::extract_all(const std::vector<Document>& documents,
                                                           std::vector<std::string>& trail,
                                                           size_t& failed_extractions) const {
  std::vector<ExtractedText> texts;
  std::unordered_set<std::string> seen_hashes;

  for (const auto& document : documents) {
    std::string content_hash = ContentExtractor::compute_content_hash(document.bytes);
    if (!seen_hashes.insert(content_hash).second) {
      trail.push_back("Skipped duplicate file: " + document.source);
      continue;
    }

    DocumentType type = DocumentType::Unknown;
    std::string text;
    try {
      text = normalize_text(extract_one(document, type));
    } catch (const ExtractionError& e) {
      ++failed_extractions;
      std::cerr << "[pipeline] Extraction stage failed for " << document.source << ": "
                << e.what() << std::endl;
      trail.push_back("Failed to extract " + document.source + ": " + e.what());
      continue;
    }

    if (text.empty()) {
      trail.push_back("No text found in " + document.source);
      continue;
    }

    trail.push_back("Processed file: " + document.source + " (" + docqa_core::to_string(type) +
                    ", " + std::to_string(code_points(text)) + " characters)");
    texts.push_back({document.source, std::move(text)});
  }
  return texts;
}

std::string Pipeline::extract_one(const Document& document, DocumentType& type) const {
  // Nothing to parse; no extractor ever sees an empty byte stream
  if (document.bytes.empty()) {
    return "";
  }
  const ContentExtractor& extractor = extractor_factory_->get_extractor_for(document);
  type = extractor.get_document_type();
  return extractor.extract(document);
}

Answer Pipeline::answer(Session& session, const std::string& question) {
  if (question.find_first_not_of(" \t\r\n\f\v") == std::string::npos) {
    throw std::invalid_argument("Question must not be empty");
  }

  std::vector<ScoredPassage> retrieved;
  {
    auto lock = session.acquire_shared();
    const auto& corpus = session.active_corpus();
    if (!corpus) {
      throw NotIngestedError("Documents have not been processed yet.");
    }
    try {
      retrieved = retriever_.retrieve(corpus.get(), question, config_.top_k);
    } catch (const EmbeddingError& e) {
      std::cerr << "[pipeline] Retrieval stage failed for question: " << e.what() << std::endl;
      throw;
    }
  }

  Prompt prompt = prompt_builder_.build(question, retrieved);

  std::string raw;
  try {
    raw = generator_->generate(prompt);
  } catch (const GenerationError& e) {
    std::cerr << "[pipeline] Generation stage failed (" << generator_->name()
              << "): " << e.what() << std::endl;
    throw;
  }

  return {sanitizer_.sanitize(raw), std::move(prompt.passages)};
}

std::string Pipeline::normalize_text(const std::string& text) {
  std::string out;
  out.reserve(text.size());

  auto emit_newline = [&out]() {
    while (!out.empty() && (out.back() == ' ' || out.back() == '\t')) {
      out.pop_back();
    }
    size_t trailing_newlines = 0;
    for (auto it = out.rbegin(); it != out.rend() && *it == '\n'; ++it) {
      ++trailing_newlines;
    }
    if (trailing_newlines < 2) {
      out.push_back('\n');
    }
  };

  for (size_t i = 0; i < text.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    if (c == '\r') {
      if (i + 1 < text.size() && text[i + 1] == '\n') {
        continue;
      }
      emit_newline();
    } else if (c == '\n') {
      emit_newline();
    } else if (c < 0x20 && c != '\t') {
      continue;
    } else {
      out.push_back(static_cast<char>(c));
    }
  }

  const char* whitespace = " \t\n";
  size_t start = out.find_first_not_of(whitespace);
  if (start == std::string::npos) {
    return "";
  }
  size_t end = out.find_last_not_of(whitespace);
  return out.substr(start, end - start + 1);
}

size_t Pipeline::code_points(const std::string& text) {
  size_t count = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

}  // namespace docqa_core
