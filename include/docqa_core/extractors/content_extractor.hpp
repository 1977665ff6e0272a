#pragma once

#include <initializer_list>
#include <memory>
#include <string>

#include "docqa_core/types/document.hpp"
#include "docqa_core/types/document_type.hpp"

namespace docqa_core {

class ExtractionError : public std::exception {
 public:
  explicit ExtractionError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given document
  virtual bool can_handle(const Document& document) const = 0;

  // Converts the raw bytes into plain text. Throws ExtractionError when the
  // bytes are not a parseable document of this type.
  virtual std::string extract(const Document& document) const = 0;

  virtual DocumentType get_document_type() const;

  // Hex-encoded SHA-256 of the raw document bytes
  static std::string compute_content_hash(const std::string& content);

 protected:
  // Lower-cased extension of the source name, ignoring any URL query or fragment
  static std::string source_extension(const std::string& source);
  static bool has_extension(const std::string& source, std::initializer_list<const char*> extensions);
};

using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace docqa_core
