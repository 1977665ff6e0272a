#include "docqa_core/extractors/plaintext_extractor.hpp"

#include <utf8.h>

namespace docqa_core {

bool PlainTextExtractor::can_handle(const Document& document) const {
  return true;
}

DocumentType PlainTextExtractor::get_document_type() const {
  return DocumentType::Text;
}

std::string PlainTextExtractor::extract(const Document& document) const {
  const std::string& content = document.bytes;
  if (content.empty()) {
    return {};
  }

  // NUL bytes are valid UTF-8 but never show up in real text files
  if (content.find('\0') != std::string::npos) {
    throw ExtractionError("Document contains binary data: " + document.source);
  }

  auto invalid = utf8::find_invalid(content.begin(), content.end());
  if (invalid != content.end()) {
    throw ExtractionError("Document is not valid UTF-8 text (invalid byte at offset " +
                          std::to_string(invalid - content.begin()) + "): " + document.source);
  }

  if (utf8::starts_with_bom(content.begin(), content.end())) {
    return content.substr(3);
  }
  return content;
}

}  // namespace docqa_core
