#pragma once

#include "content_extractor.hpp"

namespace docqa_core {

// Fallback extractor: accepts any document whose bytes are valid UTF-8.
class PlainTextExtractor : public ContentExtractor {
 public:
  bool can_handle(const Document& document) const override;

  std::string extract(const Document& document) const override;

  DocumentType get_document_type() const override;
};

}  // namespace docqa_core
