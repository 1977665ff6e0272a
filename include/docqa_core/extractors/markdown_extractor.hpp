#pragma once

#include "plaintext_extractor.hpp"

namespace docqa_core {

class MarkdownExtractor : public PlainTextExtractor {
 public:
  bool can_handle(const Document& document) const override;

  std::string extract(const Document& document) const override;

  DocumentType get_document_type() const override;

 private:
  // Drops markup from already-decoded content, line by line
  std::string strip_markup(const std::string& content) const;
};

}  // namespace docqa_core
