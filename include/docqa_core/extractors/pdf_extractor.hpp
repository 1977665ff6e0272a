#pragma once

#include "content_extractor.hpp"

namespace docqa_core {

class PdfExtractor : public ContentExtractor {
 public:
  bool can_handle(const Document& document) const override;

  /**
   * @brief Extracts the text of every page, in page order.
   *
   * Pages are joined with a newline. A page without a text layer (a scanned
   * page, for instance) contributes an empty string rather than an error.
   *
   * @throw ExtractionError if the bytes cannot be loaded as a PDF or the
   *        document is password protected.
   */
  std::string extract(const Document& document) const override;

  DocumentType get_document_type() const override;

  static constexpr int MAX_PAGES = 1000;
};

}  // namespace docqa_core
