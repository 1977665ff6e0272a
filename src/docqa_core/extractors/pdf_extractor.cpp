#include "docqa_core/extractors/pdf_extractor.hpp"

#include <poppler-document.h>
#include <poppler-page.h>

#include <algorithm>
#include <climits>
#include <iostream>
#include <memory>

namespace docqa_core {

bool PdfExtractor::can_handle(const Document& document) const {
  if (document.bytes.compare(0, 5, "%PDF-") == 0) {
    return true;
  }
  return has_extension(document.source, {".pdf"});
}

DocumentType PdfExtractor::get_document_type() const {
  return DocumentType::PDF;
}

std::string PdfExtractor::extract(const Document& document) const {
  if (document.bytes.size() > static_cast<size_t>(INT_MAX)) {
    throw ExtractionError("PDF is too large to load: " + document.source);
  }

  std::unique_ptr<poppler::document> doc(poppler::document::load_from_raw_data(
      document.bytes.data(), static_cast<int>(document.bytes.size())));
  if (!doc) {
    throw ExtractionError("Error reading PDF: failed to load document " + document.source);
  }

  // Reject encrypted/locked PDFs
  if (doc->is_locked()) {
    throw ExtractionError("Error reading PDF: document is password protected " + document.source);
  }

  const int page_count = doc->pages();
  const int pages_to_process = std::min(page_count, MAX_PAGES);
  if (page_count > MAX_PAGES) {
    std::cout << "[extractor] PDF has " << page_count << " pages, capping at " << MAX_PAGES
              << ": " << document.source << std::endl;
  }

  std::string full_text;
  for (int i = 0; i < pages_to_process; ++i) {
    if (i > 0) {
      full_text += '\n';
    }

    std::unique_ptr<poppler::page> page(doc->create_page(i));
    if (!page) {
      continue;
    }

    // Image-only pages simply have no text layer
    const poppler::byte_array utf8_page = page->text().to_utf8();
    full_text.append(utf8_page.begin(), utf8_page.end());
  }

  return full_text;
}

}  // namespace docqa_core
