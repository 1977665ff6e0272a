#include "docqa_core/extractors/content_extractor_factory.hpp"

#include "docqa_core/extractors/markdown_extractor.hpp"
#include "docqa_core/extractors/pdf_extractor.hpp"
#include "docqa_core/extractors/plaintext_extractor.hpp"

namespace docqa_core {
ContentExtractorFactory::ContentExtractorFactory() {
  extractors.push_back(std::make_unique<PdfExtractor>());
  extractors.push_back(std::make_unique<MarkdownExtractor>());
  extractors.push_back(std::make_unique<PlainTextExtractor>());
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(const Document& document) const {
  for (const auto& extractor : extractors) {
    if (extractor->can_handle(document)) {
      return *extractor;
    }
  }
  throw ExtractionError("No suitable content extractor found for " + document.source);
}
}  // namespace docqa_core
