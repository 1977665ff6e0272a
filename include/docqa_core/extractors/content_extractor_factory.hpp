#pragma once
#include <memory>
#include <vector>

#include "content_extractor.hpp"

/**
 * @class ContentExtractorFactory
 * @brief Manages and provides the correct ContentExtractor for a given document.
 *
 * This factory holds a collection of all available content extractors and
 * selects the first one that accepts the document, based on its magic bytes
 * or the extension of its source name. The plain text extractor is registered
 * last and acts as the fallback.
 */
namespace docqa_core {
class ContentExtractorFactory {
 public:
  /**
   * @brief Constructs the factory and initializes all available extractors.
   */
  ContentExtractorFactory();
  virtual ~ContentExtractorFactory() = default;

  /**
   * @brief Finds and returns the most suitable extractor for the given document.
   *
   * @param document The document that needs to be processed.
   * @return A constant reference to the appropriate ContentExtractor.
   * @throw ExtractionError if no suitable extractor is found.
   */
  virtual const ContentExtractor& get_extractor_for(const Document& document) const;

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory(ContentExtractorFactory&&) = delete;
  ContentExtractorFactory& operator=(ContentExtractorFactory&&) = delete;

 private:
  std::vector<std::unique_ptr<ContentExtractor>> extractors;
};
}  // namespace docqa_core
