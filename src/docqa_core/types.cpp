#include "docqa_core/types.hpp"

namespace docqa_core {

std::string to_string(DocumentType type) {
  switch (type) {
    case DocumentType::Text:
      return "Text";
    case DocumentType::PDF:
      return "PDF";
    case DocumentType::Markdown:
      return "Markdown";
    default:
      return "Unknown";
  }
}

DocumentType document_type_from_string(const std::string& str) {
  if (str == "Text")
    return DocumentType::Text;
  if (str == "PDF")
    return DocumentType::PDF;
  if (str == "Markdown")
    return DocumentType::Markdown;
  return DocumentType::Unknown;
}

}  // namespace docqa_core
