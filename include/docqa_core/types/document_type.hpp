#pragma once

#include <string>

namespace docqa_core {

// Core document type enumeration
enum class DocumentType { Text, PDF, Markdown, Unknown };

// Conversion utilities
std::string to_string(DocumentType type);
DocumentType document_type_from_string(const std::string& str);

}  // namespace docqa_core
