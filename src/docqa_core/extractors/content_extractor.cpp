#include "docqa_core/extractors/content_extractor.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace docqa_core {

DocumentType ContentExtractor::get_document_type() const {
  return DocumentType::Unknown;
}

std::string ContentExtractor::compute_content_hash(const std::string& content) {
  EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw ExtractionError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ExtractionError("Failed to initialize SHA256 digest");
  }

  if (EVP_DigestUpdate(mdctx, content.data(), content.length()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ExtractionError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ExtractionError("Failed to finalize SHA256 digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }

  return ss.str();
}

std::string ContentExtractor::source_extension(const std::string& source) {
  // URLs carry query strings and fragments after the path
  std::string path = source.substr(0, source.find_first_of("?#"));
  std::string extension = std::filesystem::path(path).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension;
}

bool ContentExtractor::has_extension(const std::string& source,
                                     std::initializer_list<const char*> extensions) {
  const std::string extension = source_extension(source);
  return std::any_of(extensions.begin(), extensions.end(),
                     [&extension](const char* candidate) { return extension == candidate; });
}

}  // namespace docqa_core
