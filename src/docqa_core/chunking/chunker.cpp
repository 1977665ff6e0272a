#include "docqa_core/chunking/chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <stdexcept>

namespace docqa_core {

namespace {
constexpr const char* WHITESPACE = " \t\n\r\f\v";
}

Chunker::Chunker(size_t chunk_size, size_t overlap) : chunk_size_(chunk_size), overlap_(overlap) {
  if (chunk_size_ == 0) {
    throw std::invalid_argument("chunk_size must be greater than 0");
  }
  if (overlap_ >= chunk_size_) {
    throw std::invalid_argument("overlap (" + std::to_string(overlap_) +
                                ") must be smaller than chunk_size (" +
                                std::to_string(chunk_size_) + ")");
  }
}

std::vector<std::string> Chunker::split(const std::string& text) const {
  std::vector<std::string> out;
  for (auto& chunk : split_with_offsets(text)) {
    out.push_back(std::move(chunk.text));
  }
  return out;
}

std::vector<std::string> Chunker::split(const std::string& text, size_t chunk_size, size_t overlap) {
  return Chunker(chunk_size, overlap).split(text);
}

std::vector<TextChunk> Chunker::split_with_offsets(const std::string& text) const {
  std::vector<TextChunk> out;

  const size_t first = text.find_first_not_of(WHITESPACE);
  if (first == std::string::npos) {
    return out;
  }
  const size_t last = text.find_last_not_of(WHITESPACE);
  const std::string trimmed = text.substr(first, last - first + 1);

  if (utf8::find_invalid(trimmed.begin(), trimmed.end()) != trimmed.end()) {
    throw std::invalid_argument("Cannot chunk text that is not valid UTF-8");
  }

  // Byte position of every code point, plus the end of the string
  std::vector<size_t> boundaries;
  boundaries.reserve(trimmed.size() + 1);
  for (auto it = trimmed.begin(); it != trimmed.end(); utf8::next(it, trimmed.end())) {
    boundaries.push_back(static_cast<size_t>(it - trimmed.begin()));
  }
  const size_t total = boundaries.size();
  boundaries.push_back(trimmed.size());

  // Leading whitespace is ASCII, so its byte count is its code point count
  const size_t base_offset = first;

  if (total <= chunk_size_) {
    out.push_back({trimmed, base_offset});
    return out;
  }

  const size_t step = chunk_size_ - overlap_;
  for (size_t start = 0;; start += step) {
    const size_t end = std::min(start + chunk_size_, total);
    out.push_back({trimmed.substr(boundaries[start], boundaries[end] - boundaries[start]),
                   base_offset + start});
    if (end == total) {
      break;
    }
  }

  return out;
}

}  // namespace docqa_core
