#include "docqa_core/embedding/hashing_embedder.hpp"

#include <utf8.h>

#include <cctype>
#include <cmath>
#include <iterator>

namespace docqa_core {

namespace {

// Latin-1 punctuation, general punctuation and CJK punctuation act as separators
bool is_separator(uint32_t code_point) {
  if (code_point < 0x80) {
    return !std::isalnum(static_cast<unsigned char>(code_point));
  }
  return (code_point >= 0xA0 && code_point <= 0xBF) || code_point == 0xD7 || code_point == 0xF7 ||
         (code_point >= 0x2000 && code_point <= 0x206F) ||
         (code_point >= 0x3000 && code_point <= 0x303F);
}

}  // namespace

HashingEmbedder::HashingEmbedder(size_t dimension) : dimension_(dimension) {
  if (dimension_ < MIN_DIMENSION) {
    throw EmbeddingError("Hashing embedder dimension must be at least " +
                         std::to_string(MIN_DIMENSION));
  }
}

std::string HashingEmbedder::model_id() const {
  return "hashing-" + std::to_string(dimension_);
}

std::vector<float> HashingEmbedder::embed(const std::string &text) {
  if (text.find_first_not_of(" \t\n\r\f\v") == std::string::npos) {
    throw EmbeddingError("Cannot embed empty text");
  }

  std::vector<std::string> tokens = tokenize(text);
  if (tokens.empty()) {
    throw EmbeddingError("Text contains no words to embed");
  }

  std::vector<float> vector(dimension_, 0.0f);
  for (size_t i = 0; i < tokens.size(); ++i) {
    add_feature(vector, tokens[i], 1.0f);
    if (i + 1 < tokens.size()) {
      add_feature(vector, tokens[i] + " " + tokens[i + 1], BIGRAM_WEIGHT);
    }
  }

  float norm = 0.0f;
  for (float val : vector) {
    norm += val * val;
  }
  norm = std::sqrt(norm);
  if (norm == 0.0f) {
    throw EmbeddingError("Embedding collapsed to the zero vector");
  }
  for (float &val : vector) {
    val /= norm;
  }
  return vector;
}

std::vector<std::string> HashingEmbedder::tokenize(const std::string &text) const {
  std::vector<std::string> tokens;
  std::string current;

  try {
    for (auto it = text.begin(); it != text.end();) {
      uint32_t code_point = utf8::next(it, text.end());
      if (is_separator(code_point)) {
        if (!current.empty()) {
          tokens.push_back(std::move(current));
          current.clear();
        }
        continue;
      }
      if (code_point < 0x80) {
        current.push_back(static_cast<char>(std::tolower(static_cast<int>(code_point))));
      } else {
        utf8::append(static_cast<char32_t>(code_point), std::back_inserter(current));
      }
    }
  } catch (const utf8::exception &e) {
    throw EmbeddingError(std::string("Cannot embed text that is not valid UTF-8: ") + e.what());
  }

  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

void HashingEmbedder::add_feature(std::vector<float> &vector, const std::string &feature,
                                  float weight) const {
  const uint64_t hash = fnv1a(feature);
  const size_t bucket = static_cast<size_t>(hash % dimension_);
  // The high bit picks the sign so collisions tend to cancel instead of pile up
  const float sign = (hash >> 63) ? -1.0f : 1.0f;
  vector[bucket] += sign * weight;
}

uint64_t HashingEmbedder::fnv1a(const std::string &value) {
  uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : value) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

}  // namespace docqa_core
