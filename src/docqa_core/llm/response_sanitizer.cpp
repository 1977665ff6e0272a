#include "docqa_core/llm/response_sanitizer.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace docqa_core {

namespace {

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool equals_icase(char a, char b) {
  return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
}

size_t find_icase(const std::string &text, const std::string &needle, size_t from = 0) {
  if (from > text.size()) {
    return std::string::npos;
  }
  auto it = std::search(text.begin() + from, text.end(), needle.begin(), needle.end(),
                        equals_icase);
  return it == text.end() ? std::string::npos : static_cast<size_t>(it - text.begin());
}

size_t rfind_icase(const std::string &text, const std::string &needle) {
  auto it = std::find_end(text.begin(), text.end(), needle.begin(), needle.end(), equals_icase);
  return it == text.end() ? std::string::npos : static_cast<size_t>(it - text.begin());
}

bool starts_with_icase(const std::string &text, size_t pos, const std::string &prefix) {
  if (pos + prefix.size() > text.size()) {
    return false;
  }
  return std::equal(prefix.begin(), prefix.end(), text.begin() + pos, equals_icase);
}

// Position just past `<word> *:`, or npos when the label is not at pos
size_t match_label(const std::string &text, size_t pos, const std::string &word) {
  if (!starts_with_icase(text, pos, word)) {
    return std::string::npos;
  }
  size_t i = pos + word.size();
  while (i < text.size() && is_space(text[i])) {
    ++i;
  }
  if (i >= text.size() || text[i] != ':') {
    return std::string::npos;
  }
  return i + 1;
}

}  // namespace

ResponseSanitizer::ResponseSanitizer() {
  patterns_.push_back({"think_block", strip_think_blocks});
  patterns_.push_back({"echoed_prompt", strip_echoed_prompt});
  patterns_.push_back({"answer_label", strip_answer_label});
  patterns_.push_back({"trailing_echo", strip_trailing_echo});
}

std::string ResponseSanitizer::strip_think_blocks(const std::string &text) {
  static const std::string open_tag = "<think>";
  static const std::string close_tag = "</think>";

  std::string out;
  out.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    size_t open = find_icase(text, open_tag, pos);
    if (open == std::string::npos) {
      break;
    }
    size_t close = find_icase(text, close_tag, open + open_tag.size());
    if (close == std::string::npos) {
      // An unterminated block stays
      break;
    }
    out.append(text, pos, open - pos);
    pos = close + close_tag.size();
  }
  if (pos < text.size()) {
    out.append(text, pos, std::string::npos);
  }
  return out;
}

std::string ResponseSanitizer::strip_echoed_prompt(const std::string &text) {
  static const std::string question = "question:";
  static const std::string answer = "answer:";

  size_t answer_pos = rfind_icase(text, answer);
  if (answer_pos == std::string::npos) {
    return text;
  }
  size_t question_pos = find_icase(text, question);
  if (question_pos == std::string::npos || question_pos + question.size() > answer_pos) {
    return text;
  }
  return text.substr(answer_pos + answer.size());
}

std::string ResponseSanitizer::strip_answer_label(const std::string &text) {
  size_t start = 0;
  while (start < text.size() && is_space(text[start])) {
    ++start;
  }
  for (const char *word : {"answer", "response"}) {
    size_t end = match_label(text, start, word);
    if (end != std::string::npos) {
      while (end < text.size() && is_space(text[end])) {
        ++end;
      }
      return text.substr(end);
    }
  }
  return text;
}

std::string ResponseSanitizer::strip_trailing_echo(const std::string &text) {
  size_t newline = text.find('\n');
  while (newline != std::string::npos) {
    size_t i = newline + 1;
    while (i < text.size() && is_space(text[i])) {
      ++i;
    }
    if (match_label(text, i, "question") != std::string::npos ||
        match_label(text, i, "context") != std::string::npos) {
      return text.substr(0, newline);
    }
    // Newlines inside the whitespace run just scanned lead to the same place
    newline = text.find('\n', std::max(i, newline + 1));
  }
  return text;
}

std::string ResponseSanitizer::trim(const std::string &text) {
  const char *whitespace = " \t\r\n\f\v";
  size_t start = text.find_first_not_of(whitespace);
  if (start == std::string::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(whitespace);
  return text.substr(start, end - start + 1);
}

std::string ResponseSanitizer::sanitize(const std::string &raw) const noexcept {
  try {
    std::string cleaned = raw;
    for (const auto &artifact : patterns_) {
      cleaned = artifact.strip(cleaned);
    }
    cleaned = trim(cleaned);
    if (cleaned.empty()) {
      return trim(raw);
    }
    return cleaned;
  } catch (const std::exception &e) {
    std::cerr << "[sanitizer] Returning raw response, sanitizing failed: " << e.what()
              << std::endl;
    return raw;
  }
}

}  // namespace docqa_core
