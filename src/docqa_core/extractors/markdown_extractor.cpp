#include "docqa_core/extractors/markdown_extractor.hpp"

#include <cctype>
#include <sstream>

namespace docqa_core {

namespace {

// All inline rewriting below is a single left-to-right scan per line, so
// arbitrarily long lines cost linear time and constant stack.

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

size_t skip_indent(const std::string& line, size_t max_spaces) {
  size_t i = 0;
  while (i < line.size() && i < max_spaces && is_space(line[i])) {
    ++i;
  }
  return i;
}

bool is_fence(const std::string& line) {
  size_t i = 0;
  while (i < line.size() && is_space(line[i])) {
    ++i;
  }
  return line.compare(i, 3, "```") == 0 || line.compare(i, 3, "~~~") == 0;
}

// "## Title" -> "Title"
std::string strip_heading(const std::string& line) {
  size_t i = skip_indent(line, 3);
  size_t hashes = 0;
  while (i + hashes < line.size() && line[i + hashes] == '#') {
    ++hashes;
  }
  if (hashes == 0 || hashes > 6) {
    return line;
  }
  size_t j = i + hashes;
  if (j >= line.size() || !is_space(line[j])) {
    return line;
  }
  while (j < line.size() && is_space(line[j])) {
    ++j;
  }
  return line.substr(j);
}

// "> quoted" -> "quoted"
std::string strip_quote(const std::string& line) {
  size_t i = skip_indent(line, 3);
  if (i >= line.size() || line[i] != '>') {
    return line;
  }
  ++i;
  if (i < line.size() && is_space(line[i])) {
    ++i;
  }
  return line.substr(i);
}

// First occurrence of c at or after a position. Positions must not decrease
// between calls, so the earlier answer is reused while it is still ahead.
class NextOf {
 public:
  NextOf(const std::string& text, char c) : text_(text), c_(c) {}

  size_t from(size_t pos) {
    if (!searched_ || (found_ != std::string::npos && found_ < pos)) {
      found_ = text_.find(c_, pos);
      searched_ = true;
    }
    return found_;
  }

 private:
  const std::string& text_;
  char c_;
  bool searched_ = false;
  size_t found_ = std::string::npos;
};

// "[text](url)" -> "text" and "![alt](src)" -> "alt"
std::string strip_links(const std::string& line) {
  std::string out;
  out.reserve(line.size());
  NextOf close_bracket(line, ']');
  NextOf close_paren(line, ')');

  size_t i = 0;
  while (i < line.size()) {
    bool image = line[i] == '!' && i + 1 < line.size() && line[i + 1] == '[';
    if (line[i] == '[' || image) {
      size_t text_start = i + (image ? 2 : 1);
      size_t text_end = close_bracket.from(text_start);
      bool has_text = text_end != std::string::npos && (image || text_end > text_start);
      if (has_text && text_end + 1 < line.size() && line[text_end + 1] == '(') {
        size_t url_end = close_paren.from(text_end + 2);
        if (url_end != std::string::npos) {
          out.append(line, text_start, text_end - text_start);
          i = url_end + 1;
          continue;
        }
      }
    }
    out.push_back(line[i]);
    ++i;
  }
  return out;
}

// "**bold**", "__strong__" and "*italic*" -> inner text
std::string strip_emphasis(const std::string& line) {
  std::string out;
  out.reserve(line.size());

  size_t i = 0;
  while (i < line.size()) {
    std::string delimiter;
    if (line.compare(i, 2, "**") == 0 || line.compare(i, 2, "__") == 0) {
      delimiter = line.substr(i, 2);
    } else if (line[i] == '*') {
      delimiter = "*";
    }

    if (!delimiter.empty()) {
      size_t inner_start = i + delimiter.size();
      if (inner_start < line.size() && !is_space(line[inner_start])) {
        size_t close = std::string::npos;
        if (delimiter == "__") {
          close = line.find("__", inner_start + 1);
        } else {
          // Starred emphasis never spans another star
          size_t star = line.find('*', inner_start + 1);
          if (star != std::string::npos && line.compare(star, delimiter.size(), delimiter) == 0) {
            close = star;
          }
        }
        if (close != std::string::npos && !is_space(line[close - 1])) {
          out.append(line, inner_start, close - inner_start);
          i = close + delimiter.size();
          continue;
        }
      }
    }
    out.push_back(line[i]);
    ++i;
  }
  return out;
}

// "`code`" -> "code"
std::string strip_inline_code(const std::string& line) {
  std::string out;
  out.reserve(line.size());

  size_t i = 0;
  while (i < line.size()) {
    if (line[i] == '`') {
      size_t close = line.find('`', i + 1);
      if (close == std::string::npos) {
        out.append(line, i, std::string::npos);
        break;
      }
      out.append(line, i + 1, close - i - 1);
      i = close + 1;
      continue;
    }
    out.push_back(line[i]);
    ++i;
  }
  return out;
}

}  // namespace

bool MarkdownExtractor::can_handle(const Document& document) const {
  return has_extension(document.source, {".md", ".markdown"});
}

DocumentType MarkdownExtractor::get_document_type() const {
  return DocumentType::Markdown;
}

std::string MarkdownExtractor::extract(const Document& document) const {
  // Encoding checks are shared with plain text
  return strip_markup(PlainTextExtractor::extract(document));
}

std::string MarkdownExtractor::strip_markup(const std::string& content) const {
  if (content.empty()) {
    return {};
  }

  std::istringstream input(content);
  std::ostringstream output;
  std::string line;
  bool first = true;

  while (std::getline(input, line)) {
    // Fence markers go, the code between them stays
    if (is_fence(line)) {
      continue;
    }
    line = strip_quote(strip_heading(line));
    line = strip_inline_code(strip_emphasis(strip_links(line)));

    if (!first) {
      output << '\n';
    }
    output << line;
    first = false;
  }

  return output.str();
}

}  // namespace docqa_core
