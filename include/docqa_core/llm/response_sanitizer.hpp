#pragma once

#include <functional>
#include <string>
#include <vector>

namespace docqa_core {

struct ArtifactPattern {
  std::string name;
  // Returns the text with this artifact removed, or unchanged when absent
  std::function<std::string(const std::string &)> strip;
};

/**
 * @class ResponseSanitizer
 * @brief Strips prompt artifacts from raw generator output.
 *
 * The artifact table is applied in order:
 *  1. `<think>...</think>` reasoning blocks
 *  2. an echoed prompt, up to and including the last `Answer:` marker
 *  3. a leading `Answer:` or `Response:` label
 *  4. a trailing echoed `Question:` or `Context:` section
 * and the result is trimmed. Markers match case-insensitively. Every pattern
 * is a forward scan, linear in the length of the response.
 *
 * sanitize() never throws: on any failure the raw text comes back unchanged,
 * and a non-blank input never sanitizes to an empty string.
 */
class ResponseSanitizer {
 public:
  ResponseSanitizer();

  std::string sanitize(const std::string &raw) const noexcept;

  const std::vector<ArtifactPattern> &patterns() const {
    return patterns_;
  }

 private:
  std::vector<ArtifactPattern> patterns_;

  static std::string strip_think_blocks(const std::string &text);
  static std::string strip_echoed_prompt(const std::string &text);
  static std::string strip_answer_label(const std::string &text);
  static std::string strip_trailing_echo(const std::string &text);

  static std::string trim(const std::string &text);
};

}  // namespace docqa_core
