#pragma once

#include <string>
#include <vector>

#include "docqa_core/types/passage.hpp"

namespace docqa_core {

struct Prompt {
  std::string text;
  std::string question;
  // The rendered context block on its own (used by the remote answering service)
  std::string context;
  // Passages that made it into the prompt, best first
  std::vector<ScoredPassage> passages;
};

/**
 * @class PromptBuilder
 * @brief Renders the generation prompt: instruction, Context block, Question
 *        block and the trailing "Answer:" cue, in that order.
 *
 * The rendered prompt never exceeds `max_prompt_chars` code points unless the
 * question alone does. Passages are dropped lowest-similarity first; if the
 * best passage alone does not fit, its text is cut to the remaining room.
 */
class PromptBuilder {
 public:
  static constexpr size_t DEFAULT_MAX_PROMPT_CHARS = 6000;
  static constexpr const char *INSTRUCTION =
      "Use the following context to answer the question. If the context does not contain the "
      "answer, say that you don't know.";

  explicit PromptBuilder(size_t max_prompt_chars = DEFAULT_MAX_PROMPT_CHARS);

  Prompt build(const std::string &question, const std::vector<ScoredPassage> &retrieved) const;

  size_t max_prompt_chars() const {
    return max_prompt_chars_;
  }

 private:
  size_t max_prompt_chars_;

  std::string render(const std::string &question, const std::string &context) const;
  static std::string render_context(const std::vector<ScoredPassage> &passages);
  static size_t code_points(const std::string &text);
  static std::string truncate_code_points(const std::string &text, size_t limit);
};

}  // namespace docqa_core
