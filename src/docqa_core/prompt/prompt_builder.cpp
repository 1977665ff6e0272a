#include "docqa_core/prompt/prompt_builder.hpp"

#include <utf8.h>

#include <algorithm>

namespace docqa_core {

PromptBuilder::PromptBuilder(size_t max_prompt_chars) : max_prompt_chars_(max_prompt_chars) {}

Prompt PromptBuilder::build(const std::string &question,
                            const std::vector<ScoredPassage> &retrieved) const {
  std::vector<ScoredPassage> selected = retrieved;
  std::stable_sort(selected.begin(), selected.end(),
                   [](const ScoredPassage &a, const ScoredPassage &b) {
                     if (a.score != b.score) {
                       return a.score > b.score;
                     }
                     return a.passage.id < b.passage.id;
                   });

  std::string context = render_context(selected);
  std::string text = render(question, context);

  while (!selected.empty() && code_points(text) > max_prompt_chars_) {
    if (selected.size() > 1) {
      selected.pop_back();
    } else {
      // Only the best passage is left: keep as much of it as fits
      ScoredPassage &best = selected.front();
      const std::string original = std::move(best.passage.text);
      best.passage.text.clear();
      const size_t overhead = code_points(render(question, render_context(selected)));
      if (overhead >= max_prompt_chars_) {
        selected.clear();
      } else {
        best.passage.text = truncate_code_points(original, max_prompt_chars_ - overhead);
      }
    }
    context = render_context(selected);
    text = render(question, context);
  }

  return {text, question, context, selected};
}

std::string PromptBuilder::render(const std::string &question, const std::string &context) const {
  std::string prompt;
  prompt.reserve(context.size() + question.size() + 256);
  prompt += INSTRUCTION;
  prompt += "\n\nContext:\n";
  prompt += context;
  prompt += "\n\nQuestion: ";
  prompt += question;
  prompt += "\n\nAnswer:";
  return prompt;
}

std::string PromptBuilder::render_context(const std::vector<ScoredPassage> &passages) {
  std::string context;
  for (size_t i = 0; i < passages.size(); ++i) {
    if (i > 0) {
      context += "\n\n";
    }
    context += "[" + std::to_string(i + 1) + "] (source: " + passages[i].passage.source_document +
               ")\n";
    context += passages[i].passage.text;
  }
  return context;
}

size_t PromptBuilder::code_points(const std::string &text) {
  if (utf8::find_invalid(text.begin(), text.end()) != text.end()) {
    return text.size();
  }
  return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

std::string PromptBuilder::truncate_code_points(const std::string &text, size_t limit) {
  if (utf8::find_invalid(text.begin(), text.end()) != text.end()) {
    return text.substr(0, std::min(limit, text.size()));
  }
  auto it = text.begin();
  for (size_t i = 0; i < limit && it != text.end(); ++i) {
    utf8::next(it, text.end());
  }
  return std::string(text.begin(), it);
}

}  // namespace docqa_core
