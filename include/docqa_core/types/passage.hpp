#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docqa_core {

struct Passage {
  int id = 0;
  std::string text;
  std::string source_document;
  // Code-point offset of the passage start in the normalized document text
  size_t offset = 0;
};

struct IndexEntry {
  Passage passage;
  std::vector<float> vector;
};

struct ScoredPassage {
  Passage passage;
  float score = 0.0f;
};

struct Answer {
  std::string text;
  std::vector<ScoredPassage> supporting_passages;
};

}  // namespace docqa_core
