#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docqa_core/index/vector_index.hpp"

namespace docqa_core {

// Everything one successful ingestion produced. Immutable once published.
struct Corpus {
  std::unique_ptr<VectorIndex> index;
  // model_id() of the embedder that produced the vectors
  std::string embedding_model;
  std::vector<std::string> sources;

  size_t passage_count() const {
    return index ? index->size() : 0;
  }
};

}  // namespace docqa_core
