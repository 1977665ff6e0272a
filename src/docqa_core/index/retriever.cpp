#include "docqa_core/index/retriever.hpp"

#include <stdexcept>

namespace docqa_core {

Retriever::Retriever(std::shared_ptr<Embedder> embedder) : embedder_(std::move(embedder)) {}

std::vector<ScoredPassage> Retriever::retrieve(const Corpus *corpus, const std::string &question,
                                               size_t k) const {
  if (!corpus || corpus->passage_count() == 0) {
    throw NotIngestedError("Documents have not been processed yet.");
  }
  if (corpus->embedding_model != embedder_->model_id()) {
    throw EmbeddingError("Corpus was indexed with " + corpus->embedding_model +
                         " but queries are embedded with " + embedder_->model_id());
  }

  std::vector<float> query_vector = embedder_->embed(question);
  return retrieve(corpus->index.get(), query_vector, k);
}

std::vector<ScoredPassage> Retriever::retrieve(const VectorIndex *index,
                                               const std::vector<float> &query_vector, size_t k) {
  if (!index || index->size() == 0) {
    throw NotIngestedError("Documents have not been processed yet.");
  }
  if (k == 0) {
    throw std::invalid_argument("k must be greater than 0");
  }
  if (query_vector.size() != index->dimension()) {
    throw EmbeddingError("Query embedding has dimension " + std::to_string(query_vector.size()) +
                         " but the index expects " + std::to_string(index->dimension()));
  }

  std::vector<SearchResult> hits;
  try {
    hits = index->search(query_vector, k);
  } catch (const VectorIndexError &e) {
    throw EmbeddingError(std::string("Query embedding rejected by the index: ") + e.what());
  }

  std::vector<ScoredPassage> results;
  results.reserve(hits.size());
  for (const auto &hit : hits) {
    results.push_back({index->passage(hit.id), hit.score});
  }
  return results;
}

}  // namespace docqa_core
