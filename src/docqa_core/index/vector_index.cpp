#include "docqa_core/index/vector_index.hpp"

#include <faiss/impl/FaissException.h>

#include <algorithm>
#include <cmath>

namespace docqa_core {

VectorIndex::VectorIndex(size_t dimension) : dimension_(dimension) {
  auto base_index = new faiss::IndexFlatIP(static_cast<faiss::idx_t>(dimension));
  faiss_index_ = std::make_unique<faiss::IndexIDMap>(base_index);
  // The id map deletes the flat index with it
  faiss_index_->own_fields = true;
}

VectorIndex::~VectorIndex() = default;

std::unique_ptr<VectorIndex> VectorIndex::build(std::vector<IndexEntry> entries) {
  if (entries.empty()) {
    throw VectorIndexError("Cannot build an index without entries");
  }

  const size_t dimension = entries.front().vector.size();
  if (dimension == 0) {
    throw VectorIndexError("Cannot index zero-length vectors");
  }

  std::unique_ptr<VectorIndex> index(new VectorIndex(dimension));

  std::vector<float> all_vectors_flat;
  all_vectors_flat.reserve(entries.size() * dimension);
  std::vector<faiss::idx_t> faiss_ids;
  faiss_ids.reserve(entries.size());

  for (auto &entry : entries) {
    if (entry.vector.size() != dimension) {
      throw VectorIndexError("Vector dimension mismatch for passage " +
                             std::to_string(entry.passage.id) + ". Expected " +
                             std::to_string(dimension) + ", got " +
                             std::to_string(entry.vector.size()));
    }
    if (index->position_by_id_.count(entry.passage.id) > 0) {
      throw VectorIndexError("Duplicate passage id " + std::to_string(entry.passage.id));
    }

    normalize(entry.vector);
    all_vectors_flat.insert(all_vectors_flat.end(), entry.vector.begin(), entry.vector.end());
    faiss_ids.push_back(entry.passage.id);

    index->position_by_id_[entry.passage.id] = index->passages_.size();
    index->passages_.push_back(std::move(entry.passage));
  }

  try {
    index->faiss_index_->add_with_ids(static_cast<faiss::idx_t>(faiss_ids.size()),
                                      all_vectors_flat.data(), faiss_ids.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Faiss rejected the vectors: " + std::string(e.what()));
  }
  return index;
}

std::vector<SearchResult> VectorIndex::search(const std::vector<float> &query_vector,
                                              size_t k) const {
  if (query_vector.size() != dimension_) {
    throw VectorIndexError("Vector dimension mismatch. Expected " + std::to_string(dimension_) +
                           ", got " + std::to_string(query_vector.size()));
  }
  if (k == 0 || passages_.empty()) {
    return {};
  }

  std::vector<float> query = query_vector;
  normalize(query);

  // Rank the whole corpus so ties at the k boundary are still broken by id
  const faiss::idx_t total = faiss_index_->ntotal;
  std::vector<float> scores(static_cast<size_t>(total));
  std::vector<faiss::idx_t> labels(static_cast<size_t>(total));
  try {
    faiss_index_->search(1, query.data(), total, scores.data(), labels.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Faiss search failed: " + std::string(e.what()));
  }

  std::vector<SearchResult> results;
  results.reserve(labels.size());
  for (size_t i = 0; i < labels.size(); ++i) {
    if (labels[i] < 0) {
      continue;
    }
    results.push_back({static_cast<int>(labels[i]), scores[i]});
  }

  std::sort(results.begin(), results.end(), [](const SearchResult &a, const SearchResult &b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.id < b.id;
  });
  if (results.size() > k) {
    results.resize(k);
  }
  return results;
}

const Passage &VectorIndex::passage(int id) const {
  auto it = position_by_id_.find(id);
  if (it == position_by_id_.end()) {
    throw VectorIndexError("Unknown passage id " + std::to_string(id));
  }
  return passages_[it->second];
}

void VectorIndex::normalize(std::vector<float> &vector) {
  float norm = 0.0f;
  for (float val : vector) {
    norm += val * val;
  }
  norm = std::sqrt(norm);
  if (norm == 0.0f || !std::isfinite(norm)) {
    throw VectorIndexError("Cannot normalize a zero or non-finite vector");
  }
  for (float &val : vector) {
    val /= norm;
  }
}

}  // namespace docqa_core
