#pragma once

#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "docqa_core/types/passage.hpp"

namespace docqa_core {

struct SearchResult {
  int id;
  float score;
};

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class VectorIndex
 * @brief Exact in-memory cosine-similarity index over passages.
 *
 * Vectors are L2-normalized on the way in (both at build time and at query
 * time) and stored in a Faiss inner-product index keyed by passage id, so the
 * inner product is the cosine similarity. An index is immutable once built.
 */
class VectorIndex {
 public:
  /**
   * @brief Builds an index holding every entry.
   *
   * @throw VectorIndexError if there are no entries, the vectors do not all
   *        share one dimension, a vector is all zeros, or two entries carry
   *        the same passage id.
   */
  static std::unique_ptr<VectorIndex> build(std::vector<IndexEntry> entries);

  ~VectorIndex();

  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  // Results sorted by descending score, ties by ascending id; at most k of them
  std::vector<SearchResult> search(const std::vector<float> &query_vector, size_t k) const;

  const Passage &passage(int id) const;
  const std::vector<Passage> &passages() const {
    return passages_;
  }

  size_t size() const {
    return passages_.size();
  }
  size_t dimension() const {
    return dimension_;
  }

 private:
  explicit VectorIndex(size_t dimension);

  size_t dimension_;
  std::unique_ptr<faiss::IndexIDMap> faiss_index_;
  std::vector<Passage> passages_;
  std::unordered_map<int, size_t> position_by_id_;

  static void normalize(std::vector<float> &vector);
};

}  // namespace docqa_core
