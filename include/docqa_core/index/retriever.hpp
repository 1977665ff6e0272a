#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docqa_core/embedding/embedder.hpp"
#include "docqa_core/index/corpus.hpp"
#include "docqa_core/types/passage.hpp"

namespace docqa_core {

// Raised when a question targets a session that has no corpus yet
class NotIngestedError : public std::exception {
 public:
  explicit NotIngestedError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class Retriever {
 public:
  explicit Retriever(std::shared_ptr<Embedder> embedder);

  /**
   * @brief Embeds the question and returns the top-k passages of the corpus.
   *
   * @throw NotIngestedError if the corpus is null or empty.
   * @throw EmbeddingError if the question cannot be embedded or the corpus was
   *        built by a different embedder.
   */
  std::vector<ScoredPassage> retrieve(const Corpus *corpus, const std::string &question,
                                      size_t k) const;

  /**
   * @brief Returns min(k, |index|) passages by descending cosine similarity,
   *        ties broken by ascending passage id.
   *
   * @throw NotIngestedError if the index is null or empty.
   * @throw EmbeddingError if the query dimension differs from the index.
   * @throw std::invalid_argument if k is 0.
   */
  static std::vector<ScoredPassage> retrieve(const VectorIndex *index,
                                             const std::vector<float> &query_vector, size_t k);

 private:
  std::shared_ptr<Embedder> embedder_;
};

}  // namespace docqa_core
