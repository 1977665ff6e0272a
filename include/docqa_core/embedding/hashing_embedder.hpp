#pragma once

#include <cstdint>

#include "docqa_core/embedding/embedder.hpp"

namespace docqa_core {

/**
 * @class HashingEmbedder
 * @brief Model-free embedder based on the hashing trick.
 *
 * Lower-cased word unigrams and adjacent-word bigrams are hashed (FNV-1a)
 * into `dimension` signed buckets and the result is L2-normalized. It needs
 * no model server and is deterministic by construction.
 */
class HashingEmbedder : public Embedder {
 public:
  static constexpr size_t DEFAULT_DIMENSION = 384;
  static constexpr size_t MIN_DIMENSION = 16;

  explicit HashingEmbedder(size_t dimension = DEFAULT_DIMENSION);

  std::vector<float> embed(const std::string &text) override;

  size_t dimension() const override {
    return dimension_;
  }

  std::string model_id() const override;

 private:
  static constexpr float BIGRAM_WEIGHT = 0.5f;

  size_t dimension_;

  std::vector<std::string> tokenize(const std::string &text) const;
  void add_feature(std::vector<float> &vector, const std::string &feature, float weight) const;
  static uint64_t fnv1a(const std::string &value);
};

}  // namespace docqa_core
