#include <gtest/gtest.h>

#include <cmath>
#include <numeric>

#include "docqa_core/embedding/hashing_embedder.hpp"

namespace docqa_core {

namespace {
float dot(const std::vector<float>& a, const std::vector<float>& b) {
  return std::inner_product(a.begin(), a.end(), b.begin(), 0.0f);
}
}  // namespace

TEST(HashingEmbedderTest, IsDeterministic) {
  HashingEmbedder embedder;
  auto first = embedder.embed("The capital of France is Paris.");
  auto second = embedder.embed("The capital of France is Paris.");
  EXPECT_EQ(first, second);

  HashingEmbedder other_instance;
  EXPECT_EQ(first, other_instance.embed("The capital of France is Paris."));
}

TEST(HashingEmbedderTest, ProducesUnitVectorsOfConfiguredDimension) {
  HashingEmbedder embedder(64);
  auto vector = embedder.embed("hello world");
  ASSERT_EQ(vector.size(), 64u);
  EXPECT_NEAR(std::sqrt(dot(vector, vector)), 1.0f, 1e-5f);
  EXPECT_EQ(embedder.dimension(), 64u);
  EXPECT_EQ(embedder.model_id(), "hashing-64");
}

TEST(HashingEmbedderTest, IgnoresCaseAndPunctuation) {
  HashingEmbedder embedder;
  EXPECT_EQ(embedder.embed("Paris, France!"), embedder.embed("paris france"));
}

TEST(HashingEmbedderTest, RelatedTextScoresHigherThanUnrelated) {
  HashingEmbedder embedder;
  auto question = embedder.embed("What is the capital of France?");
  auto related = embedder.embed("The capital of France is Paris.");
  auto unrelated = embedder.embed("Photosynthesis converts light into chemical energy.");
  EXPECT_GT(dot(question, related), dot(question, unrelated));
}

TEST(HashingEmbedderTest, RejectsEmptyInput) {
  HashingEmbedder embedder;
  EXPECT_THROW(embedder.embed(""), EmbeddingError);
  EXPECT_THROW(embedder.embed("   \n\t"), EmbeddingError);
  EXPECT_THROW(embedder.embed("?!... ---"), EmbeddingError);
}

TEST(HashingEmbedderTest, RejectsTooSmallDimension) {
  EXPECT_THROW(HashingEmbedder(HashingEmbedder::MIN_DIMENSION - 1), EmbeddingError);
}

}  // namespace docqa_core
