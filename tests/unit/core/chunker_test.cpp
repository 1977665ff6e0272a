#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "docqa_core/chunking/chunker.hpp"

namespace docqa_core {

class ChunkerTest : public ::testing::Test {
 protected:
  // Drops the overlap prefix of every chunk after the first and concatenates
  static std::string reconstruct(const std::vector<std::string>& chunks, size_t overlap) {
    std::string out;
    for (size_t i = 0; i < chunks.size(); ++i) {
      if (i == 0) {
        out += chunks[i];
        continue;
      }
      out += drop_code_points(chunks[i], overlap);
    }
    return out;
  }

  static std::string drop_code_points(const std::string& text, size_t count) {
    size_t pos = 0;
    while (count > 0 && pos < text.size()) {
      ++pos;
      while (pos < text.size() && (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) {
        ++pos;
      }
      --count;
    }
    return text.substr(pos);
  }

  static size_t code_points(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
      if ((c & 0xC0) != 0x80) {
        ++count;
      }
    }
    return count;
  }
};

TEST_F(ChunkerTest, ShortTextYieldsSingleTrimmedChunk) {
  auto chunks = Chunker::split("  The capital of France is Paris.  \n", 1000, 200);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "The capital of France is Paris.");
}

TEST_F(ChunkerTest, TextOfExactlyChunkSizeIsOneChunk) {
  std::string text(10, 'a');
  auto chunks = Chunker::split(text, 10, 3);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], text);
}

TEST_F(ChunkerTest, BlankTextYieldsNoChunks) {
  EXPECT_TRUE(Chunker::split("", 10, 2).empty());
  EXPECT_TRUE(Chunker::split(" \n\t ", 10, 2).empty());
}

TEST_F(ChunkerTest, WindowsOverlapAndEndAtTextEnd) {
  // 0123456789abcd: size 6, overlap 2, step 4 -> [0,6) [4,10) [8,14)
  auto chunks = Chunker::split("0123456789abcd", 6, 2);
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0], "012345");
  EXPECT_EQ(chunks[1], "456789");
  EXPECT_EQ(chunks[2], "89abcd");
}

TEST_F(ChunkerTest, LastChunkMayBeShorterButNeverOnlyOverlap) {
  // 11 chars, size 6, overlap 2: [0,6) [4,10) [8,11)
  auto chunks = Chunker::split("abcdefghijk", 6, 2);
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[2], "ijk");
  for (const auto& chunk : chunks) {
    EXPECT_GT(code_points(chunk), 2u);
  }
}

TEST_F(ChunkerTest, ReconstructsTrimmedInput) {
  const std::string text =
      "Retrieval-augmented generation combines a retriever with a generator. "
      "The retriever finds passages; the generator writes the answer.";
  for (size_t size : {5u, 17u, 40u, 64u}) {
    for (size_t overlap : {0u, 1u, 4u}) {
      auto chunks = Chunker::split(text, size, overlap);
      ASSERT_FALSE(chunks.empty());
      EXPECT_EQ(reconstruct(chunks, overlap), text) << "size=" << size << " overlap=" << overlap;
    }
  }
}

TEST_F(ChunkerTest, NeverSplitsMultiByteCharacters) {
  const std::string text = "Ça coûte 5 € - naïve façade 日本語のテキスト";
  auto chunks = Chunker::split(text, 4, 1);
  ASSERT_GT(chunks.size(), 1u);
  for (const auto& chunk : chunks) {
    EXPECT_LE(code_points(chunk), 4u);
    // Every chunk starts on a lead byte
    EXPECT_NE(static_cast<unsigned char>(chunk[0]) & 0xC0, 0x80);
  }
  EXPECT_EQ(reconstruct(chunks, 1), text);
}

TEST_F(ChunkerTest, OffsetsAreCodePointPositionsInInput) {
  Chunker chunker(6, 2);
  auto chunks = chunker.split_with_offsets("  0123456789abcd");
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].offset, 2u);
  EXPECT_EQ(chunks[1].offset, 6u);
  EXPECT_EQ(chunks[2].offset, 10u);
}

TEST_F(ChunkerTest, RejectsInvalidArguments) {
  EXPECT_THROW(Chunker(0, 0), std::invalid_argument);
  EXPECT_THROW(Chunker(10, 10), std::invalid_argument);
  EXPECT_THROW(Chunker(10, 11), std::invalid_argument);
  EXPECT_NO_THROW(Chunker(10, 9));
}

TEST_F(ChunkerTest, RejectsInvalidUtf8) {
  std::string invalid = "abc\xff\xfe def";
  EXPECT_THROW(Chunker::split(invalid, 4, 1), std::invalid_argument);
}

}  // namespace docqa_core
