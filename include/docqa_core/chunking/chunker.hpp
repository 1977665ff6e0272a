#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docqa_core {

struct TextChunk {
  std::string text;
  // Code-point offset of the chunk start in the untrimmed input
  size_t offset = 0;
};

/**
 * @class Chunker
 * @brief Fixed-window splitter with overlap, measured in Unicode code points.
 *
 * The input is trimmed of outer whitespace, then cut into windows of
 * `chunk_size` code points; consecutive windows share exactly `overlap` code
 * points. Dropping the first `overlap` code points of every chunk after the
 * first and concatenating gives back the trimmed input. The last window
 * always ends at the end of the text.
 */
class Chunker {
 public:
  // Throws std::invalid_argument unless 0 <= overlap < chunk_size
  Chunker(size_t chunk_size, size_t overlap);

  std::vector<std::string> split(const std::string& text) const;
  std::vector<TextChunk> split_with_offsets(const std::string& text) const;

  static std::vector<std::string> split(const std::string& text, size_t chunk_size, size_t overlap);

  size_t chunk_size() const {
    return chunk_size_;
  }
  size_t overlap() const {
    return overlap_;
  }

 private:
  size_t chunk_size_;
  size_t overlap_;
};

}  // namespace docqa_core
