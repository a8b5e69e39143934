#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docqa_core {

// A contiguous slice [char_start, char_end) of a document's normalized text.
// Offsets count Unicode code points, not bytes.
struct Chunk {
  int index = 0;
  size_t char_start = 0;
  size_t char_end = 0;
  // Full chunk text, used for embedding and storage.
  std::string content;
  // Display copy of content, capped at the configured snippet length.
  std::string snippet;
};

struct EmbeddedChunk {
  Chunk chunk;
  std::vector<float> embedding;
};

}  // namespace docqa_core
