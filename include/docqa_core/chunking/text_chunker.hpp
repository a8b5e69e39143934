#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

struct ChunkingConfig {
  size_t chunk_size = 1000;
  size_t chunk_overlap = 200;
  size_t snippet_max_chars = 500;
};

/**
 * @brief Splits normalized text into fixed-size windows that overlap by a fixed amount.
 *
 * Window i spans [i * step, min(i * step + chunk_size, len)) where
 * step = chunk_size - chunk_overlap. The last window is the first one that reaches the end
 * of the text. Offsets are code point offsets, so the output is identical for identical input.
 */
class TextChunker {
 public:
  // Throws ConfigError unless chunk_size > 0 and chunk_overlap < chunk_size.
  explicit TextChunker(const ChunkingConfig &config);

  // Throws ContentError if text is not valid UTF-8. Empty text yields no chunks.
  std::vector<Chunk> chunk(const std::string &text) const;

  const ChunkingConfig &config() const {
    return config_;
  }

  static void validate(const ChunkingConfig &config);

 private:
  ChunkingConfig config_;
};

}  // namespace docqa_core
