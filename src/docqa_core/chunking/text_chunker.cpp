#include "docqa_core/chunking/text_chunker.hpp"

#include <algorithm>

#include "docqa_core/errors.hpp"
#include "docqa_core/utils/text_utils.hpp"

namespace docqa_core {

TextChunker::TextChunker(const ChunkingConfig &config) : config_(config) {
  validate(config_);
}

void TextChunker::validate(const ChunkingConfig &config) {
  if (config.chunk_size == 0) {
    throw ConfigError("chunk_size must be greater than 0");
  }
  if (config.chunk_overlap >= config.chunk_size) {
    throw ConfigError("chunk_overlap (" + std::to_string(config.chunk_overlap) +
                      ") must be smaller than chunk_size (" +
                      std::to_string(config.chunk_size) + ")");
  }
  if (config.snippet_max_chars == 0) {
    throw ConfigError("snippet_max_chars must be greater than 0");
  }
}

std::vector<Chunk> TextChunker::chunk(const std::string &text) const {
  std::vector<Chunk> chunks;
  if (text.empty()) {
    return chunks;
  }

  const std::vector<size_t> boundaries = code_point_boundaries(text);
  const size_t length = boundaries.size() - 1;
  const size_t step = config_.chunk_size - config_.chunk_overlap;

  int index = 0;
  size_t offset = 0;
  while (true) {
    const size_t end = std::min(offset + config_.chunk_size, length);
    const size_t byte_start = boundaries[offset];
    const size_t byte_end = boundaries[end];

    Chunk chunk;
    chunk.index = index++;
    chunk.char_start = offset;
    chunk.char_end = end;
    chunk.content = text.substr(byte_start, byte_end - byte_start);
    if (end - offset > config_.snippet_max_chars) {
      chunk.snippet = truncate_code_points(chunk.content, config_.snippet_max_chars);
    } else {
      chunk.snippet = chunk.content;
    }
    chunks.push_back(std::move(chunk));

    if (end >= length) {
      break;
    }
    offset += step;
  }

  return chunks;
}

}  // namespace docqa_core
