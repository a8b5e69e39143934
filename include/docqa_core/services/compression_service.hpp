#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docqa_core {

class CompressionService {
 public:
  /**
   * @brief Compresses chunk text with Zstandard.
   * @param data The text to compress.
   * @param compression_level The zstd compression level (default is 3).
   * @return The compressed frame. Empty input gives an empty frame.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = 3);

  /**
   * @brief Decompresses a single Zstandard frame produced by compress().
   * @throws std::runtime_error if the data is not a complete zstd frame.
   */
  static std::string decompress(const std::vector<char>& compressed_data);
};

}  // namespace docqa_core
