#include "docqa_core/extractors/content_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include "docqa_core/utils/text_utils.hpp"

namespace docqa_core {

namespace {
constexpr const char* UTF8_BOM = "\xEF\xBB\xBF";
}

std::string ContentExtractor::get_string_content(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw ContentExtractorError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw ContentExtractorError("Failed while reading file: " + file_path.string());
  }
  return buffer.str();
}

std::string ContentExtractor::normalize_content(const std::string& content) const {
  std::string text = content;
  if (text.rfind(UTF8_BOM, 0) == 0) {
    text.erase(0, 3);
  }
  // Throws ContentError on invalid UTF-8
  code_point_length(text);
  return normalize_text(text);
}

std::string ContentExtractor::lowercase_extension(const fs::path& file_path) {
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension;
}

}  // namespace docqa_core
