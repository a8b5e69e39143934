#include "docqa_core/extractors/markdown_extractor.hpp"

namespace docqa_core {

bool MarkdownExtractor::can_handle(const fs::path& file_path) const {
  const std::string extension = lowercase_extension(file_path);
  return extension == ".md" || extension == ".markdown";
}

std::string MarkdownExtractor::extract_text(const fs::path& file_path) const {
  return normalize_content(get_string_content(file_path));
}

}  // namespace docqa_core
