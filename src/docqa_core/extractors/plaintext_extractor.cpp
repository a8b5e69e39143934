#include "docqa_core/extractors/plaintext_extractor.hpp"

namespace docqa_core {

bool PlainTextExtractor::can_handle(const fs::path& file_path) const {
  return lowercase_extension(file_path) == ".txt";
}

std::string PlainTextExtractor::extract_text(const fs::path& file_path) const {
  return normalize_content(get_string_content(file_path));
}

}  // namespace docqa_core
