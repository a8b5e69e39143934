#pragma once
#include "content_extractor.hpp"

namespace docqa_core {

// Markdown is indexed as written: headings and markup stay part of the text.
class MarkdownExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  std::string extract_text(const fs::path& file_path) const override;
};

}  // namespace docqa_core
