#pragma once

#include "content_extractor.hpp"

namespace docqa_core {

class PlainTextExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  std::string extract_text(const fs::path& file_path) const override;
};

}  // namespace docqa_core
