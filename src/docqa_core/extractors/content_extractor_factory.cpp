#include "docqa_core/extractors/content_extractor_factory.hpp"
#include "docqa_core/extractors/markdown_extractor.hpp"
#include "docqa_core/extractors/plaintext_extractor.hpp"

#include <algorithm>

namespace docqa_core {

ContentExtractorFactory::ContentExtractorFactory() {
  extractors.push_back(std::make_unique<MarkdownExtractor>());
  extractors.push_back(std::make_unique<PlainTextExtractor>());
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(
    const std::filesystem::path& file_path) const {
  for (const auto& extractor : extractors) {
    if (extractor->can_handle(file_path)) {
      return *extractor;
    }
  }
  throw ContentExtractorError("Unsupported file type: " + file_path.filename().string());
}

bool ContentExtractorFactory::is_supported(const std::filesystem::path& file_path) const {
  for (const auto& extractor : extractors) {
    if (extractor->can_handle(file_path)) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> ContentExtractorFactory::list_supported_files(
    const std::filesystem::path& dir) const {
  std::filesystem::create_directories(dir);

  std::vector<std::string> filenames;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (entry.is_regular_file() && is_supported(entry.path())) {
      filenames.push_back(entry.path().filename().string());
    }
  }
  std::sort(filenames.begin(), filenames.end());
  return filenames;
}

}  // namespace docqa_core
