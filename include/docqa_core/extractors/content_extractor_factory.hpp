#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "content_extractor.hpp"

namespace docqa_core {

/**
 * @class ContentExtractorFactory
 * @brief Selects the ContentExtractor for a file by its extension.
 *
 * Non-copyable and non-movable; the extractors it hands out live as long as the factory.
 */
class ContentExtractorFactory {
 public:
  ContentExtractorFactory();

  /**
   * @brief Returns the first registered extractor that can handle the file.
   * @throw ContentExtractorError if the extension is not supported.
   */
  const ContentExtractor& get_extractor_for(const std::filesystem::path& file_path) const;

  bool is_supported(const std::filesystem::path& file_path) const;

  // File names (not paths) of the supported regular files directly inside dir, sorted.
  // The directory is created if it does not exist.
  std::vector<std::string> list_supported_files(const std::filesystem::path& dir) const;

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory(ContentExtractorFactory&&) = delete;
  ContentExtractorFactory& operator=(ContentExtractorFactory&&) = delete;

 private:
  std::vector<std::unique_ptr<ContentExtractor>> extractors;
};

}  // namespace docqa_core
