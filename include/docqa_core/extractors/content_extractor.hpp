#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;

namespace docqa_core {

class ContentExtractorError : public std::exception {
 public:
  explicit ContentExtractorError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  // Reads the file and returns its normalized text.
  // Throws ContentExtractorError if the file cannot be read, ContentError if it is not UTF-8.
  virtual std::string extract_text(const fs::path& file_path) const = 0;

 protected:
  std::string get_string_content(const fs::path& file_path) const;

  // Validates UTF-8, drops a leading byte order mark and applies normalize_text.
  std::string normalize_content(const std::string& content) const;

  static std::string lowercase_extension(const fs::path& file_path);
};

using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace docqa_core
