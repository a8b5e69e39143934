#pragma once

#include <exception>
#include <string>

namespace docqa_core {

// Invalid chunking, k, or configuration parameters. Raised before any work begins.
class ConfigError : public std::exception {
 public:
  explicit ConfigError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Empty or unreadable document input.
class ContentError : public std::exception {
 public:
  explicit ContentError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// A stored record or chunk failed structural validation.
class MalformedRecordError : public std::exception {
 public:
  explicit MalformedRecordError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class DimensionMismatchError : public std::exception {
 public:
  DimensionMismatchError(size_t expected, size_t actual)
      : expected_(expected),
        actual_(actual),
        message_("Embedding dimension mismatch. Expected " + std::to_string(expected) +
                 ", got " + std::to_string(actual)) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  size_t expected() const {
    return expected_;
  }
  size_t actual() const {
    return actual_;
  }

 private:
  size_t expected_;
  size_t actual_;
  std::string message_;
};

class EmbeddingError : public std::exception {
 public:
  explicit EmbeddingError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class VectorStoreError : public std::exception {
 public:
  explicit VectorStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

}  // namespace docqa_core
