#include "docqa_core/utils/text_utils.hpp"

#include <utf8.h>

#include <algorithm>

#include "docqa_core/errors.hpp"

namespace docqa_core {

namespace {
constexpr const char *WHITESPACE = " \t\n\v\f\r";

std::string rstrip(const std::string &line) {
  const size_t end = line.find_last_not_of(WHITESPACE);
  return end == std::string::npos ? std::string() : line.substr(0, end + 1);
}

void ensure_valid_utf8(const std::string &text) {
  auto invalid = utf8::find_invalid(text.begin(), text.end());
  if (invalid != text.end()) {
    throw ContentError("Text is not valid UTF-8 (invalid byte at offset " +
                       std::to_string(invalid - text.begin()) + ")");
  }
}
}  // namespace

std::vector<size_t> code_point_boundaries(const std::string &text) {
  ensure_valid_utf8(text);

  std::vector<size_t> boundaries;
  boundaries.reserve(text.size() + 1);
  for (auto it = text.begin(); it != text.end(); utf8::unchecked::next(it)) {
    boundaries.push_back(static_cast<size_t>(it - text.begin()));
  }
  boundaries.push_back(text.size());
  return boundaries;
}

size_t code_point_length(const std::string &text) {
  ensure_valid_utf8(text);
  return static_cast<size_t>(utf8::unchecked::distance(text.begin(), text.end()));
}

std::string truncate_code_points(const std::string &text, size_t max_code_points) {
  auto it = text.begin();
  size_t count = 0;
  while (it != text.end() && count < max_code_points) {
    utf8::unchecked::next(it);
    ++count;
  }
  return std::string(text.begin(), it);
}

std::string normalize_text(const std::string &text) {
  std::vector<std::string> lines;
  std::string current;
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '\r' || c == '\n') {
      lines.push_back(rstrip(current));
      current.clear();
      // \r\n is a single line break
      if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty()) {
    lines.push_back(rstrip(current));
  }

  std::string joined;
  bool prev_blank = false;
  bool first = true;
  for (const auto &line : lines) {
    const bool blank = line.empty();
    if (blank && prev_blank) {
      continue;
    }
    if (!first) {
      joined.push_back('\n');
    }
    joined += line;
    first = false;
    prev_blank = blank;
  }

  const size_t begin = joined.find_first_not_of(WHITESPACE);
  if (begin == std::string::npos) {
    return "";
  }
  const size_t end = joined.find_last_not_of(WHITESPACE);
  return joined.substr(begin, end - begin + 1);
}

bool is_blank(const std::string &text) {
  return std::all_of(text.begin(), text.end(), [](char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
  });
}

}  // namespace docqa_core
