#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docqa_core {

// Byte offsets of every code point boundary in a UTF-8 string, including the end.
// boundaries[i] is the byte offset of code point i; boundaries.back() == text.size().
// Throws ContentError if text is not valid UTF-8.
std::vector<size_t> code_point_boundaries(const std::string &text);

// Number of code points in a UTF-8 string. Throws ContentError on invalid UTF-8.
size_t code_point_length(const std::string &text);

// Keeps at most max_code_points code points of a valid UTF-8 string.
std::string truncate_code_points(const std::string &text, size_t max_code_points);

// Trims trailing whitespace from every line, collapses runs of blank lines into one,
// and trims the whole text. Line endings become '\n'.
std::string normalize_text(const std::string &text);

bool is_blank(const std::string &text);

}  // namespace docqa_core
