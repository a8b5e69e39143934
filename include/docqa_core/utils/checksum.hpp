#pragma once

#include <string>

namespace docqa_core {

// SHA-256 of the given content as a lowercase hex string.
std::string compute_checksum(const std::string &content);

}  // namespace docqa_core
