#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docqa_core {

/**
 * @brief Maps text to a fixed-dimension vector.
 *
 * Implementations must be pure functions of their input and configuration: the same text
 * embedded twice by the same configuration yields a bit-identical vector, on the ingestion
 * path and on the query path alike.
 */
class Embedder {
 public:
  virtual ~Embedder() = default;

  // Throws EmbeddingError on failure.
  virtual std::vector<float> embed(const std::string &text) = 0;

  virtual size_t dimension() const = 0;

  // Names the configuration that produced a vector, e.g. "hashing-v1:d=384".
  virtual std::string identity() const = 0;
};

}  // namespace docqa_core
