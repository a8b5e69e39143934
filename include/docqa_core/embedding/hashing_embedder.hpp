#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "docqa_core/embedding/embedder.hpp"

namespace docqa_core {

/**
 * @brief Deterministic reference embedder based on feature hashing.
 *
 * Lower-cased word tokens and the character trigrams of each word are hashed with FNV-1a into
 * `dimension` signed buckets, and the result is L2-normalized. Text without any token maps to the
 * zero vector. No model or network access is needed.
 */
class HashingEmbedder : public Embedder {
 public:
  // Throws ConfigError if dimension is 0.
  explicit HashingEmbedder(size_t dimension);

  std::vector<float> embed(const std::string &text) override;

  size_t dimension() const override {
    return dimension_;
  }

  std::string identity() const override;

  static uint64_t fnv1a_64(const std::string &data);

 private:
  static constexpr float WORD_WEIGHT = 1.0f;
  static constexpr float TRIGRAM_WEIGHT = 0.5f;

  size_t dimension_;

  void add_feature(std::vector<double> &accumulator, const std::string &feature, float weight) const;
  static std::vector<std::string> tokenize(const std::string &text);
};

}  // namespace docqa_core
