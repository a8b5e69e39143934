#include "docqa_core/embedding/hashing_embedder.hpp"

#include <cctype>
#include <cmath>

#include "docqa_core/errors.hpp"

namespace docqa_core {

HashingEmbedder::HashingEmbedder(size_t dimension) : dimension_(dimension) {
  if (dimension_ == 0) {
    throw ConfigError("HashingEmbedder dimension must be greater than 0");
  }
}

std::string HashingEmbedder::identity() const {
  return "hashing-v1:d=" + std::to_string(dimension_);
}

uint64_t HashingEmbedder::fnv1a_64(const std::string &data) {
  uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

// Bytes >= 0x80 are kept inside tokens so non-ASCII words survive intact.
std::vector<std::string> HashingEmbedder::tokenize(const std::string &text) {
  std::vector<std::string> tokens;
  std::string current;
  for (unsigned char c : text) {
    if (c >= 0x80 || std::isalnum(c)) {
      current.push_back(static_cast<char>(c < 0x80 ? std::tolower(c) : c));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

void HashingEmbedder::add_feature(std::vector<double> &accumulator,
                                  const std::string &feature,
                                  float weight) const {
  const uint64_t hash = fnv1a_64(feature);
  const size_t bucket = static_cast<size_t>(hash % dimension_);
  const double sign = (hash >> 63) ? -1.0 : 1.0;
  accumulator[bucket] += sign * weight;
}

std::vector<float> HashingEmbedder::embed(const std::string &text) {
  std::vector<double> accumulator(dimension_, 0.0);

  for (const auto &token : tokenize(text)) {
    add_feature(accumulator, "w:" + token, WORD_WEIGHT);

    const std::string padded = "^" + token + "$";
    for (size_t i = 0; i + 3 <= padded.size(); ++i) {
      add_feature(accumulator, "t:" + padded.substr(i, 3), TRIGRAM_WEIGHT);
    }
  }

  double norm = 0.0;
  for (double value : accumulator) {
    norm += value * value;
  }
  norm = std::sqrt(norm);

  std::vector<float> embedding(dimension_, 0.0f);
  if (norm > 0.0) {
    for (size_t i = 0; i < dimension_; ++i) {
      embedding[i] = static_cast<float>(accumulator[i] / norm);
    }
  }
  return embedding;
}

}  // namespace docqa_core
