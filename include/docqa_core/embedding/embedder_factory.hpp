#pragma once

#include <memory>
#include <string>

#include "docqa_core/embedding/embedder.hpp"

namespace docqa_core {

struct EmbedderConfig {
  std::string type = "hashing";
  size_t dimension = 384;
  std::string ollama_url = "http://localhost:11434";
  std::string model = "nomic-embed-text";
};

// Builds the embedder named by config.type ("hashing" or "ollama").
// Throws ConfigError for an unknown type.
std::shared_ptr<Embedder> make_embedder(const EmbedderConfig &config);

}  // namespace docqa_core
