#include "docqa_core/embedding/embedder_factory.hpp"

#include "docqa_core/embedding/hashing_embedder.hpp"
#include "docqa_core/embedding/ollama_embedder.hpp"
#include "docqa_core/errors.hpp"

namespace docqa_core {

std::shared_ptr<Embedder> make_embedder(const EmbedderConfig &config) {
  if (config.type == "hashing") {
    return std::make_shared<HashingEmbedder>(config.dimension);
  }
  if (config.type == "ollama") {
    return std::make_shared<OllamaEmbedder>(config.ollama_url, config.model, config.dimension);
  }
  throw ConfigError("Unknown embedder type: " + config.type);
}

}  // namespace docqa_core
