#include "docqa_core/embedding/ollama_embedder.hpp"

#include <ollama.hpp>

#include "docqa_core/errors.hpp"

namespace docqa_core {

OllamaEmbedder::OllamaEmbedder(const std::string &ollama_url,
                               const std::string &embedding_model,
                               size_t dimension)
    : ollama_url_(ollama_url), embedding_model_(embedding_model), dimension_(dimension) {
  if (dimension_ == 0) {
    throw ConfigError("OllamaEmbedder dimension must be greater than 0");
  }
  setup_server_connection();
}

void OllamaEmbedder::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw EmbeddingError("Ollama server is not running at " + ollama_url_);
  }
}

std::string OllamaEmbedder::identity() const {
  return "ollama:" + embedding_model_ + ":d=" + std::to_string(dimension_);
}

std::vector<float> OllamaEmbedder::parse_embedding_response(const nlohmann::json &json_response) {
  if (!json_response.is_object() || !json_response.contains("embeddings")) {
    throw EmbeddingError("Response does not contain embedding field");
  }

  const auto &embeddings = json_response["embeddings"];
  if (!embeddings.is_array()) {
    throw EmbeddingError("Embeddings field is not an array");
  }
  try {
    if (embeddings.size() > 0 && embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingError("Embedding response has non-numeric values: " + std::string(e.what()));
  }
}

std::vector<float> OllamaEmbedder::embed(const std::string &text) {
  std::vector<float> embedding;
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    embedding = parse_embedding_response(response.as_json());
  } catch (const ollama::exception &e) {
    throw EmbeddingError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingError("Embedding response could not be read: " + std::string(e.what()));
  }

  if (embedding.size() != dimension_) {
    throw EmbeddingError("Model " + embedding_model_ + " returned a " +
                         std::to_string(embedding.size()) + "-dimensional embedding, expected " +
                         std::to_string(dimension_));
  }
  return embedding;
}

}  // namespace docqa_core
