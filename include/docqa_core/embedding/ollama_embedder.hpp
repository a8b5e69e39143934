#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docqa_core/embedding/embedder.hpp"

namespace docqa_core {

// Model-backed embedder that calls an Ollama server.
class OllamaEmbedder : public Embedder {
 public:
  // Throws EmbeddingError if the server is not reachable.
  OllamaEmbedder(const std::string &ollama_url, const std::string &embedding_model,
                 size_t dimension);
  ~OllamaEmbedder() override = default;

  // Disable copy constructor and assignment
  OllamaEmbedder(const OllamaEmbedder &) = delete;
  OllamaEmbedder &operator=(const OllamaEmbedder &) = delete;

  std::vector<float> embed(const std::string &text) override;

  size_t dimension() const override {
    return dimension_;
  }

  std::string identity() const override;

  // Reads the vector out of an /api/embed response body, which carries either a list of
  // vectors (the first is used) or a single vector. Throws EmbeddingError on any other shape.
  static std::vector<float> parse_embedding_response(const nlohmann::json &json_response);

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  size_t dimension_;

  void setup_server_connection();
};

}  // namespace docqa_core
