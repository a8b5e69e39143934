#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "docqa_core/embedding/embedder_factory.hpp"
#include "docqa_core/errors.hpp"
#include "docqa_core/services/ingestion_service.hpp"
#include "docqa_core/services/retrieval_service.hpp"

namespace docqa_core {

// Settings shared by docqa_api and docqa_cli, read from docqarc.json. Every key is optional.
class Config {
 public:
  std::string api_base_url;
  std::string store_backend;
  std::string metadata_db_path;
  std::string vectors_dir;
  std::string db_key;
  int db_pool_size;
  std::string knowledge_dir;

  int chunk_size;
  int chunk_overlap;
  int snippet_max_chars;
  int max_answer_chars;
  int default_top_k;
  int64_t max_file_size_bytes;
  std::string update_policy;

  EmbedderConfig embedder;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw ConfigError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception& e) {
      throw ConfigError(std::string("Failed to parse JSON in config file '") + filename +
                        "': " + e.what());
    }

    return from_json(json_config);
  }

  // Defaults when the file does not exist; a file that exists must parse and validate.
  static Config from_file_or_defaults(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
      return from_json(nlohmann::json::object());
    }
    return from_file(filename);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw ConfigError("Configuration must be a JSON object");
    }

    Config config;
    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3040"));
      config.store_backend = json_config.value("store_backend", std::string("sqlite"));
      config.metadata_db_path =
          json_config.value("metadata_db_path", std::string("./data/docqa.db"));
      config.vectors_dir = json_config.value("vectors_dir", std::string("./data/vectors"));
      config.db_key = json_config.value("db_key", std::string(""));
      config.db_pool_size = json_config.value("db_pool_size", 4);
      config.knowledge_dir = json_config.value("knowledge_dir", std::string("./data/knowledge"));

      config.chunk_size = json_config.value("chunk_size", 1000);
      config.chunk_overlap = json_config.value("chunk_overlap", 200);
      config.snippet_max_chars = json_config.value("snippet_max_chars", 500);
      config.max_answer_chars = json_config.value("max_answer_chars", 10000);
      config.default_top_k = json_config.value("default_top_k", 3);
      config.max_file_size_bytes =
          json_config.value("max_file_size_bytes", static_cast<int64_t>(10 * 1024 * 1024));
      config.update_policy = json_config.value("update_policy", std::string("replace"));

      const nlohmann::json embedder_json =
          json_config.value("embedder", nlohmann::json::object());
      if (!embedder_json.is_object()) {
        throw ConfigError("embedder must be a JSON object");
      }
      config.embedder.type = embedder_json.value("type", std::string("hashing"));
      const int dimension = embedder_json.value("dimension", 384);
      if (dimension <= 0) {
        throw ConfigError("embedder.dimension must be greater than 0");
      }
      config.embedder.dimension = static_cast<size_t>(dimension);
      config.embedder.ollama_url =
          embedder_json.value("ollama_url", std::string("http://localhost:11434"));
      config.embedder.model = embedder_json.value("model", std::string("nomic-embed-text"));
    } catch (const nlohmann::json::type_error& e) {
      throw ConfigError(std::string("Invalid value type in configuration: ") + e.what());
    }

    config.validate();
    return config;
  }

  void validate() const {
    if (api_base_url.empty()) {
      throw ConfigError("api_base_url cannot be empty");
    }
    if (store_backend != "sqlite" && store_backend != "json") {
      throw ConfigError("store_backend must be \"sqlite\" or \"json\", got \"" + store_backend +
                        "\"");
    }
    if (store_backend == "sqlite" && metadata_db_path.empty()) {
      throw ConfigError("metadata_db_path cannot be empty when store_backend is sqlite");
    }
    if (store_backend == "json" && vectors_dir.empty()) {
      throw ConfigError("vectors_dir cannot be empty when store_backend is json");
    }
    if (db_pool_size <= 0) {
      throw ConfigError("db_pool_size must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw ConfigError("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw ConfigError("chunk_overlap must be in [0, chunk_size), got " +
                        std::to_string(chunk_overlap) + " with chunk_size " +
                        std::to_string(chunk_size));
    }
    if (snippet_max_chars <= 0) {
      throw ConfigError("snippet_max_chars must be greater than 0");
    }
    if (max_answer_chars <= 0) {
      throw ConfigError("max_answer_chars must be greater than 0");
    }
    if (default_top_k <= 0) {
      throw ConfigError("default_top_k must be greater than 0");
    }
    if (max_file_size_bytes <= 0) {
      throw ConfigError("max_file_size_bytes must be greater than 0");
    }
    if (update_policy != "replace" && update_policy != "skip") {
      throw ConfigError("update_policy must be \"replace\" or \"skip\", got \"" + update_policy +
                        "\"");
    }
    if (embedder.type != "hashing" && embedder.type != "ollama") {
      throw ConfigError("embedder.type must be \"hashing\" or \"ollama\", got \"" +
                        embedder.type + "\"");
    }
    if (embedder.type == "ollama" && (embedder.ollama_url.empty() || embedder.model.empty())) {
      throw ConfigError("embedder.ollama_url and embedder.model are required for ollama");
    }
  }

  IngestionConfig ingestion_config() const {
    IngestionConfig ingestion;
    ingestion.chunking.chunk_size = static_cast<size_t>(chunk_size);
    ingestion.chunking.chunk_overlap = static_cast<size_t>(chunk_overlap);
    ingestion.chunking.snippet_max_chars = static_cast<size_t>(snippet_max_chars);
    ingestion.update_policy = update_policy_from_string(update_policy);
    ingestion.max_file_size_bytes = static_cast<uintmax_t>(max_file_size_bytes);
    return ingestion;
  }

  RetrievalConfig retrieval_config() const {
    return {.max_answer_chars = static_cast<size_t>(max_answer_chars),
            .knowledge_dir = knowledge_dir};
  }

  // Splits api_base_url ("host:port") for the server.
  std::pair<std::string, int> host_and_port() const {
    const size_t colon = api_base_url.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == api_base_url.size()) {
      throw ConfigError("api_base_url must look like host:port, got \"" + api_base_url + "\"");
    }
    const std::string port_str = api_base_url.substr(colon + 1);
    if (port_str.find_first_not_of("0123456789") != std::string::npos || port_str.size() > 5) {
      throw ConfigError("api_base_url has an invalid port: " + port_str);
    }
    const int port = std::stoi(port_str);
    if (port <= 0 || port > 65535) {
      throw ConfigError("api_base_url has an invalid port: " + port_str);
    }
    return {api_base_url.substr(0, colon), port};
  }
};

}  // namespace docqa_core
