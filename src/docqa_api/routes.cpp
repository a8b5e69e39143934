#include "docqa_api/routes.hpp"

#include <cctype>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>

#include "docqa_core/errors.hpp"
#include "docqa_core/service_provider.hpp"
#include "docqa_core/store/record_codec.hpp"

namespace docqa_api {

namespace {

// Malformed request bodies, reported as 400
class BadRequest : public std::exception {
 public:
  explicit BadRequest(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

}  // namespace

Routes::Routes(std::shared_ptr<docqa_core::ServiceProvider> services, int default_top_k)
    : services_(services), default_top_k_(default_top_k) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/ingest").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_ingest(req);
  });

  CROW_ROUTE(app, "/ingest/batch")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_ingest_batch(req); });

  CROW_ROUTE(app, "/answer").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_answer(req);
  });

  CROW_ROUTE(app, "/documents")
  ([this](const crow::request &req) { return handle_list_documents(req); });

  CROW_ROUTE(app, "/documents/<string>")
      .methods(crow::HTTPMethod::GET)([this](const crow::request &req, const std::string &filename) {
        return handle_get_document(req, decode_path_segment(filename));
      });

  CROW_ROUTE(app, "/documents/<string>")
      .methods(crow::HTTPMethod::DELETE)(
          [this](const crow::request &req, const std::string &filename) {
            return handle_delete_document(req, decode_path_segment(filename));
          });

  CROW_ROUTE(app, "/index/refresh")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_refresh_index(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("docqa API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  response["embedder"] = services_->get_embedder().identity();
  return create_json_response(response);
}

crow::response Routes::handle_ingest(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    docqa_core::IngestResult result;
    if (body.contains("path")) {
      if (!body["path"].is_string()) {
        throw BadRequest("'path' must be a string");
      }
      const std::string path = body["path"].get<std::string>();
      std::cout << "Ingesting file: " << path << std::endl;
      result = services_->get_ingestion_service().ingest_file(path);
    } else {
      if (!body.contains("filename") || !body["filename"].is_string() || !body.contains("text") ||
          !body["text"].is_string()) {
        throw BadRequest("Request body needs string fields 'filename' and 'text', or 'path'");
      }
      const std::string filename = body["filename"].get<std::string>();
      std::cout << "Ingesting text as: " << filename << std::endl;
      result = services_->get_ingestion_service().ingest(filename, body["text"].get<std::string>());
    }

    if (!result.ok()) {
      nlohmann::json response = create_error_response(result.message);
      response["data"] = result;
      return create_json_response(response, 422);
    }
    return create_json_response(create_success_response(result.message, result));
  } catch (const BadRequest &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const docqa_core::ConfigError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_ingest: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_ingest_batch(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    if (!body.contains("paths") || !body["paths"].is_array()) {
      throw BadRequest("Request body needs an array field 'paths'");
    }
    std::vector<std::filesystem::path> paths;
    for (const auto &path : body["paths"]) {
      if (!path.is_string()) {
        throw BadRequest("'paths' must contain only strings");
      }
      paths.emplace_back(path.get<std::string>());
    }

    std::cout << "Ingesting batch of " << paths.size() << " file(s)" << std::endl;
    auto results = services_->get_ingestion_service().ingest_files(paths);
    size_t failed = 0;
    for (const auto &result : results) {
      if (!result.ok()) {
        ++failed;
      }
    }
    nlohmann::json data;
    data["results"] = results;
    data["count"] = results.size();
    data["failed"] = failed;
    return create_json_response(create_success_response(
        "Ingested " + std::to_string(results.size() - failed) + " of " +
            std::to_string(results.size()) + " file(s)",
        data));
  } catch (const BadRequest &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_ingest_batch: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_answer(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    if (!body.contains("question") || !body["question"].is_string()) {
      throw BadRequest("Request body needs a string field 'question'");
    }
    int k = default_top_k_;
    if (body.contains("k")) {
      if (!body["k"].is_number_integer()) {
        throw BadRequest("'k' must be an integer");
      }
      k = body["k"].get<int>();
    }
    const std::string question = body["question"].get<std::string>();
    std::cout << "Answering: " << question << " with k: " << k << std::endl;

    docqa_core::Answer answer = services_->get_retrieval_service().answer(question, k);
    return create_json_response(create_success_response(
        "Found " + std::to_string(answer.matches.size()) + " match(es)", answer));
  } catch (const BadRequest &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const docqa_core::ConfigError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const docqa_core::EmbeddingError &e) {
    std::cerr << "Error: Embedding the question failed: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 502);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_answer: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_list_documents(const crow::request &req) {
  try {
    std::cout << "Listing documents" << std::endl;
    auto documents = services_->get_document_service().list_documents();
    nlohmann::json data;
    data["documents"] = documents;
    data["count"] = documents.size();
    return create_json_response(create_success_response("Documents retrieved successfully", data));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_list_documents: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_get_document(const crow::request &req, const std::string &filename) {
  try {
    auto document = services_->get_document_service().get_document(filename);
    if (!document) {
      return create_json_response(create_error_response("Document not found: " + filename), 404);
    }
    return create_json_response(create_success_response("Document retrieved successfully",
                                                        *document));
  } catch (const docqa_core::MalformedRecordError &e) {
    return create_json_response(create_error_response(e.what()), 500);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_get_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_delete_document(const crow::request &req,
                                              const std::string &filename) {
  try {
    std::cout << "Removing document: " << filename << std::endl;
    if (!services_->get_document_service().remove_document(filename)) {
      return create_json_response(create_error_response("Document not found: " + filename), 404);
    }
    return create_json_response(create_success_response("Document removed successfully"));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_delete_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_refresh_index(const crow::request &req) {
  services_->get_retrieval_service().invalidate();
  return create_json_response(create_success_response("Index will be rebuilt on the next query"));
}

std::string Routes::decode_path_segment(const std::string &segment) {
  std::string decoded;
  decoded.reserve(segment.size());
  for (size_t i = 0; i < segment.size(); ++i) {
    const bool escaped = segment[i] == '%' && i + 2 < segment.size() &&
                         std::isxdigit(static_cast<unsigned char>(segment[i + 1])) &&
                         std::isxdigit(static_cast<unsigned char>(segment[i + 2]));
    if (escaped) {
      decoded.push_back(static_cast<char>(std::stoi(segment.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else {
      decoded.push_back(segment[i]);
    }
  }
  return decoded;
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  try {
    nlohmann::json json_body = nlohmann::json::parse(body);
    if (!json_body.is_object()) {
      throw BadRequest("Request body must be a JSON object");
    }
    return json_body;
  } catch (const nlohmann::json::parse_error &e) {
    throw BadRequest(std::string("Invalid JSON body: ") + e.what());
  }
}

}  // namespace docqa_api
