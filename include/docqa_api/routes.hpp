#pragma once
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "server.hpp"

namespace docqa_core {
class ServiceProvider;
}  // namespace docqa_core

namespace docqa_api {

class Routes {
 public:
  Routes(std::shared_ptr<docqa_core::ServiceProvider> services, int default_top_k);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  Routes(Routes &&) noexcept = default;
  Routes &operator=(Routes &&) noexcept = default;

  void register_routes(Server &server);

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_ingest(const crow::request &req);
  crow::response handle_ingest_batch(const crow::request &req);
  crow::response handle_answer(const crow::request &req);
  crow::response handle_list_documents(const crow::request &req);
  crow::response handle_get_document(const crow::request &req, const std::string &filename);
  crow::response handle_delete_document(const crow::request &req, const std::string &filename);
  crow::response handle_refresh_index(const crow::request &req);

  // Filenames arrive percent-encoded in /documents/<filename>
  static std::string decode_path_segment(const std::string &segment);

 private:
  std::shared_ptr<docqa_core::ServiceProvider> services_;
  int default_top_k_;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace docqa_api
