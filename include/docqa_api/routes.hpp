#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

#include "server.hpp"

// Forward declarations
namespace docqa_core {
class Pipeline;
class Session;
struct Document;
}  // namespace docqa_core

namespace docqa_api {

class Routes {
 public:
  Routes(std::shared_ptr<docqa_core::Pipeline> pipeline,
         std::shared_ptr<docqa_core::Session> session);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);
  void register_routes(crow::SimpleApp &app);

  // Route handlers
  crow::response handle_root(const crow::request &req);
  crow::response handle_upload_documents(const crow::request &req);
  crow::response handle_process_url(const crow::request &req);
  crow::response handle_ask_question(const crow::request &req);
  crow::response handle_upload_file(const crow::request &req);
  crow::response handle_status(const crow::request &req);

 private:
  std::shared_ptr<docqa_core::Pipeline> pipeline_;
  std::shared_ptr<docqa_core::Session> session_;

  // Helper methods
  static bool is_multipart(const crow::request &req);
  static std::vector<docqa_core::Document> extract_uploaded_files(const crow::request &req,
                                                                  const std::string &field_name);
  // Looks in the query string, then an urlencoded or multipart body
  static std::optional<std::string> extract_field(const crow::request &req,
                                                  const std::string &name);
  static nlohmann::json create_detail_response(const std::string &detail);
  static crow::response create_json_response(const nlohmann::json &json_data,
                                             int status_code = 200);
};

}  // namespace docqa_api
