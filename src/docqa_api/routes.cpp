#include "docqa_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "docqa_core/pipeline.hpp"
#include "docqa_core/session.hpp"

namespace docqa_api {
namespace {

std::string content_type_of(const crow::request &req) {
  return req.get_header_value("Content-Type");
}

bool is_blank(const std::string &value) {
  return value.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

Routes::Routes(std::shared_ptr<docqa_core::Pipeline> pipeline,
               std::shared_ptr<docqa_core::Session> session)
    : pipeline_(std::move(pipeline)), session_(std::move(session)) {}

void Routes::register_routes(Server &server) {
  register_routes(server.get_app());
}

void Routes::register_routes(crow::SimpleApp &app) {
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_root(req); });

  CROW_ROUTE(app, "/upload_documents/")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_upload_documents(req); });

  CROW_ROUTE(app, "/process_url/")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_process_url(req); });

  CROW_ROUTE(app, "/ask_question/")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_ask_question(req); });

  CROW_ROUTE(app, "/uploadfile/")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_upload_file(req); });

  CROW_ROUTE(app, "/status")
  ([this](const crow::request &req) { return handle_status(req); });

  std::cout << "[api] All routes registered successfully" << std::endl;
}

crow::response Routes::handle_root(const crow::request &) {
  nlohmann::json response;
  response["message"] = "Welcome to the document question answering API";
  return create_json_response(response);
}

crow::response Routes::handle_upload_documents(const crow::request &req) {
  if (!is_multipart(req)) {
    return create_json_response(create_detail_response("Expected a multipart/form-data body"), 400);
  }

  std::vector<docqa_core::Document> documents;
  try {
    documents = extract_uploaded_files(req, "uploaded_files");
  } catch (const std::exception &e) {
    std::cerr << "[api] Malformed multipart body: " << e.what() << std::endl;
    return create_json_response(create_detail_response("Malformed multipart body"), 400);
  }
  if (documents.empty()) {
    return create_json_response(create_detail_response("No files were uploaded"), 400);
  }

  std::cout << "[api] Ingesting " << documents.size() << " uploaded file(s)" << std::endl;
  docqa_core::IngestStatus status = pipeline_->ingest(*session_, documents);

  nlohmann::json response;
  response["status"] = status.to_string();
  return create_json_response(response);
}

crow::response Routes::handle_process_url(const crow::request &req) {
  std::optional<std::string> url;
  try {
    url = extract_field(req, "url");
  } catch (const std::exception &e) {
    std::cerr << "[api] Malformed request body: " << e.what() << std::endl;
    return create_json_response(create_detail_response("Malformed request body"), 400);
  }
  if (!url || is_blank(*url)) {
    return create_json_response(create_detail_response("Field required: url"), 422);
  }

  std::cout << "[api] Ingesting " << *url << std::endl;
  docqa_core::IngestStatus status = pipeline_->ingest_url(*session_, *url);

  nlohmann::json response;
  response["status"] = status.to_string();
  return create_json_response(response);
}

crow::response Routes::handle_ask_question(const crow::request &req) {
  std::optional<std::string> question;
  try {
    question = extract_field(req, "question");
  } catch (const std::exception &e) {
    std::cerr << "[api] Malformed request body: " << e.what() << std::endl;
    return create_json_response(create_detail_response("Malformed request body"), 400);
  }
  if (!question || is_blank(*question)) {
    return create_json_response(create_detail_response("Field required: question"), 422);
  }

  try {
    docqa_core::Answer answer = pipeline_->answer(*session_, *question);

    nlohmann::json sources = nlohmann::json::array();
    for (const auto &supporting : answer.supporting_passages) {
      nlohmann::json source;
      source["source"] = supporting.passage.source_document;
      source["passage_id"] = supporting.passage.id;
      source["offset"] = supporting.passage.offset;
      source["score"] = supporting.score;
      sources.push_back(source);
    }

    nlohmann::json response;
    response["response"] = answer.text;
    response["sources"] = sources;
    return create_json_response(response);
  } catch (const docqa_core::NotIngestedError &) {
    return create_json_response(create_detail_response("Documents have not been processed yet."),
                                400);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_detail_response(e.what()), 422);
  } catch (const docqa_core::GenerationError &e) {
    std::cerr << "[api] Error answering question: " << e.what() << std::endl;
    return create_json_response(create_detail_response(std::string("Error: ") + e.what()), 500);
  } catch (const docqa_core::EmbeddingError &e) {
    std::cerr << "[api] Error answering question: " << e.what() << std::endl;
    return create_json_response(create_detail_response(std::string("Error: ") + e.what()), 500);
  }
}

crow::response Routes::handle_upload_file(const crow::request &req) {
  if (!is_multipart(req)) {
    return create_json_response(create_detail_response("Expected a multipart/form-data body"), 400);
  }
  try {
    std::vector<docqa_core::Document> files = extract_uploaded_files(req, "file");
    if (files.empty()) {
      return create_json_response(create_detail_response("Field required: file"), 422);
    }
    std::optional<std::string> description = extract_field(req, "description");
    if (!description) {
      return create_json_response(create_detail_response("Field required: description"), 422);
    }

    nlohmann::json response;
    response["filename"] = files.front().source;
    response["description"] = *description;
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "[api] Malformed multipart body: " << e.what() << std::endl;
    return create_json_response(create_detail_response("Malformed multipart body"), 400);
  }
}

crow::response Routes::handle_status(const crow::request &) {
  std::shared_ptr<const docqa_core::Corpus> corpus = session_->corpus();

  nlohmann::json response;
  response["state"] = docqa_core::to_string(session_->state());
  response["passages"] = corpus ? corpus->passage_count() : 0;
  response["sources"] = corpus ? nlohmann::json(corpus->sources) : nlohmann::json::array();
  return create_json_response(response);
}

bool Routes::is_multipart(const crow::request &req) {
  std::string content_type = content_type_of(req);
  return content_type.rfind("multipart/form-data", 0) == 0 &&
         content_type.find("boundary=") != std::string::npos;
}

std::vector<docqa_core::Document> Routes::extract_uploaded_files(const crow::request &req,
                                                                 const std::string &field_name) {
  crow::multipart::message message(req);

  std::vector<docqa_core::Document> documents;
  for (const auto &part : message.parts) {
    const auto disposition = part.get_header_object("Content-Disposition");
    auto name = disposition.params.find("name");
    auto filename = disposition.params.find("filename");
    if (name == disposition.params.end() || name->second != field_name ||
        filename == disposition.params.end()) {
      continue;
    }
    documents.push_back({filename->second, part.body});
  }
  return documents;
}

std::optional<std::string> Routes::extract_field(const crow::request &req,
                                                 const std::string &name) {
  if (const char *value = req.url_params.get(name)) {
    return std::string(value);
  }

  if (is_multipart(req)) {
    crow::multipart::message message(req);
    for (const auto &part : message.parts) {
      const auto disposition = part.get_header_object("Content-Disposition");
      auto part_name = disposition.params.find("name");
      if (part_name != disposition.params.end() && part_name->second == name &&
          disposition.params.find("filename") == disposition.params.end()) {
        return part.body;
      }
    }
    return std::nullopt;
  }

  if (content_type_of(req).rfind("application/x-www-form-urlencoded", 0) == 0) {
    crow::query_string form("?" + req.body);
    if (const char *value = form.get(name)) {
      return std::string(value);
    }
  }
  return std::nullopt;
}

nlohmann::json Routes::create_detail_response(const std::string &detail) {
  nlohmann::json response;
  response["detail"] = detail;
  return response;
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

}  // namespace docqa_api
