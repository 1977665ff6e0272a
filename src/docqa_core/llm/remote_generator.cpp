#include "docqa_core/llm/remote_generator.hpp"

#include <nlohmann/json.hpp>

namespace docqa_core {

RemoteAnswerGenerator::RemoteAnswerGenerator(std::shared_ptr<HttpClient> http_client,
                                             const std::string &base_url,
                                             const std::string &api_token, long timeout_ms)
    : http_client_(std::move(http_client)),
      base_url_(base_url),
      api_token_(api_token),
      timeout_ms_(timeout_ms) {}

std::string RemoteAnswerGenerator::build_url() const {
  if (!base_url_.empty() && base_url_.back() == '/') {
    return base_url_ + "query";
  }
  return base_url_ + "/query";
}

std::string RemoteAnswerGenerator::generate(const Prompt &prompt) {
  nlohmann::json request_data = {
      {"query", prompt.question}, {"documents", prompt.context}, {"prompt", prompt.text}};

  std::vector<std::string> headers;
  if (!api_token_.empty()) {
    headers.push_back("Authorization: Bearer " + api_token_);
  }

  HttpResponse response;
  try {
    response = http_client_->post_json(build_url(), request_data.dump(), headers, timeout_ms_);
  } catch (const HttpError &e) {
    if (e.timed_out()) {
      throw GenerationError("Answering service timed out after " + std::to_string(timeout_ms_) +
                            " ms");
    }
    throw GenerationError("Error querying answering service: " + std::string(e.what()));
  }

  if (response.status != 200) {
    throw GenerationError("Error querying answering service (Status " +
                          std::to_string(response.status) + "): " + response.body);
  }

  nlohmann::json body = nlohmann::json::parse(response.body, nullptr, /*allow_exceptions*/ false);
  if (body.is_discarded() || !body.is_object()) {
    throw GenerationError("Answering service returned a malformed body");
  }

  auto answer = body.find("answer");
  if (answer == body.end() || answer->is_null()) {
    return NO_ANSWER;
  }
  if (!answer->is_string()) {
    throw GenerationError("Answering service returned a non-string answer");
  }
  return answer->get<std::string>();
}

}  // namespace docqa_core
