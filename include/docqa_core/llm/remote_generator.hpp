#pragma once

#include <memory>
#include <string>

#include "docqa_core/llm/generator.hpp"
#include "docqa_core/net/http_client.hpp"

namespace docqa_core {

/**
 * @class RemoteAnswerGenerator
 * @brief Remote-service backend: asks an external answering service.
 *
 * Sends `POST <base_url>/query` with `{"query", "documents", "prompt"}` and a
 * bearer token, and reads the `answer` field of the JSON reply. Transport
 * failures, timeouts, non-200 statuses and bodies that are not JSON objects
 * all raise GenerationError.
 */
class RemoteAnswerGenerator : public Generator {
 public:
  static constexpr const char *NO_ANSWER = "No answer available";

  RemoteAnswerGenerator(std::shared_ptr<HttpClient> http_client, const std::string &base_url,
                        const std::string &api_token, long timeout_ms);

  std::string generate(const Prompt &prompt) override;

  std::string name() const override {
    return "remote:" + base_url_;
  }

 private:
  std::shared_ptr<HttpClient> http_client_;
  std::string base_url_;
  std::string api_token_;
  long timeout_ms_;

  std::string build_url() const;
};

}  // namespace docqa_core
