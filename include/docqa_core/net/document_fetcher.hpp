#pragma once

#include <memory>
#include <string>

#include "docqa_core/net/http_client.hpp"
#include "docqa_core/types/document.hpp"

namespace docqa_core {

class DownloadError : public std::exception {
 public:
  // status is the HTTP status when the server answered, 0 otherwise
  explicit DownloadError(const std::string &message, long status = 0)
      : message_(message), status_(status) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  long status() const {
    return status_;
  }

 private:
  std::string message_;
  long status_;
};

class DocumentFetcher {
 public:
  virtual ~DocumentFetcher() = default;

  // Downloads the URL into a Document whose source is the URL
  virtual Document fetch(const std::string &url) = 0;
};

class CurlDocumentFetcher : public DocumentFetcher {
 public:
  static constexpr long DEFAULT_TIMEOUT_MS = 10000;

  explicit CurlDocumentFetcher(std::shared_ptr<HttpClient> http_client,
                               long timeout_ms = DEFAULT_TIMEOUT_MS);

  Document fetch(const std::string &url) override;

 private:
  std::shared_ptr<HttpClient> http_client_;
  long timeout_ms_;
};

}  // namespace docqa_core
