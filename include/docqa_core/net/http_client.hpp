#pragma once

#include <string>
#include <vector>

namespace docqa_core {

struct HttpResponse {
  long status = 0;
  std::string body;
};

// Transport-level failure: DNS, connection, TLS, timeout
class HttpError : public std::exception {
 public:
  explicit HttpError(const std::string &message, bool timed_out = false)
      : message_(message), timed_out_(timed_out) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  bool timed_out() const {
    return timed_out_;
  }

 private:
  std::string message_;
  bool timed_out_;
};

/**
 * @class HttpClient
 * @brief Minimal blocking HTTP client on top of libcurl.
 *
 * Every request uses its own easy handle, so one client can be shared by
 * concurrent requests. Non-2xx statuses are returned, not thrown; only
 * transport failures raise HttpError.
 */
class HttpClient {
 public:
  HttpClient();
  virtual ~HttpClient() = default;

  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  virtual HttpResponse get(const std::string &url, long timeout_ms);

  virtual HttpResponse post_json(const std::string &url, const std::string &body,
                                 const std::vector<std::string> &headers, long timeout_ms);

 private:
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
};

}  // namespace docqa_core
