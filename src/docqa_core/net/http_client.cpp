#include "docqa_core/net/http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace docqa_core {

namespace {

struct CurlHandleDeleter {
  void operator()(CURL *handle) const {
    curl_easy_cleanup(handle);
  }
};

struct CurlHeaderListDeleter {
  void operator()(curl_slist *list) const {
    curl_slist_free_all(list);
  }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;
using CurlHeaderList = std::unique_ptr<curl_slist, CurlHeaderListDeleter>;

std::once_flag curl_global_init_flag;

CurlHandle make_handle() {
  CurlHandle handle(curl_easy_init());
  if (!handle) {
    throw HttpError("Failed to initialize CURL");
  }
  return handle;
}

HttpResponse perform(CURL *handle, std::string &response_buffer) {
  CURLcode res = curl_easy_perform(handle);
  if (res != CURLE_OK) {
    throw HttpError("CURL request failed: " + std::string(curl_easy_strerror(res)),
                    res == CURLE_OPERATION_TIMEDOUT);
  }

  HttpResponse response;
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
  response.body = std::move(response_buffer);
  return response;
}

}  // namespace

HttpClient::HttpClient() {
  std::call_once(curl_global_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t HttpClient::write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

HttpResponse HttpClient::get(const std::string &url, long timeout_ms) {
  CurlHandle handle = make_handle();
  std::string response_buffer;

  curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response_buffer);

  return perform(handle.get(), response_buffer);
}

HttpResponse HttpClient::post_json(const std::string &url, const std::string &body,
                                   const std::vector<std::string> &headers, long timeout_ms) {
  CurlHandle handle = make_handle();
  std::string response_buffer;

  curl_slist *raw_list = curl_slist_append(nullptr, "Content-Type: application/json");
  for (const auto &header : headers) {
    raw_list = curl_slist_append(raw_list, header.c_str());
  }
  CurlHeaderList header_list(raw_list);

  curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, header_list.get());
  curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response_buffer);

  return perform(handle.get(), response_buffer);
}

}  // namespace docqa_core
