#include "docqa_core/net/document_fetcher.hpp"

namespace docqa_core {

CurlDocumentFetcher::CurlDocumentFetcher(std::shared_ptr<HttpClient> http_client, long timeout_ms)
    : http_client_(std::move(http_client)), timeout_ms_(timeout_ms) {}

Document CurlDocumentFetcher::fetch(const std::string &url) {
  if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
    throw DownloadError("Unsupported URL (expected http or https): " + url);
  }

  HttpResponse response;
  try {
    response = http_client_->get(url, timeout_ms_);
  } catch (const HttpError &e) {
    throw DownloadError("Failed to download: " + std::string(e.what()));
  }

  if (response.status != 200) {
    throw DownloadError("Failed to download (Status " + std::to_string(response.status) + ")",
                        response.status);
  }

  return {url, std::move(response.body)};
}

}  // namespace docqa_core
