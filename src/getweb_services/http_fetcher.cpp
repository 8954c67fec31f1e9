#include "getweb_services/http_fetcher.hpp"

#include <curl/curl.h>

#include <memory>
#include <utility>

namespace getweb_services {

namespace {

struct CurlDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};

}  // namespace

CurlHttpFetcher::CurlHttpFetcher(HttpFetcherOptions options) : options_(std::move(options)) {
  if (options_.user_agent.empty()) {
    options_.user_agent = FIREFOX_USER_AGENT;
  }
}

size_t CurlHttpFetcher::write_callback(void* contents, size_t size, size_t nmemb,
                                       std::string* userp) {
  userp->append(static_cast<char*>(contents), size * nmemb);
  return size * nmemb;
}

std::string CurlHttpFetcher::reason_phrase(long status) {
  switch (status) {
    case 400:
      return "Bad Request";
    case 401:
      return "Unauthorized";
    case 403:
      return "Forbidden";
    case 404:
      return "Not Found";
    case 408:
      return "Request Timeout";
    case 410:
      return "Gone";
    case 429:
      return "Too Many Requests";
    case 500:
      return "Internal Server Error";
    case 502:
      return "Bad Gateway";
    case 503:
      return "Service Unavailable";
    case 504:
      return "Gateway Timeout";
    default:
      return "Unknown error";
  }
}

getweb_core::RawFetch CurlHttpFetcher::fetch(const std::string& url) const {
  std::unique_ptr<CURL, CurlDeleter> handle(curl_easy_init());
  if (!handle) {
    throw HttpFetchError("Failed to initialize CURL", 0);
  }

  getweb_core::RawFetch result;
  CURL* curl = handle.get();
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options_.max_redirects);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, options_.timeout_seconds);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &result.bytes);

  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    throw HttpFetchError("CURL request failed: " + std::string(curl_easy_strerror(res)), 0);
  }

  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code < 200 || http_code >= 300) {
    std::string reason = reason_phrase(http_code);
    throw HttpFetchError("HTTP error " + std::to_string(http_code) + ": " + reason, http_code,
                         reason);
  }

  char* content_type = nullptr;
  if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK &&
      content_type != nullptr) {
    result.content_type = std::string(content_type);
  }

  return result;
}

}  // namespace getweb_services
