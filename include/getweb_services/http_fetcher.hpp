#pragma once

#include <exception>
#include <string>

#include "getweb_core/types.hpp"

namespace getweb_services {

class HttpFetchError : public std::exception {
 public:
  // status is 0 for transport failures (DNS, TLS, timeout, ...)
  HttpFetchError(const std::string& message, long status, const std::string& reason = "")
      : message_(message), status_(status), reason_(reason) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }
  long status() const noexcept {
    return status_;
  }
  const std::string& reason() const noexcept {
    return reason_;
  }

 private:
  std::string message_;
  long status_;
  std::string reason_;
};

class HttpFetcher {
 public:
  virtual ~HttpFetcher() = default;

  // GET url; throws HttpFetchError on transport failure or a non-2xx status
  virtual getweb_core::RawFetch fetch(const std::string& url) const = 0;
};

struct HttpFetcherOptions {
  std::string user_agent;
  long timeout_seconds = 30;
  long max_redirects = 5;
};

/**
 * @brief HttpFetcher backed by libcurl.
 *
 * Uses a fresh easy handle per request, so one instance can serve concurrent
 * callers. curl_global_init must have been called by the process.
 */
class CurlHttpFetcher : public HttpFetcher {
 public:
  static constexpr const char* FIREFOX_USER_AGENT =
      "Mozilla/5.0 (Macintosh; Intel Mac OS X 10.15; rv:115.0) Gecko/20100101 Firefox/115.0";

  explicit CurlHttpFetcher(HttpFetcherOptions options);

  getweb_core::RawFetch fetch(const std::string& url) const override;

  // Short reason phrase for common HTTP status codes
  static std::string reason_phrase(long status);

 private:
  static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp);

  HttpFetcherOptions options_;
};

}  // namespace getweb_services
