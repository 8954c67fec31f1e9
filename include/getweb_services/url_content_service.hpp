#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "getweb_core/cache/result_cache.hpp"
#include "getweb_core/extraction/extraction_orchestrator.hpp"
#include "getweb_core/metadata/page_metadata.hpp"
#include "getweb_core/types.hpp"
#include "getweb_services/http_fetcher.hpp"

namespace getweb_services {

struct FetchRequest {
  std::size_t max_length = 10000;
  bool extract_main_content = true;
  getweb_core::OutputFormat output_format = getweb_core::OutputFormat::Markdown;
};

using ContentCache = getweb_core::ResultCache<getweb_core::ExtractedContent>;

/**
 * @brief Fetches a URL and turns it into readable content or page metadata.
 *
 * All failures, fetch errors included, leave as getweb_core::ExtractionError.
 * The cache is optional; pass nullptr to fetch every time.
 */
class UrlContentService {
 public:
  UrlContentService(std::shared_ptr<HttpFetcher> fetcher,
                    std::shared_ptr<getweb_core::ExtractionOrchestrator> orchestrator,
                    std::shared_ptr<ContentCache> cache);

  getweb_core::ExtractedContent fetch_content(const std::string& url, const FetchRequest& request);

  getweb_core::PageMetadata fetch_metadata(const std::string& url);

  // "example.com/a" -> "https://example.com/a"; URLs with a scheme are kept
  static std::string normalize_url(const std::string& url);

  // Content truncated to request.max_length plus the extraction-settings footer
  static std::string render_fetch_report(const std::string& url,
                                         const getweb_core::ExtractedContent& content,
                                         const FetchRequest& request);

  static constexpr const char* TRUNCATION_SUFFIX = "... [Content truncated due to length]";

 private:
  getweb_core::RawFetch fetch_raw(const std::string& url) const;

  std::shared_ptr<HttpFetcher> fetcher_;
  std::shared_ptr<getweb_core::ExtractionOrchestrator> orchestrator_;
  std::shared_ptr<ContentCache> cache_;
};

}  // namespace getweb_services
