#include "getweb_services/url_content_service.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "getweb_core/cache/fingerprint.hpp"
#include "getweb_core/content/binary_classifier.hpp"
#include "getweb_core/content/charset_decoder.hpp"
#include "getweb_core/errors.hpp"
#include "getweb_core/html/html_document.hpp"
#include "getweb_core/utils/text_utils.hpp"

namespace getweb_services {

using getweb_core::ErrorCode;
using getweb_core::ExtractionError;

UrlContentService::UrlContentService(
    std::shared_ptr<HttpFetcher> fetcher,
    std::shared_ptr<getweb_core::ExtractionOrchestrator> orchestrator,
    std::shared_ptr<ContentCache> cache)
    : fetcher_(std::move(fetcher)), orchestrator_(std::move(orchestrator)), cache_(std::move(cache)) {
  if (!fetcher_ || !orchestrator_) {
    throw std::invalid_argument("UrlContentService requires a fetcher and an orchestrator");
  }
}

std::string UrlContentService::normalize_url(const std::string& url) {
  std::string trimmed(getweb_core::text::trim(url));
  if (trimmed.find("://") == std::string::npos) {
    return "https://" + trimmed;
  }
  return trimmed;
}

getweb_core::RawFetch UrlContentService::fetch_raw(const std::string& url) const {
  try {
    return fetcher_->fetch(url);
  } catch (const HttpFetchError& e) {
    std::cerr << "[UrlContentService] Fetch failed for " << url << ": " << e.what() << std::endl;
    if (e.status() == 0) {
      throw ExtractionError(ErrorCode::HttpFailure, "Network error during HTTP fetch",
                            {{"url", url},
                             {"httpStatus", 0},
                             {"hint", "Please verify the URL or try again later."}});
    }
    std::string hint = e.status() == 404 ? "The resource was not found (404)."
                                         : "Please verify the URL and try again.";
    throw ExtractionError(ErrorCode::HttpFailure,
                          "HTTP error " + std::to_string(e.status()) + ": " + e.reason(),
                          {{"url", url},
                           {"httpStatus", e.status()},
                           {"reason", e.reason()},
                           {"hint", hint}});
  }
}

getweb_core::ExtractedContent UrlContentService::fetch_content(const std::string& url,
                                                               const FetchRequest& request) {
  std::string target = normalize_url(url);
  std::string key =
      getweb_core::fingerprint({target, request.extract_main_content ? "main" : "full",
                                getweb_core::to_string(request.output_format)});

  if (cache_) {
    if (auto cached = cache_->get(key)) {
      return *cached;
    }
  }

  getweb_core::RawFetch raw = fetch_raw(target);
  getweb_core::ExtractionOptions options;
  options.extract_main_content = request.extract_main_content;
  options.output_format = request.output_format;

  getweb_core::ExtractedContent content = orchestrator_->extract(target, raw, options);
  if (cache_) {
    cache_->put(key, content);
  }
  return content;
}

getweb_core::PageMetadata UrlContentService::fetch_metadata(const std::string& url) {
  std::string target = normalize_url(url);
  getweb_core::RawFetch raw = fetch_raw(target);

  std::string_view head(raw.bytes);
  auto verdict = getweb_core::BinaryClassifier::classify(
      raw.content_type, head.substr(0, getweb_core::BinaryClassifier::HEAD_BYTES));
  if (verdict.is_binary()) {
    throw ExtractionError(
        ErrorCode::UnsupportedBinary, "Fetch cannot be performed for this type of content",
        {{"url", target},
         {"contentType", verdict.content_type.value_or(raw.content_type.value_or("unknown"))},
         {"size", raw.bytes.size()}});
  }

  std::string html;
  try {
    html = getweb_core::CharsetDecoder::decode(raw.bytes, raw.content_type);
  } catch (const getweb_core::DecodeError& e) {
    throw ExtractionError(ErrorCode::DecodeFailure, "Failed to decode textual content to UTF-8",
                          {{"url", target},
                           {"encoding", e.encoding()},
                           {"hint", "The page encoding could not be reliably decoded."}});
  }

  try {
    return getweb_core::PageMetadataExtractor().extract(html, target);
  } catch (const getweb_core::HtmlParseError& e) {
    std::cerr << "[UrlContentService] Metadata parse failed for " << target << ": " << e.what()
              << std::endl;
    throw ExtractionError(
        ErrorCode::HtmlConversionFailure, "Failed to read page metadata",
        {{"url", target}, {"hint", "The page structure could not be parsed."}});
  }
}

std::string UrlContentService::render_fetch_report(const std::string& url,
                                                   const getweb_core::ExtractedContent& content,
                                                   const FetchRequest& request) {
  bool truncated = content.text.size() > request.max_length;
  std::ostringstream out;
  out << (truncated ? getweb_core::text::safe_truncate_utf8(content.text, request.max_length,
                                                            TRUNCATION_SUFFIX)
                    : content.text);

  out << "\n---\nExtraction settings:\n"
      << "- URL: " << url << "\n"
      << "- Main content extraction: " << (request.extract_main_content ? "Enabled" : "Disabled")
      << "\n"
      << "- Extraction kind: " << getweb_core::to_string(content.kind) << "\n"
      << "- Main fragment used: " << (content.main_fragment_used ? "Yes" : "No") << "\n"
      << "- Output format: " << getweb_core::to_string(request.output_format) << "\n"
      << "- Content length: " << content.text.size() << " characters";
  if (truncated) {
    out << " (truncated to " << request.max_length << ")";
  }
  out << "\n---";
  return out.str();
}

}  // namespace getweb_services
