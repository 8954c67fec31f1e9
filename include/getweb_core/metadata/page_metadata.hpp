#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace getweb_core {

struct PageMetadata {
  std::string title;
  std::string description;
  std::optional<std::string> og_image;
  std::optional<std::string> favicon;
  std::string url;
};

/**
 * @brief Reads title, description, Open Graph image and favicon from a page.
 *
 * Relative image and icon references are resolved against the page URL. A
 * page without an icon link gets the favicon service URL for its host.
 */
class PageMetadataExtractor {
 public:
  PageMetadata extract(std::string_view html, const std::string& page_url) const;

  // Absolute form of reference relative to base; reference itself if it cannot be resolved
  static std::string resolve_url(const std::string& base, const std::string& reference);

  // Favicon service URL for the host of page_url, nullopt when it has no host
  static std::optional<std::string> fallback_favicon(const std::string& page_url);
};

// Markdown summary with "None" in place of missing values
std::string format_metadata_report(const PageMetadata& metadata);

}  // namespace getweb_core
