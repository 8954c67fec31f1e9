#include "getweb_core/metadata/page_metadata.hpp"

#include <libxml/uri.h>

#include <sstream>

#include "getweb_core/html/html_document.hpp"
#include "getweb_core/utils/text_utils.hpp"

namespace getweb_core {

namespace {

std::optional<std::string> first_attribute(const HtmlDocument& doc,
                                           const std::string& xpath,
                                           const char* attr) {
  xmlNode* node = doc.find_first(xpath);
  if (node == nullptr) {
    return std::nullopt;
  }
  return HtmlDocument::attribute(node, attr);
}

std::string or_none(const std::string& value) {
  return value.empty() ? "None" : value;
}

}  // namespace

std::string PageMetadataExtractor::resolve_url(const std::string& base,
                                               const std::string& reference) {
  xmlChar* built = xmlBuildURI(BAD_CAST reference.c_str(), BAD_CAST base.c_str());
  if (built == nullptr) {
    return reference;
  }
  std::string resolved(reinterpret_cast<const char*>(built));
  xmlFree(built);
  return resolved;
}

std::optional<std::string> PageMetadataExtractor::fallback_favicon(const std::string& page_url) {
  xmlURI* uri = xmlParseURI(page_url.c_str());
  if (uri == nullptr) {
    return std::nullopt;
  }
  std::optional<std::string> favicon;
  if (uri->server != nullptr && uri->server[0] != '\0') {
    favicon = "https://www.google.com/s2/favicons?domain=" + std::string(uri->server) + "&sz=32";
  }
  xmlFreeURI(uri);
  return favicon;
}

PageMetadata PageMetadataExtractor::extract(std::string_view html,
                                            const std::string& page_url) const {
  PageMetadata metadata;
  metadata.url = page_url;

  if (!text::trim(html).empty()) {
    HtmlDocument doc = HtmlDocument::parse(html);

    if (xmlNode* title = doc.find_first("//title")) {
      metadata.title = std::string(text::trim(HtmlDocument::text_content(title)));
    }

    auto description = first_attribute(doc, "//meta[@name='description']", "content");
    if (!description) {
      description = first_attribute(doc, "//meta[@property='og:description']", "content");
    }
    metadata.description = description.value_or("");

    if (auto image = first_attribute(doc, "//meta[@property='og:image']", "content")) {
      metadata.og_image = resolve_url(page_url, *image);
    }

    if (auto icon = first_attribute(doc, "//link[@rel='icon' or @rel='shortcut icon']", "href")) {
      metadata.favicon = resolve_url(page_url, *icon);
    }
  }

  if (!metadata.favicon) {
    metadata.favicon = fallback_favicon(page_url);
  }
  return metadata;
}

std::string format_metadata_report(const PageMetadata& metadata) {
  std::ostringstream out;
  out << "## URL Metadata for " << metadata.url << "\n\n"
      << "**Title:** " << or_none(metadata.title) << "\n\n"
      << "**Description:** " << or_none(metadata.description) << "\n\n"
      << "**Image:** " << metadata.og_image.value_or("None") << "\n\n"
      << "**Favicon:** " << metadata.favicon.value_or("None");
  return out.str();
}

}  // namespace getweb_core
