#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace getweb_core {

enum class ContentVerdict { Text, Binary };

// Result of classifying one fetched resource. content_type is only set for a
// Binary verdict that came from the declared header.
struct ClassificationVerdict {
  ContentVerdict verdict = ContentVerdict::Text;
  std::optional<std::string> content_type;

  bool is_binary() const {
    return verdict == ContentVerdict::Binary;
  }

  static ClassificationVerdict text() {
    return {ContentVerdict::Text, std::nullopt};
  }
  static ClassificationVerdict binary(std::optional<std::string> content_type) {
    return {ContentVerdict::Binary, std::move(content_type)};
  }

  bool operator==(const ClassificationVerdict&) const = default;
};

/**
 * @brief Decides whether fetched bytes are safe to treat as text.
 *
 * A declared MIME type that affirmatively claims text is trusted. A declared
 * binary MIME type is trusted too. Anything else falls through to magic-byte
 * sniffing over the head of the payload.
 */
class BinaryClassifier {
 public:
  // Number of leading bytes inspected by classify()
  static constexpr std::size_t HEAD_BYTES = 512;

  static ClassificationVerdict classify(const std::optional<std::string>& content_type,
                                        std::string_view head);

  // Fast path consulted before classify() so PDFs reach the PDF extractor
  static bool is_pdf(const std::optional<std::string>& content_type, std::string_view head);

  // "Text/HTML; charset=utf-8" -> "text/html"
  static std::string primary_mime(std::string_view content_type);

 private:
  static bool is_textual_mime(const std::string& mime);
  static bool is_binary_mime(const std::string& mime);
  static bool has_binary_signature(std::string_view head);

  // Sniffing only ever looks this far for the MP4 "ftyp" box
  static constexpr std::size_t FTYP_WINDOW = 64;
};

}  // namespace getweb_core
