#include "getweb_core/content/binary_classifier.hpp"

#include <array>

#include "getweb_core/utils/text_utils.hpp"

namespace getweb_core {

namespace {

constexpr std::array<std::string_view, 5> TEXTUAL_APPLICATION_TYPES = {
    "application/json", "application/xml", "application/javascript", "application/xhtml+xml",
    "application/x-www-form-urlencoded"};

constexpr std::array<std::string_view, 4> BINARY_PREFIXES = {"image/", "audio/", "video/",
                                                             "font/"};

constexpr std::array<std::string_view, 4> BINARY_TYPES = {
    "application/pdf", "application/zip", "application/gzip", "application/octet-stream"};

// Fixed-offset magic numbers, all anchored at byte 0
const std::array<std::string_view, 8> MAGIC_PREFIXES = {
    std::string_view("%PDF-", 5),                              // PDF
    std::string_view("\x89PNG\r\n\x1a\n", 8),                  // PNG
    std::string_view("\xFF\xD8\xFF", 3),                       // JPEG
    std::string_view("GIF8", 4),                               // GIF
    std::string_view("PK\x03\x04", 4),                         // ZIP
    std::string_view("\x1F\x8B", 2),                           // GZIP
    std::string_view("Rar!", 4),                               // RAR
    std::string_view("7z\xBC\xAF\x27\x1C", 6),                 // 7-Zip
};

bool starts_with(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

std::string BinaryClassifier::primary_mime(std::string_view content_type) {
  auto semicolon = content_type.find(';');
  return text::to_lower_ascii(text::trim(content_type.substr(0, semicolon)));
}

bool BinaryClassifier::is_textual_mime(const std::string& mime) {
  if (starts_with(mime, "text/")) {
    return true;
  }
  for (auto textual : TEXTUAL_APPLICATION_TYPES) {
    if (mime == textual) {
      return true;
    }
  }
  return false;
}

bool BinaryClassifier::is_binary_mime(const std::string& mime) {
  for (auto prefix : BINARY_PREFIXES) {
    if (starts_with(mime, prefix)) {
      return true;
    }
  }
  for (auto type : BINARY_TYPES) {
    if (mime == type) {
      return true;
    }
  }
  return starts_with(mime, "application/x-") || starts_with(mime, "application/vnd.");
}

bool BinaryClassifier::has_binary_signature(std::string_view head) {
  for (auto magic : MAGIC_PREFIXES) {
    if (starts_with(head, magic)) {
      return true;
    }
  }

  // RIFF container carrying a WebP image
  if (starts_with(head, "RIFF") && head.size() >= 12 && head.substr(8, 4) == "WEBP") {
    return true;
  }

  // ISO base media (MP4, MOV, ...) announces itself with an ftyp box
  return head.substr(0, FTYP_WINDOW).find("ftyp") != std::string_view::npos;
}

ClassificationVerdict BinaryClassifier::classify(const std::optional<std::string>& content_type,
                                                 std::string_view head) {
  if (content_type) {
    std::string mime = primary_mime(*content_type);
    if (is_textual_mime(mime)) {
      return ClassificationVerdict::text();
    }
    if (is_binary_mime(mime)) {
      return ClassificationVerdict::binary(mime);
    }
  }

  if (has_binary_signature(head.substr(0, HEAD_BYTES))) {
    return ClassificationVerdict::binary(std::nullopt);
  }
  return ClassificationVerdict::text();
}

bool BinaryClassifier::is_pdf(const std::optional<std::string>& content_type,
                              std::string_view head) {
  if (content_type && text::to_lower_ascii(*content_type).find("application/pdf") != std::string::npos) {
    return true;
  }
  return starts_with(head, "%PDF-");
}

}  // namespace getweb_core
