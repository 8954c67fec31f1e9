#pragma once

#include <optional>
#include <string>

namespace getweb_core {

// What kind of extraction produced an ExtractedContent
enum class ExtractionKind { HtmlMain, HtmlFull, Pdf, PlainText };

// Which handler set the HTML transducer runs with
enum class OutputFormat { Markdown, PlainText };

// Conversion utilities
std::string to_string(ExtractionKind kind);
std::string to_string(OutputFormat format);
OutputFormat output_format_from_string(const std::string& str);

// Bytes of one fetched resource plus its declared Content-Type header.
struct RawFetch {
  std::string bytes;
  std::optional<std::string> content_type;
};

struct ExtractedContent {
  std::string text;
  std::optional<std::string> content_type;
  ExtractionKind kind;
  bool main_fragment_used;
};

}  // namespace getweb_core
