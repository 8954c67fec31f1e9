#include "getweb_core/types.hpp"

#include <stdexcept>

namespace getweb_core {

std::string to_string(ExtractionKind kind) {
  switch (kind) {
    case ExtractionKind::HtmlMain:
      return "HtmlMain";
    case ExtractionKind::HtmlFull:
      return "HtmlFull";
    case ExtractionKind::Pdf:
      return "Pdf";
    case ExtractionKind::PlainText:
      return "PlainText";
  }
  return "Unknown";
}

std::string to_string(OutputFormat format) {
  switch (format) {
    case OutputFormat::Markdown:
      return "markdown";
    case OutputFormat::PlainText:
      return "text";
  }
  return "unknown";
}

OutputFormat output_format_from_string(const std::string& str) {
  if (str == "markdown" || str == "md")
    return OutputFormat::Markdown;
  if (str == "text" || str == "plain")
    return OutputFormat::PlainText;
  throw std::invalid_argument("Unknown output format: " + str);
}

}  // namespace getweb_core
