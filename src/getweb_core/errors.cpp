#include "getweb_core/errors.hpp"

#include <utility>

namespace getweb_core {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::UnsupportedBinary:
      return "ERR_FETCH_UNSUPPORTED_BINARY";
    case ErrorCode::PdfParseFailure:
      return "ERR_FETCH_PDF_PARSE";
    case ErrorCode::PdfEncrypted:
      return "ERR_FETCH_PDF_ENCRYPTED";
    case ErrorCode::PdfTooLarge:
      return "ERR_FETCH_PDF_TOO_LARGE";
    case ErrorCode::DecodeFailure:
      return "ERR_FETCH_DECODE";
    case ErrorCode::HtmlConversionFailure:
      return "ERR_FETCH_HTML_CONVERSION";
    case ErrorCode::HttpFailure:
      return "ERR_FETCH_HTTP";
    case ErrorCode::UnknownFailure:
      return "ERR_FETCH_UNKNOWN";
  }
  return "ERR_FETCH_UNKNOWN";
}

ExtractionError::ExtractionError(ErrorCode code, std::string message, nlohmann::json details)
    : code_(code), message_(std::move(message)), details_(std::move(details)) {}

std::string ExtractionError::to_payload() const {
  return build_error_payload(to_string(code_), message_, details_);
}

std::string build_error_payload(const std::string& code,
                                const std::string& message,
                                const nlohmann::json& details) {
  nlohmann::json payload = {{"code", code}, {"message", message}, {"details", details}};
  std::string out = message;
  out.push_back('\n');
  // details can carry server-supplied header text that is not valid UTF-8
  out += payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return out;
}

}  // namespace getweb_core
