#pragma once

#include <exception>
#include <string>

#include <nlohmann/json.hpp>

namespace getweb_core {

// Machine-readable failure codes handed to the tool layer.
enum class ErrorCode {
  UnsupportedBinary,
  PdfParseFailure,
  PdfEncrypted,
  PdfTooLarge,
  DecodeFailure,
  HtmlConversionFailure,
  HttpFailure,
  UnknownFailure
};

// Wire name of a code, e.g. "ERR_FETCH_UNSUPPORTED_BINARY"
std::string to_string(ErrorCode code);

/**
 * @brief Structured failure of one extraction call.
 *
 * Carries a code the caller can branch on, a short human-readable message and
 * a JSON object with diagnostic details (url, contentType, size, hint, ...).
 */
class ExtractionError : public std::exception {
 public:
  ExtractionError(ErrorCode code, std::string message, nlohmann::json details);

  const char* what() const noexcept override {
    return message_.c_str();
  }

  ErrorCode code() const noexcept {
    return code_;
  }
  const std::string& message() const noexcept {
    return message_;
  }
  const nlohmann::json& details() const noexcept {
    return details_;
  }

  // Renders the error with build_error_payload
  std::string to_payload() const;

 private:
  ErrorCode code_;
  std::string message_;
  nlohmann::json details_;
};

/**
 * @brief Builds the standardized textual error body for tool errors.
 *
 * First line: the message. Second line: a compact JSON object with the
 * fields code, message and details.
 */
std::string build_error_payload(const std::string& code,
                                const std::string& message,
                                const nlohmann::json& details);

}  // namespace getweb_core
