#pragma once

#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace getweb_core {

class DecodeError : public std::exception {
 public:
  DecodeError(const std::string& message, const std::string& encoding)
      : message_(message), encoding_(encoding) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

  // Label of the encoding that was last attempted
  const std::string& encoding() const noexcept {
    return encoding_;
  }

 private:
  std::string message_;
  std::string encoding_;
};

struct BomMatch {
  std::string encoding;
  std::size_t length;
};

/**
 * @brief Converts fetched bytes to UTF-8 without ever inserting U+FFFD.
 *
 * Stages, in order: byte-order mark, charset= parameter of the declared
 * Content-Type, statistical detection over the whole buffer. The first stage
 * that applies decides the encoding; if decoding under it hits a malformed or
 * unmappable sequence a DecodeError is thrown instead of trying the next one.
 */
class CharsetDecoder {
 public:
  static std::string decode(std::string_view bytes, const std::optional<std::string>& content_type);

  // Raw charset= value of a Content-Type header, quotes stripped
  static std::optional<std::string> extract_charset_label(std::string_view content_type);

  // Canonical converter name for a charset label, nullopt when unsupported
  static std::optional<std::string> resolve_label(std::string_view label);

  static std::optional<BomMatch> sniff_bom(std::string_view bytes);

  // Best statistical guess, always a name resolve_label accepts
  static std::string detect_encoding(std::string_view bytes);

  // Throws DecodeError on the first invalid sequence
  static std::string decode_strict(std::string_view bytes, const std::string& encoding);

  static constexpr const char* FALLBACK_ENCODING = "windows-1252";
};

}  // namespace getweb_core
