#include "getweb_core/content/charset_decoder.hpp"

#include <unicode/localpointer.h>
#include <unicode/ucnv.h>
#include <unicode/ucsdet.h>
#include <unicode/unistr.h>
#include <utf8.h>

#include <algorithm>
#include <array>
#include <climits>
#include <iostream>

#include "getweb_core/utils/text_utils.hpp"

namespace getweb_core {

namespace {

// Labels that browsers map to a lossy "replacement" decoder; never decode with them
constexpr std::array<std::string_view, 4> REPLACEMENT_LABELS = {"iso-2022-kr", "hz-gb-2312",
                                                                "iso-2022-cn", "iso-2022-cn-ext"};

// Latin-1 and ASCII labels are decoded as windows-1252, the way browsers do
constexpr std::array<std::string_view, 9> WINDOWS_1252_LABELS = {
    "iso-8859-1", "iso8859-1", "iso_8859-1", "latin1", "l1",
    "us-ascii",   "ascii",     "cp1252",     "windows-1252"};

constexpr std::array<std::string_view, 3> UTF8_LABELS = {"utf-8", "utf8", "unicode-1-1-utf-8"};

template <std::size_t N>
bool is_one_of(const std::string& value, const std::array<std::string_view, N>& labels) {
  return std::find(labels.begin(), labels.end(), value) != labels.end();
}

int32_t clamp_length(std::size_t size) {
  return static_cast<int32_t>(std::min<std::size_t>(size, INT32_MAX));
}

}  // namespace

std::optional<std::string> CharsetDecoder::extract_charset_label(std::string_view content_type) {
  std::string lowered = text::to_lower_ascii(content_type);
  std::size_t pos = 0;
  while ((pos = lowered.find(';', pos)) != std::string::npos) {
    ++pos;
    std::size_t end = lowered.find(';', pos);
    std::string_view param = text::trim(std::string_view(lowered).substr(pos, end - pos));
    auto eq = param.find('=');
    if (eq == std::string_view::npos || text::trim(param.substr(0, eq)) != "charset") {
      continue;
    }
    std::string_view value = text::trim(param.substr(eq + 1));
    while (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
      value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '"' || value.back() == '\'')) {
      value.remove_suffix(1);
    }
    value = text::trim(value);
    if (value.empty()) {
      return std::nullopt;
    }
    return std::string(value);
  }
  return std::nullopt;
}

std::optional<std::string> CharsetDecoder::resolve_label(std::string_view label) {
  std::string lowered = text::to_lower_ascii(text::trim(label));
  if (lowered.empty() || is_one_of(lowered, REPLACEMENT_LABELS)) {
    return std::nullopt;
  }
  if (is_one_of(lowered, UTF8_LABELS)) {
    return "UTF-8";
  }
  if (is_one_of(lowered, WINDOWS_1252_LABELS)) {
    return FALLBACK_ENCODING;
  }
  if (lowered == "utf-16" || lowered == "utf-16le") {
    return "UTF-16LE";
  }
  if (lowered == "utf-16be") {
    return "UTF-16BE";
  }

  // Anything else is accepted if ICU knows a converter for it
  UErrorCode status = U_ZERO_ERROR;
  icu::LocalUConverterPointer converter(ucnv_open(lowered.c_str(), &status));
  if (U_FAILURE(status) || converter.isNull()) {
    return std::nullopt;
  }
  return lowered;
}

std::optional<BomMatch> CharsetDecoder::sniff_bom(std::string_view bytes) {
  if (bytes.size() >= 3 && bytes.compare(0, 3, "\xEF\xBB\xBF") == 0) {
    return BomMatch{"UTF-8", 3};
  }
  if (bytes.size() >= 2 && bytes.compare(0, 2, "\xFF\xFE") == 0) {
    return BomMatch{"UTF-16LE", 2};
  }
  if (bytes.size() >= 2 && bytes.compare(0, 2, "\xFE\xFF") == 0) {
    return BomMatch{"UTF-16BE", 2};
  }
  return std::nullopt;
}

std::string CharsetDecoder::detect_encoding(std::string_view bytes) {
  if (utf8::is_valid(bytes.begin(), bytes.end())) {
    return "UTF-8";
  }

  UErrorCode status = U_ZERO_ERROR;
  icu::LocalUCharsetDetectorPointer detector(ucsdet_open(&status));
  if (U_FAILURE(status)) {
    std::cerr << "[CharsetDecoder] Could not open charset detector: " << u_errorName(status)
              << std::endl;
    return FALLBACK_ENCODING;
  }

  // Markup would skew the statistics towards ASCII-only encodings
  ucsdet_enableInputFilter(detector.getAlias(), true);
  ucsdet_setText(detector.getAlias(), bytes.data(), clamp_length(bytes.size()), &status);
  const UCharsetMatch* match = ucsdet_detect(detector.getAlias(), &status);
  if (U_FAILURE(status) || match == nullptr) {
    return FALLBACK_ENCODING;
  }

  const char* name = ucsdet_getName(match, &status);
  if (U_FAILURE(status) || name == nullptr) {
    return FALLBACK_ENCODING;
  }

  // ICU tags bidi variants such as "IBM424_rtl"; the converter name has no suffix
  std::string detected(name);
  auto underscore = detected.rfind('_');
  if (underscore != std::string::npos) {
    std::string suffix = detected.substr(underscore);
    if (suffix == "_rtl" || suffix == "_ltr") {
      detected.erase(underscore);
    }
  }

  return resolve_label(detected).value_or(FALLBACK_ENCODING);
}

std::string CharsetDecoder::decode_strict(std::string_view bytes, const std::string& encoding) {
  if (bytes.empty()) {
    return {};
  }

  if (encoding == "UTF-8") {
    if (utf8::find_invalid(bytes.begin(), bytes.end()) != bytes.end()) {
      throw DecodeError("Content contains invalid UTF-8 byte sequences", encoding);
    }
    return std::string(bytes);
  }

  if (bytes.size() > static_cast<std::size_t>(INT32_MAX)) {
    throw DecodeError("Content is too large to decode as " + encoding, encoding);
  }

  UErrorCode status = U_ZERO_ERROR;
  icu::LocalUConverterPointer converter(ucnv_open(encoding.c_str(), &status));
  if (U_FAILURE(status)) {
    throw DecodeError("Unsupported encoding: " + encoding, encoding);
  }

  // Stop at the first malformed or unmappable sequence instead of substituting U+FFFD
  ucnv_setToUCallBack(converter.getAlias(), UCNV_TO_U_CALLBACK_STOP, nullptr, nullptr, nullptr,
                      &status);
  if (U_FAILURE(status)) {
    throw DecodeError("Could not configure converter for " + encoding, encoding);
  }

  icu::UnicodeString decoded(bytes.data(), static_cast<int32_t>(bytes.size()),
                             converter.getAlias(), status);
  if (U_FAILURE(status) || decoded.isBogus()) {
    throw DecodeError("Content contains byte sequences that are invalid in " + encoding, encoding);
  }

  std::string out;
  decoded.toUTF8String(out);
  return out;
}

std::string CharsetDecoder::decode(std::string_view bytes,
                                   const std::optional<std::string>& content_type) {
  if (bytes.empty()) {
    return {};
  }

  if (auto bom = sniff_bom(bytes)) {
    return decode_strict(bytes.substr(bom->length), bom->encoding);
  }

  if (content_type) {
    if (auto label = extract_charset_label(*content_type)) {
      if (auto encoding = resolve_label(*label)) {
        return decode_strict(bytes, *encoding);
      }
      std::cerr << "[CharsetDecoder] Unknown charset label '" << *label
                << "', falling back to detection" << std::endl;
    }
  }

  return decode_strict(bytes, detect_encoding(bytes));
}

}  // namespace getweb_core
