#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace getweb_core::text {

// Strips ASCII whitespace (space, \t, \n, \v, \f, \r) from both ends
std::string_view trim(std::string_view text);

std::string to_lower_ascii(std::string_view text);

bool contains_ignore_case(std::string_view haystack, std::string_view needle);

// Number of code points in a valid UTF-8 string
std::size_t utf8_length(std::string_view text);

/**
 * @brief Truncates UTF-8 text without splitting a multi-byte sequence.
 *
 * Text that fits in max_bytes is returned unchanged. Otherwise the result is
 * cut on a code point boundary and suffix is appended, keeping the total at or
 * under max_bytes. When max_bytes leaves no room for the suffix the text is
 * only cut.
 */
std::string safe_truncate_utf8(std::string_view text, std::size_t max_bytes, std::string_view suffix);

}  // namespace getweb_core::text
