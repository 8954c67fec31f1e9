#include "getweb_core/utils/text_utils.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>

namespace getweb_core::text {

namespace {

bool is_ascii_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

// Largest prefix of text made of whole code points and no longer than limit bytes
std::size_t boundary_at_or_below(std::string_view text, std::size_t limit) {
  auto it = text.begin();
  while (it != text.end()) {
    auto next = it;
    utf8::next(next, text.end());
    if (static_cast<std::size_t>(next - text.begin()) > limit) {
      break;
    }
    it = next;
  }
  return static_cast<std::size_t>(it - text.begin());
}

}  // namespace

std::string_view trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && is_ascii_space(text[begin])) {
    ++begin;
  }
  while (end > begin && is_ascii_space(text[end - 1])) {
    --end;
  }
  return text.substr(begin, end - begin);
}

std::string to_lower_ascii(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool contains_ignore_case(std::string_view haystack, std::string_view needle) {
  return to_lower_ascii(haystack).find(to_lower_ascii(needle)) != std::string::npos;
}

std::size_t utf8_length(std::string_view text) {
  return static_cast<std::size_t>(utf8::distance(text.begin(), text.end()));
}

std::string safe_truncate_utf8(std::string_view text, std::size_t max_bytes, std::string_view suffix) {
  if (text.size() <= max_bytes) {
    return std::string(text);
  }
  if (max_bytes == 0) {
    return {};
  }

  if (max_bytes <= suffix.size()) {
    return std::string(text.substr(0, boundary_at_or_below(text, max_bytes)));
  }

  std::string result(text.substr(0, boundary_at_or_below(text, max_bytes - suffix.size())));
  result.append(suffix);
  return result;
}

}  // namespace getweb_core::text
