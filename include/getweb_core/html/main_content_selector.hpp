#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace getweb_core {

class HtmlDocument;

enum class FragmentKind {
  Main,          // a curated selector or the heuristic found the content region
  Body,          // low confidence, fell back to <body>
  FullDocument   // nothing structural was usable
};

struct ContentFragment {
  FragmentKind kind;
  std::string html;
};

/**
 * @brief Locates the substantive content region of an HTML page.
 *
 * Three stages: a curated list of well-known content selectors, then a
 * class/id keyword heuristic that keeps the longest qualifying element, then
 * the <body>. Returns nullopt only for empty or whitespace-only input.
 */
class MainContentSelector {
 public:
  // Heuristic candidates with fewer trimmed characters are ignored
  static constexpr std::size_t MIN_CANDIDATE_CHARS = 180;

  std::optional<ContentFragment> select(std::string_view html) const;

  // Translates the simple selectors used here (tag, #id, .class, [attr="v"])
  static std::string css_to_xpath(std::string_view selector);

  static const std::vector<std::string>& main_selectors();

 private:
  std::optional<std::string> select_by_curated_list(const HtmlDocument& doc) const;
  std::optional<std::string> select_by_class_heuristic(const HtmlDocument& doc) const;
};

}  // namespace getweb_core
