#include "getweb_core/html/main_content_selector.hpp"

#include <cctype>
#include <iostream>
#include <regex>
#include <stdexcept>
#include <utility>

#include "getweb_core/html/html_document.hpp"
#include "getweb_core/utils/text_utils.hpp"

namespace getweb_core {

namespace {

const std::vector<std::string> MAIN_SELECTORS = {
    "article",
    "article[role=\"article\"]",
    "main",
    "#main",
    "#main-content",
    "#mainContent",
    "#primary-content",
    "#article",
    "#article-body",
    "#articleBody",
    "#story-body",
    "#storyBody",
    "[role=\"main\"]",
    "[role=\"article\"]",
    ".main",
    ".main-content",
    ".main__content",
    ".main-body",
    ".primary-content",
    ".primary__content",
    ".page-content",
    ".page__content",
    ".content-body",
    ".content__body",
    ".content__article-body",
    ".contentArticle",
    ".article-content",
    ".article__content",
    ".article-body",
    ".article-body__content",
    ".article__body",
    ".articleBody",
    ".articleText",
    ".articletext",
    ".article-main",
    ".articlePage",
    ".article-page",
    ".articleDetail",
    ".article-detail",
    ".articleSection",
    ".o-article__body",
    ".c-article",
    ".c-article__content",
    ".l-article-content",
    ".story",
    ".story-body",
    ".story-body__inner",
    ".story__content",
    ".story-content",
    ".storyContent",
    ".storyText",
    ".post",
    ".post-article",
    ".post__content",
    ".post-content",
    ".post-content__body",
    ".post-body",
    ".post-body__content",
    ".post-text",
    ".entry",
    ".entry-content",
    ".entry__content",
    ".entry-content__inner",
    ".blog-post",
    ".blog__content",
    ".body-content",
    ".bodyText",
    ".body__content",
    ".rich-text",
    ".rich-text__content",
    ".prose",
    ".markdown-body",
    ".read__content",
    ".news-article",
    ".news-article__content",
    ".news-article-body",
    ".mw-parser-output",
};

const std::regex& positive_pattern() {
  static const std::regex pattern(
      "article|body|content|entry|hentry|h-entry|main|page|pagination|post|text|blog|story|"
      "paragraph",
      std::regex::ECMAScript | std::regex::icase);
  return pattern;
}

const std::regex& negative_pattern() {
  static const std::regex pattern(
      "hidden|^hid$| hid$| hid |^hid |banner|breadcrumb|combx|comment|com-|contact|foot|footer|"
      "footnote|masthead|media|meta|outbrain|promo|related|scroll|share|shoutbox|sidebar|"
      "skyscraper|sponsor|shopping|tags|tool|widget|subscribe|nav|author|byline",
      std::regex::ECMAScript | std::regex::icase);
  return pattern;
}

bool is_name_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

std::string read_name(std::string_view selector, std::size_t& pos) {
  std::size_t start = pos;
  while (pos < selector.size() && is_name_char(selector[pos])) {
    ++pos;
  }
  if (pos == start) {
    throw std::invalid_argument("Unsupported selector: " + std::string(selector));
  }
  return std::string(selector.substr(start, pos - start));
}

bool has_text(const xmlNode* node) {
  return !text::trim(HtmlDocument::text_content(node)).empty();
}

}  // namespace

const std::vector<std::string>& MainContentSelector::main_selectors() {
  return MAIN_SELECTORS;
}

std::string MainContentSelector::css_to_xpath(std::string_view selector) {
  std::size_t pos = 0;
  std::string tag = "*";
  if (pos < selector.size() && is_name_char(selector[pos])) {
    tag = read_name(selector, pos);
  }

  std::string predicates;
  while (pos < selector.size()) {
    char c = selector[pos++];
    if (c == '#') {
      predicates += "[@id='" + read_name(selector, pos) + "']";
    } else if (c == '.') {
      predicates += "[contains(concat(' ', normalize-space(@class), ' '), ' " +
                    read_name(selector, pos) + " ')]";
    } else if (c == '[') {
      std::string attr = read_name(selector, pos);
      if (pos < selector.size() && selector[pos] == ']') {
        ++pos;
        predicates += "[@" + attr + "]";
        continue;
      }
      if (pos + 1 >= selector.size() || selector[pos] != '=' || selector[pos + 1] != '"') {
        throw std::invalid_argument("Unsupported selector: " + std::string(selector));
      }
      pos += 2;
      auto close = selector.find("\"]", pos);
      if (close == std::string_view::npos) {
        throw std::invalid_argument("Unterminated attribute selector: " + std::string(selector));
      }
      predicates += "[@" + attr + "='" + std::string(selector.substr(pos, close - pos)) + "']";
      pos = close + 2;
    } else {
      throw std::invalid_argument("Unsupported selector: " + std::string(selector));
    }
  }

  return "//" + tag + predicates;
}

std::optional<std::string> MainContentSelector::select_by_curated_list(
    const HtmlDocument& doc) const {
  static const std::vector<std::string> xpaths = [] {
    std::vector<std::string> out;
    out.reserve(MAIN_SELECTORS.size());
    for (const auto& selector : MAIN_SELECTORS) {
      out.push_back(css_to_xpath(selector));
    }
    return out;
  }();

  for (const auto& xpath : xpaths) {
    // Only the first match of each selector is considered
    xmlNode* node = doc.find_first(xpath);
    if (node == nullptr || !has_text(node)) {
      continue;
    }
    return doc.outer_html(node);
  }
  return std::nullopt;
}

std::optional<std::string> MainContentSelector::select_by_class_heuristic(
    const HtmlDocument& doc) const {
  xmlNode* best = nullptr;
  std::size_t best_len = 0;

  for (xmlNode* node : doc.select("//*[@class or @id]")) {
    std::string tokens = HtmlDocument::attribute(node, "class").value_or("");
    if (auto id = HtmlDocument::attribute(node, "id")) {
      if (!tokens.empty()) {
        tokens.push_back(' ');
      }
      tokens += *id;
    }
    if (tokens.empty()) {
      continue;
    }

    bool positive = std::regex_search(tokens, positive_pattern());
    bool negative = std::regex_search(tokens, negative_pattern());
    if (negative && !positive) {
      continue;
    }
    if (!positive) {
      continue;
    }

    std::string content = HtmlDocument::text_content(node);
    std::size_t len = text::utf8_length(text::trim(content));
    if (len < MIN_CANDIDATE_CHARS) {
      continue;
    }
    if (best == nullptr || len > best_len) {
      best = node;
      best_len = len;
    }
  }

  if (best == nullptr) {
    return std::nullopt;
  }
  return doc.outer_html(best);
}

std::optional<ContentFragment> MainContentSelector::select(std::string_view html) const {
  if (text::trim(html).empty()) {
    return std::nullopt;
  }

  try {
    HtmlDocument doc = HtmlDocument::parse(html);

    if (auto fragment = select_by_curated_list(doc)) {
      return ContentFragment{FragmentKind::Main, std::move(*fragment)};
    }
    if (auto fragment = select_by_class_heuristic(doc)) {
      return ContentFragment{FragmentKind::Main, std::move(*fragment)};
    }

    xmlNode* body = doc.body();
    if (body != nullptr && has_text(body)) {
      return ContentFragment{FragmentKind::Body, doc.outer_html(body)};
    }
  } catch (const HtmlParseError& e) {
    std::cerr << "[MainContentSelector] " << e.what() << ", using the full document" << std::endl;
  }

  return ContentFragment{FragmentKind::FullDocument, std::string(html)};
}

}  // namespace getweb_core
