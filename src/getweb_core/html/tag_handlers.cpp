#include "getweb_core/html/tag_handlers.hpp"

#include <array>
#include <memory>

#include "getweb_core/utils/text_utils.hpp"

namespace getweb_core {

namespace {

constexpr std::array<std::string_view, 6> CHROME_TAGS = {"head", "script", "style",
                                                         "nav",  "footer", "aside"};

// Substrings that mark a class token as ad or overlay chrome
constexpr std::array<std::string_view, 4> CHROME_CLASS_FRAGMENTS = {"ad", "banner", "popup",
                                                                    "promo"};

constexpr std::array<std::string_view, 6> CHROME_ID_FRAGMENTS = {"ad",     "banner",     "popup",
                                                                 "cookie", "newsletter", "sidebar"};

constexpr std::array<std::string_view, 11> PLAIN_BLOCK_TAGS = {
    "div", "section", "article", "main", "header", "blockquote",
    "ul",  "ol",      "table",   "form", "figure"};

bool is_heading(const std::string& tag) {
  return tag.size() == 2 && tag[0] == 'h' && tag[1] >= '1' && tag[1] <= '6';
}

template <std::size_t N>
bool is_one_of(const std::string& tag, const std::array<std::string_view, N>& tags) {
  for (auto candidate : tags) {
    if (tag == candidate) {
      return true;
    }
  }
  return false;
}

}  // namespace

// ChromeRemover

bool ChromeRemover::should_handle(const std::string& /*tag*/) const {
  return true;
}

StartTagOutcome ChromeRemover::on_start(const HtmlElement& element, MarkdownWriter& /*writer*/) {
  if (is_one_of(element.tag(), CHROME_TAGS)) {
    return StartTagOutcome::Skip;
  }

  if (element.has_any_classes({"ad", "ads", "advertisement", "banner", "popup", "modal", "cookie",
                               "newsletter", "sidebar", "widget", "promo", "sponsored",
                               "affiliate", "tracking"})) {
    return StartTagOutcome::Skip;
  }

  for (const auto& cls : element.classes()) {
    for (auto fragment : CHROME_CLASS_FRAGMENTS) {
      if (cls.find(fragment) != std::string::npos) {
        return StartTagOutcome::Skip;
      }
    }
  }

  if (element.has_any_classes({"advertisement", "sponsored-content"})) {
    return StartTagOutcome::Skip;
  }

  if (auto id = element.attr("id")) {
    std::string id_lower = text::to_lower_ascii(*id);
    for (auto fragment : CHROME_ID_FRAGMENTS) {
      if (id_lower.find(fragment) != std::string::npos) {
        return StartTagOutcome::Skip;
      }
    }
  }

  return StartTagOutcome::Continue;
}

// ParagraphHandler

bool ParagraphHandler::should_handle(const std::string& /*tag*/) const {
  return true;
}

StartTagOutcome ParagraphHandler::on_start(const HtmlElement& element, MarkdownWriter& writer) {
  if (element.is_inline() && writer.is_inside("p")) {
    const auto& stack = writer.current_element_stack();
    if (!stack.empty()) {
      const HtmlElement& parent = stack.back();
      if (!(parent.is_inline() || writer.ends_with(' ') || writer.ends_with('\n'))) {
        writer.push_str(" ");
      }
    }
  }

  if (element.tag() == "p") {
    writer.push_blank_line();
  }
  return StartTagOutcome::Continue;
}

// HeadingHandler

bool HeadingHandler::should_handle(const std::string& tag) const {
  return is_heading(tag);
}

StartTagOutcome HeadingHandler::on_start(const HtmlElement& element, MarkdownWriter& writer) {
  std::size_t level = static_cast<std::size_t>(element.tag()[1] - '0');
  writer.push_blank_line();
  writer.push_str(std::string(level, '#'));
  writer.push_str(" ");
  return StartTagOutcome::Continue;
}

void HeadingHandler::on_end(const HtmlElement& /*element*/, MarkdownWriter& writer) {
  writer.push_blank_line();
}

// ListHandler

bool ListHandler::should_handle(const std::string& tag) const {
  return tag == "ul" || tag == "ol" || tag == "li";
}

StartTagOutcome ListHandler::on_start(const HtmlElement& element, MarkdownWriter& writer) {
  if (element.tag() == "li") {
    writer.push_str("- ");
  } else {
    writer.push_newline();
  }
  return StartTagOutcome::Continue;
}

void ListHandler::on_end(const HtmlElement& /*element*/, MarkdownWriter& writer) {
  writer.push_newline();
}

// TableHandler

bool TableHandler::should_handle(const std::string& tag) const {
  return tag == "table" || tag == "thead" || tag == "tbody" || tag == "tr" || tag == "th" ||
         tag == "td";
}

StartTagOutcome TableHandler::on_start(const HtmlElement& element, MarkdownWriter& writer) {
  const std::string& tag = element.tag();
  if (tag == "thead") {
    writer.push_blank_line();
  } else if (tag == "tr") {
    writer.push_newline();
  } else if (tag == "th") {
    ++current_table_columns_;
    if (is_first_th_) {
      is_first_th_ = false;
    } else {
      writer.push_str(" ");
    }
    writer.push_str("| ");
  } else if (tag == "td") {
    if (is_first_td_) {
      is_first_td_ = false;
    } else {
      writer.push_str(" ");
    }
    writer.push_str("| ");
  }
  return StartTagOutcome::Continue;
}

void TableHandler::on_end(const HtmlElement& element, MarkdownWriter& writer) {
  const std::string& tag = element.tag();
  if (tag == "thead") {
    writer.push_newline();
    for (std::size_t i = 0; i < current_table_columns_; ++i) {
      if (i > 0) {
        writer.push_str(" ");
      }
      writer.push_str("| ---");
    }
    writer.push_str(" |");
    is_first_th_ = true;
  } else if (tag == "tr") {
    writer.push_str(" |");
    is_first_td_ = true;
  } else if (tag == "table") {
    current_table_columns_ = 0;
  }
}

// StyledTextHandler

bool StyledTextHandler::should_handle(const std::string& tag) const {
  return tag == "strong" || tag == "em";
}

StartTagOutcome StyledTextHandler::on_start(const HtmlElement& element, MarkdownWriter& writer) {
  writer.push_str(element.tag() == "strong" ? "**" : "_");
  return StartTagOutcome::Continue;
}

void StyledTextHandler::on_end(const HtmlElement& element, MarkdownWriter& writer) {
  writer.push_str(element.tag() == "strong" ? "**" : "_");
}

// LinkHandler

bool LinkHandler::should_handle(const std::string& tag) const {
  return tag == "a";
}

StartTagOutcome LinkHandler::on_start(const HtmlElement& element, MarkdownWriter& writer) {
  if (element.attr("href")) {
    writer.push_str("[");
  }
  return StartTagOutcome::Continue;
}

void LinkHandler::on_end(const HtmlElement& element, MarkdownWriter& writer) {
  if (auto href = element.attr("href")) {
    writer.push_str("](" + *href + ")");
  }
}

// ImageHandler

bool ImageHandler::should_handle(const std::string& tag) const {
  return tag == "img";
}

StartTagOutcome ImageHandler::on_start(const HtmlElement& element, MarkdownWriter& writer) {
  if (auto src = element.attr("src")) {
    std::string alt = element.attr("alt").value_or("image");
    writer.push_str("![" + alt + "](" + *src + ")");
  }
  // Images never have content worth descending into
  return StartTagOutcome::Skip;
}

// CodeHandler

bool CodeHandler::should_handle(const std::string& tag) const {
  return tag == "pre" || tag == "code";
}

StartTagOutcome CodeHandler::on_start(const HtmlElement& element, MarkdownWriter& writer) {
  if (element.tag() == "code") {
    if (!writer.is_inside("pre")) {
      writer.push_str("`");
    }
  } else {
    writer.push_str("\n\n```\n");
  }
  return StartTagOutcome::Continue;
}

void CodeHandler::on_end(const HtmlElement& element, MarkdownWriter& writer) {
  if (element.tag() == "code") {
    if (!writer.is_inside("pre")) {
      writer.push_str("`");
    }
  } else {
    writer.push_str("\n```\n");
  }
}

TextOutcome CodeHandler::on_text(const std::string& text, MarkdownWriter& writer) {
  if (writer.is_inside("pre")) {
    writer.push_str(text);
    return TextOutcome::Handled;
  }
  return TextOutcome::NoOp;
}

// BlockSpacingHandler

bool BlockSpacingHandler::should_handle(const std::string& tag) const {
  return is_heading(tag) || tag == "li" || tag == "tr" || tag == "td" || tag == "th" ||
         tag == "br" || is_one_of(tag, PLAIN_BLOCK_TAGS);
}

StartTagOutcome BlockSpacingHandler::on_start(const HtmlElement& element, MarkdownWriter& writer) {
  const std::string& tag = element.tag();
  if (is_heading(tag)) {
    writer.push_blank_line();
  } else if (tag == "td" || tag == "th") {
    if (!writer.ends_with(' ') && !writer.ends_with('\n')) {
      writer.push_str(" ");
    }
  } else {
    writer.push_newline();
  }
  return StartTagOutcome::Continue;
}

void BlockSpacingHandler::on_end(const HtmlElement& element, MarkdownWriter& writer) {
  const std::string& tag = element.tag();
  if (is_heading(tag)) {
    writer.push_blank_line();
  } else if (tag == "li" || tag == "tr" || is_one_of(tag, PLAIN_BLOCK_TAGS)) {
    writer.push_newline();
  }
}

// PreformattedTextHandler

bool PreformattedTextHandler::should_handle(const std::string& tag) const {
  return tag == "pre";
}

StartTagOutcome PreformattedTextHandler::on_start(const HtmlElement& /*element*/,
                                                  MarkdownWriter& writer) {
  writer.push_blank_line();
  return StartTagOutcome::Continue;
}

void PreformattedTextHandler::on_end(const HtmlElement& /*element*/, MarkdownWriter& writer) {
  writer.push_blank_line();
}

TextOutcome PreformattedTextHandler::on_text(const std::string& text, MarkdownWriter& writer) {
  if (writer.is_inside("pre")) {
    writer.push_str(text);
    return TextOutcome::Handled;
  }
  return TextOutcome::NoOp;
}

std::vector<TagHandlerPtr> markdown_handlers() {
  std::vector<TagHandlerPtr> handlers;
  handlers.push_back(std::make_unique<ChromeRemover>());
  handlers.push_back(std::make_unique<ParagraphHandler>());
  handlers.push_back(std::make_unique<HeadingHandler>());
  handlers.push_back(std::make_unique<ListHandler>());
  handlers.push_back(std::make_unique<TableHandler>());
  handlers.push_back(std::make_unique<StyledTextHandler>());
  handlers.push_back(std::make_unique<LinkHandler>());
  handlers.push_back(std::make_unique<ImageHandler>());
  handlers.push_back(std::make_unique<CodeHandler>());
  return handlers;
}

std::vector<TagHandlerPtr> plain_text_handlers() {
  std::vector<TagHandlerPtr> handlers;
  handlers.push_back(std::make_unique<ChromeRemover>());
  handlers.push_back(std::make_unique<ParagraphHandler>());
  handlers.push_back(std::make_unique<BlockSpacingHandler>());
  handlers.push_back(std::make_unique<PreformattedTextHandler>());
  return handlers;
}

}  // namespace getweb_core
