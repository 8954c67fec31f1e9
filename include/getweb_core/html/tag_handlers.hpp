#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "getweb_core/html/markdown_writer.hpp"

namespace getweb_core {

// Drops page chrome: head, scripts, navigation and ad/popup/cookie containers.
class ChromeRemover : public TagHandler {
 public:
  bool should_handle(const std::string& tag) const override;
  StartTagOutcome on_start(const HtmlElement& element, MarkdownWriter& writer) override;
};

// Separates paragraphs and keeps inline runs inside <p> apart by one space.
class ParagraphHandler : public TagHandler {
 public:
  bool should_handle(const std::string& tag) const override;
  StartTagOutcome on_start(const HtmlElement& element, MarkdownWriter& writer) override;
};

class HeadingHandler : public TagHandler {
 public:
  bool should_handle(const std::string& tag) const override;
  StartTagOutcome on_start(const HtmlElement& element, MarkdownWriter& writer) override;
  void on_end(const HtmlElement& element, MarkdownWriter& writer) override;
};

class ListHandler : public TagHandler {
 public:
  bool should_handle(const std::string& tag) const override;
  StartTagOutcome on_start(const HtmlElement& element, MarkdownWriter& writer) override;
  void on_end(const HtmlElement& element, MarkdownWriter& writer) override;
};

/**
 * @brief Renders tables as pipe tables.
 *
 * Columns are counted from the <th> cells; leaving <thead> writes the
 * "| --- |" separator row for that many columns.
 */
class TableHandler : public TagHandler {
 public:
  bool should_handle(const std::string& tag) const override;
  StartTagOutcome on_start(const HtmlElement& element, MarkdownWriter& writer) override;
  void on_end(const HtmlElement& element, MarkdownWriter& writer) override;

 private:
  std::size_t current_table_columns_ = 0;
  bool is_first_th_ = true;
  bool is_first_td_ = true;
};

// strong -> **text**, em -> _text_
class StyledTextHandler : public TagHandler {
 public:
  bool should_handle(const std::string& tag) const override;
  StartTagOutcome on_start(const HtmlElement& element, MarkdownWriter& writer) override;
  void on_end(const HtmlElement& element, MarkdownWriter& writer) override;
};

class LinkHandler : public TagHandler {
 public:
  bool should_handle(const std::string& tag) const override;
  StartTagOutcome on_start(const HtmlElement& element, MarkdownWriter& writer) override;
  void on_end(const HtmlElement& element, MarkdownWriter& writer) override;
};

class ImageHandler : public TagHandler {
 public:
  bool should_handle(const std::string& tag) const override;
  StartTagOutcome on_start(const HtmlElement& element, MarkdownWriter& writer) override;
};

// Inline code in backticks, <pre> as a fenced block with its text copied verbatim.
class CodeHandler : public TagHandler {
 public:
  bool should_handle(const std::string& tag) const override;
  StartTagOutcome on_start(const HtmlElement& element, MarkdownWriter& writer) override;
  void on_end(const HtmlElement& element, MarkdownWriter& writer) override;
  TextOutcome on_text(const std::string& text, MarkdownWriter& writer) override;
};

// Plain-text output: line breaks around headings, list items, rows and block containers.
class BlockSpacingHandler : public TagHandler {
 public:
  bool should_handle(const std::string& tag) const override;
  StartTagOutcome on_start(const HtmlElement& element, MarkdownWriter& writer) override;
  void on_end(const HtmlElement& element, MarkdownWriter& writer) override;
};

// Plain-text output: <pre> text copied verbatim, set off by blank lines, no fences.
class PreformattedTextHandler : public TagHandler {
 public:
  bool should_handle(const std::string& tag) const override;
  StartTagOutcome on_start(const HtmlElement& element, MarkdownWriter& writer) override;
  void on_end(const HtmlElement& element, MarkdownWriter& writer) override;
  TextOutcome on_text(const std::string& text, MarkdownWriter& writer) override;
};

// Fresh handler lists; table state must not leak between conversions.
std::vector<TagHandlerPtr> markdown_handlers();
std::vector<TagHandlerPtr> plain_text_handlers();

}  // namespace getweb_core
