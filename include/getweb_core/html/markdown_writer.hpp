#pragma once

#include <libxml/tree.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "getweb_core/html/html_element.hpp"

namespace getweb_core {

enum class StartTagOutcome { Continue, Skip };

enum class TextOutcome { Handled, NoOp };

class MarkdownWriter;

/**
 * @brief Per-tag reaction plugged into a MarkdownWriter walk.
 *
 * on_start/on_end are only called for tags accepted by should_handle().
 * on_text is offered every text node; returning Handled stops the remaining
 * handlers and the default text path. Handlers may keep state across one
 * walk but must not retain the writer.
 */
class TagHandler {
 public:
  virtual ~TagHandler() = default;

  virtual bool should_handle(const std::string& tag) const = 0;

  virtual StartTagOutcome on_start(const HtmlElement& /*element*/, MarkdownWriter& /*writer*/) {
    return StartTagOutcome::Continue;
  }

  virtual void on_end(const HtmlElement& /*element*/, MarkdownWriter& /*writer*/) {}

  virtual TextOutcome on_text(const std::string& /*text*/, MarkdownWriter& /*writer*/) {
    return TextOutcome::NoOp;
  }
};

using TagHandlerPtr = std::unique_ptr<TagHandler>;

/**
 * @brief Depth-first walk of an HTML tree that feeds an ordered handler list.
 *
 * Start and end handlers run in registration order. An element whose start is
 * skipped is neither entered nor ended. The walk keeps its own stack of
 * pending nodes, so nesting depth is bounded by heap rather than call stack.
 */
class MarkdownWriter {
 public:
  std::string run(const xmlNode* root, std::vector<TagHandlerPtr>& handlers);

  // Blank-line collapse and trim applied to the raw output of run()
  static std::string prettify(const std::string& markdown);

  void push_str(std::string_view str) {
    output_.append(str);
  }
  void push_newline() {
    output_.push_back('\n');
  }
  void push_blank_line() {
    output_.append("\n\n");
  }

  const std::string& output() const {
    return output_;
  }
  bool ends_with(char c) const {
    return !output_.empty() && output_.back() == c;
  }

  // Ancestors of the node being visited, outermost first
  const std::vector<HtmlElement>& current_element_stack() const {
    return element_stack_;
  }
  bool is_inside(std::string_view tag) const;

 private:
  StartTagOutcome start_tag(const HtmlElement& element, std::vector<TagHandlerPtr>& handlers);
  void end_tag(const HtmlElement& element, std::vector<TagHandlerPtr>& handlers);
  void visit_text(const std::string& text, std::vector<TagHandlerPtr>& handlers);

  std::string output_;
  std::vector<HtmlElement> element_stack_;
};

}  // namespace getweb_core
