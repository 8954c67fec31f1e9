#include "getweb_core/html/markdown_writer.hpp"

#include <utility>

#include "getweb_core/utils/text_utils.hpp"

namespace getweb_core {

namespace {

struct Frame {
  const xmlNode* node;
  bool exiting;
};

// Children are pushed last-to-first so they pop in document order
void push_children(const xmlNode* node, std::vector<Frame>& pending) {
  for (const xmlNode* child = node->last; child != nullptr; child = child->prev) {
    pending.push_back({child, false});
  }
}

bool is_blank_line(std::string_view line) {
  return text::trim(line).empty();
}

}  // namespace

bool MarkdownWriter::is_inside(std::string_view tag) const {
  for (const auto& element : element_stack_) {
    if (element.tag() == tag) {
      return true;
    }
  }
  return false;
}

std::string MarkdownWriter::run(const xmlNode* root, std::vector<TagHandlerPtr>& handlers) {
  output_.clear();
  element_stack_.clear();
  if (root == nullptr) {
    return {};
  }

  std::vector<Frame> pending{{root, false}};
  while (!pending.empty()) {
    Frame frame = pending.back();
    pending.pop_back();

    if (frame.exiting) {
      HtmlElement element = std::move(element_stack_.back());
      element_stack_.pop_back();
      end_tag(element, handlers);
      continue;
    }

    const xmlNode* node = frame.node;
    switch (node->type) {
      case XML_ELEMENT_NODE: {
        HtmlElement element = HtmlElement::from_node(node);
        if (element.tag().empty()) {
          push_children(node, pending);
          break;
        }
        if (start_tag(element, handlers) == StartTagOutcome::Skip) {
          break;
        }
        element_stack_.push_back(std::move(element));
        pending.push_back({node, true});
        push_children(node, pending);
        break;
      }
      case XML_TEXT_NODE:
      case XML_CDATA_SECTION_NODE:
        if (node->content != nullptr) {
          visit_text(reinterpret_cast<const char*>(node->content), handlers);
        }
        break;
      case XML_DOCUMENT_NODE:
      case XML_HTML_DOCUMENT_NODE:
        push_children(node, pending);
        break;
      default:
        // Comments, doctype, processing instructions
        break;
    }
  }

  return prettify(output_);
}

StartTagOutcome MarkdownWriter::start_tag(const HtmlElement& element,
                                          std::vector<TagHandlerPtr>& handlers) {
  for (auto& handler : handlers) {
    if (handler->should_handle(element.tag()) &&
        handler->on_start(element, *this) == StartTagOutcome::Skip) {
      return StartTagOutcome::Skip;
    }
  }
  return StartTagOutcome::Continue;
}

void MarkdownWriter::end_tag(const HtmlElement& element, std::vector<TagHandlerPtr>& handlers) {
  for (auto& handler : handlers) {
    if (handler->should_handle(element.tag())) {
      handler->on_end(element, *this);
    }
  }
}

void MarkdownWriter::visit_text(const std::string& text, std::vector<TagHandlerPtr>& handlers) {
  for (auto& handler : handlers) {
    if (handler->on_text(text, *this) == TextOutcome::Handled) {
      return;
    }
  }

  std::size_t begin = text.find_first_not_of("\n\r\t");
  if (begin == std::string::npos) {
    return;
  }
  std::size_t end = text.find_last_not_of("\n\r\t");
  std::string collapsed = text.substr(begin, end - begin + 1);
  for (char& c : collapsed) {
    if (c == '\n') {
      c = ' ';
    }
  }
  push_str(collapsed);
}

std::string MarkdownWriter::prettify(const std::string& markdown) {
  // Whitespace-only lines become empty so they count as blank lines below
  std::string blanked;
  blanked.reserve(markdown.size());
  std::string_view rest(markdown);
  while (true) {
    auto newline = rest.find('\n');
    std::string_view line = rest.substr(0, newline);
    if (!is_blank_line(line)) {
      blanked.append(line);
    }
    if (newline == std::string_view::npos) {
      break;
    }
    blanked.push_back('\n');
    rest.remove_prefix(newline + 1);
  }

  // Runs of three or more newlines collapse to one blank line
  std::string collapsed;
  collapsed.reserve(blanked.size());
  std::size_t newline_run = 0;
  for (char c : blanked) {
    if (c == '\n') {
      if (++newline_run > 2) {
        continue;
      }
    } else {
      newline_run = 0;
    }
    collapsed.push_back(c);
  }

  return std::string(text::trim(collapsed));
}

}  // namespace getweb_core
