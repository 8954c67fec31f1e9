#pragma once

#include <libxml/tree.h>

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace getweb_core {

// Snapshot of one element visited by the MarkdownWriter: tag name plus its
// attributes in source order.
class HtmlElement {
 public:
  using Attribute = std::pair<std::string, std::string>;

  HtmlElement(std::string tag, std::vector<Attribute> attributes)
      : tag_(std::move(tag)), attributes_(std::move(attributes)) {}

  static HtmlElement from_node(const xmlNode* node);

  const std::string& tag() const {
    return tag_;
  }
  const std::vector<Attribute>& attributes() const {
    return attributes_;
  }

  std::optional<std::string> attr(std::string_view name) const;

  // Class attribute split on single spaces, each token trimmed
  std::vector<std::string> classes() const;
  bool has_class(std::string_view cls) const;
  bool has_any_classes(std::initializer_list<std::string_view> candidates) const;

  // True for elements rendered inline by default (a, span, code, img, ...)
  bool is_inline() const;

 private:
  std::string tag_;
  std::vector<Attribute> attributes_;
};

}  // namespace getweb_core
