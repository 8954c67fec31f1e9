#include "getweb_core/html/html_element.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include "getweb_core/utils/text_utils.hpp"

namespace getweb_core {

namespace {

const std::unordered_set<std::string_view>& inline_elements() {
  static const std::unordered_set<std::string_view> elements = {
      "a",      "abbr",   "acronym",  "audio",  "b",        "bdi",    "bdo",      "big",
      "br",     "button", "canvas",   "cite",   "code",     "data",   "datalist", "del",
      "dfn",    "em",     "embed",    "i",      "iframe",   "img",    "input",    "ins",
      "kbd",    "label",  "map",      "mark",   "meter",    "noscript", "object", "output",
      "picture", "progress", "q",     "ruby",   "s",        "samp",   "script",   "select",
      "slot",   "small",  "span",     "strong", "sub",      "sup",    "svg",      "template",
      "textarea", "time", "tt",       "u",      "var",      "video",  "wbr"};
  return elements;
}

}  // namespace

HtmlElement HtmlElement::from_node(const xmlNode* node) {
  std::vector<Attribute> attributes;
  for (const xmlAttr* prop = node->properties; prop != nullptr; prop = prop->next) {
    std::string name(reinterpret_cast<const char*>(prop->name));
    std::string value;
    xmlChar* raw = xmlNodeGetContent(reinterpret_cast<const xmlNode*>(prop));
    if (raw != nullptr) {
      value = reinterpret_cast<const char*>(raw);
      xmlFree(raw);
    }
    attributes.emplace_back(std::move(name), std::move(value));
  }
  return HtmlElement(text::to_lower_ascii(reinterpret_cast<const char*>(node->name)),
                     std::move(attributes));
}

std::optional<std::string> HtmlElement::attr(std::string_view name) const {
  for (const auto& [key, value] : attributes_) {
    if (key == name) {
      return value;
    }
  }
  return std::nullopt;
}

std::vector<std::string> HtmlElement::classes() const {
  std::vector<std::string> out;
  auto cls = attr("class");
  if (!cls) {
    return out;
  }
  std::string_view rest(*cls);
  while (true) {
    auto space = rest.find(' ');
    out.emplace_back(text::trim(rest.substr(0, space)));
    if (space == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(space + 1);
  }
  return out;
}

bool HtmlElement::has_class(std::string_view cls) const {
  return has_any_classes({cls});
}

bool HtmlElement::has_any_classes(std::initializer_list<std::string_view> candidates) const {
  for (const auto& cls : classes()) {
    if (std::find(candidates.begin(), candidates.end(), cls) != candidates.end()) {
      return true;
    }
  }
  return false;
}

bool HtmlElement::is_inline() const {
  return inline_elements().count(tag_) > 0;
}

}  // namespace getweb_core
