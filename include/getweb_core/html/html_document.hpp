#pragma once

#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace getweb_core {

class HtmlParseError : public std::exception {
 public:
  explicit HtmlParseError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @brief Owning handle to a leniently parsed HTML tree.
 *
 * Input must already be UTF-8. Malformed markup is repaired by the parser;
 * only a document the parser cannot produce at all raises HtmlParseError.
 * Node pointers returned by the accessors stay valid for the lifetime of the
 * HtmlDocument that produced them.
 */
class HtmlDocument {
 public:
  static HtmlDocument parse(std::string_view html);

  // The document itself, for walks that must also see nodes outside <html>
  const xmlNode* document_node() const {
    return reinterpret_cast<const xmlNode*>(doc_.get());
  }
  xmlNode* root() const;
  xmlNode* body() const;

  // Nodes matching an XPath 1.0 expression, in document order
  std::vector<xmlNode*> select(const std::string& xpath) const;
  xmlNode* find_first(const std::string& xpath) const;

  // Serialized markup of the node including its own tag
  std::string outer_html(xmlNode* node) const;

  static std::string text_content(const xmlNode* node);
  static std::optional<std::string> attribute(const xmlNode* node, const char* name);

 private:
  struct DocDeleter {
    void operator()(xmlDoc* doc) const {
      xmlFreeDoc(doc);
    }
  };

  explicit HtmlDocument(xmlDoc* doc) : doc_(doc) {}

  std::unique_ptr<xmlDoc, DocDeleter> doc_;
};

}  // namespace getweb_core
