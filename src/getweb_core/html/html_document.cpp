#include "getweb_core/html/html_document.hpp"

#include <libxml/HTMLtree.h>
#include <libxml/encoding.h>
#include <libxml/parserInternals.h>
#include <libxml/xpath.h>

#include <climits>

namespace getweb_core {

namespace {

struct XPathContextDeleter {
  void operator()(xmlXPathContext* ctx) const {
    xmlXPathFreeContext(ctx);
  }
};

struct XPathObjectDeleter {
  void operator()(xmlXPathObject* obj) const {
    xmlXPathFreeObject(obj);
  }
};

struct ParserContextDeleter {
  void operator()(htmlParserCtxt* ctxt) const {
    htmlFreeParserCtxt(ctxt);
  }
};

struct BufferDeleter {
  void operator()(xmlBuffer* buf) const {
    xmlBufferFree(buf);
  }
};

constexpr int PARSE_OPTIONS = HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING |
                              HTML_PARSE_NONET | HTML_PARSE_IGNORE_ENC | HTML_PARSE_COMPACT;

}  // namespace

HtmlDocument HtmlDocument::parse(std::string_view html) {
  if (html.size() > static_cast<std::size_t>(INT_MAX)) {
    throw HtmlParseError("HTML document is too large to parse");
  }

  std::unique_ptr<htmlParserCtxt, ParserContextDeleter> ctxt(
      htmlCreateMemoryParserCtxt(html.data(), static_cast<int>(html.size())));
  if (!ctxt) {
    throw HtmlParseError("Failed to create HTML parser context");
  }

  htmlCtxtUseOptions(ctxt.get(), PARSE_OPTIONS);
  // No HTML_PARSE_HUGE before libxml2 2.11; the tree builder reads the XML flag
  // for its 256-level nesting cap
  ctxt->options |= XML_PARSE_HUGE;

  xmlCharEncodingHandler* utf8 = xmlFindCharEncodingHandler("UTF-8");
  if (utf8 != nullptr) {
    xmlSwitchToEncoding(ctxt.get(), utf8);
  }

  htmlParseDocument(ctxt.get());
  std::unique_ptr<xmlDoc, DocDeleter> doc(ctxt->myDoc);
  ctxt->myDoc = nullptr;

  if (!doc) {
    throw HtmlParseError("Failed to parse HTML document");
  }
  // A halted parser still hands back the tree built so far
  if (ctxt->disableSAX != 0) {
    throw HtmlParseError("HTML parser stopped before the end of the document");
  }
  return HtmlDocument(doc.release());
}

xmlNode* HtmlDocument::root() const {
  return xmlDocGetRootElement(doc_.get());
}

xmlNode* HtmlDocument::body() const {
  return find_first("//body");
}

std::vector<xmlNode*> HtmlDocument::select(const std::string& xpath) const {
  std::unique_ptr<xmlXPathContext, XPathContextDeleter> ctx(xmlXPathNewContext(doc_.get()));
  if (!ctx) {
    throw HtmlParseError("Failed to create XPath context");
  }

  std::unique_ptr<xmlXPathObject, XPathObjectDeleter> result(
      xmlXPathEvalExpression(BAD_CAST xpath.c_str(), ctx.get()));
  if (!result) {
    throw HtmlParseError("Invalid XPath expression: " + xpath);
  }

  std::vector<xmlNode*> nodes;
  xmlNodeSet* set = result->nodesetval;
  if (set == nullptr) {
    return nodes;
  }
  nodes.reserve(static_cast<std::size_t>(set->nodeNr));
  for (int i = 0; i < set->nodeNr; ++i) {
    nodes.push_back(set->nodeTab[i]);
  }
  return nodes;
}

xmlNode* HtmlDocument::find_first(const std::string& xpath) const {
  auto nodes = select(xpath);
  return nodes.empty() ? nullptr : nodes.front();
}

std::string HtmlDocument::outer_html(xmlNode* node) const {
  std::unique_ptr<xmlBuffer, BufferDeleter> buffer(xmlBufferCreate());
  if (!buffer) {
    throw HtmlParseError("Failed to allocate serialization buffer");
  }
  if (htmlNodeDump(buffer.get(), doc_.get(), node) < 0) {
    throw HtmlParseError("Failed to serialize HTML node");
  }
  return std::string(reinterpret_cast<const char*>(xmlBufferContent(buffer.get())),
                     static_cast<std::size_t>(xmlBufferLength(buffer.get())));
}

std::string HtmlDocument::text_content(const xmlNode* node) {
  xmlChar* content = xmlNodeGetContent(node);
  if (content == nullptr) {
    return {};
  }
  std::string text(reinterpret_cast<const char*>(content));
  xmlFree(content);
  return text;
}

std::optional<std::string> HtmlDocument::attribute(const xmlNode* node, const char* name) {
  xmlChar* value = xmlGetProp(node, BAD_CAST name);
  if (value == nullptr) {
    return std::nullopt;
  }
  std::string out(reinterpret_cast<const char*>(value));
  xmlFree(value);
  return out;
}

}  // namespace getweb_core
