#include "getweb_core/html/html_converter.hpp"

#include "getweb_core/html/html_document.hpp"
#include "getweb_core/html/markdown_writer.hpp"
#include "getweb_core/html/tag_handlers.hpp"
#include "getweb_core/utils/text_utils.hpp"

namespace getweb_core {

std::string HtmlConverter::convert(std::string_view html) const {
  if (text::trim(html).empty()) {
    return {};
  }

  HtmlDocument doc = [&] {
    try {
      return HtmlDocument::parse(html);
    } catch (const HtmlParseError& e) {
      throw HtmlConversionError(std::string("Failed to convert HTML: ") + e.what());
    }
  }();

  auto handlers = format_ == OutputFormat::Markdown ? markdown_handlers() : plain_text_handlers();
  MarkdownWriter writer;
  return writer.run(doc.document_node(), handlers);
}

}  // namespace getweb_core
