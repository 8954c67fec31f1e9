#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>

#include "getweb_core/html/html_converter.hpp"

namespace getweb_core {

using ::testing::HasSubstr;
using ::testing::Not;

class HtmlConverterTest : public ::testing::Test {
 protected:
  HtmlConverter markdown_{OutputFormat::Markdown};
  HtmlConverter plain_{OutputFormat::PlainText};
};

TEST_F(HtmlConverterTest, EmptyInputConvertsToEmptyString) {
  EXPECT_EQ(markdown_.convert(""), "");
  EXPECT_EQ(plain_.convert("   \n"), "");
}

TEST_F(HtmlConverterTest, RemovesScriptsAndHead) {
  std::string html =
      "<html><head><title>Ignored</title><script>evil()</script></head>"
      "<body><p>Hello</p></body></html>";

  std::string out = markdown_.convert(html);
  EXPECT_EQ(out, "Hello");
  EXPECT_THAT(out, Not(HasSubstr("evil")));
}

TEST_F(HtmlConverterTest, RemovesInlineScriptsInBody) {
  std::string out =
      markdown_.convert("<html><body><script>evil()</script><p>Hello</p></body></html>");
  EXPECT_THAT(out, HasSubstr("Hello"));
  EXPECT_THAT(out, Not(HasSubstr("evil")));
}

TEST_F(HtmlConverterTest, RemovesChromeByClassAndId) {
  std::string html =
      "<body><div class=\"cookie\">Accept cookies</div>"
      "<div id=\"newsletter-signup\">Subscribe now</div>"
      "<div class=\"top-banner\">Big sale</div>"
      "<p>Real content</p></body>";

  EXPECT_EQ(markdown_.convert(html), "Real content");
}

TEST_F(HtmlConverterTest, RendersHeadingsAndParagraphs) {
  std::string html = "<h2>Title</h2><p>First paragraph.</p><p>Second paragraph.</p>";

  EXPECT_EQ(markdown_.convert(html), "## Title\n\nFirst paragraph.\n\nSecond paragraph.");
}

TEST_F(HtmlConverterTest, RendersTableWithSeparatorRow) {
  std::string html =
      "<table><thead><tr><th>A</th><th>B</th></tr></thead>"
      "<tbody><tr><td>1</td><td>2</td></tr></tbody></table>";

  EXPECT_EQ(markdown_.convert(html), "| A | B |\n| --- | --- |\n| 1 | 2 |");
}

TEST_F(HtmlConverterTest, KeepsPreformattedTextVerbatim) {
  std::string html = "<pre>  line one\n    indented  two</pre>";

  std::string out = markdown_.convert(html);
  EXPECT_THAT(out, HasSubstr("```"));
  EXPECT_THAT(out, HasSubstr("  line one\n    indented  two"));
}

TEST_F(HtmlConverterTest, RendersInlineFormatting) {
  std::string html =
      "<p><strong>Bold</strong> and <em>soft</em> with <code>x()</code> and "
      "<a href=\"https://example.com/docs\">docs</a></p>";

  EXPECT_EQ(markdown_.convert(html),
            "**Bold** and _soft_ with `x()` and [docs](https://example.com/docs)");
}

TEST_F(HtmlConverterTest, LinkWithoutHrefIsPlainText) {
  EXPECT_EQ(markdown_.convert("<p><a name=\"top\">anchor</a></p>"), "anchor");
}

TEST_F(HtmlConverterTest, RendersListsAndImages) {
  std::string html =
      "<ul><li>One</li><li>Two</li></ul><p><img src=\"/logo.png\" alt=\"Logo\"></p>"
      "<p><img src=\"/pic.png\"></p>";

  std::string out = markdown_.convert(html);
  EXPECT_THAT(out, HasSubstr("- One\n- Two"));
  EXPECT_THAT(out, HasSubstr("![Logo](/logo.png)"));
  EXPECT_THAT(out, HasSubstr("![image](/pic.png)"));
}

TEST_F(HtmlConverterTest, InsertsSpaceBetweenAdjacentInlineRuns) {
  EXPECT_EQ(markdown_.convert("<p>Hello<span>world</span></p>"), "Hello world");
}

TEST_F(HtmlConverterTest, PlainTextFormatDropsMarkup) {
  std::string html =
      "<h1>Title</h1><p>Body <strong>bold</strong> "
      "<a href=\"https://example.com\">link</a></p>";

  std::string out = plain_.convert(html);
  EXPECT_EQ(out, "Title\n\nBody bold link");
  EXPECT_THAT(out, Not(HasSubstr("**")));
  EXPECT_THAT(out, Not(HasSubstr("](")));
}

TEST_F(HtmlConverterTest, PlainTextKeepsTableCellsApart) {
  std::string html = "<table><tr><td>left</td><td>right</td></tr></table>";

  EXPECT_EQ(plain_.convert(html), "left right");
}

TEST_F(HtmlConverterTest, ParsesMarkupNestedDeeperThanParserDefault) {
  std::string html = "<p>before</p>";
  for (int i = 0; i < 300; ++i) {
    html += "<span>";
  }
  html += "deep";
  for (int i = 0; i < 300; ++i) {
    html += "</span>";
  }
  html += "<p>after</p>";

  std::string out = markdown_.convert(html);
  EXPECT_THAT(out, HasSubstr("before"));
  EXPECT_THAT(out, HasSubstr("deep"));
  EXPECT_THAT(out, HasSubstr("after"));
}

TEST_F(HtmlConverterTest, ConvertsDeeplyNestedBlocks) {
  std::string html;
  for (int i = 0; i < 1000; ++i) {
    html += "<div>";
  }
  html += "deep text";
  for (int i = 0; i < 1000; ++i) {
    html += "</div>";
  }

  EXPECT_EQ(plain_.convert(html), "deep text");
}

TEST_F(HtmlConverterTest, ConvertsMalformedMarkupLeniently) {
  EXPECT_EQ(markdown_.convert("<p>Unclosed <strong>bold"), "Unclosed **bold**");
}

}  // namespace getweb_core
