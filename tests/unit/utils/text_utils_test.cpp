#include <gtest/gtest.h>

#include <string>

#include "getweb_core/utils/text_utils.hpp"

namespace getweb_core::text {

TEST(TextUtilsTest, TrimStripsAsciiWhitespaceOnly) {
  EXPECT_EQ(trim("  \t hello world \r\n"), "hello world");
  EXPECT_EQ(trim("\n\n"), "");
  EXPECT_EQ(trim(""), "");
  // Non-breaking space is not ASCII whitespace
  EXPECT_EQ(trim("\xC2\xA0x"), "\xC2\xA0x");
}

TEST(TextUtilsTest, CaseHelpers) {
  EXPECT_EQ(to_lower_ascii("Text/HTML; Charset=UTF-8"), "text/html; charset=utf-8");
  EXPECT_TRUE(contains_ignore_case("File is ENCRYPTED", "encrypt"));
  EXPECT_FALSE(contains_ignore_case("bad xref table", "password"));
}

TEST(TextUtilsTest, Utf8LengthCountsCodePoints) {
  EXPECT_EQ(utf8_length("abc"), 3u);
  EXPECT_EQ(utf8_length("caf\xC3\xA9"), 4u);
  EXPECT_EQ(utf8_length("\xE2\x82\xAC\xF0\x9F\x98\x80"), 2u);
}

TEST(TextUtilsTest, TruncateKeepsShortTextUnchanged) {
  EXPECT_EQ(safe_truncate_utf8("short", 10, "..."), "short");
  EXPECT_EQ(safe_truncate_utf8("exact", 5, "..."), "exact");
}

TEST(TextUtilsTest, TruncateAppendsSuffixWithinLimit) {
  std::string result = safe_truncate_utf8("abcdefghij", 8, "...");
  EXPECT_EQ(result, "abcde...");
  EXPECT_LE(result.size(), 8u);
}

TEST(TextUtilsTest, TruncateNeverSplitsMultiByteSequence) {
  // Each euro sign is three bytes; a cut at 4 bytes must fall back to 3
  std::string euros = "\xE2\x82\xAC\xE2\x82\xAC\xE2\x82\xAC";
  EXPECT_EQ(safe_truncate_utf8(euros, 4, ""), "\xE2\x82\xAC");
  EXPECT_EQ(safe_truncate_utf8(euros, 7, "."), "\xE2\x82\xAC\xE2\x82\xAC.");
}

TEST(TextUtilsTest, TruncateWithoutRoomForSuffixOnlyCuts) {
  EXPECT_EQ(safe_truncate_utf8("abcdefghij", 3, "...."), "abc");
  EXPECT_EQ(safe_truncate_utf8("abcdefghij", 0, "..."), "");
}

}  // namespace getweb_core::text
