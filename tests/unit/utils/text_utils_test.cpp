#include <gtest/gtest.h>

#include "docqa_core/errors.hpp"
#include "docqa_core/utils/text_utils.hpp"

namespace docqa_core {

TEST(TextUtilsTest, CodePointLengthCountsMultiByteCharactersOnce) {
  EXPECT_EQ(code_point_length(""), 0u);
  EXPECT_EQ(code_point_length("abc"), 3u);
  EXPECT_EQ(code_point_length("na\xC3\xAFve"), 5u);
  EXPECT_EQ(code_point_length("\xF0\x9F\x98\x80"), 1u);
}

TEST(TextUtilsTest, CodePointBoundariesEndWithByteLength) {
  auto boundaries = code_point_boundaries("a\xC3\xA9z");
  ASSERT_EQ(boundaries.size(), 4u);
  EXPECT_EQ(boundaries[0], 0u);
  EXPECT_EQ(boundaries[1], 1u);
  EXPECT_EQ(boundaries[2], 3u);
  EXPECT_EQ(boundaries[3], 4u);
}

TEST(TextUtilsTest, InvalidUtf8Throws) {
  EXPECT_THROW(code_point_length(std::string("\xC3", 1)), ContentError);
  EXPECT_THROW(code_point_boundaries(std::string("ok\x80", 3)), ContentError);
}

TEST(TextUtilsTest, TruncateKeepsWholeCodePoints) {
  EXPECT_EQ(truncate_code_points("\xC3\xA9\xC3\xA9\xC3\xA9", 2), "\xC3\xA9\xC3\xA9");
  EXPECT_EQ(truncate_code_points("abc", 10), "abc");
  EXPECT_EQ(truncate_code_points("abc", 0), "");
}

TEST(TextUtilsTest, NormalizeUnifiesLineEndingsAndTrims) {
  EXPECT_EQ(normalize_text("  line one  \r\nline two\t\rline three\n\n"),
            "line one\nline two\nline three");
}

TEST(TextUtilsTest, NormalizeCollapsesBlankLineRuns) {
  EXPECT_EQ(normalize_text("a\n\n\n\nb\n \n\t\nc"), "a\n\nb\n\nc");
}

TEST(TextUtilsTest, NormalizeOfWhitespaceIsEmpty) {
  EXPECT_EQ(normalize_text(" \n\t\r\n "), "");
}

TEST(TextUtilsTest, IsBlank) {
  EXPECT_TRUE(is_blank(""));
  EXPECT_TRUE(is_blank(" \t\n"));
  EXPECT_FALSE(is_blank("  x "));
}

}  // namespace docqa_core
