#include <gtest/gtest.h>

#include "utils/HashUtils.hpp"
#include "utils/StringUtils.hpp"

using homestream::utils::HashUtils;
using homestream::utils::StringUtils;

TEST(StringUtilsTest, SanitizeFileNameReplacesUnsafeCharacters) {
    EXPECT_EQ(StringUtils::sanitizeFileName("Who? What: Why!"), "Who. What - Why.");
    EXPECT_EQ(StringUtils::sanitizeFileName("AC/DC \\ Live"), "AC-DC - Live");
    EXPECT_EQ(StringUtils::sanitizeFileName("<b>\"quoted\"</b>"), "(b)'quoted'(-b)");
    EXPECT_EQ(StringUtils::sanitizeFileName("a;b|c*d"), "a,b c.d");
}

TEST(StringUtilsTest, SanitizeFileNameDropsControlCharacters) {
    EXPECT_EQ(StringUtils::sanitizeFileName("line\none\ttab"), "lineonetab");
}

TEST(StringUtilsTest, SanitizeFileNameIsIdempotent) {
    const std::string once = StringUtils::sanitizeFileName("Law & Order: SVU?");
    EXPECT_EQ(StringUtils::sanitizeFileName(once), once);
}

TEST(StringUtilsTest, ParseBitrateSuffixes) {
    EXPECT_DOUBLE_EQ(*StringUtils::parseBitrate("448k"), 448000.0);
    EXPECT_DOUBLE_EQ(*StringUtils::parseBitrate("30M"), 30000000.0);
    EXPECT_DOUBLE_EQ(*StringUtils::parseBitrate("2Ki"), 2048.0);
    EXPECT_DOUBLE_EQ(*StringUtils::parseBitrate("2MB"), 16000000.0);
    EXPECT_DOUBLE_EQ(*StringUtils::parseBitrate("1500"), 1500.0);
    EXPECT_FALSE(StringUtils::parseBitrate("fast").has_value());
    EXPECT_FALSE(StringUtils::parseBitrate("12kx").has_value());
    EXPECT_FALSE(StringUtils::parseBitrate("").has_value());
}

TEST(StringUtilsTest, ParseLongRejectsTrailingGarbage) {
    EXPECT_EQ(StringUtils::parseLong(" 42 "), 42);
    EXPECT_FALSE(StringUtils::parseLong("42abc").has_value());
    EXPECT_FALSE(StringUtils::parseLong("").has_value());
    EXPECT_EQ(StringUtils::parseInt("99999999999", 7), 7);
}

TEST(StringUtilsTest, ParseIsoTimestamp) {
    auto date = StringUtils::parseIsoTimestamp("2021-02-22");
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(StringUtils::formatIsoTimestamp(*date), "2021-02-22T00:00:00Z");

    auto full = StringUtils::parseIsoTimestamp("2021-02-22T20:30:15Z");
    ASSERT_TRUE(full.has_value());
    EXPECT_EQ(StringUtils::formatTimestamp(*full, "%H:%M:%S"), "20:30:15");

    EXPECT_FALSE(StringUtils::parseIsoTimestamp("yesterday").has_value());
}

TEST(StringUtilsTest, ToHexIsUppercaseWithPrefix) {
    EXPECT_EQ(StringUtils::toHex(0x5F3A2B10), "0x5F3A2B10");
}

TEST(StringUtilsTest, SplitAndJoin) {
    auto parts = StringUtils::split("a/b/c", '/');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(StringUtils::join(parts, "-"), "a-b-c");
}

TEST(StringUtilsTest, EscapeXml) {
    EXPECT_EQ(StringUtils::escapeXml("Tom & Jerry <1>"), "Tom &amp; Jerry &lt;1&gt;");
}

TEST(HashUtilsTest, Sha1OfStrings) {
    EXPECT_EQ(HashUtils::sha1String("abc"), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(HashUtils::sha1String(""), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}
