#include <gtest/gtest.h>
#include "tradelog/encoding.hpp"

using tradelog::TextEncoding;
using tradelog::decode_text;

namespace {

// "株式現物買" in Shift_JIS
const std::string kShiftJisBuy = "\x8a\x94" "\x8e\xae" "\x8c\xbb" "\x95\xa8" "\x94\x83";
const std::string kUtf8Buy = "株式現物買";

} // namespace

TEST(EncodingTest, DecodesShiftJis) {
    EXPECT_EQ(decode_text(kShiftJisBuy, TextEncoding::ShiftJis), kUtf8Buy);
}

TEST(EncodingTest, AsciiIsUnchangedByShiftJis) {
    EXPECT_EQ(decode_text("2025/10/03,7203,100", TextEncoding::ShiftJis), "2025/10/03,7203,100");
}

TEST(EncodingTest, TruncatedSequenceBecomesReplacementChar) {
    std::string bytes = "A" + kShiftJisBuy.substr(0, 3);  // cuts the second glyph in half
    std::string decoded = decode_text(bytes, TextEncoding::ShiftJis);
    EXPECT_EQ(decoded, "A株\xEF\xBF\xBD");
}

TEST(EncodingTest, AutoKeepsUtf8) {
    EXPECT_EQ(decode_text(kUtf8Buy, TextEncoding::Auto), kUtf8Buy);
}

TEST(EncodingTest, AutoFallsBackToShiftJis) {
    EXPECT_EQ(decode_text(kShiftJisBuy, TextEncoding::Auto), kUtf8Buy);
}

TEST(EncodingTest, Utf8BomIsStripped) {
    std::string with_bom = "\xEF\xBB\xBF" + kUtf8Buy;
    EXPECT_EQ(decode_text(with_bom, TextEncoding::Auto), kUtf8Buy);
    EXPECT_EQ(decode_text(with_bom, TextEncoding::Utf8), kUtf8Buy);
}

TEST(EncodingTest, ForcedUtf8ReplacesStrayBytes) {
    std::string decoded = decode_text("abc\xFF" "def", TextEncoding::Utf8);
    EXPECT_EQ(decoded, "abc\xEF\xBF\xBD" "def");
    EXPECT_TRUE(tradelog::is_valid_utf8(decoded));

    // Truncated tail: each leftover byte is replaced on its own
    EXPECT_EQ(decode_text(kUtf8Buy + "\xE6\xA0", TextEncoding::Utf8),
              kUtf8Buy + "\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(EncodingTest, BomInputWithStrayBytesIsRepaired) {
    std::string bytes = "\xEF\xBB\xBF" "abc\xFF\xFE" "def";
    std::string decoded = decode_text(bytes, TextEncoding::Auto);
    EXPECT_EQ(decoded, "abc\xEF\xBF\xBD\xEF\xBF\xBD" "def");
    EXPECT_TRUE(tradelog::is_valid_utf8(decoded));
}

TEST(EncodingTest, Utf8Validation) {
    EXPECT_TRUE(tradelog::is_valid_utf8("plain ascii"));
    EXPECT_TRUE(tradelog::is_valid_utf8(kUtf8Buy));
    EXPECT_FALSE(tradelog::is_valid_utf8(kShiftJisBuy));
    EXPECT_FALSE(tradelog::is_valid_utf8("\xE6\xA0"));       // truncated
    EXPECT_FALSE(tradelog::is_valid_utf8("\xC0\xAF"));       // overlong
}

TEST(EncodingTest, ParsesEncodingNames) {
    EXPECT_EQ(tradelog::parse_encoding("Shift_JIS"), TextEncoding::ShiftJis);
    EXPECT_EQ(tradelog::parse_encoding("cp932"), TextEncoding::ShiftJis);
    EXPECT_EQ(tradelog::parse_encoding("UTF-8"), TextEncoding::Utf8);
    EXPECT_EQ(tradelog::parse_encoding(""), TextEncoding::Auto);
    EXPECT_FALSE(tradelog::parse_encoding("latin1").has_value());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
