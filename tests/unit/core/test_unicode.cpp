#include <gtest/gtest.h>
#include "petalite/core/unicode.hpp"

using namespace petalite;

// ============================================================================
// Classification
// ============================================================================

TEST(UnicodeTest, Validity) {
    EXPECT_TRUE(unicode::is_valid('A'));
    EXPECT_TRUE(unicode::is_valid(0x10FFFF));
    EXPECT_FALSE(unicode::is_valid(0x110000));
    EXPECT_FALSE(unicode::is_valid(0xD800));
    EXPECT_FALSE(unicode::is_valid(0xDFFF));
}

TEST(UnicodeTest, ControlCharacters) {
    EXPECT_TRUE(unicode::is_control(0x00));
    EXPECT_TRUE(unicode::is_control('\t'));
    EXPECT_TRUE(unicode::is_control(0x7F));
    EXPECT_TRUE(unicode::is_control(0x85));
    EXPECT_FALSE(unicode::is_control(' '));
    EXPECT_FALSE(unicode::is_control(0xA0));
}

// ============================================================================
// UTF-8 Decoding
// ============================================================================

TEST(Utf8Test, DecodeAscii) {
    auto result = unicode::utf8_decode("A", 1);
    EXPECT_EQ(result.code_point, U'A');
    EXPECT_EQ(result.bytes_consumed, 1u);
}

TEST(Utf8Test, DecodeMultiByte) {
    auto two = unicode::utf8_decode("\xC3\xA9", 2);              // é
    EXPECT_EQ(two.code_point, 0xE9u);
    EXPECT_EQ(two.bytes_consumed, 2u);

    auto three = unicode::utf8_decode("\xE4\xB8\xAD", 3);        // 中
    EXPECT_EQ(three.code_point, 0x4E2Du);
    EXPECT_EQ(three.bytes_consumed, 3u);

    auto four = unicode::utf8_decode("\xF0\x9F\x98\x80", 4);     // 😀
    EXPECT_EQ(four.code_point, 0x1F600u);
    EXPECT_EQ(four.bytes_consumed, 4u);
}

TEST(Utf8Test, InvalidSequencesBecomeReplacement) {
    EXPECT_EQ(unicode::utf8_decode("\xFF", 1).code_point, unicode::REPLACEMENT_CHARACTER);
    EXPECT_EQ(unicode::utf8_decode("\xC0\x80", 2).code_point, unicode::REPLACEMENT_CHARACTER);
    EXPECT_EQ(unicode::utf8_decode("\xE4\xB8", 2).code_point, unicode::REPLACEMENT_CHARACTER);
}

TEST(Utf8Test, DecodeStringTracksOffsets) {
    auto decoded = unicode::decode_utf8("a\xC3\xA9z");
    ASSERT_EQ(decoded.size(), 3u);

    EXPECT_EQ(decoded[0].code_point, U'a');
    EXPECT_EQ(decoded[0].byte_offset, 0u);
    EXPECT_EQ(decoded[1].code_point, 0xE9u);
    EXPECT_EQ(decoded[1].byte_offset, 1u);
    EXPECT_EQ(decoded[1].byte_length, 2u);
    EXPECT_EQ(decoded[2].code_point, U'z');
    EXPECT_EQ(decoded[2].byte_offset, 3u);
}

TEST(Utf8Test, DecodeStringNeverStalls) {
    auto decoded = unicode::decode_utf8("\x80\x80x");
    ASSERT_EQ(decoded.size(), 3u);
    EXPECT_EQ(decoded[0].code_point, unicode::REPLACEMENT_CHARACTER);
    EXPECT_EQ(decoded[2].code_point, U'x');
}

TEST(Utf8Test, EncodeString) {
    EXPECT_EQ(unicode::encode_utf8(U"aé中"), "a\xC3\xA9\xE4\xB8\xAD");
    EXPECT_EQ(unicode::encode_utf8(std::u32string(1, char32_t(0x110000))), "\xEF\xBF\xBD");
}
