/**
 * @file test_hex.cpp
 * @brief Тесты hex преобразований
 */

#include <gtest/gtest.h>

#include "core/hex.hpp"

namespace bchpool::tests {

class HexTest : public ::testing::Test {};

TEST_F(HexTest, EncodeLowercase) {
    Bytes data = {0x00, 0xAB, 0x10, 0xFF};
    EXPECT_EQ(to_hex(data), "00ab10ff");
    EXPECT_EQ(to_hex(Bytes{}), "");
}

TEST_F(HexTest, DecodeMixedCase) {
    auto bytes = from_hex("00AbCd10");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, (Bytes{0x00, 0xAB, 0xCD, 0x10}));
}

TEST_F(HexTest, DecodeRejectsOddLength) {
    auto bytes = from_hex("abc");
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(bytes.error().code, ErrorCode::ConfigParseError);
}

TEST_F(HexTest, DecodeRejectsBadCharacter) {
    EXPECT_FALSE(from_hex("zz").has_value());
    EXPECT_FALSE(from_hex("0g").has_value());
}

TEST_F(HexTest, FixedWidthCheck) {
    EXPECT_TRUE(is_hex("deadbeef", 8));
    EXPECT_FALSE(is_hex("deadbeef", 16));
    EXPECT_FALSE(is_hex("deadbeeg", 8));
    EXPECT_TRUE(is_hex("", 0));
}

TEST_F(HexTest, ParseU32) {
    auto bits = parse_hex_u32("1d00ffff");
    ASSERT_TRUE(bits.has_value());
    EXPECT_EQ(*bits, 0x1d00ffffu);

    auto prefixed = parse_hex_u32("0x20000000");
    ASSERT_TRUE(prefixed.has_value());
    EXPECT_EQ(*prefixed, 0x20000000u);

    EXPECT_FALSE(parse_hex_u32("").has_value());
    EXPECT_FALSE(parse_hex_u32("123456789").has_value());
    EXPECT_FALSE(parse_hex_u32("xyz").has_value());
}

/**
 * @brief Display порядок развёрнут относительно внутреннего
 */
TEST_F(HexTest, DisplayHashIsReversed) {
    std::string display(63, '0');
    display += "1";

    auto hash = hash_from_display_hex(display);
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ((*hash)[0], 0x01);
    EXPECT_EQ((*hash)[31], 0x00);

    EXPECT_EQ(hash_to_display_hex(*hash), display);
}

TEST_F(HexTest, DisplayHashRequires64Chars) {
    EXPECT_FALSE(hash_from_display_hex("abcd").has_value());
    EXPECT_FALSE(hash_from_display_hex(std::string(66, 'a')).has_value());
}

} // namespace bchpool::tests
