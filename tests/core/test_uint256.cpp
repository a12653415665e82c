/**
 * @file test_uint256.cpp
 * @brief Тесты 256-битной арифметики
 */

#include <gtest/gtest.h>

#include "core/primitives/uint256.hpp"

namespace bchpool::tests {

using core::uint256;

class Uint256Test : public ::testing::Test {};

TEST_F(Uint256Test, HexRoundTrip) {
    const std::string hex = "00000000ffff0000000000000000000000000000000000000000000000000000";
    auto value = uint256::from_hex(hex);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->to_hex(), hex);

    // Младший байт хранится первым
    EXPECT_EQ((*value)[31], 0x00);
    EXPECT_EQ((*value)[27], 0xff);
    EXPECT_EQ((*value)[26], 0xff);
    EXPECT_EQ((*value)[25], 0x00);
}

TEST_F(Uint256Test, FromHexRejectsWrongLength) {
    EXPECT_FALSE(uint256::from_hex("ffff").has_value());
}

TEST_F(Uint256Test, ComparesAsBigEndianNumber) {
    uint256 small(0xFFULL);
    uint256 large = uint256::one() << 200;

    EXPECT_LT(small, large);
    EXPECT_GT(large, small);
    EXPECT_EQ(uint256(42ULL), uint256(42ULL));
    EXPECT_LT(uint256::zero(), uint256::one());
    EXPECT_GT(uint256::max(), large);
}

TEST_F(Uint256Test, Shifts) {
    EXPECT_EQ(uint256::one() << 8, uint256(256ULL));
    EXPECT_EQ(uint256(256ULL) >> 8, uint256::one());
    EXPECT_EQ((uint256::one() << 255) >> 255, uint256::one());
    EXPECT_TRUE((uint256::one() << 256).is_zero());
}

TEST_F(Uint256Test, Divide) {
    EXPECT_EQ(uint256(1000ULL).divide(10), uint256(100ULL));
    EXPECT_EQ((uint256::one() << 128).divide(1ULL << 32), uint256::one() << 96);
    EXPECT_EQ(uint256(7ULL).divide(0), uint256::max());
}

TEST_F(Uint256Test, ToDouble) {
    EXPECT_DOUBLE_EQ(uint256(12345ULL).to_double(), 12345.0);
    EXPECT_DOUBLE_EQ((uint256::one() << 64).to_double(), 18446744073709551616.0);
}

} // namespace bchpool::tests
