/**
 * @file test_target.cpp
 * @brief Тесты target и difficulty
 */

#include <gtest/gtest.h>

#include "bitcoin/target.hpp"

#include <cmath>

namespace bchpool::tests {

using namespace bitcoin;
using core::uint256;

class TargetTest : public ::testing::Test {};

TEST_F(TargetTest, DifficultyOneTarget) {
    EXPECT_EQ(difficulty_one_target().to_hex(),
              "00000000ffff0000000000000000000000000000000000000000000000000000");
}

TEST_F(TargetTest, BitsToTarget) {
    EXPECT_EQ(bits_to_target(0x1b0404cb).to_hex(),
              "00000000000404cb000000000000000000000000000000000000000000000000");
    EXPECT_EQ(bits_to_target(0x03123456), uint256(0x123456ULL));
    EXPECT_EQ(bits_to_target(0x02123456), uint256(0x1234ULL));
}

TEST_F(TargetTest, NegativeBitsGiveZero) {
    EXPECT_TRUE(bits_to_target(0x1d800000).is_zero());
}

TEST_F(TargetTest, TargetToBitsRoundTrip) {
    for (uint32_t bits : {0x1d00ffffu, 0x1b0404cbu, 0x1802cc47u, 0x207fffffu}) {
        EXPECT_EQ(target_to_bits(bits_to_target(bits)), bits) << std::hex << bits;
    }
    EXPECT_EQ(target_to_bits(uint256::zero()), 0u);
}

TEST_F(TargetTest, BitsToDifficulty) {
    EXPECT_DOUBLE_EQ(bits_to_difficulty(0x1d00ffff), 1.0);
    EXPECT_NEAR(bits_to_difficulty(0x1b0404cb), 16307.420938523983, 1e-6);
    EXPECT_DOUBLE_EQ(bits_to_difficulty(0x1d000000), 0.0);
}

TEST_F(TargetTest, TargetForIntegralDifficulty) {
    auto diff1 = difficulty_one_target();
    EXPECT_EQ(target_for_difficulty(1.0), diff1);
    EXPECT_EQ(target_for_difficulty(2.0), diff1 >> 1);
    EXPECT_EQ(target_for_difficulty(256.0), diff1 >> 8);
}

/**
 * @brief Дробная сложность пула даёт target больше diff1
 */
TEST_F(TargetTest, TargetForFractionalDifficulty) {
    auto diff1 = difficulty_one_target();
    EXPECT_EQ(target_for_difficulty(0.5), diff1 << 1);
    EXPECT_GT(target_for_difficulty(0.001), diff1);
    EXPECT_GT(target_for_difficulty(0.001), target_for_difficulty(0.01));
}

TEST_F(TargetTest, TargetDecreasesWithDifficulty) {
    uint256 previous = target_for_difficulty(0.001);
    for (double d : {0.01, 0.1, 1.0, 10.0, 1000.0, 1e6, 1e12}) {
        auto current = target_for_difficulty(d);
        EXPECT_LT(current, previous) << d;
        previous = current;
    }
}

TEST_F(TargetTest, NonPositiveDifficultyGivesMaxTarget) {
    EXPECT_EQ(target_for_difficulty(0.0), uint256::max());
    EXPECT_EQ(target_for_difficulty(-1.0), uint256::max());
    EXPECT_EQ(target_for_difficulty(std::nan("")), uint256::max());
}

TEST_F(TargetTest, DifficultyFromHash) {
    EXPECT_NEAR(difficulty_from_hash(difficulty_one_target().to_hash256()), 1.0, 1e-9);
    EXPECT_NEAR(difficulty_from_hash((difficulty_one_target() >> 4).to_hash256()), 16.0, 1e-9);
    EXPECT_TRUE(std::isinf(difficulty_from_hash(Hash256{})));
}

TEST_F(TargetTest, MeetsTarget) {
    auto target = difficulty_one_target();
    EXPECT_TRUE(meets_target(target.to_hash256(), target));
    EXPECT_TRUE(meets_target((target >> 1).to_hash256(), target));
    EXPECT_FALSE(meets_target((target << 1).to_hash256(), target));

    EXPECT_TRUE(meets_bits(Hash256{}, 0x1d00ffff));
    EXPECT_FALSE(meets_bits(uint256::max().to_hash256(), 0x207fffff));
}

TEST_F(TargetTest, Formatting) {
    EXPECT_EQ(format_difficulty(1234567.0), "1.23 M");
    EXPECT_EQ(format_difficulty(0.5), "0.50 ");
    EXPECT_EQ(format_hashrate(12.5e12), "12.50 TH/s");
    EXPECT_EQ(format_hashrate(999.0), "999.00 H/s");
}

} // namespace bchpool::tests
