/**
 * @file test_merkle.cpp
 * @brief Тесты Merkle root и branch
 */

#include <gtest/gtest.h>

#include "core/byte_order.hpp"
#include "core/hex.hpp"
#include "core/primitives/merkle.hpp"

#include <vector>

namespace bchpool::tests {

namespace {

Hash256 filled(uint8_t value) {
    Hash256 hash{};
    hash.fill(value);
    hash[0] = static_cast<uint8_t>(value ^ 0x5a);
    return hash;
}

Hash256 display(std::string_view hex) {
    auto hash = hash_from_display_hex(hex);
    EXPECT_TRUE(hash.has_value());
    // hash_from_display_hex возвращает внутренний порядок, тесту нужен display
    return hash ? reverse_copy(*hash) : Hash256{};
}

} // namespace

class MerkleTest : public ::testing::Test {
protected:
    std::vector<Hash256> leaves(std::size_t count) const {
        std::vector<Hash256> result;
        for (std::size_t i = 0; i < count; ++i) {
            result.push_back(filled(static_cast<uint8_t>(i + 1)));
        }
        return result;
    }
};

TEST_F(MerkleTest, EmptyListGivesZeroHash) {
    EXPECT_EQ(core::compute_merkle_root({}), Hash256{});
    EXPECT_EQ(core::compute_root(std::span<const Hash256>{}), Hash256{});
}

TEST_F(MerkleTest, SingleLeafIsRoot) {
    auto leaf = filled(7);
    EXPECT_EQ(core::compute_merkle_root({leaf}), leaf);

    std::vector<Hash256> one = {leaf};
    EXPECT_EQ(core::compute_root(one), leaf);
}

TEST_F(MerkleTest, TwoLeaves) {
    auto l = leaves(2);
    EXPECT_EQ(core::compute_merkle_root(l), core::merkle_hash(l[0], l[1]));
}

/**
 * @brief Нечётный уровень: последний элемент дублируется
 */
TEST_F(MerkleTest, OddLevelDuplicatesLast) {
    auto l = leaves(3);
    auto expected = core::merkle_hash(core::merkle_hash(l[0], l[1]),
                                      core::merkle_hash(l[2], l[2]));
    EXPECT_EQ(core::compute_merkle_root(l), expected);
}

/**
 * @brief Блок 100000 сети Bitcoin: 4 транзакции
 */
TEST_F(MerkleTest, KnownBlockRoot) {
    std::vector<Hash256> txids = {
        display("8c14f0db3df150123e6f3dbbf30f8b955a8249b62ac1d1ff16284aefa3d06d87"),
        display("fff2525b8931402dd09222c50775608f75787bd2b87e56995a7bdd30f79702c4"),
        display("6359f0868171b1d194cbee1af2f16ea598ae8fad666d9b012c8ed2b79a236ec4"),
        display("e9a66845e05d5abc0ad04ec80f774a7e585c6e8db975962d069a522137b80c1d"),
    };

    auto root = core::compute_root(txids);
    EXPECT_EQ(to_hex(root), "f3e94742aca4b5ef85488dc37c06c3282295ffec960994b2c0d5ac2a25a95766");
}

TEST_F(MerkleTest, DisplayRootMatchesInternalRoot) {
    auto internal = leaves(5);
    std::vector<Hash256> display_hashes;
    for (const auto& h : internal) {
        display_hashes.push_back(reverse_copy(h));
    }

    EXPECT_EQ(core::compute_root(display_hashes),
              reverse_copy(core::compute_merkle_root(internal)));
}

/**
 * @brief Branch любого листа восстанавливает корень
 */
TEST_F(MerkleTest, BranchReproducesRootForEveryLeaf) {
    for (std::size_t count : {2u, 3u, 5u, 8u, 11u}) {
        auto l = leaves(count);
        auto root = core::compute_merkle_root(l);

        for (std::size_t i = 0; i < count; ++i) {
            auto branch = core::build_branch(l, i);
            EXPECT_TRUE(branch.verify(l[i], root)) << "count=" << count << " index=" << i;
        }
    }
}

TEST_F(MerkleTest, CoinbaseBranchDepth) {
    EXPECT_TRUE(core::build_branch(leaves(1), 0).hashes.empty());
    EXPECT_EQ(core::build_branch(leaves(2), 0).hashes.size(), 1u);
    EXPECT_EQ(core::build_branch(leaves(4), 0).hashes.size(), 2u);
    EXPECT_EQ(core::build_branch(leaves(5), 0).hashes.size(), 3u);
}

TEST_F(MerkleTest, DisplayBranchOutOfRangeIsEmpty) {
    auto l = leaves(3);
    EXPECT_TRUE(core::compute_branch(l, 3).empty());
}

TEST_F(MerkleTest, DisplayBranchFirstSiblingIsNeighbour) {
    auto l = leaves(4);
    auto branch = core::compute_branch(l, 0);
    ASSERT_EQ(branch.size(), 2u);
    EXPECT_EQ(branch[0], l[1]);
}

} // namespace bchpool::tests
