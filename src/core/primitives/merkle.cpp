/**
 * @file merkle.cpp
 * @brief Реализация Merkle tree функций
 */

#include "merkle.hpp"
#include "../byte_order.hpp"
#include "../../crypto/sha256.hpp"

#include <cstring>

namespace bchpool::core {

namespace {

[[nodiscard]] std::vector<Hash256> to_internal(std::span<const Hash256> display_hashes) {
    std::vector<Hash256> leaves;
    leaves.reserve(display_hashes.size());
    for (const auto& hash : display_hashes) {
        leaves.push_back(reverse_copy(hash));
    }
    return leaves;
}

} // namespace

Hash256 MerkleBranch::compute_root(const Hash256& leaf_hash) const noexcept {
    Hash256 current = leaf_hash;
    uint32_t idx = index;

    for (const auto& hash : hashes) {
        if (idx & 1) {
            // Текущий узел справа, hash слева
            current = merkle_hash(hash, current);
        } else {
            current = merkle_hash(current, hash);
        }
        idx >>= 1;
    }

    return current;
}

bool MerkleBranch::verify(
    const Hash256& leaf_hash,
    const Hash256& expected_root
) const noexcept {
    return compute_root(leaf_hash) == expected_root;
}

Hash256 compute_merkle_root(std::vector<Hash256> leaves) noexcept {
    if (leaves.empty()) {
        return Hash256{};
    }

    while (leaves.size() > 1) {
        if (leaves.size() % 2 != 0) {
            leaves.push_back(leaves.back());
        }

        std::vector<Hash256> next_level;
        next_level.reserve(leaves.size() / 2);

        for (std::size_t i = 0; i < leaves.size(); i += 2) {
            next_level.push_back(merkle_hash(leaves[i], leaves[i + 1]));
        }

        leaves = std::move(next_level);
    }

    return leaves[0];
}

Hash256 merkle_hash(const Hash256& left, const Hash256& right) noexcept {
    std::array<uint8_t, 64> combined;
    std::memcpy(combined.data(), left.data(), 32);
    std::memcpy(combined.data() + 32, right.data(), 32);
    return crypto::sha256d(combined);
}

MerkleBranch build_branch(std::vector<Hash256> leaves, std::size_t index) {
    MerkleBranch branch;
    if (index >= leaves.size()) {
        return branch;
    }
    branch.index = static_cast<uint32_t>(index);

    std::size_t idx = index;
    while (leaves.size() > 1) {
        if (leaves.size() % 2 != 0) {
            leaves.push_back(leaves.back());
        }

        // Сосед текущей позиции (для дублированного элемента это он сам)
        branch.hashes.push_back(leaves[idx ^ 1]);

        std::vector<Hash256> next_level;
        next_level.reserve(leaves.size() / 2);
        for (std::size_t i = 0; i < leaves.size(); i += 2) {
            next_level.push_back(merkle_hash(leaves[i], leaves[i + 1]));
        }

        leaves = std::move(next_level);
        idx /= 2;
    }

    return branch;
}

Hash256 compute_root(std::span<const Hash256> display_hashes) noexcept {
    if (display_hashes.empty()) {
        return Hash256{};
    }
    if (display_hashes.size() == 1) {
        return display_hashes[0];
    }
    return reverse_copy(compute_merkle_root(to_internal(display_hashes)));
}

std::vector<Hash256> compute_branch(
    std::span<const Hash256> display_hashes,
    std::size_t target_index
) {
    auto branch = build_branch(to_internal(display_hashes), target_index);

    std::vector<Hash256> result;
    result.reserve(branch.hashes.size());
    for (const auto& hash : branch.hashes) {
        result.push_back(reverse_copy(hash));
    }
    return result;
}

} // namespace bchpool::core
