/**
 * @file merkle.hpp
 * @brief Merkle tree функции
 *
 * Два представления хешей:
 * - internal: как байты выходят из SHA256d (используется в заголовке блока);
 * - display: развёрнутый порядок, как txid в RPC ноды и в explorer.
 *
 * compute_root / compute_branch принимают и возвращают display порядок,
 * compute_merkle_root и MerkleBranch работают во внутреннем порядке.
 */

#pragma once

#include "../types.hpp"

#include <vector>
#include <span>

namespace bchpool::core {

/**
 * @brief Merkle branch для доказательства включения
 *
 * Содержит хеши соседних узлов (internal порядок) на пути от листа к корню.
 */
struct MerkleBranch {
    /// @brief Хеши соседних узлов на пути к корню
    std::vector<Hash256> hashes;

    /// @brief Индекс позиции (битовая маска: 0=лево, 1=право)
    uint32_t index{0};

    /**
     * @brief Вычислить корень Merkle дерева
     *
     * Для coinbase (index 0) на каждом уровне: root = SHA256d(root || hash).
     *
     * @param leaf_hash Хеш листа (internal порядок)
     * @return Hash256 Корень Merkle дерева (internal порядок)
     */
    [[nodiscard]] Hash256 compute_root(const Hash256& leaf_hash) const noexcept;

    [[nodiscard]] bool verify(
        const Hash256& leaf_hash,
        const Hash256& expected_root
    ) const noexcept;
};

// =============================================================================
// Внутренний порядок байт
// =============================================================================

/**
 * @brief Вычислить Merkle root из списка хешей (internal порядок)
 *
 * При нечётном количестве элементов на уровне последний дублируется.
 * Пустой список даёт нулевой хеш, один элемент возвращается как есть.
 */
[[nodiscard]] Hash256 compute_merkle_root(std::vector<Hash256> leaves) noexcept;

/**
 * @brief Объединить два хеша для Merkle дерева
 *
 * @return Hash256 SHA256d(left || right)
 */
[[nodiscard]] Hash256 merkle_hash(
    const Hash256& left,
    const Hash256& right
) noexcept;

/**
 * @brief Построить branch для листа (internal порядок)
 */
[[nodiscard]] MerkleBranch build_branch(
    std::vector<Hash256> leaves,
    std::size_t index
);

// =============================================================================
// Display порядок (как в шаблоне ноды)
// =============================================================================

/**
 * @brief Merkle root для хешей в display порядке
 *
 * @param display_hashes Хеши транзакций (txid как в RPC)
 * @return Hash256 Корень в display порядке
 */
[[nodiscard]] Hash256 compute_root(std::span<const Hash256> display_hashes) noexcept;

/**
 * @brief Соседние хеши для листа target_index в display порядке
 *
 * При target_index вне диапазона возвращает пустой список.
 */
[[nodiscard]] std::vector<Hash256> compute_branch(
    std::span<const Hash256> display_hashes,
    std::size_t target_index
);

} // namespace bchpool::core
