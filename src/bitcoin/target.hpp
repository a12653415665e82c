/**
 * @file target.hpp
 * @brief Difficulty и target
 *
 * Target - 256-битное число, хеш заголовка (как little-endian число)
 * должен быть меньше или равен target.
 *
 * Compact формат "bits" (4 байта):
 * - Первый байт: exponent
 * - Следующие 3 байта: mantissa
 *
 * target = mantissa * 2^(8 * (exponent - 3))
 *
 * Сложность пула дробная (например 0.001), поэтому target для неё
 * считается как (diff1 << 32) / round(difficulty * 2^32).
 */

#pragma once

#include "../core/types.hpp"
#include "../core/primitives/uint256.hpp"

#include <cstdint>
#include <string>

namespace bchpool::bitcoin {

/**
 * @brief Target сложности 1: 0x00000000FFFF0000...0000
 */
[[nodiscard]] core::uint256 difficulty_one_target() noexcept;

// =============================================================================
// Преобразования bits <-> target
// =============================================================================

/**
 * @brief Преобразовать compact bits в 256-битный target
 *
 * Отрицательный target (бит 0x00800000) даёт ноль.
 */
[[nodiscard]] core::uint256 bits_to_target(uint32_t bits) noexcept;

[[nodiscard]] uint32_t target_to_bits(const core::uint256& target) noexcept;

// =============================================================================
// Difficulty
// =============================================================================

/**
 * @brief Target для (возможно дробной) сложности
 *
 * Сложность <= 0 или NaN даёт максимальный target.
 */
[[nodiscard]] core::uint256 target_for_difficulty(double difficulty) noexcept;

[[nodiscard]] double bits_to_difficulty(uint32_t bits) noexcept;

/**
 * @brief Фактическая сложность хеша: diff1 / hash
 *
 * @param hash Хеш заголовка во внутреннем порядке байт
 */
[[nodiscard]] double difficulty_from_hash(const Hash256& hash) noexcept;

// =============================================================================
// Проверки
// =============================================================================

/**
 * @brief Проверить, что хеш (internal порядок) не больше target
 */
[[nodiscard]] bool meets_target(const Hash256& hash, const core::uint256& target) noexcept;

[[nodiscard]] bool meets_bits(const Hash256& hash, uint32_t bits) noexcept;

// =============================================================================
// Форматирование
// =============================================================================

/**
 * @brief Форматировать difficulty для отображения ("1.23 T", "0.00 ")
 */
[[nodiscard]] std::string format_difficulty(double difficulty);

/**
 * @brief Форматировать хешрейт ("12.50 TH/s")
 */
[[nodiscard]] std::string format_hashrate(double hashes_per_second);

} // namespace bchpool::bitcoin
