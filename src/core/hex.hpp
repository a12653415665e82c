/**
 * @file hex.hpp
 * @brief Преобразования hex <-> байты
 *
 * Все поля Stratum (coinb1/coinb2, extranonce, ntime, nonce, merkle branch)
 * передаются в hex. Хеши блоков и транзакций в RPC ноды идут в "display"
 * порядке (развёрнутом относительно внутреннего).
 */

#pragma once

#include "types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace bchpool {

/**
 * @brief Байты в hex строку (нижний регистр)
 */
[[nodiscard]] std::string to_hex(ByteSpan data);

/**
 * @brief Hex строка в байты
 *
 * Нечётная длина или посторонний символ дают ConfigParseError
 * с описанием позиции.
 */
[[nodiscard]] Result<Bytes> from_hex(std::string_view hex);

/**
 * @brief Проверка hex строки фиксированной ширины
 *
 * @param hex Строка
 * @param width Ожидаемое количество символов
 */
[[nodiscard]] bool is_hex(std::string_view hex, std::size_t width) noexcept;

/**
 * @brief Разобрать 32-битное число из hex (до 8 цифр, допускается "0x")
 */
[[nodiscard]] Result<uint32_t> parse_hex_u32(std::string_view hex);

/**
 * @brief Хеш из display hex (64 символа) во внутренний порядок байт
 */
[[nodiscard]] Result<Hash256> hash_from_display_hex(std::string_view hex);

/**
 * @brief Хеш из внутреннего порядка в display hex
 */
[[nodiscard]] std::string hash_to_display_hex(const Hash256& hash);

} // namespace bchpool
