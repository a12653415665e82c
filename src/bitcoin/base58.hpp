/**
 * @file base58.hpp
 * @brief Base58 и Base58Check кодирование (legacy адреса)
 */

#pragma once

#include "../core/types.hpp"

#include <string>
#include <string_view>

namespace bchpool::bitcoin {

/**
 * @brief Кодировать байты в Base58 (ведущие нули -> '1')
 */
[[nodiscard]] std::string encode_base58(ByteSpan data);

/**
 * @brief Декодировать Base58 строку
 *
 * @return Result<Bytes> Байты или AddressInvalidCharacter
 */
[[nodiscard]] Result<Bytes> decode_base58(std::string_view str);

/**
 * @brief Base58Check: данные + первые 4 байта SHA256d(данные)
 */
[[nodiscard]] std::string encode_base58check(ByteSpan payload);

/**
 * @brief Декодировать Base58Check и проверить контрольную сумму
 *
 * @return Result<Bytes> Payload без контрольной суммы
 */
[[nodiscard]] Result<Bytes> decode_base58check(std::string_view str);

} // namespace bchpool::bitcoin
