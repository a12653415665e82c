/**
 * @file sha256.hpp
 * @brief SHA256 и SHA256d
 *
 * Программная реализация по FIPS 180-4. Используется для:
 * - хеша заголовка блока (proof-of-work);
 * - txid coinbase и Merkle дерева;
 * - контрольной суммы Base58Check.
 */

#pragma once

#include "../core/types.hpp"

#include <array>
#include <span>
#include <cstdint>

namespace bchpool::crypto {

/**
 * @brief SHA256 состояние (8 x 32-bit слов)
 */
using Sha256State = std::array<uint32_t, 8>;

/**
 * @brief Потоковый SHA256
 *
 * @code
 * crypto::Sha256 hasher;
 * hasher.write(header).write(tail);
 * Hash256 digest = hasher.finalize();
 * @endcode
 */
class Sha256 {
public:
    Sha256() noexcept;

    /**
     * @brief Добавить данные
     */
    Sha256& write(ByteSpan data) noexcept;

    /**
     * @brief Завершить вычисление
     *
     * После вызова объект сбрасывается в начальное состояние.
     */
    [[nodiscard]] Hash256 finalize() noexcept;

    void reset() noexcept;

private:
    Sha256State state_;
    std::array<uint8_t, 64> buffer_{};
    std::size_t buffered_{0};
    uint64_t total_{0};
};

/**
 * @brief Функция сжатия для одного 64-байтного блока
 */
void sha256_transform(Sha256State& state, const uint8_t* block) noexcept;

/**
 * @brief SHA256 данных произвольной длины
 */
[[nodiscard]] Hash256 sha256(ByteSpan data) noexcept;

/**
 * @brief SHA256d = SHA256(SHA256(data))
 */
[[nodiscard]] Hash256 sha256d(ByteSpan data) noexcept;

} // namespace bchpool::crypto
