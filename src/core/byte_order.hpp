/**
 * @file byte_order.hpp
 * @brief Функции для работы с порядком байт (endianness)
 *
 * Числовые поля транзакций и заголовка блока сериализуются в little-endian,
 * а hex-представления Stratum (version, nbits, ntime, nonce) и хеши в
 * "display" виде идут в обратном порядке.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <array>
#include <span>
#include <bit>
#include <concepts>

namespace bchpool {

/**
 * @brief Concept для целочисленных типов фиксированного размера
 */
template<typename T>
concept UnsignedInteger = std::unsigned_integral<T> &&
                          (sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8);

// =============================================================================
// Преобразование порядка байт
// =============================================================================

/**
 * @brief Поменять порядок байт (byte swap)
 */
template<UnsignedInteger T>
[[nodiscard]] constexpr T byte_swap(T value) noexcept {
    T result = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        result = static_cast<T>((result << 8) | (value & 0xFF));
        value = static_cast<T>(value >> 8);
    }
    return result;
}

template<UnsignedInteger T>
[[nodiscard]] constexpr T to_little_endian(T value) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        return value;
    } else {
        return byte_swap(value);
    }
}

template<UnsignedInteger T>
[[nodiscard]] constexpr T to_big_endian(T value) noexcept {
    if constexpr (std::endian::native == std::endian::big) {
        return value;
    } else {
        return byte_swap(value);
    }
}

// =============================================================================
// Чтение/запись из/в байтовый массив
// =============================================================================

inline void write_le16(uint8_t* dest, uint16_t value) noexcept {
    value = to_little_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

inline void write_le32(uint8_t* dest, uint32_t value) noexcept {
    value = to_little_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

inline void write_le64(uint8_t* dest, uint64_t value) noexcept {
    value = to_little_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

[[nodiscard]] inline uint32_t read_le32(const uint8_t* src) noexcept {
    uint32_t value;
    std::memcpy(&value, src, sizeof(value));
    return to_little_endian(value);
}

[[nodiscard]] inline uint64_t read_le64(const uint8_t* src) noexcept {
    uint64_t value;
    std::memcpy(&value, src, sizeof(value));
    return to_little_endian(value);
}

inline void write_be32(uint8_t* dest, uint32_t value) noexcept {
    value = to_big_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

[[nodiscard]] inline uint32_t read_be32(const uint8_t* src) noexcept {
    uint32_t value;
    std::memcpy(&value, src, sizeof(value));
    return to_big_endian(value);
}

// =============================================================================
// Реверс массива байт (для хешей)
// =============================================================================

/**
 * @brief Реверсировать массив байт на месте
 *
 * Преобразование хешей между internal и display форматами.
 */
inline void reverse_bytes(std::span<uint8_t> data) noexcept {
    auto begin = data.begin();
    auto end = data.end();
    while (begin < end) {
        --end;
        std::swap(*begin, *end);
        ++begin;
    }
}

/**
 * @brief Создать реверсированную копию массива байт
 */
template<std::size_t N>
[[nodiscard]] constexpr std::array<uint8_t, N> reverse_copy(
    const std::array<uint8_t, N>& input
) noexcept {
    std::array<uint8_t, N> result{};
    for (std::size_t i = 0; i < N; ++i) {
        result[i] = input[N - 1 - i];
    }
    return result;
}

} // namespace bchpool
