/**
 * @file uint256.cpp
 * @brief Реализация 256-битного целого числа
 */

#include "uint256.hpp"
#include "../hex.hpp"

#include <cmath>

namespace bchpool::core {

uint256 uint256::operator<<(unsigned shift) const noexcept {
    uint256 result;
    if (shift >= SIZE * 8) {
        return result;
    }
    const std::size_t byte_shift = shift / 8;
    const unsigned bit_shift = shift % 8;

    for (std::size_t i = SIZE; i-- > byte_shift;) {
        const std::size_t src = i - byte_shift;
        unsigned value = static_cast<unsigned>(data_[src]) << bit_shift;
        if (bit_shift != 0 && src > 0) {
            value |= static_cast<unsigned>(data_[src - 1]) >> (8 - bit_shift);
        }
        result.data_[i] = static_cast<uint8_t>(value);
    }
    return result;
}

uint256 uint256::operator>>(unsigned shift) const noexcept {
    uint256 result;
    if (shift >= SIZE * 8) {
        return result;
    }
    const std::size_t byte_shift = shift / 8;
    const unsigned bit_shift = shift % 8;

    for (std::size_t i = 0; i + byte_shift < SIZE; ++i) {
        const std::size_t src = i + byte_shift;
        unsigned value = static_cast<unsigned>(data_[src]) >> bit_shift;
        if (bit_shift != 0 && src + 1 < SIZE) {
            value |= static_cast<unsigned>(data_[src + 1]) << (8 - bit_shift);
        }
        result.data_[i] = static_cast<uint8_t>(value);
    }
    return result;
}

uint256 uint256::divide(uint64_t divisor) const noexcept {
    if (divisor == 0) {
        return max();
    }

    // Деление столбиком по 32-битным словам, от старшего к младшему
    uint256 result;
    unsigned __int128 remainder = 0;
    for (std::size_t word = SIZE / 4; word-- > 0;) {
        uint32_t limb = static_cast<uint32_t>(data_[word * 4])
                      | static_cast<uint32_t>(data_[word * 4 + 1]) << 8
                      | static_cast<uint32_t>(data_[word * 4 + 2]) << 16
                      | static_cast<uint32_t>(data_[word * 4 + 3]) << 24;
        remainder = (remainder << 32) | limb;
        auto quotient = static_cast<uint32_t>(remainder / divisor);
        remainder %= divisor;
        result.data_[word * 4] = static_cast<uint8_t>(quotient);
        result.data_[word * 4 + 1] = static_cast<uint8_t>(quotient >> 8);
        result.data_[word * 4 + 2] = static_cast<uint8_t>(quotient >> 16);
        result.data_[word * 4 + 3] = static_cast<uint8_t>(quotient >> 24);
    }
    return result;
}

double uint256::to_double() const noexcept {
    double value = 0.0;
    for (std::size_t i = SIZE; i-- > 0;) {
        value = value * 256.0 + static_cast<double>(data_[i]);
    }
    return value;
}

std::string uint256::to_hex() const {
    return hash_to_display_hex(data_);
}

Result<uint256> uint256::from_hex(std::string_view hex) {
    auto hash = hash_from_display_hex(hex);
    if (!hash) {
        return Forward<uint256>(hash);
    }
    return uint256{*hash};
}

} // namespace bchpool::core
