/**
 * @file target.cpp
 * @brief Реализация работы с difficulty и target
 */

#include "target.hpp"

#include <format>
#include <cmath>

namespace bchpool::bitcoin {

namespace {

/// @brief Сложность 1 в compact формате
constexpr uint32_t DIFF1_BITS = 0x1d00ffff;

/// @brief Максимальная сложность, для которой difficulty * 2^32 помещается в uint64
constexpr double MAX_SCALED_DIFFICULTY = 4294967295.0;

} // namespace

core::uint256 difficulty_one_target() noexcept {
    return bits_to_target(DIFF1_BITS);
}

// =============================================================================
// bits <-> target
// =============================================================================

core::uint256 bits_to_target(uint32_t bits) noexcept {
    const uint32_t exponent = (bits >> 24) & 0xFF;
    uint32_t mantissa = bits & 0x00FFFFFF;

    if (mantissa & 0x00800000) {
        return core::uint256::zero();
    }

    if (exponent <= 3) {
        mantissa >>= 8 * (3 - exponent);
        return core::uint256{static_cast<uint64_t>(mantissa)};
    }
    return core::uint256{static_cast<uint64_t>(mantissa)} << (8 * (exponent - 3));
}

uint32_t target_to_bits(const core::uint256& target) noexcept {
    // Находим первый ненулевой байт (от старшего)
    int first_nonzero = 31;
    while (first_nonzero >= 0 && target[static_cast<std::size_t>(first_nonzero)] == 0) {
        --first_nonzero;
    }
    if (first_nonzero < 0) {
        return 0;
    }

    uint32_t exponent = static_cast<uint32_t>(first_nonzero + 1);
    uint32_t mantissa = static_cast<uint32_t>(target[static_cast<std::size_t>(first_nonzero)]) << 16;
    if (first_nonzero > 0) {
        mantissa |= static_cast<uint32_t>(target[static_cast<std::size_t>(first_nonzero - 1)]) << 8;
    }
    if (first_nonzero > 1) {
        mantissa |= static_cast<uint32_t>(target[static_cast<std::size_t>(first_nonzero - 2)]);
    }

    // Знаковый бит mantissa должен быть сброшен
    if (mantissa & 0x00800000) {
        mantissa >>= 8;
        exponent++;
    }

    return (exponent << 24) | mantissa;
}

// =============================================================================
// Difficulty
// =============================================================================

core::uint256 target_for_difficulty(double difficulty) noexcept {
    if (!(difficulty > 0.0)) {
        return core::uint256::max();
    }

    const auto diff1 = difficulty_one_target();
    if (difficulty <= MAX_SCALED_DIFFICULTY) {
        const auto scaled = static_cast<uint64_t>(std::llround(difficulty * 4294967296.0));
        if (scaled == 0) {
            return core::uint256::max();
        }
        return (diff1 << 32).divide(scaled);
    }

    if (difficulty >= 1.8e19) {
        return core::uint256::zero();
    }
    return diff1.divide(static_cast<uint64_t>(std::llround(difficulty)));
}

double bits_to_difficulty(uint32_t bits) noexcept {
    // difficulty = (0xFFFF * 2^208) / (mantissa * 2^(8 * (exponent - 3)))
    //            = 0xFFFF / mantissa * 2^(232 - 8 * exponent)
    const uint32_t exponent = (bits >> 24) & 0xFF;
    const uint32_t mantissa = bits & 0x00FFFFFF;

    if (mantissa == 0) {
        return 0.0;
    }

    const double diff = static_cast<double>(0xFFFF) / static_cast<double>(mantissa);
    return std::ldexp(diff, 232 - static_cast<int>(exponent) * 8);
}

double difficulty_from_hash(const Hash256& hash) noexcept {
    const double value = core::uint256{hash}.to_double();
    if (value == 0.0) {
        return INFINITY;
    }
    return difficulty_one_target().to_double() / value;
}

// =============================================================================
// Проверки
// =============================================================================

bool meets_target(const Hash256& hash, const core::uint256& target) noexcept {
    return core::uint256{hash} <= target;
}

bool meets_bits(const Hash256& hash, uint32_t bits) noexcept {
    return meets_target(hash, bits_to_target(bits));
}

// =============================================================================
// Форматирование
// =============================================================================

std::string format_difficulty(double difficulty) {
    const char* suffixes[] = {"", "K", "M", "G", "T", "P", "E", "Z", "Y"};
    int suffix_idx = 0;

    while (difficulty >= 1000.0 && suffix_idx < 8) {
        difficulty /= 1000.0;
        ++suffix_idx;
    }

    return std::format("{:.2f} {}", difficulty, suffixes[suffix_idx]);
}

std::string format_hashrate(double hashes_per_second) {
    const char* units[] = {"H/s", "KH/s", "MH/s", "GH/s", "TH/s", "PH/s", "EH/s"};
    int unit_idx = 0;

    while (hashes_per_second >= 1000.0 && unit_idx < 6) {
        hashes_per_second /= 1000.0;
        ++unit_idx;
    }

    return std::format("{:.2f} {}", hashes_per_second, units[unit_idx]);
}

} // namespace bchpool::bitcoin
