/**
 * @file hex.cpp
 * @brief Реализация hex преобразований
 */

#include "hex.hpp"

#include <format>

namespace bchpool {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

[[nodiscard]] constexpr int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string to_hex(ByteSpan data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

Result<Bytes> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return Err<Bytes>(
            ErrorCode::ConfigParseError,
            std::format("Нечётная длина hex строки: {}", hex.size())
        );
    }

    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int high = hex_value(hex[i]);
        int low = hex_value(hex[i + 1]);
        if (high < 0 || low < 0) {
            return Err<Bytes>(
                ErrorCode::ConfigParseError,
                std::format("Неверный символ в hex строке на позиции {}", i)
            );
        }
        out.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return out;
}

bool is_hex(std::string_view hex, std::size_t width) noexcept {
    if (hex.size() != width) {
        return false;
    }
    for (char c : hex) {
        if (hex_value(c) < 0) {
            return false;
        }
    }
    return true;
}

Result<uint32_t> parse_hex_u32(std::string_view hex) {
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex.remove_prefix(2);
    }
    if (hex.empty() || hex.size() > 8) {
        return Err<uint32_t>(
            ErrorCode::ConfigParseError,
            std::format("Неверная длина 32-битного hex числа: {}", hex.size())
        );
    }

    uint32_t value = 0;
    for (char c : hex) {
        int v = hex_value(c);
        if (v < 0) {
            return Err<uint32_t>(
                ErrorCode::ConfigParseError,
                std::format("Неверный символ в hex числе: '{}'", c)
            );
        }
        value = (value << 4) | static_cast<uint32_t>(v);
    }
    return value;
}

Result<Hash256> hash_from_display_hex(std::string_view hex) {
    if (hex.size() != 64) {
        return Err<Hash256>(
            ErrorCode::CryptoInvalidLength,
            std::format("Неверная длина хеша: {} (ожидается 64)", hex.size())
        );
    }
    auto bytes = from_hex(hex);
    if (!bytes) {
        return Forward<Hash256>(bytes);
    }

    Hash256 hash{};
    for (std::size_t i = 0; i < hash.size(); ++i) {
        hash[i] = (*bytes)[hash.size() - 1 - i];
    }
    return hash;
}

std::string hash_to_display_hex(const Hash256& hash) {
    std::string out;
    out.reserve(64);
    for (std::size_t i = hash.size(); i-- > 0;) {
        out.push_back(HEX_DIGITS[hash[i] >> 4]);
        out.push_back(HEX_DIGITS[hash[i] & 0x0F]);
    }
    return out;
}

} // namespace bchpool
