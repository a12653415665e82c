/**
 * @file base58.cpp
 * @brief Реализация Base58Check
 */

#include "base58.hpp"
#include "../crypto/sha256.hpp"

#include <algorithm>
#include <array>
#include <format>

namespace bchpool::bitcoin {

namespace {

constexpr std::string_view BASE58_ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

/// @brief Размер контрольной суммы Base58Check
constexpr std::size_t CHECKSUM_SIZE = 4;

} // namespace

std::string encode_base58(ByteSpan data) {
    std::size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) {
        ++zeros;
    }

    // Цифры base58 в обратном порядке (младшая первой)
    std::vector<uint8_t> digits;
    digits.reserve(data.size() * 138 / 100 + 1);
    for (std::size_t i = zeros; i < data.size(); ++i) {
        unsigned carry = data[i];
        for (auto& digit : digits) {
            carry += static_cast<unsigned>(digit) << 8;
            digit = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string result(zeros, '1');
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        result.push_back(BASE58_ALPHABET[*it]);
    }
    return result;
}

Result<Bytes> decode_base58(std::string_view str) {
    std::size_t ones = 0;
    while (ones < str.size() && str[ones] == '1') {
        ++ones;
    }

    // Байты в обратном порядке (младший первым)
    std::vector<uint8_t> bytes;
    bytes.reserve(str.size() * 733 / 1000 + 1);
    for (std::size_t i = ones; i < str.size(); ++i) {
        auto pos = BASE58_ALPHABET.find(str[i]);
        if (pos == std::string_view::npos) {
            return Err<Bytes>(
                ErrorCode::AddressInvalidCharacter,
                std::format("Недопустимый символ base58: '{}'", str[i])
            );
        }
        auto carry = static_cast<unsigned>(pos);
        for (auto& byte : bytes) {
            carry += static_cast<unsigned>(byte) * 58;
            byte = static_cast<uint8_t>(carry & 0xFF);
            carry >>= 8;
        }
        while (carry > 0) {
            bytes.push_back(static_cast<uint8_t>(carry & 0xFF));
            carry >>= 8;
        }
    }

    Bytes result(ones, 0);
    result.insert(result.end(), bytes.rbegin(), bytes.rend());
    return result;
}

std::string encode_base58check(ByteSpan payload) {
    Bytes data(payload.begin(), payload.end());
    auto checksum = crypto::sha256d(payload);
    data.insert(data.end(), checksum.begin(), checksum.begin() + CHECKSUM_SIZE);
    return encode_base58(data);
}

Result<Bytes> decode_base58check(std::string_view str) {
    auto decoded = decode_base58(str);
    if (!decoded) {
        return decoded;
    }
    if (decoded->size() < CHECKSUM_SIZE) {
        return Err<Bytes>(ErrorCode::AddressInvalidLength, "Строка base58check слишком короткая");
    }

    const auto payload_size = decoded->size() - CHECKSUM_SIZE;
    auto checksum = crypto::sha256d(ByteSpan(decoded->data(), payload_size));
    if (!std::equal(checksum.begin(), checksum.begin() + CHECKSUM_SIZE,
                    decoded->begin() + static_cast<std::ptrdiff_t>(payload_size))) {
        return Err<Bytes>(ErrorCode::AddressInvalidChecksum);
    }

    decoded->resize(payload_size);
    return decoded;
}

} // namespace bchpool::bitcoin
