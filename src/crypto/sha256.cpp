/**
 * @file sha256.cpp
 * @brief Реализация SHA256
 */

#include "sha256.hpp"
#include "../core/byte_order.hpp"
#include "../core/constants.hpp"

#include <algorithm>
#include <bit>
#include <cstring>

namespace bchpool::crypto {

namespace {

[[nodiscard]] constexpr uint32_t big_sigma0(uint32_t x) noexcept {
    return std::rotr(x, 2) ^ std::rotr(x, 13) ^ std::rotr(x, 22);
}

[[nodiscard]] constexpr uint32_t big_sigma1(uint32_t x) noexcept {
    return std::rotr(x, 6) ^ std::rotr(x, 11) ^ std::rotr(x, 25);
}

[[nodiscard]] constexpr uint32_t small_sigma0(uint32_t x) noexcept {
    return std::rotr(x, 7) ^ std::rotr(x, 18) ^ (x >> 3);
}

[[nodiscard]] constexpr uint32_t small_sigma1(uint32_t x) noexcept {
    return std::rotr(x, 17) ^ std::rotr(x, 19) ^ (x >> 10);
}

} // namespace

// =============================================================================
// Функция сжатия
// =============================================================================

void sha256_transform(Sha256State& state, const uint8_t* block) noexcept {
    std::array<uint32_t, 64> w;
    for (std::size_t i = 0; i < 16; ++i) {
        w[i] = read_be32(block + i * 4);
    }
    for (std::size_t i = 16; i < 64; ++i) {
        w[i] = small_sigma1(w[i - 2]) + w[i - 7] + small_sigma0(w[i - 15]) + w[i - 16];
    }

    Sha256State v = state;
    for (std::size_t i = 0; i < 64; ++i) {
        const uint32_t ch = (v[4] & v[5]) ^ (~v[4] & v[6]);
        const uint32_t maj = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
        const uint32_t t1 = v[7] + big_sigma1(v[4]) + ch + constants::SHA256_K[i] + w[i];
        const uint32_t t2 = big_sigma0(v[0]) + maj;

        v[7] = v[6];
        v[6] = v[5];
        v[5] = v[4];
        v[4] = v[3] + t1;
        v[3] = v[2];
        v[2] = v[1];
        v[1] = v[0];
        v[0] = t1 + t2;
    }

    for (std::size_t i = 0; i < 8; ++i) {
        state[i] += v[i];
    }
}

// =============================================================================
// Потоковый SHA256
// =============================================================================

Sha256::Sha256() noexcept : state_(constants::SHA256_INIT) {}

void Sha256::reset() noexcept {
    state_ = constants::SHA256_INIT;
    buffered_ = 0;
    total_ = 0;
}

Sha256& Sha256::write(ByteSpan data) noexcept {
    const uint8_t* ptr = data.data();
    std::size_t len = data.size();
    total_ += len;

    if (buffered_ > 0) {
        std::size_t take = std::min(len, buffer_.size() - buffered_);
        std::memcpy(buffer_.data() + buffered_, ptr, take);
        buffered_ += take;
        ptr += take;
        len -= take;
        if (buffered_ < buffer_.size()) {
            return *this;
        }
        sha256_transform(state_, buffer_.data());
        buffered_ = 0;
    }

    while (len >= 64) {
        sha256_transform(state_, ptr);
        ptr += 64;
        len -= 64;
    }

    if (len > 0) {
        std::memcpy(buffer_.data(), ptr, len);
        buffered_ = len;
    }
    return *this;
}

Hash256 Sha256::finalize() noexcept {
    const uint64_t bit_len = total_ * 8;

    // Padding: 0x80, нули, длина в битах (big-endian) в последних 8 байтах
    std::array<uint8_t, 72> pad{};
    pad[0] = 0x80;
    const std::size_t pad_len = 1 + ((119 - (total_ % 64)) % 64);
    write_be32(pad.data() + pad_len, static_cast<uint32_t>(bit_len >> 32));
    write_be32(pad.data() + pad_len + 4, static_cast<uint32_t>(bit_len));
    write(ByteSpan(pad.data(), pad_len + 8));

    Hash256 result;
    for (std::size_t i = 0; i < 8; ++i) {
        write_be32(result.data() + i * 4, state_[i]);
    }
    reset();
    return result;
}

// =============================================================================
// Однократные функции
// =============================================================================

Hash256 sha256(ByteSpan data) noexcept {
    Sha256 hasher;
    hasher.write(data);
    return hasher.finalize();
}

Hash256 sha256d(ByteSpan data) noexcept {
    Hash256 first = sha256(data);
    return sha256(ByteSpan(first.data(), first.size()));
}

} // namespace bchpool::crypto
