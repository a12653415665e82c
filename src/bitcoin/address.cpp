/**
 * @file address.cpp
 * @brief Реализация CashAddr и legacy адресов
 *
 * CashAddr:
 * 1. payload = [version_byte] + hash160, version_byte = type << 3 (размер 160 бит = 0)
 * 2. payload перепаковывается из 8-битных групп в 5-битные (MSB first, с дополнением нулями)
 * 3. Контрольная сумма: 40-битный BCH код над
 *    (младшие 5 бит каждого символа префикса) + [0] + payload + [0] * 8
 * 4. 8 символов контрольной суммы добавляются к payload
 */

#include "address.hpp"
#include "base58.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <vector>

namespace bchpool::bitcoin {

// =============================================================================
// Константы
// =============================================================================

namespace {

/// @brief Алфавит CashAddr (совпадает с bech32)
constexpr std::string_view CASHADDR_CHARSET = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

/// @brief Генераторы полинома контрольной суммы
constexpr std::array<uint64_t, 5> CASHADDR_GEN = {
    0x98f2bc8e61, 0x79b76d99e2, 0xf33e5fb3c4, 0xae2eabe2a8, 0x1e4f43e470
};

constexpr std::size_t CHECKSUM_LENGTH = 8;

/// @brief version byte + hash160
constexpr std::size_t PAYLOAD_SIZE = 21;

constexpr std::array<NetworkParams, 3> NETWORKS = {{
    {Network::Mainnet, "mainnet", "bitcoincash", 0x00, 0x05, 8332},
    {Network::Testnet, "testnet", "bchtest", 0x6f, 0xc4, 18332},
    {Network::Regtest, "regtest", "bchreg", 0x6f, 0xc4, 18443},
}};

// =============================================================================
// Вспомогательные функции
// =============================================================================

[[nodiscard]] uint64_t polymod(const std::vector<uint8_t>& values) noexcept {
    uint64_t c = 1;
    for (uint8_t d : values) {
        const uint8_t c0 = static_cast<uint8_t>(c >> 35);
        c = ((c & 0x07ffffffffULL) << 5) ^ d;
        for (std::size_t i = 0; i < CASHADDR_GEN.size(); ++i) {
            if ((c0 >> i) & 1) {
                c ^= CASHADDR_GEN[i];
            }
        }
    }
    return c ^ 1;
}

/**
 * @brief Младшие 5 бит каждого символа префикса и разделитель 0
 */
[[nodiscard]] std::vector<uint8_t> expand_prefix(std::string_view prefix) {
    std::vector<uint8_t> result;
    result.reserve(prefix.size() + 1);
    for (char c : prefix) {
        result.push_back(static_cast<uint8_t>(c & 0x1f));
    }
    result.push_back(0);
    return result;
}

/**
 * @brief Перепаковка групп бит (MSB first)
 *
 * Без pad остаток должен быть короче from_bits и нулевым.
 */
[[nodiscard]] bool convert_bits(
    std::vector<uint8_t>& out,
    const std::vector<uint8_t>& in,
    unsigned from_bits,
    unsigned to_bits,
    bool pad
) {
    uint32_t acc = 0;
    unsigned bits = 0;
    const uint32_t max_v = (1u << to_bits) - 1;

    for (uint8_t value : in) {
        if (value >> from_bits) {
            return false;
        }
        acc = ((acc << from_bits) | value) & 0xFFFFFF;
        bits += from_bits;
        while (bits >= to_bits) {
            bits -= to_bits;
            out.push_back(static_cast<uint8_t>((acc >> bits) & max_v));
        }
    }

    if (pad) {
        if (bits > 0) {
            out.push_back(static_cast<uint8_t>((acc << (to_bits - bits)) & max_v));
        }
    } else if (bits >= from_bits || ((acc << (to_bits - bits)) & max_v) != 0) {
        return false;
    }

    return true;
}

[[nodiscard]] bool is_known_prefix(std::string_view prefix) noexcept {
    for (const auto& params : NETWORKS) {
        if (params.cashaddr_prefix == prefix) {
            return true;
        }
    }
    return false;
}

[[nodiscard]] uint8_t legacy_version(Network network, AddressType type) noexcept {
    const auto& params = network_params(network);
    return type == AddressType::P2SH ? params.p2sh_version : params.p2kh_version;
}

} // namespace

// =============================================================================
// Сеть
// =============================================================================

const NetworkParams& network_params(Network network) noexcept {
    switch (network) {
        case Network::Mainnet: return NETWORKS[0];
        case Network::Testnet: return NETWORKS[1];
        case Network::Regtest: return NETWORKS[2];
    }
    return NETWORKS[0];
}

Result<Network> parse_network(std::string_view name) {
    if (name == "mainnet" || name == "main") return Network::Mainnet;
    if (name == "testnet" || name == "test") return Network::Testnet;
    if (name == "regtest") return Network::Regtest;
    return Err<Network>(
        ErrorCode::ConfigInvalidValue,
        std::format("Неизвестная сеть: {}", name)
    );
}

std::string_view to_string(Network network) noexcept {
    return network_params(network).name;
}

std::string_view to_string(AddressType type) noexcept {
    return type == AddressType::P2SH ? "P2SH" : "P2KH";
}

// =============================================================================
// CashAddr
// =============================================================================

std::string encode_cashaddr(
    std::string_view prefix,
    AddressType type,
    const Hash160& hash
) {
    std::vector<uint8_t> payload_bytes;
    payload_bytes.reserve(PAYLOAD_SIZE);
    payload_bytes.push_back(static_cast<uint8_t>(static_cast<uint8_t>(type) << 3));
    payload_bytes.insert(payload_bytes.end(), hash.begin(), hash.end());

    std::vector<uint8_t> payload;
    // 8 -> 5 с дополнением не может завершиться ошибкой
    (void)convert_bits(payload, payload_bytes, 8, 5, true);

    auto checksum_input = expand_prefix(prefix);
    checksum_input.insert(checksum_input.end(), payload.begin(), payload.end());
    checksum_input.insert(checksum_input.end(), CHECKSUM_LENGTH, 0);
    const uint64_t mod = polymod(checksum_input);

    std::string result;
    result.reserve(prefix.size() + 1 + payload.size() + CHECKSUM_LENGTH);
    result.append(prefix);
    result.push_back(':');
    for (uint8_t v : payload) {
        result.push_back(CASHADDR_CHARSET[v]);
    }
    for (std::size_t i = 0; i < CHECKSUM_LENGTH; ++i) {
        result.push_back(CASHADDR_CHARSET[(mod >> (5 * (7 - i))) & 0x1f]);
    }
    return result;
}

Result<CashAddress> decode_cashaddr(
    std::string_view address,
    std::optional<std::string_view> default_prefix
) {
    bool has_upper = false;
    bool has_lower = false;
    std::string lower;
    lower.reserve(address.size());
    for (char c : address) {
        if (c >= 'A' && c <= 'Z') {
            has_upper = true;
            lower.push_back(static_cast<char>(c - 'A' + 'a'));
        } else {
            if (c >= 'a' && c <= 'z') {
                has_lower = true;
            }
            lower.push_back(c);
        }
    }
    if (has_upper && has_lower) {
        return Err<CashAddress>(ErrorCode::AddressInvalidCharacter, "Смешанный регистр в адресе");
    }

    std::string prefix;
    std::string_view data = lower;
    if (auto sep = lower.find(':'); sep != std::string::npos) {
        prefix = lower.substr(0, sep);
        data = std::string_view(lower).substr(sep + 1);
    } else if (default_prefix) {
        prefix = std::string(*default_prefix);
    } else {
        return Err<CashAddress>(ErrorCode::AddressInvalidPrefix, "Адрес без префикса сети");
    }

    if (!is_known_prefix(prefix)) {
        return Err<CashAddress>(
            ErrorCode::AddressInvalidPrefix,
            std::format("Неизвестный префикс адреса: {}", prefix)
        );
    }

    if (data.size() <= CHECKSUM_LENGTH) {
        return Err<CashAddress>(
            ErrorCode::AddressInvalidLength,
            std::format("Слишком короткий адрес: {} символов", data.size())
        );
    }

    std::vector<uint8_t> values;
    values.reserve(data.size());
    for (char c : data) {
        auto pos = CASHADDR_CHARSET.find(c);
        if (pos == std::string_view::npos) {
            return Err<CashAddress>(
                ErrorCode::AddressInvalidCharacter,
                std::format("Недопустимый символ в адресе: '{}'", c)
            );
        }
        values.push_back(static_cast<uint8_t>(pos));
    }

    auto checksum_input = expand_prefix(prefix);
    checksum_input.insert(checksum_input.end(), values.begin(), values.end());
    if (polymod(checksum_input) != 0) {
        return Err<CashAddress>(ErrorCode::AddressInvalidChecksum);
    }

    values.resize(values.size() - CHECKSUM_LENGTH);
    std::vector<uint8_t> payload;
    if (!convert_bits(payload, values, 5, 8, false) || payload.size() != PAYLOAD_SIZE) {
        return Err<CashAddress>(
            ErrorCode::AddressInvalidLength,
            std::format("Неверная длина payload: {} байт (ожидается {})", payload.size(), PAYLOAD_SIZE)
        );
    }

    const uint8_t version = payload[0];
    // Младшие 3 бита: размер хеша (0 = 160 бит), старший бит зарезервирован
    if ((version & 0x07) != 0 || (version >> 3) > 1) {
        return Err<CashAddress>(
            ErrorCode::AddressInvalidVersion,
            std::format("Неподдерживаемый version byte: 0x{:02x}", version)
        );
    }

    CashAddress result;
    result.prefix = std::move(prefix);
    result.type = static_cast<AddressType>(version >> 3);
    std::copy(payload.begin() + 1, payload.end(), result.hash.begin());
    return result;
}

// =============================================================================
// Legacy
// =============================================================================

std::string encode_legacy(Network network, AddressType type, const Hash160& hash) {
    Bytes payload;
    payload.reserve(PAYLOAD_SIZE);
    payload.push_back(legacy_version(network, type));
    payload.insert(payload.end(), hash.begin(), hash.end());
    return encode_base58check(payload);
}

Result<LegacyAddress> decode_legacy(std::string_view address) {
    auto payload = decode_base58check(address);
    if (!payload) {
        return Forward<LegacyAddress>(payload);
    }
    if (payload->size() != PAYLOAD_SIZE) {
        return Err<LegacyAddress>(
            ErrorCode::AddressInvalidLength,
            std::format("Неверная длина legacy адреса: {} байт", payload->size())
        );
    }

    LegacyAddress result;
    switch ((*payload)[0]) {
        case 0x00: result.network = Network::Mainnet; result.type = AddressType::P2KH; break;
        case 0x05: result.network = Network::Mainnet; result.type = AddressType::P2SH; break;
        case 0x6f: result.network = Network::Testnet; result.type = AddressType::P2KH; break;
        case 0xc4: result.network = Network::Testnet; result.type = AddressType::P2SH; break;
        default:
            return Err<LegacyAddress>(
                ErrorCode::AddressInvalidVersion,
                std::format("Неизвестная версия legacy адреса: 0x{:02x}", (*payload)[0])
            );
    }
    std::copy(payload->begin() + 1, payload->end(), result.hash.begin());
    return result;
}

Result<std::string> to_legacy(std::string_view cashaddr) {
    auto decoded = decode_cashaddr(cashaddr);
    if (!decoded) {
        return Forward<std::string>(decoded);
    }
    Network network = Network::Mainnet;
    for (const auto& params : NETWORKS) {
        if (params.cashaddr_prefix == decoded->prefix) {
            network = params.network;
        }
    }
    return encode_legacy(network, decoded->type, decoded->hash);
}

Result<std::string> from_legacy(std::string_view legacy, Network network) {
    auto decoded = decode_legacy(legacy);
    if (!decoded) {
        return Forward<std::string>(decoded);
    }
    Network target = decoded->network;
    if (target == Network::Testnet && network == Network::Regtest) {
        target = Network::Regtest;
    }
    return encode_cashaddr(network_params(target).cashaddr_prefix, decoded->type, decoded->hash);
}

// =============================================================================
// Адрес выплаты
// =============================================================================

Result<CashAddress> extract_hash160(std::string_view address, Network network) {
    const auto& params = network_params(network);

    auto cash = decode_cashaddr(address, params.cashaddr_prefix);
    if (cash) {
        if (cash->prefix != params.cashaddr_prefix) {
            return Err<CashAddress>(
                ErrorCode::AddressInvalidPrefix,
                std::format("Адрес сети {} не подходит для {}", cash->prefix, params.name)
            );
        }
        return cash;
    }

    // Адрес с явным префиксом не может быть legacy
    if (address.find(':') != std::string_view::npos) {
        return cash;
    }

    auto legacy = decode_legacy(address);
    if (!legacy) {
        // Для строк, похожих на CashAddr без префикса, полезнее ошибка CashAddr
        const char first = address.empty() ? '\0' : address.front();
        const bool looks_cashaddr = first == 'q' || first == 'p' || first == 'Q' || first == 'P';
        return looks_cashaddr ? cash : Forward<CashAddress>(legacy);
    }

    const Network expected = network == Network::Mainnet ? Network::Mainnet : Network::Testnet;
    if (legacy->network != expected) {
        return Err<CashAddress>(
            ErrorCode::AddressInvalidVersion,
            std::format("Legacy адрес другой сети, ожидается {}", params.name)
        );
    }

    CashAddress result;
    result.prefix = std::string(params.cashaddr_prefix);
    result.type = legacy->type;
    result.hash = legacy->hash;
    return result;
}

Result<std::string> normalize_address(std::string_view address, Network network) {
    auto decoded = extract_hash160(address, network);
    if (!decoded) {
        return Forward<std::string>(decoded);
    }
    return encode_cashaddr(decoded->prefix, decoded->type, decoded->hash);
}

bool is_valid_address(std::string_view address, Network network) {
    return extract_hash160(address, network).has_value();
}

} // namespace bchpool::bitcoin
