/**
 * @file address.hpp
 * @brief Кодек адресов Bitcoin Cash
 *
 * Поддерживает:
 * - CashAddr: bitcoincash:q... / bchtest:q... / bchreg:q... (P2KH и P2SH)
 * - Legacy Base58Check: 1... / 3... (mainnet), m/n... / 2... (testnet, regtest)
 *
 * Адрес выплаты определяет scriptPubKey coinbase транзакции, поэтому
 * все ошибки декодирования возвращаются через Result, без исключений.
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace bchpool::bitcoin {

// =============================================================================
// Сеть
// =============================================================================

enum class Network {
    Mainnet,
    Testnet,
    Regtest
};

/**
 * @brief Параметры сети, влияющие на адреса и RPC
 */
struct NetworkParams {
    Network network;
    std::string_view name;
    std::string_view cashaddr_prefix;
    uint8_t p2kh_version;
    uint8_t p2sh_version;
    uint16_t rpc_port;
};

[[nodiscard]] const NetworkParams& network_params(Network network) noexcept;

/**
 * @brief Разобрать имя сети: "mainnet"/"main", "testnet"/"test", "regtest"
 */
[[nodiscard]] Result<Network> parse_network(std::string_view name);

[[nodiscard]] std::string_view to_string(Network network) noexcept;

// =============================================================================
// Адрес
// =============================================================================

enum class AddressType : uint8_t {
    P2KH = 0,
    P2SH = 1
};

[[nodiscard]] std::string_view to_string(AddressType type) noexcept;

/**
 * @brief Результат декодирования CashAddr
 */
struct CashAddress {
    std::string prefix;
    AddressType type{AddressType::P2KH};
    Hash160 hash{};

    [[nodiscard]] bool operator==(const CashAddress&) const = default;
};

/**
 * @brief Результат декодирования legacy адреса
 *
 * Testnet и regtest используют одинаковые версии, поэтому для них
 * network всегда Testnet.
 */
struct LegacyAddress {
    Network network{Network::Mainnet};
    AddressType type{AddressType::P2KH};
    Hash160 hash{};

    [[nodiscard]] bool operator==(const LegacyAddress&) const = default;
};

// =============================================================================
// CashAddr
// =============================================================================

/**
 * @brief Кодировать CashAddr
 *
 * @param prefix Префикс сети (bitcoincash, bchtest, bchreg)
 * @param type Тип адреса
 * @param hash 20-байтный хеш
 * @return std::string Адрес вида "prefix:payload"
 */
[[nodiscard]] std::string encode_cashaddr(
    std::string_view prefix,
    AddressType type,
    const Hash160& hash
);

/**
 * @brief Декодировать CashAddr
 *
 * Принимает адрес в нижнем или верхнем регистре (смешанный отклоняется).
 * Адрес без префикса проверяется с default_prefix; если он не задан,
 * возвращается AddressInvalidPrefix.
 *
 * Ошибки: AddressInvalidPrefix, AddressInvalidCharacter,
 * AddressInvalidChecksum, AddressInvalidLength, AddressInvalidVersion.
 */
[[nodiscard]] Result<CashAddress> decode_cashaddr(
    std::string_view address,
    std::optional<std::string_view> default_prefix = std::nullopt
);

// =============================================================================
// Legacy
// =============================================================================

[[nodiscard]] std::string encode_legacy(
    Network network,
    AddressType type,
    const Hash160& hash
);

[[nodiscard]] Result<LegacyAddress> decode_legacy(std::string_view address);

/**
 * @brief CashAddr -> legacy Base58Check
 */
[[nodiscard]] Result<std::string> to_legacy(std::string_view cashaddr);

/**
 * @brief Legacy Base58Check -> CashAddr
 *
 * @param network Сеть для выбора префикса testnet/regtest адресов
 */
[[nodiscard]] Result<std::string> from_legacy(
    std::string_view legacy,
    Network network = Network::Mainnet
);

// =============================================================================
// Адрес выплаты
// =============================================================================

/**
 * @brief Извлечь тип и hash160 из адреса любого поддерживаемого формата
 *
 * Адрес должен принадлежать указанной сети.
 */
[[nodiscard]] Result<CashAddress> extract_hash160(
    std::string_view address,
    Network network
);

/**
 * @brief Каноническая форма адреса: CashAddr с префиксом, нижний регистр
 */
[[nodiscard]] Result<std::string> normalize_address(
    std::string_view address,
    Network network
);

[[nodiscard]] bool is_valid_address(std::string_view address, Network network);

} // namespace bchpool::bitcoin
