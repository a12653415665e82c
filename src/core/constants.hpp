/**
 * @file constants.hpp
 * @brief Константы протокола Bitcoin Cash и пула
 *
 * Размеры структур, значения по умолчанию для конфигурации,
 * коды ошибок Stratum и параметры резервного (fallback) задания.
 *
 * @note Все константы определены как constexpr для compile-time вычислений.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <string_view>

namespace bchpool::constants {

// =============================================================================
// Размеры структур Bitcoin
// =============================================================================

/// @brief Размер SHA256 хеша в байтах
inline constexpr std::size_t SHA256_SIZE = 32;

/// @brief Размер блока SHA256 (один transform) в байтах
inline constexpr std::size_t SHA256_BLOCK_SIZE = 64;

/// @brief Размер заголовка блока в байтах
inline constexpr std::size_t BLOCK_HEADER_SIZE = 80;

/// @brief Размер HASH160 (RIPEMD160(SHA256)) в байтах
inline constexpr std::size_t HASH160_SIZE = 20;

/// @brief Размер P2PKH scriptPubKey: OP_DUP OP_HASH160 <20> OP_EQUALVERIFY OP_CHECKSIG
inline constexpr std::size_t P2PKH_SCRIPT_SIZE = 25;

/// @brief Размер P2SH scriptPubKey: OP_HASH160 <20> OP_EQUAL
inline constexpr std::size_t P2SH_SCRIPT_SIZE = 23;

// =============================================================================
// Константы транзакций
// =============================================================================

/// @brief Версия блока для резервного задания
inline constexpr uint32_t BLOCK_VERSION = 0x20000000;

/// @brief Версия coinbase транзакции
inline constexpr uint32_t TX_VERSION = 1;

/// @brief Sequence для coinbase input
inline constexpr uint32_t COINBASE_SEQUENCE = 0xFFFFFFFF;

/// @brief Индекс предыдущего выхода coinbase input
inline constexpr uint32_t COINBASE_PREVOUT_INDEX = 0xFFFFFFFF;

/// @brief Locktime для coinbase транзакции
inline constexpr uint32_t COINBASE_LOCKTIME = 0;

/// @brief Максимальный размер scriptSig coinbase
inline constexpr std::size_t MAX_SCRIPTSIG_SIZE = 100;

/// @brief Подпись пула в coinbase scriptSig
inline constexpr std::string_view DEFAULT_COINBASE_PREFIX = "/BCHPool/";

// =============================================================================
// Extranonce
// =============================================================================

/// @brief Размер extra_nonce1 в байтах (32 hex символа)
inline constexpr std::size_t EXTRANONCE1_SIZE = 16;

/// @brief Размер extra_nonce2 в байтах по умолчанию
inline constexpr std::size_t EXTRANONCE2_SIZE = 4;

/// @brief Максимальный размер extra_nonce2
inline constexpr std::size_t EXTRANONCE2_MAX_SIZE = 8;

// =============================================================================
// Задания и шары
// =============================================================================

/// @brief Интервал рассылки заданий (секунды)
inline constexpr uint32_t JOB_BROADCAST_INTERVAL = 30;

/// @brief Интервал очистки устаревших заданий (секунды)
inline constexpr uint32_t JOB_CLEANUP_INTERVAL = 300;

/// @brief Максимальный возраст задания (секунды)
inline constexpr uint32_t MAX_JOB_AGE = 300;

/// @brief Размер истории заданий
inline constexpr std::size_t JOB_HISTORY_SIZE = 100;

/// @brief Максимум запомненных nonce на задание
inline constexpr std::size_t NONCES_PER_JOB = 1000;

/// @brief Допустимое отклонение ntime от текущего времени (секунды)
inline constexpr int64_t MAX_NTIME_DRIFT = 7200;

// =============================================================================
// Сложность
// =============================================================================

inline constexpr double DEFAULT_DIFFICULTY = 1.0;
inline constexpr double MIN_DIFFICULTY = 0.001;
inline constexpr double MAX_DIFFICULTY = 1000.0;
inline constexpr double TARGET_SHARES_PER_MINUTE = 60.0;

/// @brief Интервал пересчёта сложности (секунды)
inline constexpr uint32_t DIFFICULTY_UPDATE_INTERVAL = 300;

/// @brief Минимум шаров за последний час для пересчёта
inline constexpr std::size_t DIFFICULTY_MIN_SAMPLES = 10;

/// @brief Максимальный множитель изменения сложности за один шаг
inline constexpr double DIFFICULTY_MAX_STEP = 4.0;

/// @brief Минимальное относительное изменение, при котором сложность применяется
inline constexpr double DIFFICULTY_MIN_CHANGE = 0.01;

/// @brief Количество шаров на майнера для оценки хешрейта
inline constexpr std::size_t MINER_SHARE_HISTORY = 100;

// =============================================================================
// Резервное задание (нет шаблона от ноды)
// =============================================================================

inline constexpr std::string_view FALLBACK_PREV_HASH =
    "000000000000000007cbc708a5e00de8fd5e4b5b3e2a4f61c5aec6d6b7a9b8c9";
inline constexpr uint32_t FALLBACK_BITS = 0x1d00ffff;
inline constexpr uint32_t FALLBACK_VERSION = 0x20000000;
inline constexpr int64_t FALLBACK_COINBASE_VALUE = 3'125'000'000;

// =============================================================================
// Коды ошибок Stratum
// =============================================================================

inline constexpr int STRATUM_ERR_OTHER = 20;
inline constexpr int STRATUM_ERR_JOB_NOT_FOUND = 21;
inline constexpr int STRATUM_ERR_DUPLICATE = 22;
inline constexpr int STRATUM_ERR_LOW_DIFFICULTY = 23;
inline constexpr int STRATUM_ERR_UNAUTHORIZED = 24;
inline constexpr int STRATUM_ERR_NOT_SUBSCRIBED = 25;

// =============================================================================
// Константы сети
// =============================================================================

/// @brief Порт Stratum TCP (newline-delimited JSON)
inline constexpr uint16_t DEFAULT_TCP_PORT = 3333;

/// @brief Порт Stratum WebSocket
inline constexpr uint16_t DEFAULT_WEBSOCKET_PORT = 3334;

/// @brief Максимальное количество подключений
inline constexpr std::size_t DEFAULT_MAX_CONNECTIONS = 1000;

/// @brief Максимальный размер одного сообщения (байт)
inline constexpr std::size_t DEFAULT_MAX_MESSAGE_SIZE = 1024 * 1024;

/// @brief Порт RPC ноды по умолчанию
inline constexpr uint16_t DEFAULT_NODE_RPC_PORT = 28332;

/// @brief Порт RPC ноды (mainnet)
inline constexpr uint16_t NODE_RPC_PORT_MAINNET = 8332;

/// @brief Порт RPC ноды (testnet)
inline constexpr uint16_t NODE_RPC_PORT_TESTNET = 18332;

/// @brief Порт RPC ноды (regtest)
inline constexpr uint16_t NODE_RPC_PORT_REGTEST = 18443;

/// @brief Таймаут RPC запросов (секунды)
inline constexpr uint32_t DEFAULT_RPC_TIMEOUT = 30;

// =============================================================================
// Начальные значения SHA256 (H0-H7)
// =============================================================================

/// @brief Начальные значения хеша SHA256 (FIPS 180-4)
inline constexpr std::array<uint32_t, 8> SHA256_INIT = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
};

/// @brief Константы раунда SHA256 (первые 32 бита дробной части кубических корней простых чисел)
inline constexpr std::array<uint32_t, 64> SHA256_K = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

} // namespace bchpool::constants
