/**
 * @file config.hpp
 * @brief Конфигурация BCH Solo Pool
 *
 * Загрузка и парсинг конфигурации из TOML файла.
 *
 * Пример конфигурации (bchpool.toml):
 * @code
 * [server]
 * bind_address = "0.0.0.0"
 * tcp_port = 3333
 * websocket_port = 3334
 *
 * [node]
 * rpc_host = "127.0.0.1"
 * rpc_port = 28332
 * rpc_user = "bchpool"
 * rpc_password = "password"
 *
 * [pool]
 * network = "testnet"
 * payout_address = "bchtest:qpm2qsznhks23z7629mms6s4cwef74vcwvqcw003ap"
 *
 * [difficulty]
 * initial = 1.0
 * min = 0.001
 * max = 1000.0
 * target_shares_per_minute = 60.0
 *
 * [jobs]
 * broadcast_interval = 30
 * max_job_age = 300
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"
#include "../bitcoin/address.hpp"

#include <string>
#include <string_view>
#include <filesystem>
#include <optional>

namespace bchpool {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Настройки серверов Stratum
 */
struct ServerConfig {
    std::string bind_address = "0.0.0.0";

    /// @brief Порт TCP транспорта (JSON построчно)
    uint16_t tcp_port = constants::DEFAULT_TCP_PORT;

    /// @brief Порт WebSocket транспорта
    uint16_t websocket_port = constants::DEFAULT_WEBSOCKET_PORT;

    bool enable_tcp = true;
    bool enable_websocket = true;

    /// @brief Максимум одновременных подключений на транспорт
    std::size_t max_connections = constants::DEFAULT_MAX_CONNECTIONS;

    /// @brief Максимальный размер строки/кадра в байтах
    std::size_t max_message_size = constants::DEFAULT_MAX_MESSAGE_SIZE;
};

/**
 * @brief Подключение к ноде Bitcoin Cash
 */
struct NodeConfig {
    std::string rpc_host = "127.0.0.1";
    uint16_t rpc_port = constants::DEFAULT_NODE_RPC_PORT;
    std::string rpc_user = "bchpool";
    std::string rpc_password;
    uint32_t timeout_seconds = constants::DEFAULT_RPC_TIMEOUT;
};

/**
 * @brief Параметры пула и coinbase
 */
struct PoolConfig {
    bitcoin::Network network = bitcoin::Network::Testnet;

    /// @brief Адрес выплаты для broadcast заданий
    std::string payout_address = "bchtest:qpm2qsznhks23z7629mms6s4cwef74vcwvqcw003ap";

    std::string coinbase_prefix = std::string(constants::DEFAULT_COINBASE_PREFIX);
    std::size_t extranonce2_size = constants::EXTRANONCE2_SIZE;
    std::size_t max_scriptsig_size = constants::MAX_SCRIPTSIG_SIZE;

    /// @brief Имя воркера, если в username нет ".worker"
    std::string default_worker = "default";
};

/**
 * @brief Настройки сложности
 */
struct DifficultyConfig {
    double initial = constants::DEFAULT_DIFFICULTY;
    double min = constants::MIN_DIFFICULTY;
    double max = constants::MAX_DIFFICULTY;
    double target_shares_per_minute = constants::TARGET_SHARES_PER_MINUTE;

    /// @brief Интервал пересчёта (секунды)
    uint32_t update_interval = constants::DIFFICULTY_UPDATE_INTERVAL;

    /// @brief Минимум шаров за час для пересчёта
    std::size_t min_samples = constants::DIFFICULTY_MIN_SAMPLES;

    bool enable_dynamic = true;
};

/**
 * @brief Жизненный цикл заданий
 */
struct JobsConfig {
    uint32_t broadcast_interval = constants::JOB_BROADCAST_INTERVAL;
    uint32_t cleanup_interval = constants::JOB_CLEANUP_INTERVAL;
    uint32_t max_job_age = constants::MAX_JOB_AGE;
    std::size_t history_size = constants::JOB_HISTORY_SIZE;
    std::size_t nonces_per_job = constants::NONCES_PER_JOB;
    int64_t max_ntime_drift = constants::MAX_NTIME_DRIFT;
};

/**
 * @brief Резервное задание до получения первого шаблона
 */
struct FallbackConfig {
    std::string prev_block_hash = std::string(constants::FALLBACK_PREV_HASH);
    uint32_t bits = constants::FALLBACK_BITS;
    uint32_t version = constants::FALLBACK_VERSION;
    int64_t coinbase_value = constants::FALLBACK_COINBASE_VALUE;
};

/**
 * @brief Настройки логирования и терминального вывода
 */
struct LoggingConfig {
    /// @brief Уровень логирования: "error", "warn", "info", "debug"
    std::string level = "info";

    /// @brief Размер истории событий
    uint32_t event_history = 200;

    /// @brief Интервал вывода статуса (секунды, 0 - выключен)
    uint32_t status_interval = 60;

    /// @brief Использовать ANSI цвета в сводке статуса
    bool color = false;
};

/**
 * @brief Полная конфигурация пула
 */
struct Config {
    ServerConfig server;
    NodeConfig node;
    PoolConfig pool;
    DifficultyConfig difficulty;
    JobsConfig jobs;
    FallbackConfig fallback;
    LoggingConfig logging;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Разобрать конфигурацию из строки TOML
     */
    [[nodiscard]] static Result<Config> parse(std::string_view toml_text);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь
     * 2. ./bchpool.toml
     * 3. /etc/bchpool/bchpool.toml
     * 4. ~/.config/bchpool/bchpool.toml
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Валидация конфигурации
     *
     * - адрес выплаты декодируется для выбранной сети;
     * - extranonce2_size от 1 до 8;
     * - 0 < min <= initial <= max, target_shares_per_minute > 0;
     * - порты ненулевые и различны, если включены оба транспорта;
     * - подпись пула и extranonce помещаются в scriptSig.
     */
    [[nodiscard]] Result<void> validate() const;
};

} // namespace bchpool
