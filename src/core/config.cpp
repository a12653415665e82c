/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"
#include "hex.hpp"

#include <toml++/toml.hpp>
#include <cstdlib>
#include <format>
#include <vector>

namespace bchpool {

namespace {

/**
 * @brief Прочитать 32-битное значение, записанное числом или hex строкой
 */
[[nodiscard]] Result<std::optional<uint32_t>> read_u32_or_hex(const toml::table& table, std::string_view key) {
    if (auto val = table[key].value<int64_t>()) {
        return std::optional<uint32_t>{static_cast<uint32_t>(*val)};
    }
    if (auto val = table[key].value<std::string>()) {
        auto parsed = parse_hex_u32(*val);
        if (!parsed) {
            return Err<std::optional<uint32_t>>(
                ErrorCode::ConfigInvalidValue,
                std::format("fallback.{}: {}", key, parsed.error().message)
            );
        }
        return std::optional<uint32_t>{*parsed};
    }
    return std::optional<uint32_t>{};
}

[[nodiscard]] Result<Config> from_table(const toml::table& table) {
    Config config;

    // === Секция [server] ===
    if (auto server = table["server"].as_table()) {
        if (auto val = (*server)["bind_address"].value<std::string>()) {
            config.server.bind_address = *val;
        }
        if (auto val = (*server)["tcp_port"].value<int64_t>()) {
            config.server.tcp_port = static_cast<uint16_t>(*val);
        }
        if (auto val = (*server)["websocket_port"].value<int64_t>()) {
            config.server.websocket_port = static_cast<uint16_t>(*val);
        }
        if (auto val = (*server)["enable_tcp"].value<bool>()) {
            config.server.enable_tcp = *val;
        }
        if (auto val = (*server)["enable_websocket"].value<bool>()) {
            config.server.enable_websocket = *val;
        }
        if (auto val = (*server)["max_connections"].value<int64_t>()) {
            config.server.max_connections = static_cast<std::size_t>(*val);
        }
        if (auto val = (*server)["max_message_size"].value<int64_t>()) {
            config.server.max_message_size = static_cast<std::size_t>(*val);
        }
    }

    // === Секция [node] ===
    if (auto node = table["node"].as_table()) {
        if (auto val = (*node)["rpc_host"].value<std::string>()) {
            config.node.rpc_host = *val;
        }
        if (auto val = (*node)["rpc_port"].value<int64_t>()) {
            config.node.rpc_port = static_cast<uint16_t>(*val);
        }
        if (auto val = (*node)["rpc_user"].value<std::string>()) {
            config.node.rpc_user = *val;
        }
        if (auto val = (*node)["rpc_password"].value<std::string>()) {
            config.node.rpc_password = *val;
        }
        if (auto val = (*node)["timeout_seconds"].value<int64_t>()) {
            config.node.timeout_seconds = static_cast<uint32_t>(*val);
        }
    }

    // === Секция [pool] ===
    if (auto pool = table["pool"].as_table()) {
        if (auto val = (*pool)["network"].value<std::string>()) {
            auto network = bitcoin::parse_network(*val);
            if (!network) {
                return Forward<Config>(network);
            }
            config.pool.network = *network;
        }
        if (auto val = (*pool)["payout_address"].value<std::string>()) {
            config.pool.payout_address = *val;
        }
        if (auto val = (*pool)["coinbase_prefix"].value<std::string>()) {
            config.pool.coinbase_prefix = *val;
        }
        if (auto val = (*pool)["extranonce2_size"].value<int64_t>()) {
            config.pool.extranonce2_size = static_cast<std::size_t>(*val);
        }
        if (auto val = (*pool)["max_scriptsig_size"].value<int64_t>()) {
            config.pool.max_scriptsig_size = static_cast<std::size_t>(*val);
        }
        if (auto val = (*pool)["default_worker"].value<std::string>()) {
            config.pool.default_worker = *val;
        }
    }

    // === Секция [difficulty] ===
    if (auto difficulty = table["difficulty"].as_table()) {
        if (auto val = (*difficulty)["initial"].value<double>()) {
            config.difficulty.initial = *val;
        }
        if (auto val = (*difficulty)["min"].value<double>()) {
            config.difficulty.min = *val;
        }
        if (auto val = (*difficulty)["max"].value<double>()) {
            config.difficulty.max = *val;
        }
        if (auto val = (*difficulty)["target_shares_per_minute"].value<double>()) {
            config.difficulty.target_shares_per_minute = *val;
        }
        if (auto val = (*difficulty)["update_interval"].value<int64_t>()) {
            config.difficulty.update_interval = static_cast<uint32_t>(*val);
        }
        if (auto val = (*difficulty)["min_samples"].value<int64_t>()) {
            config.difficulty.min_samples = static_cast<std::size_t>(*val);
        }
        if (auto val = (*difficulty)["enable_dynamic"].value<bool>()) {
            config.difficulty.enable_dynamic = *val;
        }
    }

    // === Секция [jobs] ===
    if (auto jobs = table["jobs"].as_table()) {
        if (auto val = (*jobs)["broadcast_interval"].value<int64_t>()) {
            config.jobs.broadcast_interval = static_cast<uint32_t>(*val);
        }
        if (auto val = (*jobs)["cleanup_interval"].value<int64_t>()) {
            config.jobs.cleanup_interval = static_cast<uint32_t>(*val);
        }
        if (auto val = (*jobs)["max_job_age"].value<int64_t>()) {
            config.jobs.max_job_age = static_cast<uint32_t>(*val);
        }
        if (auto val = (*jobs)["history_size"].value<int64_t>()) {
            config.jobs.history_size = static_cast<std::size_t>(*val);
        }
        if (auto val = (*jobs)["nonces_per_job"].value<int64_t>()) {
            config.jobs.nonces_per_job = static_cast<std::size_t>(*val);
        }
        if (auto val = (*jobs)["max_ntime_drift"].value<int64_t>()) {
            config.jobs.max_ntime_drift = *val;
        }
    }

    // === Секция [fallback] ===
    if (auto fallback = table["fallback"].as_table()) {
        if (auto val = (*fallback)["prev_block_hash"].value<std::string>()) {
            config.fallback.prev_block_hash = *val;
        }
        auto bits = read_u32_or_hex(*fallback, "bits");
        if (!bits) {
            return Forward<Config>(bits);
        }
        if (*bits) {
            config.fallback.bits = **bits;
        }
        auto version = read_u32_or_hex(*fallback, "version");
        if (!version) {
            return Forward<Config>(version);
        }
        if (*version) {
            config.fallback.version = **version;
        }
        if (auto val = (*fallback)["coinbase_value"].value<int64_t>()) {
            config.fallback.coinbase_value = *val;
        }
    }

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto val = (*logging)["level"].value<std::string>()) {
            config.logging.level = *val;
        }
        if (auto val = (*logging)["event_history"].value<int64_t>()) {
            config.logging.event_history = static_cast<uint32_t>(*val);
        }
        if (auto val = (*logging)["status_interval"].value<int64_t>()) {
            config.logging.status_interval = static_cast<uint32_t>(*val);
        }
        if (auto val = (*logging)["color"].value<bool>()) {
            config.logging.color = *val;
        }
    }

    return config;
}

} // namespace

// =============================================================================
// Config - Загрузка
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            std::format("Файл конфигурации не найден: {}", path.string())
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::parse(std::string_view toml_text) {
    try {
        auto table = toml::parse(toml_text);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Явно указанный путь обязан существовать
    if (path.has_value()) {
        return load(path.value());
    }

    std::vector<std::filesystem::path> search_paths;
    search_paths.push_back("bchpool.toml");
    search_paths.push_back("/etc/bchpool/bchpool.toml");

    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "bchpool" / "bchpool.toml"
        );
    }

    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }

    return Err<Config>(
        ErrorCode::ConfigNotFound,
        "Файл конфигурации не найден в стандартных путях"
    );
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    if (pool.payout_address.empty()) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Адрес для выплаты не указан (pool.payout_address)"
        );
    }

    if (auto address = bitcoin::extract_hash160(pool.payout_address, pool.network); !address) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("pool.payout_address для сети {}: {}",
                        bitcoin::to_string(pool.network), address.error().message)
        );
    }

    if (pool.extranonce2_size < 1 || pool.extranonce2_size > constants::EXTRANONCE2_MAX_SIZE) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Размер extranonce2 должен быть от 1 до 8 байт"
        );
    }

    // Высота (до 5 байт) + подпись + extranonce1 + extranonce2
    const std::size_t script_sig_need = 5 + pool.coinbase_prefix.size()
        + constants::EXTRANONCE1_SIZE + pool.extranonce2_size;
    if (pool.max_scriptsig_size > constants::MAX_SCRIPTSIG_SIZE || script_sig_need > pool.max_scriptsig_size) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Подпись пула слишком длинная: scriptSig {} байт, лимит {}",
                        script_sig_need, pool.max_scriptsig_size)
        );
    }

    if (!(difficulty.min > 0.0) || difficulty.min > difficulty.initial || difficulty.initial > difficulty.max) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Требуется 0 < min <= initial <= max, получено {} / {} / {}",
                        difficulty.min, difficulty.initial, difficulty.max)
        );
    }

    if (!(difficulty.target_shares_per_minute > 0.0)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "difficulty.target_shares_per_minute должен быть больше 0"
        );
    }

    if (difficulty.enable_dynamic && difficulty.update_interval == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "difficulty.update_interval должен быть больше 0 при enable_dynamic = true"
        );
    }

    if (!server.enable_tcp && !server.enable_websocket) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Должен быть включён хотя бы один транспорт"
        );
    }

    if ((server.enable_tcp && server.tcp_port == 0) ||
        (server.enable_websocket && server.websocket_port == 0)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Порт сервера не может быть 0"
        );
    }

    if (server.enable_tcp && server.enable_websocket && server.tcp_port == server.websocket_port) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("tcp_port и websocket_port совпадают: {}", server.tcp_port)
        );
    }

    if (jobs.broadcast_interval == 0 || jobs.cleanup_interval == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Интервалы jobs.broadcast_interval и jobs.cleanup_interval должны быть больше 0"
        );
    }

    if (jobs.nonces_per_job == 0 || jobs.history_size == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "jobs.nonces_per_job и jobs.history_size должны быть больше 0"
        );
    }

    if (jobs.max_ntime_drift < 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("jobs.max_ntime_drift не может быть отрицательным: {}", jobs.max_ntime_drift)
        );
    }

    if (auto prev = hash_from_display_hex(fallback.prev_block_hash); !prev) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("fallback.prev_block_hash: {}", prev.error().message)
        );
    }

    if (logging.level != "error" && logging.level != "warn" &&
        logging.level != "info" && logging.level != "debug") {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Неизвестный уровень логирования: {}", logging.level)
        );
    }

    return {};
}

} // namespace bchpool
