/**
 * @file main.cpp
 * @brief Точка входа BCH Solo Pool
 *
 * Соло-пул Bitcoin Cash с протоколом Stratum поверх TCP и WebSocket.
 *
 * Основные компоненты:
 * 1. RPC Client - шаблоны блоков и отправка блоков через ноду
 * 2. Job Registry - broadcast и personal задания
 * 3. Share Validator - проверка shares и поиск блоков
 * 4. Difficulty Controller - подстройка сложности пула
 * 5. Session Manager - конечный автомат сессий Stratum
 * 6. TCP / WebSocket серверы
 * 7. Status Reporter - периодическая сводка
 *
 * Использование:
 *   bchpool [options]
 *
 * Опции:
 *   -c, --config PATH    Путь к файлу конфигурации
 *   -h, --help           Показать справку
 *   -v, --version        Показать версию
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/periodic_task.hpp"
#include "bitcoin/address.hpp"
#include "bitcoin/block_assembler.hpp"
#include "bitcoin/rpc_client.hpp"
#include "bitcoin/target.hpp"
#include "mining/difficulty_controller.hpp"
#include "mining/extranonce_manager.hpp"
#include "mining/job_registry.hpp"
#include "mining/persistence.hpp"
#include "mining/share_validator.hpp"
#include "network/server.hpp"
#include "network/session_manager.hpp"
#include "network/websocket_server.hpp"
#include "log/logger.hpp"
#include "log/status_reporter.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

constexpr std::string_view COMPONENT = "Main";

/// @brief Флаг для graceful shutdown
std::atomic<bool> g_running{true};

/**
 * @brief Обработчик сигналов
 */
void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        g_running.store(false, std::memory_order_relaxed);
    }
}

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
BCH Solo Pool v)" << VERSION << R"(
Соло-пул Bitcoin Cash: Stratum поверх TCP и WebSocket

ИСПОЛЬЗОВАНИЕ:
    bchpool [ОПЦИИ]

ОПЦИИ:
    -c, --config PATH    Путь к файлу конфигурации (bchpool.toml)
    -h, --help           Показать эту справку
    -v, --version        Показать версию программы
    --test-config        Проверить конфигурацию и выйти
    --test-rpc           Проверить подключение к ноде и выйти

ПРИМЕРЫ:
    bchpool -c /etc/bchpool/bchpool.toml
    bchpool --test-rpc

)";
}

void print_version() {
    std::cout << "BCH Solo Pool v" << VERSION << std::endl;
}

/**
 * @brief Аргументы командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    bool show_help = false;
    bool show_version = false;
    bool test_config = false;
    bool test_rpc = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "--test-config") {
            args.test_config = true;
        } else if (arg == "--test-rpc") {
            args.test_rpc = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else {
            std::cerr << "[WARNING] Неизвестный аргумент: " << arg << std::endl;
        }
    }

    return args;
}

bchpool::bitcoin::RpcConfig make_rpc_config(const bchpool::NodeConfig& node) {
    bchpool::bitcoin::RpcConfig rpc;
    rpc.host = node.rpc_host;
    rpc.port = node.rpc_port;
    rpc.user = node.rpc_user;
    rpc.password = node.rpc_password;
    rpc.timeout = node.timeout_seconds;
    return rpc;
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace bchpool;
    using namespace std::chrono_literals;

    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_help();
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Конфигурация
    auto config_result = args.config_path
        ? Config::load(*args.config_path)
        : Config::load_with_search();

    if (!config_result) {
        log::error(COMPONENT, config_result.error().message);
        return 1;
    }

    Config config = std::move(*config_result);

    if (auto validation = config.validate(); !validation) {
        log::error(COMPONENT, std::format("Ошибка валидации конфигурации: {}",
                                          validation.error().message));
        return 1;
    }

    if (auto level = log::parse_level(config.logging.level)) {
        log::set_level(*level);
    } else {
        log::warning(COMPONENT, level.error().message);
    }

    if (args.test_config) {
        log::info(COMPONENT, "Конфигурация валидна");
        return 0;
    }

    // Адрес выплаты в каноническом виде
    auto payout = bitcoin::normalize_address(config.pool.payout_address, config.pool.network);
    if (!payout) {
        log::error(COMPONENT, std::format("Неверный адрес выплаты: {}", payout.error().message));
        return 1;
    }

    log::info(COMPONENT, std::format("BCH Solo Pool v{}, сеть {}, выплата на {}",
                                     VERSION, bitcoin::to_string(config.pool.network), *payout));

    // Нода
    bitcoin::RpcClient rpc_client(make_rpc_config(config.node));

    log::info(COMPONENT, std::format("Подключение к ноде {}:{}...",
                                     config.node.rpc_host, config.node.rpc_port));

    auto blockchain_info = rpc_client.get_blockchain_info();
    if (!blockchain_info) {
        if (args.test_rpc) {
            log::error(COMPONENT, std::format("Нода недоступна: {}", blockchain_info.error().message));
            return 1;
        }
        log::warning(COMPONENT, std::format("Нода недоступна ({}), работаем на резервном шаблоне",
                                            blockchain_info.error().message));
    } else {
        log::info(COMPONENT, std::format("Сеть ноды: {}, высота {}, сложность {}",
                                         blockchain_info->chain, blockchain_info->blocks,
                                         bitcoin::format_difficulty(blockchain_info->difficulty)));
        if (blockchain_info->headers > blockchain_info->blocks) {
            log::warning(COMPONENT, "Нода синхронизируется (IBD), шаблоны могут быть устаревшими");
        }
    }

    if (args.test_rpc) {
        log::info(COMPONENT, "Подключение к ноде успешно");
        return 0;
    }

    // Ядро пула
    bitcoin::AssemblerConfig assembler_config;
    assembler_config.network = config.pool.network;
    assembler_config.coinbase_prefix = config.pool.coinbase_prefix;
    assembler_config.max_scriptsig_size = config.pool.max_scriptsig_size;
    assembler_config.extranonce2_size = config.pool.extranonce2_size;
    bitcoin::BlockAssembler assembler(assembler_config);

    mining::RegistryConfig registry_config;
    registry_config.payout_address = *payout;
    registry_config.max_job_age = std::chrono::seconds(config.jobs.max_job_age);
    registry_config.history_size = config.jobs.history_size;
    registry_config.fallback = config.fallback;
    mining::JobRegistry registry(assembler, registry_config);

    mining::ValidatorConfig validator_config;
    validator_config.extranonce2_size = config.pool.extranonce2_size;
    validator_config.max_ntime_drift = config.jobs.max_ntime_drift;
    validator_config.nonces_per_job = config.jobs.nonces_per_job;
    mining::ShareValidator validator(registry, assembler, validator_config);

    mining::DifficultyController difficulty(config.difficulty);
    mining::ExtranonceManager extranonces;
    mining::MemoryPersistence persistence;

    log::StatusReporter reporter(config.logging);

    network::SessionConfig session_config;
    session_config.network = config.pool.network;
    session_config.default_worker = config.pool.default_worker;
    session_config.extranonce2_size = config.pool.extranonce2_size;

    network::SessionManager sessions(session_config, network::SessionServices{
        registry, validator, difficulty, extranonces, persistence, assembler, rpc_client, &reporter
    });

    // Серверы
    std::unique_ptr<network::TcpServer> tcp_server;
    std::unique_ptr<network::WebSocketServer> ws_server;

    if (config.server.enable_tcp) {
        tcp_server = std::make_unique<network::TcpServer>(config.server, sessions);
        if (auto started = tcp_server->start(); !started) {
            log::error(COMPONENT, std::format("Не удалось запустить TCP сервер: {}",
                                              started.error().message));
            return 1;
        }
    }

    if (config.server.enable_websocket) {
        ws_server = std::make_unique<network::WebSocketServer>(config.server, sessions);
        if (auto started = ws_server->start(); !started) {
            log::error(COMPONENT, std::format("Не удалось запустить WebSocket сервер: {}",
                                              started.error().message));
            if (tcp_server) tcp_server->stop();
            return 1;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Фоновые задачи
    std::atomic<bool> node_connected{false};
    const auto start_time = std::chrono::steady_clock::now();

    core::PeriodicTask template_task("template", std::chrono::seconds(config.jobs.broadcast_interval), [&] {
        auto tmpl = rpc_client.get_block_template();
        if (!tmpl) {
            node_connected.store(false, std::memory_order_relaxed);
            log::warning(COMPONENT, std::format("getblocktemplate: {}", tmpl.error().message));
            reporter.log_node_error(tmpl.error().message);
        } else {
            node_connected.store(true, std::memory_order_relaxed);

            auto previous = registry.current_template();
            const bool new_block = !previous || previous->prev_hash != tmpl->prev_hash;
            const uint32_t height = tmpl->height;
            const std::size_t tx_count = tmpl->transactions.size();

            auto job = registry.update_template(std::make_shared<const bitcoin::BlockTemplate>(std::move(*tmpl)));
            if (!job) {
                log::error(COMPONENT, std::format("Не удалось построить задание: {}", job.error().message));
                return;
            }
            if (new_block) {
                log::info(COMPONENT, std::format("Новый шаблон: высота {}, транзакций {}", height, tx_count));
                reporter.log_new_template(height, tx_count);
            }
        }

        sessions.broadcast_jobs();
    }, true);

    core::PeriodicTask cleanup_task("cleanup", std::chrono::seconds(config.jobs.cleanup_interval), [&] {
        auto jobs = registry.cleanup_old_jobs(std::chrono::seconds(config.jobs.max_job_age));
        auto nonces = validator.cleanup_nonce_cache();
        auto samples = difficulty.cleanup_old_data();
        if (jobs + nonces + samples > 0) {
            log::debug(COMPONENT, std::format("Очистка: заданий {}, nonce-кэшей {}, записей shares {}",
                                              jobs, nonces, samples));
        }
    });

    core::PeriodicTask difficulty_task("difficulty", std::chrono::seconds(config.difficulty.update_interval), [&] {
        auto adjustment = difficulty.apply();
        if (adjustment.changed) {
            log::info(COMPONENT, std::format("Сложность {} -> {}",
                                             bitcoin::format_difficulty(adjustment.old_difficulty),
                                             bitcoin::format_difficulty(adjustment.new_difficulty)));
        }
    });

    core::PeriodicTask stats_task("stats", 5s, [&] {
        auto session_stats = sessions.stats();
        auto registry_stats = registry.stats();
        auto tmpl = registry.current_template();

        log::PoolStats stats;
        stats.height = tmpl ? tmpl->height : 0;
        stats.node_connected = node_connected.load(std::memory_order_relaxed);
        stats.fallback_template = !tmpl;
        stats.tcp_sessions = static_cast<uint32_t>(session_stats.tcp_sessions);
        stats.websocket_sessions = static_cast<uint32_t>(session_stats.websocket_sessions);
        stats.authorized_miners = static_cast<uint32_t>(session_stats.authorized_sessions);
        stats.shares_accepted = session_stats.shares_accepted;
        stats.shares_rejected = session_stats.shares_rejected;
        stats.blocks_found = session_stats.blocks_found;
        stats.active_jobs = registry_stats.active_jobs;
        stats.pool_hashrate = difficulty.pool_hashrate();
        reporter.update_stats(stats);
    }, true);

    template_task.start();
    cleanup_task.start();
    if (config.difficulty.enable_dynamic) {
        difficulty_task.start();
    }
    stats_task.start();
    reporter.start();

    log::info(COMPONENT, "Пул запущен");

    while (g_running.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(200ms);
    }

    // Graceful shutdown
    log::info(COMPONENT, "Получен сигнал завершения, останавливаем...");

    template_task.stop();
    cleanup_task.stop();
    difficulty_task.stop();
    stats_task.stop();
    reporter.stop();

    if (ws_server) ws_server->stop();
    if (tcp_server) tcp_server->stop();
    sessions.close_all();

    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time);
    auto final_stats = sessions.stats();

    std::cout << "\n=== Итоговая статистика ===" << std::endl;
    std::cout << "Время работы: " << uptime.count() << " секунд" << std::endl;
    std::cout << "Подключений: " << final_stats.total_connections << std::endl;
    std::cout << "Shares принято: " << final_stats.shares_accepted
              << ", отклонено: " << final_stats.shares_rejected << std::endl;
    std::cout << "Найдено блоков: " << final_stats.blocks_found << std::endl;

    return 0;
}
