/**
 * @file server.hpp
 * @brief TCP сервер Stratum
 *
 * Принимает входящие подключения майнеров, для каждого создаёт
 * TcpConnection и регистрирует его в SessionManager.
 */

#pragma once

#include "session_manager.hpp"
#include "tcp_connection.hpp"
#include "../core/config.hpp"

#include <memory>
#include <string>
#include <vector>

namespace bchpool::network {

/**
 * @brief Статистика сервера
 */
struct ServerStats {
    std::size_t active_connections = 0;
    uint64_t total_connections = 0;
    uint64_t rejected_connections = 0;  ///< Отклонено из-за лимита подключений
};

/**
 * @brief TCP сервер Stratum (JSON построчно)
 *
 * Функции:
 * - Принимает входящие TCP подключения
 * - Соблюдает лимит max_connections
 * - Передаёт строки в SessionManager
 * - Убирает завершившиеся соединения
 */
class TcpServer {
public:
    /**
     * @brief Создать сервер
     *
     * @param config Конфигурация сервера
     * @param sessions Менеджер сессий, должен пережить сервер
     */
    TcpServer(const ServerConfig& config, SessionManager& sessions);

    ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    /**
     * @brief Открыть сокет на bind_address:tcp_port и запустить приём
     */
    [[nodiscard]] Result<void> start();

    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    /**
     * @brief Фактический порт (полезно при tcp_port = 0)
     */
    [[nodiscard]] uint16_t port() const noexcept;

    [[nodiscard]] ServerStats stats() const;

    [[nodiscard]] std::size_t connection_count() const;

    [[nodiscard]] std::vector<std::string> connected_addresses() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bchpool::network
