/**
 * @file websocket_server.hpp
 * @brief WebSocket сервер Stratum
 *
 * Те же сообщения Stratum, что и по TCP, но каждое сообщение - отдельный
 * текстовый кадр WebSocket без перевода строки. Реализован на Boost.Beast:
 * io_context с пулом потоков, операции каждой сессии идут через strand.
 */

#pragma once

#include "session_manager.hpp"
#include "../core/config.hpp"

#include <memory>

namespace bchpool::network {

struct WebSocketServerStats {
    std::size_t active_connections = 0;
    uint64_t total_connections = 0;
    uint64_t rejected_connections = 0;
    uint64_t failed_handshakes = 0;
};

class WebSocketServer {
public:
    /**
     * @param config Конфигурация сервера (websocket_port, лимиты)
     * @param sessions Менеджер сессий, должен пережить сервер
     * @param threads Количество потоков io_context
     */
    WebSocketServer(const ServerConfig& config, SessionManager& sessions,
                    std::size_t threads = 2);

    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    /**
     * @brief Открыть сокет на bind_address:websocket_port и запустить потоки
     */
    [[nodiscard]] Result<void> start();

    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    [[nodiscard]] uint16_t port() const noexcept;

    [[nodiscard]] WebSocketServerStats stats() const;

    [[nodiscard]] std::size_t connection_count() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bchpool::network
