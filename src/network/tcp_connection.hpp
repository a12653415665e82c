/**
 * @file tcp_connection.hpp
 * @brief Соединение Stratum поверх TCP
 *
 * Управляет TCP соединением с одним майнером:
 * - Поток приёма: poll + recv, разбор строк JSON через LineBuffer
 * - Поток отправки: очередь сообщений, каждое завершается '\n'
 * - Переполнение строки закрывает соединение
 */

#pragma once

#include "protocol.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace bchpool::network {

// =============================================================================
// Callbacks
// =============================================================================

/**
 * @brief Callback на каждую полную строку
 */
using LineReceivedCallback = std::function<void(std::string_view line)>;

/**
 * @brief Callback при отключении (вызывается из потока приёма)
 */
using DisconnectedCallback = std::function<void()>;

/**
 * @brief Статистика TCP соединения
 */
struct ConnectionStats {
    uint64_t lines_received = 0;
    uint64_t messages_sent = 0;
    uint64_t bytes_received = 0;
    uint64_t bytes_sent = 0;
    std::chrono::steady_clock::time_point connected_at;
};

// =============================================================================
// TCP Connection
// =============================================================================

class TcpConnection : public SessionTransport {
public:
    /**
     * @brief Создать соединение из socket fd
     *
     * @param socket_fd Файловый дескриптор принятого сокета
     * @param remote_addr Адрес удалённой стороны "ip:port"
     * @param max_line_size Максимальная длина строки
     */
    TcpConnection(int socket_fd, std::string remote_addr, std::size_t max_line_size);

    ~TcpConnection() override;

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    /**
     * @brief Запустить потоки приёма и отправки
     *
     * Callbacks должны быть установлены до вызова.
     */
    void start();

    /**
     * @brief Остановить потоки и закрыть сокет
     *
     * Нельзя вызывать из callbacks этого соединения.
     */
    void stop();

    /**
     * @brief Поток приёма завершился и callback отключения отработал
     */
    [[nodiscard]] bool is_finished() const noexcept;

    void set_line_callback(LineReceivedCallback callback);
    void set_disconnected_callback(DisconnectedCallback callback);

    [[nodiscard]] ConnectionStats stats() const;

    // =========================================================================
    // SessionTransport
    // =========================================================================

    bool send(std::string message) override;

    void close() override;

    [[nodiscard]] std::string remote_address() const override;

    [[nodiscard]] TransportKind kind() const noexcept override {
        return TransportKind::Tcp;
    }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bchpool::network
