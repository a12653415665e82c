/**
 * @file transport.hpp
 * @brief Транспорт одной сессии Stratum
 *
 * TCP (JSON построчно) и WebSocket (JSON в текстовом кадре) несут
 * одинаковые сообщения; SessionManager работает только с этим интерфейсом.
 */

#pragma once

#include <string>
#include <string_view>

namespace bchpool::network {

enum class TransportKind {
    Tcp,
    WebSocket
};

[[nodiscard]] constexpr std::string_view to_string(TransportKind kind) noexcept {
    switch (kind) {
        case TransportKind::Tcp:       return "tcp";
        case TransportKind::WebSocket: return "websocket";
    }
    return "unknown";
}

class SessionTransport {
public:
    virtual ~SessionTransport() = default;

    /**
     * @brief Поставить сообщение в очередь отправки
     *
     * @param message JSON без завершающего перевода строки
     * @return false если соединение уже закрыто
     */
    virtual bool send(std::string message) = 0;

    /**
     * @brief Закрыть соединение (без ожидания потоков)
     */
    virtual void close() = 0;

    [[nodiscard]] virtual std::string remote_address() const = 0;

    [[nodiscard]] virtual TransportKind kind() const noexcept = 0;
};

} // namespace bchpool::network
