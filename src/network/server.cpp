/**
 * @file server.cpp
 * @brief Реализация TCP сервера Stratum
 */

#include "server.hpp"
#include "../log/logger.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

#include <atomic>
#include <format>
#include <list>
#include <mutex>
#include <thread>

namespace bchpool::network {

namespace {

constexpr std::string_view COMPONENT = "TcpServer";

} // anonymous namespace

struct TcpServer::Impl {
    ServerConfig config;
    SessionManager& sessions;

    int listen_fd = -1;
    uint16_t bound_port = 0;
    std::atomic<bool> running{false};

    std::thread accept_thread;
    std::thread cleanup_thread;

    mutable std::mutex connections_mutex;
    std::list<std::shared_ptr<TcpConnection>> connections;

    mutable std::mutex stats_mutex;
    ServerStats stats;

    Impl(const ServerConfig& cfg, SessionManager& sm)
        : config(cfg)
        , sessions(sm)
    {}

    ~Impl() {
        stop();
    }

    Result<void> start() {
        listen_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd < 0) {
            return Err<void>(
                ErrorCode::NetworkConnectionFailed,
                std::format("Не удалось создать сокет: {}", strerror(errno))
            );
        }

        int opt = 1;
        setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        struct sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(config.tcp_port);

        if (config.bind_address == "0.0.0.0") {
            addr.sin_addr.s_addr = INADDR_ANY;
        } else if (inet_pton(AF_INET, config.bind_address.c_str(), &addr.sin_addr) != 1) {
            ::close(listen_fd);
            listen_fd = -1;
            return Err<void>(
                ErrorCode::ConfigInvalidValue,
                std::format("Неверный адрес привязки: {}", config.bind_address)
            );
        }

        if (bind(listen_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            ::close(listen_fd);
            listen_fd = -1;
            return Err<void>(
                ErrorCode::NetworkConnectionFailed,
                std::format("Не удалось привязать сокет к {}:{}: {}",
                           config.bind_address, config.tcp_port, strerror(errno))
            );
        }

        if (listen(listen_fd, 128) < 0) {
            ::close(listen_fd);
            listen_fd = -1;
            return Err<void>(
                ErrorCode::NetworkConnectionFailed,
                std::format("Не удалось начать прослушивание: {}", strerror(errno))
            );
        }

        struct sockaddr_in bound{};
        socklen_t bound_len = sizeof(bound);
        if (getsockname(listen_fd, reinterpret_cast<struct sockaddr*>(&bound), &bound_len) == 0) {
            bound_port = ntohs(bound.sin_port);
        }

        int flags = fcntl(listen_fd, F_GETFL, 0);
        fcntl(listen_fd, F_SETFL, flags | O_NONBLOCK);

        running.store(true, std::memory_order_relaxed);
        accept_thread = std::thread([this] { accept_loop(); });
        cleanup_thread = std::thread([this] { cleanup_loop(); });

        log::info(COMPONENT, std::format("Слушаем {}:{}", config.bind_address, bound_port));
        return {};
    }

    void stop() {
        running.store(false, std::memory_order_relaxed);

        if (accept_thread.joinable()) {
            accept_thread.join();
        }
        if (cleanup_thread.joinable()) {
            cleanup_thread.join();
        }

        if (listen_fd >= 0) {
            ::close(listen_fd);
            listen_fd = -1;
        }

        // Соединения останавливаются вне мьютекса: их callback отключения
        // обращается к SessionManager
        std::list<std::shared_ptr<TcpConnection>> closing;
        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            closing.swap(connections);
        }
        for (auto& conn : closing) {
            conn->stop();
        }
    }

    void accept_loop() {
        while (running.load(std::memory_order_relaxed)) {
            struct pollfd pfd;
            pfd.fd = listen_fd;
            pfd.events = POLLIN;

            int ret = poll(&pfd, 1, 100);

            if (ret < 0) {
                if (errno == EINTR) continue;
                log::error(COMPONENT, std::format("Ошибка poll: {}", strerror(errno)));
                break;
            }

            if (ret == 0) continue;

            if (pfd.revents & POLLIN) {
                accept_connection();
            }
        }
    }

    void accept_connection() {
        struct sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);

        int client_fd = accept(listen_fd,
                               reinterpret_cast<struct sockaddr*>(&client_addr),
                               &addr_len);

        if (client_fd < 0) {
            return;
        }

        char addr_str[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &client_addr.sin_addr, addr_str, sizeof(addr_str));
        std::string remote_addr = std::format("{}:{}",
                                              addr_str,
                                              ntohs(client_addr.sin_port));

        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            if (connections.size() >= config.max_connections) {
                ::close(client_fd);

                std::lock_guard<std::mutex> slock(stats_mutex);
                stats.rejected_connections++;
                log::warning(COMPONENT, std::format(
                    "Лимит подключений {} достигнут, {} отклонён",
                    config.max_connections, remote_addr));
                return;
            }
        }

        auto conn = std::make_shared<TcpConnection>(client_fd, remote_addr,
                                                    config.max_message_size);

        uint64_t session_id = sessions.open_session(conn);

        conn->set_line_callback([this, session_id](std::string_view line) {
            sessions.handle_message(session_id, line);
        });

        conn->set_disconnected_callback([this, session_id]() {
            sessions.close_session(session_id);
        });

        conn->start();

        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            connections.push_back(std::move(conn));

            std::lock_guard<std::mutex> slock(stats_mutex);
            stats.total_connections++;
            stats.active_connections = connections.size();
        }

        log::debug(COMPONENT, std::format("Подключение {} (сессия {})", remote_addr, session_id));
    }

    void cleanup_loop() {
        while (running.load(std::memory_order_relaxed)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));

            std::list<std::shared_ptr<TcpConnection>> finished;
            {
                std::lock_guard<std::mutex> lock(connections_mutex);

                for (auto it = connections.begin(); it != connections.end();) {
                    if ((*it)->is_finished()) {
                        finished.push_back(std::move(*it));
                        it = connections.erase(it);
                    } else {
                        ++it;
                    }
                }

                std::lock_guard<std::mutex> slock(stats_mutex);
                stats.active_connections = connections.size();
            }

            for (auto& conn : finished) {
                conn->stop();
            }
        }
    }
};

// =============================================================================
// TcpServer
// =============================================================================

TcpServer::TcpServer(const ServerConfig& config, SessionManager& sessions)
    : impl_(std::make_unique<Impl>(config, sessions))
{
}

TcpServer::~TcpServer() = default;

Result<void> TcpServer::start() {
    return impl_->start();
}

void TcpServer::stop() {
    impl_->stop();
}

bool TcpServer::is_running() const noexcept {
    return impl_->running.load(std::memory_order_relaxed);
}

uint16_t TcpServer::port() const noexcept {
    return impl_->bound_port;
}

ServerStats TcpServer::stats() const {
    std::lock_guard<std::mutex> lock(impl_->stats_mutex);
    return impl_->stats;
}

std::size_t TcpServer::connection_count() const {
    std::lock_guard<std::mutex> lock(impl_->connections_mutex);
    return impl_->connections.size();
}

std::vector<std::string> TcpServer::connected_addresses() const {
    std::lock_guard<std::mutex> lock(impl_->connections_mutex);

    std::vector<std::string> addresses;
    addresses.reserve(impl_->connections.size());

    for (const auto& conn : impl_->connections) {
        addresses.push_back(conn->remote_address());
    }

    return addresses;
}

} // namespace bchpool::network
