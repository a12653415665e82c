/**
 * @file tcp_connection.cpp
 * @brief Реализация TCP соединения Stratum
 */

#include "tcp_connection.hpp"
#include "../log/logger.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <format>
#include <mutex>
#include <queue>
#include <thread>

namespace bchpool::network {

namespace {

constexpr std::string_view COMPONENT = "TcpConnection";

} // anonymous namespace

struct TcpConnection::Impl {
    int socket_fd = -1;
    std::string remote_addr;

    std::atomic<bool> connected{false};
    std::atomic<bool> running{false};
    std::atomic<bool> finished{false};

    std::thread recv_thread;
    std::thread send_thread;

    std::mutex send_mutex;
    std::condition_variable send_cv;
    std::queue<std::string> send_queue;

    LineBuffer buffer;

    LineReceivedCallback line_callback;
    DisconnectedCallback disconnected_callback;

    mutable std::mutex stats_mutex;
    ConnectionStats stats;

    Impl(int fd, std::string addr, std::size_t max_line_size)
        : socket_fd(fd)
        , remote_addr(std::move(addr))
        , buffer(max_line_size)
    {
        stats.connected_at = std::chrono::steady_clock::now();
    }

    ~Impl() {
        stop();
    }

    /// Прервать потоки без ожидания: сокет закрывается только в stop()
    void shutdown_socket() {
        running.store(false, std::memory_order_relaxed);
        connected.store(false, std::memory_order_relaxed);

        if (socket_fd >= 0) {
            ::shutdown(socket_fd, SHUT_RDWR);
        }

        send_cv.notify_all();
    }

    void stop() {
        shutdown_socket();

        if (recv_thread.joinable()) {
            recv_thread.join();
        }
        if (send_thread.joinable()) {
            send_thread.join();
        }

        if (socket_fd >= 0) {
            ::close(socket_fd);
            socket_fd = -1;
        }
    }

    void recv_loop() {
        std::array<char, 1024> chunk;

        while (running.load(std::memory_order_relaxed)) {
            struct pollfd pfd;
            pfd.fd = socket_fd;
            pfd.events = POLLIN;

            int ret = poll(&pfd, 1, 100);  // 100ms таймаут

            if (ret < 0) {
                if (errno == EINTR) continue;
                break;
            }

            if (ret == 0) continue;

            if (pfd.revents & (POLLERR | POLLNVAL)) {
                break;
            }

            if (pfd.revents & (POLLIN | POLLHUP)) {
                ssize_t n = recv(socket_fd, chunk.data(), chunk.size(), 0);

                if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
                    continue;
                }
                if (n <= 0) {
                    break;
                }

                {
                    std::lock_guard<std::mutex> lock(stats_mutex);
                    stats.bytes_received += static_cast<uint64_t>(n);
                }

                buffer.add_data(std::string_view(chunk.data(), static_cast<std::size_t>(n)));

                while (running.load(std::memory_order_relaxed)) {
                    auto line = buffer.try_parse();
                    if (!line) break;
                    if (line->empty()) continue;

                    {
                        std::lock_guard<std::mutex> lock(stats_mutex);
                        stats.lines_received++;
                    }

                    if (line_callback) {
                        line_callback(*line);
                    }
                }

                if (buffer.overflow()) {
                    log::warning(COMPONENT, std::format(
                        "{}: строка длиннее {} байт, соединение закрыто",
                        remote_addr, buffer.buffered_size()));
                    break;
                }
            }
        }

        shutdown_socket();

        if (disconnected_callback) {
            disconnected_callback();
        }

        finished.store(true, std::memory_order_release);
    }

    void send_loop() {
        while (true) {
            std::string data;

            {
                std::unique_lock<std::mutex> lock(send_mutex);
                send_cv.wait(lock, [this] {
                    return !send_queue.empty() || !running.load(std::memory_order_relaxed);
                });

                if (!running.load(std::memory_order_relaxed)) {
                    return;
                }

                data = std::move(send_queue.front());
                send_queue.pop();
            }

            if (!write_all(data)) {
                shutdown_socket();
                return;
            }

            std::lock_guard<std::mutex> lock(stats_mutex);
            stats.messages_sent++;
            stats.bytes_sent += data.size();
        }
    }

    bool write_all(const std::string& data) {
        std::size_t sent = 0;

        while (sent < data.size() && running.load(std::memory_order_relaxed)) {
            ssize_t n = ::send(socket_fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);

            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    struct pollfd pfd;
                    pfd.fd = socket_fd;
                    pfd.events = POLLOUT;
                    poll(&pfd, 1, 100);
                    continue;
                }
                log::debug(COMPONENT, std::format("{}: ошибка send: {}",
                                                  remote_addr, std::strerror(errno)));
                return false;
            }

            sent += static_cast<std::size_t>(n);
        }

        return sent == data.size();
    }

    bool enqueue_send(std::string message) {
        if (!connected.load(std::memory_order_relaxed)) {
            return false;
        }

        message.push_back('\n');

        {
            std::lock_guard<std::mutex> lock(send_mutex);
            send_queue.push(std::move(message));
        }
        send_cv.notify_one();
        return true;
    }
};

// =============================================================================
// TcpConnection
// =============================================================================

TcpConnection::TcpConnection(int socket_fd, std::string remote_addr, std::size_t max_line_size)
    : impl_(std::make_unique<Impl>(socket_fd, std::move(remote_addr), max_line_size))
{
    int flag = 1;
    setsockopt(socket_fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));

    int flags = fcntl(socket_fd, F_GETFL, 0);
    fcntl(socket_fd, F_SETFL, flags | O_NONBLOCK);

    impl_->connected.store(true, std::memory_order_relaxed);
}

TcpConnection::~TcpConnection() = default;

void TcpConnection::start() {
    impl_->running.store(true, std::memory_order_relaxed);
    impl_->recv_thread = std::thread([this] { impl_->recv_loop(); });
    impl_->send_thread = std::thread([this] { impl_->send_loop(); });
}

void TcpConnection::stop() {
    impl_->stop();
}

bool TcpConnection::is_finished() const noexcept {
    return impl_->finished.load(std::memory_order_acquire);
}

void TcpConnection::set_line_callback(LineReceivedCallback callback) {
    impl_->line_callback = std::move(callback);
}

void TcpConnection::set_disconnected_callback(DisconnectedCallback callback) {
    impl_->disconnected_callback = std::move(callback);
}

ConnectionStats TcpConnection::stats() const {
    std::lock_guard<std::mutex> lock(impl_->stats_mutex);
    return impl_->stats;
}

bool TcpConnection::send(std::string message) {
    return impl_->enqueue_send(std::move(message));
}

void TcpConnection::close() {
    impl_->shutdown_socket();
}

std::string TcpConnection::remote_address() const {
    return impl_->remote_addr;
}

} // namespace bchpool::network
