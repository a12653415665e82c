/**
 * @file websocket_server.cpp
 * @brief Реализация WebSocket сервера на Boost.Beast
 */

#include "websocket_server.hpp"
#include "transport.hpp"
#include "../log/logger.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <deque>
#include <format>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace bchpool::network {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr std::string_view COMPONENT = "WebSocketServer";

class WebSocketSession;

/**
 * @brief Состояние, общее для сервера и его сессий
 */
struct SharedState {
    std::atomic<uint64_t> total_connections{0};
    std::atomic<uint64_t> rejected_connections{0};
    std::atomic<uint64_t> failed_handshakes{0};

    std::mutex live_mutex;
    std::unordered_map<const WebSocketSession*, std::weak_ptr<WebSocketSession>> live;

    void remove(const WebSocketSession* session) {
        std::lock_guard<std::mutex> lock(live_mutex);
        live.erase(session);
    }
};

// =============================================================================
// WebSocket Session
// =============================================================================

/**
 * @brief Одно WebSocket соединение
 *
 * Все операции над потоком выполняются на strand сокета. Одновременно
 * выполняется не больше одного чтения и одной записи.
 */
class WebSocketSession : public SessionTransport,
                         public std::enable_shared_from_this<WebSocketSession> {
public:
    WebSocketSession(tcp::socket&& socket, SessionManager& sessions,
                     std::size_t max_message_size, std::shared_ptr<SharedState> shared)
        : ws_(std::move(socket))
        , sessions_(sessions)
        , max_message_size_(max_message_size)
        , shared_(std::move(shared))
    {
        beast::error_code ec;
        auto endpoint = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
        remote_ = ec ? std::string("unknown")
                     : std::format("{}:{}", endpoint.address().to_string(), endpoint.port());
    }

    void run() {
        net::dispatch(ws_.get_executor(),
                      beast::bind_front_handler(&WebSocketSession::on_run, shared_from_this()));
    }

    // =========================================================================
    // SessionTransport
    // =========================================================================

    bool send(std::string message) override {
        if (closed_.load(std::memory_order_acquire)) {
            return false;
        }

        net::post(ws_.get_executor(),
                  [self = shared_from_this(), msg = std::move(message)]() mutable {
                      self->queue_.push_back(std::move(msg));
                      if (self->queue_.size() == 1 && !self->finished_) {
                          self->do_write();
                      }
                  });
        return true;
    }

    void close() override {
        if (closed_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }

        net::post(ws_.get_executor(), [self = shared_from_this()] {
            self->close_socket();
        });
    }

    [[nodiscard]] std::string remote_address() const override {
        return remote_;
    }

    [[nodiscard]] TransportKind kind() const noexcept override {
        return TransportKind::WebSocket;
    }

private:
    void on_run() {
        // У websocket::stream свои таймауты
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.read_message_max(max_message_size_);

        ws_.async_accept(
            beast::bind_front_handler(&WebSocketSession::on_accept, shared_from_this()));
    }

    void on_accept(beast::error_code ec) {
        if (ec) {
            shared_->failed_handshakes.fetch_add(1, std::memory_order_relaxed);
            log::debug(COMPONENT, std::format("{}: handshake не удался: {}",
                                              remote_, ec.message()));
            finish();
            return;
        }

        ws_.text(true);
        session_id_ = sessions_.open_session(shared_from_this());
        opened_ = true;

        log::debug(COMPONENT, std::format("Подключение {} (сессия {})", remote_, session_id_));

        if (closed_.load(std::memory_order_acquire)) {
            finish();
            return;
        }

        do_read();
    }

    void do_read() {
        ws_.async_read(
            buffer_,
            beast::bind_front_handler(&WebSocketSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t /*bytes*/) {
        if (ec) {
            if (ec == websocket::error::message_too_big) {
                log::warning(COMPONENT, std::format(
                    "{}: кадр длиннее {} байт, соединение закрыто",
                    remote_, max_message_size_));
            }
            finish();
            return;
        }

        std::string message = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        if (!message.empty() && !closed_.load(std::memory_order_acquire)) {
            sessions_.handle_message(session_id_, message);
        }

        if (closed_.load(std::memory_order_acquire)) {
            finish();
            return;
        }

        do_read();
    }

    void do_write() {
        ws_.async_write(
            net::buffer(queue_.front()),
            beast::bind_front_handler(&WebSocketSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t /*bytes*/) {
        if (ec) {
            finish();
            return;
        }

        queue_.pop_front();

        if (!queue_.empty() && !finished_) {
            do_write();
        }
    }

    void close_socket() {
        beast::error_code ec;
        auto& socket = beast::get_lowest_layer(ws_).socket();
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }

    /// Выполняется на strand, один раз
    void finish() {
        if (finished_) {
            return;
        }
        finished_ = true;
        closed_.store(true, std::memory_order_release);

        if (opened_) {
            sessions_.close_session(session_id_);
        }

        close_socket();
        shared_->remove(this);
    }

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    std::deque<std::string> queue_;

    SessionManager& sessions_;
    std::size_t max_message_size_;
    std::shared_ptr<SharedState> shared_;

    std::string remote_;
    uint64_t session_id_ = 0;
    bool opened_ = false;
    bool finished_ = false;
    std::atomic<bool> closed_{false};
};

} // anonymous namespace

// =============================================================================
// WebSocketServer::Impl
// =============================================================================

struct WebSocketServer::Impl {
    ServerConfig config;
    SessionManager& sessions;
    std::size_t thread_count;

    net::io_context ioc;
    tcp::acceptor acceptor;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work;
    std::vector<std::thread> threads;

    std::shared_ptr<SharedState> shared = std::make_shared<SharedState>();
    std::atomic<bool> running{false};
    uint16_t bound_port = 0;

    Impl(const ServerConfig& cfg, SessionManager& sm, std::size_t n)
        : config(cfg)
        , sessions(sm)
        , thread_count(n == 0 ? 1 : n)
        , acceptor(net::make_strand(ioc))
    {}

    ~Impl() {
        stop();
    }

    Result<void> start() {
        beast::error_code ec;

        auto address = net::ip::make_address(config.bind_address, ec);
        if (ec) {
            return Err<void>(
                ErrorCode::ConfigInvalidValue,
                std::format("Неверный адрес привязки: {}", config.bind_address)
            );
        }

        tcp::endpoint endpoint{address, config.websocket_port};

        acceptor.open(endpoint.protocol(), ec);
        if (!ec) acceptor.set_option(net::socket_base::reuse_address(true), ec);
        if (!ec) acceptor.bind(endpoint, ec);
        if (!ec) acceptor.listen(net::socket_base::max_listen_connections, ec);

        if (ec) {
            beast::error_code ignored;
            acceptor.close(ignored);
            return Err<void>(
                ErrorCode::NetworkConnectionFailed,
                std::format("Не удалось открыть WebSocket порт {}:{}: {}",
                            config.bind_address, config.websocket_port, ec.message())
            );
        }

        bound_port = acceptor.local_endpoint(ec).port();

        running.store(true, std::memory_order_relaxed);
        work.emplace(ioc.get_executor());
        do_accept();

        threads.reserve(thread_count);
        for (std::size_t i = 0; i < thread_count; ++i) {
            threads.emplace_back([this] { ioc.run(); });
        }

        log::info(COMPONENT, std::format("Слушаем ws://{}:{}", config.bind_address, bound_port));
        return {};
    }

    void stop() {
        if (!running.exchange(false, std::memory_order_relaxed)) {
            return;
        }

        net::post(acceptor.get_executor(), [this] {
            beast::error_code ec;
            acceptor.close(ec);
        });

        std::vector<std::shared_ptr<WebSocketSession>> live;
        {
            std::lock_guard<std::mutex> lock(shared->live_mutex);
            for (auto& [ptr, weak] : shared->live) {
                if (auto session = weak.lock()) {
                    live.push_back(std::move(session));
                }
            }
        }
        for (auto& session : live) {
            session->close();
        }
        live.clear();

        // io_context завершится, когда все сессии доработают
        work.reset();
        for (auto& thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        threads.clear();
    }

    void do_accept() {
        acceptor.async_accept(
            net::make_strand(ioc),
            [this](beast::error_code ec, tcp::socket socket) {
                on_accept(ec, std::move(socket));
            });
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (!running.load(std::memory_order_relaxed) || ec == net::error::operation_aborted) {
            return;
        }

        if (ec) {
            log::warning(COMPONENT, std::format("Ошибка accept: {}", ec.message()));
        } else if (connection_count() >= config.max_connections) {
            shared->rejected_connections.fetch_add(1, std::memory_order_relaxed);
            beast::error_code ignored;
            socket.close(ignored);
            log::warning(COMPONENT, std::format(
                "Лимит подключений {} достигнут", config.max_connections));
        } else {
            auto session = std::make_shared<WebSocketSession>(
                std::move(socket), sessions, config.max_message_size, shared);
            {
                std::lock_guard<std::mutex> lock(shared->live_mutex);
                shared->live.emplace(session.get(), session);
            }
            shared->total_connections.fetch_add(1, std::memory_order_relaxed);
            session->run();
        }

        do_accept();
    }

    std::size_t connection_count() const {
        std::lock_guard<std::mutex> lock(shared->live_mutex);
        return shared->live.size();
    }
};

// =============================================================================
// WebSocketServer
// =============================================================================

WebSocketServer::WebSocketServer(const ServerConfig& config, SessionManager& sessions,
                                 std::size_t threads)
    : impl_(std::make_unique<Impl>(config, sessions, threads))
{
}

WebSocketServer::~WebSocketServer() = default;

Result<void> WebSocketServer::start() {
    return impl_->start();
}

void WebSocketServer::stop() {
    impl_->stop();
}

bool WebSocketServer::is_running() const noexcept {
    return impl_->running.load(std::memory_order_relaxed);
}

uint16_t WebSocketServer::port() const noexcept {
    return impl_->bound_port;
}

WebSocketServerStats WebSocketServer::stats() const {
    WebSocketServerStats result;
    result.active_connections = impl_->connection_count();
    result.total_connections = impl_->shared->total_connections.load(std::memory_order_relaxed);
    result.rejected_connections = impl_->shared->rejected_connections.load(std::memory_order_relaxed);
    result.failed_handshakes = impl_->shared->failed_handshakes.load(std::memory_order_relaxed);
    return result;
}

std::size_t WebSocketServer::connection_count() const {
    return impl_->connection_count();
}

} // namespace bchpool::network
