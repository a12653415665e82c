/**
 * @file status_reporter.cpp
 * @brief Реализация сводки состояния пула
 */

#include "status_reporter.hpp"
#include "../bitcoin/target.hpp"
#include "../core/periodic_task.hpp"

#include <algorithm>
#include <format>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace bchpool::log {

// =============================================================================
// ANSI коды цветов
// =============================================================================

namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* DIM = "\033[2m";

    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
}

// =============================================================================
// Реализация
// =============================================================================

struct StatusReporter::Impl {
    LoggingConfig config;

    std::chrono::steady_clock::time_point start_time;
    std::unique_ptr<core::PeriodicTask> render_task;

    PoolStats stats;
    mutable std::mutex data_mutex;

    std::deque<EventRecord> events;
    mutable std::mutex events_mutex;

    explicit Impl(const LoggingConfig& cfg)
        : config(cfg)
        , start_time(std::chrono::steady_clock::now()) {}

    void render_status() {
        std::cout << render_impl(config.color) << std::flush;
    }

    std::string render_impl(bool use_color) const {
        std::ostringstream out;

        const char* bold = use_color ? ansi::BOLD : "";
        const char* reset = use_color ? ansi::RESET : "";
        const char* green = use_color ? ansi::GREEN : "";
        const char* yellow = use_color ? ansi::YELLOW : "";
        const char* red = use_color ? ansi::RED : "";
        const char* cyan = use_color ? ansi::CYAN : "";
        const char* dim = use_color ? ansi::DIM : "";

        PoolStats snapshot;
        {
            std::lock_guard<std::mutex> lock(data_mutex);
            snapshot = stats;
        }

        out << bold << "=================== BCHPOOL STATUS ===================" << reset << "\n";

        auto now = std::chrono::steady_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - start_time);
        auto hours = uptime.count() / 3600;
        auto minutes = (uptime.count() % 3600) / 60;
        auto seconds = uptime.count() % 60;

        out << bold << "Uptime: " << reset
            << std::setfill('0') << std::setw(2) << hours << ":"
            << std::setw(2) << minutes << ":"
            << std::setw(2) << seconds << std::setfill(' ') << "\n";

        // === Узел ===
        out << bold << "Node:" << reset << " height " << snapshot.height << ", ";
        if (snapshot.node_connected) {
            out << green << "CONNECTED" << reset;
        } else {
            out << red << "DISCONNECTED" << reset;
        }
        if (snapshot.fallback_template) {
            out << " " << yellow << "(fallback template)" << reset;
        }
        out << "\n";

        // === Сессии ===
        out << bold << "Sessions:" << reset
            << " tcp " << snapshot.tcp_sessions
            << ", websocket " << snapshot.websocket_sessions
            << ", authorized " << snapshot.authorized_miners << "\n";

        // === Shares ===
        out << bold << "Shares:" << reset
            << " accepted " << snapshot.shares_accepted
            << ", rejected " << snapshot.shares_rejected
            << ", jobs " << snapshot.active_jobs << "\n";

        out << bold << "Blocks found:" << reset << " ";
        if (snapshot.blocks_found > 0) {
            out << bold << green << snapshot.blocks_found << reset;
        } else {
            out << snapshot.blocks_found;
        }
        out << "\n";

        out << bold << "Hashrate:" << reset << " "
            << bitcoin::format_hashrate(snapshot.pool_hashrate) << "\n";

        // === Последние события ===
        out << bold << "Recent Events:" << reset << "\n";
        {
            std::lock_guard<std::mutex> events_lock(events_mutex);
            if (events.empty()) {
                out << "  " << dim << "(no events)" << reset << "\n";
            } else {
                size_t start = events.size() > 10 ? events.size() - 10 : 0;
                for (size_t i = start; i < events.size(); ++i) {
                    const auto& event = events[i];

                    auto time = std::chrono::system_clock::to_time_t(event.timestamp);
                    std::tm tm{};
                    localtime_r(&time, &tm);
                    out << "  " << std::put_time(&tm, "%H:%M:%S") << " ";

                    switch (event.type) {
                        case EventType::NEW_TEMPLATE:
                        case EventType::JOB_BROADCAST:
                        case EventType::DIFFICULTY:
                            out << cyan << "[" << to_string(event.type) << "]" << reset;
                            break;
                        case EventType::BLOCK_FOUND:
                            out << bold << green << "[" << to_string(event.type) << "]" << reset;
                            break;
                        case EventType::SHARE_OK:
                        case EventType::MINER_CONNECT:
                            out << green << "[" << to_string(event.type) << "]" << reset;
                            break;
                        case EventType::MINER_DISCONNECT:
                            out << yellow << "[" << to_string(event.type) << "]" << reset;
                            break;
                        case EventType::SHARE_REJECT:
                        case EventType::BLOCK_REJECTED:
                        case EventType::NODE_ERROR:
                            out << red << "[" << to_string(event.type) << "]" << reset;
                            break;
                    }

                    out << " " << event.message;
                    if (!event.miner.empty()) {
                        out << dim << " (" << event.miner << ")" << reset;
                    }
                    out << "\n";
                }
            }
        }

        out << bold << "======================================================" << reset << "\n";

        return out.str();
    }
};

// =============================================================================
// Публичный API
// =============================================================================

StatusReporter::StatusReporter(const LoggingConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

StatusReporter::~StatusReporter() {
    stop();
}

void StatusReporter::start() {
    if (impl_->render_task || impl_->config.status_interval == 0) {
        return;
    }

    impl_->start_time = std::chrono::steady_clock::now();
    impl_->render_task = std::make_unique<core::PeriodicTask>(
        "StatusReporter",
        std::chrono::seconds(impl_->config.status_interval),
        [this]() { impl_->render_status(); }
    );
    impl_->render_task->start();
}

void StatusReporter::stop() {
    if (impl_->render_task) {
        impl_->render_task->stop();
        impl_->render_task.reset();
    }
}

bool StatusReporter::is_running() const noexcept {
    return impl_->render_task && impl_->render_task->is_running();
}

void StatusReporter::update_stats(const PoolStats& stats) {
    std::lock_guard<std::mutex> lock(impl_->data_mutex);
    impl_->stats = stats;
}

PoolStats StatusReporter::stats() const {
    std::lock_guard<std::mutex> lock(impl_->data_mutex);
    return impl_->stats;
}

void StatusReporter::log_event(EventType type, const std::string& message,
                               const std::string& miner) {
    std::lock_guard<std::mutex> lock(impl_->events_mutex);

    EventRecord record;
    record.type = type;
    record.timestamp = std::chrono::system_clock::now();
    record.message = message;
    record.miner = miner;

    impl_->events.push_back(std::move(record));

    while (impl_->events.size() > impl_->config.event_history) {
        impl_->events.pop_front();
    }
}

void StatusReporter::log_new_template(uint32_t height, size_t tx_count) {
    log_event(EventType::NEW_TEMPLATE,
              std::format("New template at height {} ({} txs)", height, tx_count));
}

void StatusReporter::log_share(bool accepted, const std::string& miner, const std::string& detail) {
    log_event(accepted ? EventType::SHARE_OK : EventType::SHARE_REJECT, detail, miner);
}

void StatusReporter::log_block(bool accepted, uint32_t height, const std::string& miner,
                               const std::string& detail) {
    if (accepted) {
        log_event(EventType::BLOCK_FOUND,
                  std::format("FOUND BLOCK at height {}", height), miner);
    } else {
        log_event(EventType::BLOCK_REJECTED,
                  std::format("Block at height {} rejected: {}", height, detail), miner);
    }
}

void StatusReporter::log_difficulty(const std::string& miner, double old_difficulty,
                                    double new_difficulty) {
    log_event(EventType::DIFFICULTY,
              std::format("{} -> {}", bitcoin::format_difficulty(old_difficulty),
                          bitcoin::format_difficulty(new_difficulty)),
              miner);
}

void StatusReporter::log_node_error(const std::string& message) {
    log_event(EventType::NODE_ERROR, message);
}

std::vector<EventRecord> StatusReporter::recent_events(size_t limit) const {
    std::lock_guard<std::mutex> lock(impl_->events_mutex);
    size_t start = impl_->events.size() > limit ? impl_->events.size() - limit : 0;
    return {impl_->events.begin() + static_cast<std::ptrdiff_t>(start), impl_->events.end()};
}

std::string StatusReporter::render_plain() const {
    return impl_->render_impl(false);
}

std::string StatusReporter::render() const {
    return impl_->render_impl(impl_->config.color);
}

} // namespace bchpool::log
