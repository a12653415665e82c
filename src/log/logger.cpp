/**
 * @file logger.cpp
 * @brief Реализация лога
 */

#include "logger.hpp"

#include <atomic>
#include <format>
#include <iostream>
#include <mutex>

namespace bchpool::log {

namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_output_mutex;

} // namespace

Result<Level> parse_level(std::string_view name) {
    if (name == "error") return Level::Error;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "info") return Level::Info;
    if (name == "debug") return Level::Debug;
    return Err<Level>(
        ErrorCode::ConfigInvalidValue,
        std::format("Неизвестный уровень логирования: {}", name)
    );
}

void set_level(Level level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

Level level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

bool enabled(Level level) noexcept {
    return static_cast<int>(level) <= static_cast<int>(g_level.load(std::memory_order_relaxed));
}

void write(Level level, std::string_view component, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    std::string line = std::format("[{}] [{}] {}\n", to_string(level), component, message);

    std::lock_guard lock(g_output_mutex);
    if (level == Level::Error || level == Level::Warn) {
        std::cerr << line << std::flush;
    } else {
        std::cout << line << std::flush;
    }
}

} // namespace bchpool::log
