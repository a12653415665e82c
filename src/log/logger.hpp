/**
 * @file logger.hpp
 * @brief Построчный лог с уровнем и компонентом
 *
 * Формат строки: "[INFO] [JobRegistry] сообщение".
 * error и warning пишутся в std::cerr, остальное в std::cout.
 */

#pragma once

#include "../core/types.hpp"

#include <string_view>

namespace bchpool::log {

enum class Level {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

[[nodiscard]] constexpr std::string_view to_string(Level level) noexcept {
    switch (level) {
        case Level::Error: return "ERROR";
        case Level::Warn:  return "WARNING";
        case Level::Info:  return "INFO";
        case Level::Debug: return "DEBUG";
    }
    return "UNKNOWN";
}

/**
 * @brief Разобрать уровень: "error", "warn", "info", "debug"
 */
[[nodiscard]] Result<Level> parse_level(std::string_view name);

/**
 * @brief Установить минимальный выводимый уровень
 */
void set_level(Level level) noexcept;

[[nodiscard]] Level level() noexcept;

[[nodiscard]] bool enabled(Level level) noexcept;

void write(Level level, std::string_view component, std::string_view message);

inline void error(std::string_view component, std::string_view message) {
    write(Level::Error, component, message);
}

inline void warning(std::string_view component, std::string_view message) {
    write(Level::Warn, component, message);
}

inline void info(std::string_view component, std::string_view message) {
    write(Level::Info, component, message);
}

inline void debug(std::string_view component, std::string_view message) {
    write(Level::Debug, component, message);
}

} // namespace bchpool::log
