/**
 * @file status_reporter.hpp
 * @brief Периодическая сводка состояния пула
 *
 * Раз в status_interval секунд выводит в терминал:
 * - Uptime, высоту шаблона и состояние узла
 * - Количество сессий по транспортам
 * - Принятые/отклонённые shares и найденные блоки
 * - Оценку хешрейта пула
 * - Кольцевой буфер последних событий
 */

#pragma once

#include "../core/config.hpp"
#include "../core/types.hpp"

#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace bchpool::log {

// =============================================================================
// Типы событий
// =============================================================================

enum class EventType {
    NEW_TEMPLATE,       ///< Получен новый шаблон блока
    JOB_BROADCAST,      ///< Разослано новое задание
    SHARE_OK,           ///< Share принят
    SHARE_REJECT,       ///< Share отклонён
    BLOCK_FOUND,        ///< Блок принят узлом
    BLOCK_REJECTED,     ///< Блок отклонён узлом
    DIFFICULTY,         ///< Изменена сложность майнера
    MINER_CONNECT,      ///< Майнер подключился
    MINER_DISCONNECT,   ///< Майнер отключился
    NODE_ERROR          ///< Ошибка обращения к узлу
};

[[nodiscard]] constexpr std::string_view to_string(EventType type) noexcept {
    switch (type) {
        case EventType::NEW_TEMPLATE:     return "TEMPLATE";
        case EventType::JOB_BROADCAST:    return "BROADCAST";
        case EventType::SHARE_OK:         return "SHARE_OK";
        case EventType::SHARE_REJECT:     return "SHARE_REJECT";
        case EventType::BLOCK_FOUND:      return "BLOCK_FOUND";
        case EventType::BLOCK_REJECTED:   return "BLOCK_REJECTED";
        case EventType::DIFFICULTY:       return "DIFFICULTY";
        case EventType::MINER_CONNECT:    return "CONNECT";
        case EventType::MINER_DISCONNECT: return "DISCONNECT";
        case EventType::NODE_ERROR:       return "NODE_ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief Запись события
 */
struct EventRecord {
    EventType type;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::string miner;  ///< Адрес или id сессии, если событие относится к майнеру
};

/**
 * @brief Снимок счётчиков пула для сводки
 */
struct PoolStats {
    uint32_t height = 0;
    bool node_connected = false;
    bool fallback_template = false;    ///< Работаем на резервном шаблоне
    uint32_t tcp_sessions = 0;
    uint32_t websocket_sessions = 0;
    uint32_t authorized_miners = 0;
    uint64_t shares_accepted = 0;
    uint64_t shares_rejected = 0;
    uint64_t blocks_found = 0;
    uint64_t active_jobs = 0;
    double pool_hashrate = 0.0;        ///< H/s
};

// =============================================================================
// Status Reporter
// =============================================================================

class StatusReporter {
public:
    explicit StatusReporter(const LoggingConfig& config);

    ~StatusReporter();

    StatusReporter(const StatusReporter&) = delete;
    StatusReporter& operator=(const StatusReporter&) = delete;

    // ==========================================================================
    // Управление
    // ==========================================================================

    /**
     * @brief Запустить периодический вывод (если status_interval > 0)
     */
    void start();

    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    // ==========================================================================
    // Данные
    // ==========================================================================

    void update_stats(const PoolStats& stats);

    [[nodiscard]] PoolStats stats() const;

    // ==========================================================================
    // События
    // ==========================================================================

    void log_event(EventType type, const std::string& message,
                   const std::string& miner = "");

    void log_new_template(uint32_t height, size_t tx_count);

    void log_share(bool accepted, const std::string& miner, const std::string& detail);

    void log_block(bool accepted, uint32_t height, const std::string& miner,
                   const std::string& detail = "");

    void log_difficulty(const std::string& miner, double old_difficulty, double new_difficulty);

    void log_node_error(const std::string& message);

    /**
     * @brief Последние события (старые первыми)
     */
    [[nodiscard]] std::vector<EventRecord> recent_events(size_t limit) const;

    // ==========================================================================
    // Рендеринг
    // ==========================================================================

    /**
     * @brief Сводка без ANSI кодов
     */
    [[nodiscard]] std::string render_plain() const;

    [[nodiscard]] std::string render() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bchpool::log
