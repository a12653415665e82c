/**
 * @file difficulty_controller.hpp
 * @brief Динамическая сложность пула
 *
 * Пересчёт по числу принятых shares за последний час:
 *
 *   ratio      = (shares_last_hour / 60) / target_shares_per_minute
 *   candidate  = current * sqrt(ratio)
 *
 * candidate ограничивается [min, max] и не более чем 4x от текущей
 * в любую сторону. Изменение меньше 1% не применяется.
 */

#pragma once

#include "../core/config.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace bchpool::mining {

using DifficultyChangedCallback = std::function<void(double old_difficulty, double new_difficulty)>;

/**
 * @brief Итог apply()
 */
struct DifficultyAdjustment {
    bool changed = false;
    double old_difficulty = 0.0;
    double new_difficulty = 0.0;
    std::string reason;
};

struct DifficultyStats {
    double current_difficulty = 0.0;
    uint64_t total_shares = 0;
    std::size_t shares_last_hour = 0;
    std::size_t active_miners = 0;
    double target_shares_per_minute = 0.0;
    double min_difficulty = 0.0;
    double max_difficulty = 0.0;
    bool enable_dynamic = false;
    std::chrono::system_clock::time_point last_update{};
};

class DifficultyController {
public:
    using Clock = std::chrono::system_clock;

    explicit DifficultyController(const DifficultyConfig& config);

    ~DifficultyController();

    DifficultyController(const DifficultyController&) = delete;
    DifficultyController& operator=(const DifficultyController&) = delete;

    [[nodiscard]] double current() const;

    /**
     * @brief Установить сложность вручную (с ограничением [min, max])
     */
    void set_difficulty(double difficulty);

    /**
     * @brief Учесть принятый share
     */
    void record_share(const std::string& miner_address, double difficulty,
                      Clock::time_point now = Clock::now());

    /**
     * @brief Рассчитать новую сложность без применения
     *
     * При выключенной динамике или менее min_samples shares за час
     * возвращает текущую сложность.
     */
    [[nodiscard]] double recompute(Clock::time_point now = Clock::now()) const;

    /**
     * @brief Пересчитать и применить
     *
     * При изменении вызывает callback рассылки mining.set_difficulty.
     */
    DifficultyAdjustment apply(Clock::time_point now = Clock::now());

    [[nodiscard]] std::size_t shares_last_hour(Clock::time_point now = Clock::now()) const;

    /**
     * @brief Хешрейт майнера за последние 5 минут, H/s
     *
     * 2^32 * difficulty / средний интервал между shares (не меньше 0.1 с).
     */
    [[nodiscard]] double miner_hashrate(const std::string& miner_address,
                                        Clock::time_point now = Clock::now()) const;

    [[nodiscard]] double pool_hashrate(Clock::time_point now = Clock::now()) const;

    /**
     * @brief Удалить записи старше max_age
     *
     * @return Количество удалённых записей пула
     */
    std::size_t cleanup_old_data(std::chrono::hours max_age = std::chrono::hours(24),
                                 Clock::time_point now = Clock::now());

    [[nodiscard]] DifficultyStats stats(Clock::time_point now = Clock::now()) const;

    void set_change_callback(DifficultyChangedCallback callback);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bchpool::mining
