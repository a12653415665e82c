/**
 * @file periodic_task.hpp
 * @brief Фоновая задача с фиксированным интервалом
 *
 * stop() будит поток и дожидается завершения текущей итерации.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace bchpool::core {

class PeriodicTask {
public:
    using Callback = std::function<void()>;

    /**
     * @param name Имя для лога
     * @param interval Интервал между итерациями
     * @param callback Тело итерации
     * @param run_immediately Выполнить первую итерацию сразу после start()
     */
    PeriodicTask(std::string name,
                 std::chrono::milliseconds interval,
                 Callback callback,
                 bool run_immediately = false);

    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();

    /**
     * @brief Разбудить поток и выполнить итерацию вне расписания
     */
    void trigger();

    [[nodiscard]] bool is_running() const noexcept { return running_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] uint64_t iterations() const noexcept { return iterations_; }

private:
    void run();

    std::string name_;
    std::chrono::milliseconds interval_;
    Callback callback_;
    bool run_immediately_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> iterations_{0};
    bool triggered_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
};

} // namespace bchpool::core
