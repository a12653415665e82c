/**
 * @file periodic_task.cpp
 * @brief Реализация фоновой задачи
 */

#include "periodic_task.hpp"
#include "../log/logger.hpp"

#include <exception>
#include <format>

namespace bchpool::core {

PeriodicTask::PeriodicTask(std::string name,
                           std::chrono::milliseconds interval,
                           Callback callback,
                           bool run_immediately)
    : name_(std::move(name))
    , interval_(interval)
    , callback_(std::move(callback))
    , run_immediately_(run_immediately)
{
}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread([this]() { run(); });
}

void PeriodicTask::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void PeriodicTask::trigger() {
    {
        std::lock_guard lock(mutex_);
        triggered_ = true;
    }
    cv_.notify_all();
}

void PeriodicTask::run() {
    bool first = true;
    while (running_) {
        if (!(first && run_immediately_)) {
            std::unique_lock lock(mutex_);
            cv_.wait_for(lock, interval_, [this]() { return !running_ || triggered_; });
            triggered_ = false;
            if (!running_) {
                break;
            }
        }
        first = false;

        // Исключение в итерации не должно останавливать задачу
        try {
            callback_();
        } catch (const std::exception& e) {
            log::error(name_, std::format("Ошибка фоновой задачи: {}", e.what()));
        }
        ++iterations_;
    }
}

} // namespace bchpool::core
