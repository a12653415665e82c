/**
 * @file difficulty_controller.cpp
 * @brief Реализация динамической сложности
 */

#include "difficulty_controller.hpp"
#include "../log/logger.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <format>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace bchpool::mining {

namespace {

constexpr auto HOUR = std::chrono::hours(1);
constexpr auto HASHRATE_WINDOW = std::chrono::minutes(5);
constexpr double MIN_SHARE_INTERVAL = 0.1;
constexpr double HASHES_PER_DIFFICULTY = 4294967296.0;

struct ShareSample {
    std::chrono::system_clock::time_point timestamp;
    double difficulty;
};

} // namespace

struct DifficultyController::Impl {
    DifficultyConfig config;

    mutable std::mutex mutex;

    double current;
    uint64_t total_shares = 0;
    Clock::time_point last_update;

    /// Время принятых shares за последний час
    std::deque<Clock::time_point> pool_shares;

    /// Последние shares каждого майнера
    std::unordered_map<std::string, std::deque<ShareSample>> miner_shares;

    DifficultyChangedCallback change_callback;

    explicit Impl(const DifficultyConfig& cfg)
        : config(cfg)
        , current(std::clamp(cfg.initial, cfg.min, cfg.max))
        , last_update(Clock::now()) {}

    // Вызывается под mutex
    void prune_locked(Clock::time_point now) {
        while (!pool_shares.empty() && now - pool_shares.front() > HOUR) {
            pool_shares.pop_front();
        }
    }

    // Вызывается под mutex
    std::size_t count_last_hour_locked(Clock::time_point now) const {
        return static_cast<std::size_t>(std::count_if(
            pool_shares.begin(), pool_shares.end(),
            [now](Clock::time_point t) { return now - t <= HOUR; }));
    }

    // Вызывается под mutex
    double recompute_locked(Clock::time_point now) const {
        if (!config.enable_dynamic) {
            return current;
        }

        const std::size_t samples = count_last_hour_locked(now);
        if (samples < config.min_samples) {
            return current;
        }

        const double shares_per_minute = static_cast<double>(samples) / 60.0;
        const double ratio = shares_per_minute / config.target_shares_per_minute;
        const double candidate = current * std::sqrt(ratio);

        double low = std::max(config.min, current / constants::DIFFICULTY_MAX_STEP);
        double high = std::min(config.max, current * constants::DIFFICULTY_MAX_STEP);
        if (low > high) {
            low = config.min;
            high = config.max;
        }
        return std::clamp(candidate, low, high);
    }

    // Вызывается под mutex
    double miner_hashrate_locked(const std::string& address, Clock::time_point now) const {
        auto it = miner_shares.find(address);
        if (it == miner_shares.end()) {
            return 0.0;
        }

        std::vector<ShareSample> recent;
        for (const auto& sample : it->second) {
            if (now - sample.timestamp <= HASHRATE_WINDOW) {
                recent.push_back(sample);
            }
        }
        if (recent.size() < 2) {
            return 0.0;
        }

        double total_interval = 0.0;
        double total_difficulty = 0.0;
        for (std::size_t i = 1; i < recent.size(); ++i) {
            total_interval += std::chrono::duration<double>(recent[i].timestamp - recent[i - 1].timestamp).count();
            total_difficulty += recent[i].difficulty;
        }

        const double count = static_cast<double>(recent.size() - 1);
        const double mean_interval = std::max(total_interval / count, MIN_SHARE_INTERVAL);
        const double mean_difficulty = total_difficulty / count;
        return HASHES_PER_DIFFICULTY * mean_difficulty / mean_interval;
    }
};

DifficultyController::DifficultyController(const DifficultyConfig& config)
    : impl_(std::make_unique<Impl>(config))
{
}

DifficultyController::~DifficultyController() = default;

double DifficultyController::current() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->current;
}

void DifficultyController::set_difficulty(double difficulty) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->current = std::clamp(difficulty, impl_->config.min, impl_->config.max);
    impl_->last_update = Clock::now();
}

void DifficultyController::record_share(const std::string& miner_address, double difficulty,
                                        Clock::time_point now) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    impl_->pool_shares.push_back(now);
    impl_->prune_locked(now);
    ++impl_->total_shares;

    auto& samples = impl_->miner_shares[miner_address];
    samples.push_back(ShareSample{now, difficulty});
    while (samples.size() > constants::MINER_SHARE_HISTORY) {
        samples.pop_front();
    }
}

double DifficultyController::recompute(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->recompute_locked(now);
}

DifficultyAdjustment DifficultyController::apply(Clock::time_point now) {
    DifficultyAdjustment adjustment;
    DifficultyChangedCallback callback;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);

        adjustment.old_difficulty = impl_->current;
        adjustment.new_difficulty = impl_->recompute_locked(now);

        const double change = std::abs(adjustment.new_difficulty - adjustment.old_difficulty)
                            / adjustment.old_difficulty;
        if (change < constants::DIFFICULTY_MIN_CHANGE) {
            adjustment.new_difficulty = adjustment.old_difficulty;
            adjustment.reason = "Change too small";
            return adjustment;
        }

        impl_->current = adjustment.new_difficulty;
        impl_->last_update = now;
        adjustment.changed = true;
        adjustment.reason = "Difficulty updated";
        callback = impl_->change_callback;
    }

    log::info("Difficulty", std::format("Сложность изменена: {:.6g} -> {:.6g}",
                                        adjustment.old_difficulty, adjustment.new_difficulty));
    if (callback) {
        callback(adjustment.old_difficulty, adjustment.new_difficulty);
    }
    return adjustment;
}

std::size_t DifficultyController::shares_last_hour(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->count_last_hour_locked(now);
}

double DifficultyController::miner_hashrate(const std::string& miner_address,
                                            Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->miner_hashrate_locked(miner_address, now);
}

double DifficultyController::pool_hashrate(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    double total = 0.0;
    for (const auto& [address, _] : impl_->miner_shares) {
        total += impl_->miner_hashrate_locked(address, now);
    }
    return total;
}

std::size_t DifficultyController::cleanup_old_data(std::chrono::hours max_age,
                                                   Clock::time_point now) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    std::size_t removed = 0;
    while (!impl_->pool_shares.empty() && now - impl_->pool_shares.front() > max_age) {
        impl_->pool_shares.pop_front();
        ++removed;
    }

    for (auto it = impl_->miner_shares.begin(); it != impl_->miner_shares.end();) {
        auto& samples = it->second;
        while (!samples.empty() && now - samples.front().timestamp > max_age) {
            samples.pop_front();
        }
        if (samples.empty()) {
            it = impl_->miner_shares.erase(it);
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        log::debug("Difficulty", std::format("Очищено записей shares: {}", removed));
    }
    return removed;
}

DifficultyStats DifficultyController::stats(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    DifficultyStats stats;
    stats.current_difficulty = impl_->current;
    stats.total_shares = impl_->total_shares;
    stats.shares_last_hour = impl_->count_last_hour_locked(now);
    stats.active_miners = impl_->miner_shares.size();
    stats.target_shares_per_minute = impl_->config.target_shares_per_minute;
    stats.min_difficulty = impl_->config.min;
    stats.max_difficulty = impl_->config.max;
    stats.enable_dynamic = impl_->config.enable_dynamic;
    stats.last_update = impl_->last_update;
    return stats;
}

void DifficultyController::set_change_callback(DifficultyChangedCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->change_callback = std::move(callback);
}

} // namespace bchpool::mining
