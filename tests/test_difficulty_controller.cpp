/**
 * @file test_difficulty_controller.cpp
 * @brief Тесты динамической сложности
 */

#include <gtest/gtest.h>

#include "mining/difficulty_controller.hpp"

#include <cmath>

namespace bchpool::tests {

using namespace mining;
using namespace std::chrono_literals;
using Clock = std::chrono::system_clock;

class DifficultyControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.initial = 1.0;
        config_.min = 0.001;
        config_.max = 1000.0;
        config_.target_shares_per_minute = 60.0;
        config_.min_samples = 10;
        config_.enable_dynamic = true;
    }

    /// Записать count shares равномерно за последние 50 минут до now
    static void record(DifficultyController& controller, std::size_t count, Clock::time_point now,
                       const std::string& address = "miner") {
        const auto span = std::chrono::duration_cast<Clock::duration>(50min);
        for (std::size_t i = 0; i < count; ++i) {
            auto offset = span * static_cast<long>(count - i) / static_cast<long>(count);
            controller.record_share(address, 1.0, now - offset);
        }
    }

    DifficultyConfig config_;
    const Clock::time_point now_ = Clock::time_point(std::chrono::seconds(1'700'000'000));
};

TEST_F(DifficultyControllerTest, InitialClampedToRange) {
    config_.initial = 5000.0;
    DifficultyController controller(config_);
    EXPECT_DOUBLE_EQ(controller.current(), 1000.0);

    controller.set_difficulty(0.0);
    EXPECT_DOUBLE_EQ(controller.current(), 0.001);
}

TEST_F(DifficultyControllerTest, NotEnoughSamplesKeepsDifficulty) {
    DifficultyController controller(config_);
    record(controller, 9, now_);
    EXPECT_DOUBLE_EQ(controller.recompute(now_), 1.0);
    EXPECT_FALSE(controller.apply(now_).changed);
}

TEST_F(DifficultyControllerTest, DynamicDisabledKeepsDifficulty) {
    config_.enable_dynamic = false;
    DifficultyController controller(config_);
    record(controller, 20000, now_);
    EXPECT_DOUBLE_EQ(controller.recompute(now_), 1.0);
}

/**
 * @brief Вчетверо больше shares, чем нужно: сложность растёт в sqrt(4) = 2 раза
 */
TEST_F(DifficultyControllerTest, SquareRootOfRatio) {
    DifficultyController controller(config_);
    record(controller, 14400, now_);
    EXPECT_EQ(controller.shares_last_hour(now_), 14400u);
    EXPECT_NEAR(controller.recompute(now_), 2.0, 1e-9);
}

TEST_F(DifficultyControllerTest, StepClampedToFourTimes) {
    DifficultyController controller(config_);
    record(controller, 3600 * 64, now_);
    EXPECT_NEAR(controller.recompute(now_), 4.0, 1e-9);

    DifficultyController slow(config_);
    slow.set_difficulty(100.0);
    record(slow, 10, now_);
    EXPECT_NEAR(slow.recompute(now_), 25.0, 1e-9);
}

TEST_F(DifficultyControllerTest, ResultStaysWithinBounds) {
    config_.initial = 300.0;
    DifficultyController high(config_);
    record(high, 3600 * 16, now_);
    EXPECT_DOUBLE_EQ(high.recompute(now_), 1000.0);

    config_.initial = 0.002;
    DifficultyController low(config_);
    record(low, 10, now_);
    EXPECT_DOUBLE_EQ(low.recompute(now_), 0.001);
}

/**
 * @brief Изменение меньше 1% не применяется
 */
TEST_F(DifficultyControllerTest, SmallChangeIgnored) {
    DifficultyController controller(config_);
    record(controller, 3660, now_);

    auto adjustment = controller.apply(now_);
    EXPECT_FALSE(adjustment.changed);
    EXPECT_DOUBLE_EQ(adjustment.new_difficulty, 1.0);
    EXPECT_DOUBLE_EQ(controller.current(), 1.0);
}

TEST_F(DifficultyControllerTest, ApplyNotifiesCallback) {
    DifficultyController controller(config_);
    double notified_old = 0.0;
    double notified_new = 0.0;
    controller.set_change_callback([&](double old_difficulty, double new_difficulty) {
        notified_old = old_difficulty;
        notified_new = new_difficulty;
    });

    record(controller, 3700, now_);
    auto adjustment = controller.apply(now_);
    ASSERT_TRUE(adjustment.changed);
    EXPECT_NEAR(adjustment.new_difficulty, std::sqrt(3700.0 / 3600.0), 1e-9);
    EXPECT_DOUBLE_EQ(notified_old, 1.0);
    EXPECT_DOUBLE_EQ(notified_new, adjustment.new_difficulty);
    EXPECT_DOUBLE_EQ(controller.current(), adjustment.new_difficulty);
}

TEST_F(DifficultyControllerTest, OldSharesLeaveHourWindow) {
    DifficultyController controller(config_);
    record(controller, 100, now_ - 2h);
    EXPECT_EQ(controller.shares_last_hour(now_), 0u);
    EXPECT_EQ(controller.stats(now_).total_shares, 100u);
}

TEST_F(DifficultyControllerTest, MinerHashrate) {
    DifficultyController controller(config_);
    controller.record_share("a", 1.0, now_ - 20s);
    controller.record_share("a", 1.0, now_ - 10s);
    controller.record_share("a", 1.0, now_);

    EXPECT_NEAR(controller.miner_hashrate("a", now_), 4294967296.0 / 10.0, 1.0);
    EXPECT_DOUBLE_EQ(controller.miner_hashrate("unknown", now_), 0.0);

    controller.record_share("b", 2.0, now_ - 5s);
    controller.record_share("b", 2.0, now_);
    EXPECT_NEAR(controller.pool_hashrate(now_),
                4294967296.0 / 10.0 + 2.0 * 4294967296.0 / 5.0, 1.0);
}

TEST_F(DifficultyControllerTest, HashrateIntervalHasFloor) {
    DifficultyController controller(config_);
    controller.record_share("a", 1.0, now_);
    controller.record_share("a", 1.0, now_);
    EXPECT_NEAR(controller.miner_hashrate("a", now_), 4294967296.0 / 0.1, 1.0);
}

TEST_F(DifficultyControllerTest, CleanupOldData) {
    DifficultyController controller(config_);
    controller.record_share("old", 1.0, now_ - 30h);

    EXPECT_EQ(controller.cleanup_old_data(24h, now_), 1u);
    EXPECT_EQ(controller.stats(now_).active_miners, 0u);

    controller.record_share("new", 1.0, now_);
    EXPECT_EQ(controller.cleanup_old_data(24h, now_), 0u);
    EXPECT_EQ(controller.stats(now_).active_miners, 1u);
}

} // namespace bchpool::tests
