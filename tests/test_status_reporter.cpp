/**
 * @file test_status_reporter.cpp
 * @brief Тесты сводки состояния и истории событий
 */

#include <gtest/gtest.h>

#include "log/status_reporter.hpp"

namespace bchpool::tests {

using namespace log;

class StatusReporterTest : public ::testing::Test {
protected:
    LoggingConfig make_config(uint32_t history, uint32_t interval = 0) {
        LoggingConfig config;
        config.event_history = history;
        config.status_interval = interval;
        config.color = false;
        return config;
    }
};

TEST_F(StatusReporterTest, EventHistoryBounded) {
    StatusReporter reporter(make_config(3));
    for (int i = 0; i < 5; ++i) {
        reporter.log_event(EventType::JOB_BROADCAST, "job " + std::to_string(i));
    }

    auto events = reporter.recent_events(10);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events.front().message, "job 2");
    EXPECT_EQ(events.back().message, "job 4");

    auto last = reporter.recent_events(1);
    ASSERT_EQ(last.size(), 1u);
    EXPECT_EQ(last[0].message, "job 4");
}

TEST_F(StatusReporterTest, TypedEventHelpers) {
    StatusReporter reporter(make_config(50));

    reporter.log_new_template(101, 3);
    reporter.log_share(true, "addr", "diff 1");
    reporter.log_share(false, "addr", "Duplicate share");
    reporter.log_block(true, 101, "addr");
    reporter.log_block(false, 102, "addr", "bad-txns");
    reporter.log_node_error("connection refused");

    auto events = reporter.recent_events(50);
    ASSERT_EQ(events.size(), 6u);

    EXPECT_EQ(events[0].type, EventType::NEW_TEMPLATE);
    EXPECT_EQ(events[0].message, "New template at height 101 (3 txs)");

    EXPECT_EQ(events[1].type, EventType::SHARE_OK);
    EXPECT_EQ(events[1].miner, "addr");
    EXPECT_EQ(events[2].type, EventType::SHARE_REJECT);
    EXPECT_EQ(events[2].message, "Duplicate share");

    EXPECT_EQ(events[3].type, EventType::BLOCK_FOUND);
    EXPECT_EQ(events[3].message, "FOUND BLOCK at height 101");
    EXPECT_EQ(events[4].type, EventType::BLOCK_REJECTED);
    EXPECT_EQ(events[4].message, "Block at height 102 rejected: bad-txns");

    EXPECT_EQ(events[5].type, EventType::NODE_ERROR);
    EXPECT_TRUE(events[5].miner.empty());
}

TEST_F(StatusReporterTest, DifficultyEventMentionsMiner) {
    StatusReporter reporter(make_config(10));
    reporter.log_difficulty("addr", 1.0, 2.0);

    auto events = reporter.recent_events(1);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, EventType::DIFFICULTY);
    EXPECT_EQ(events[0].miner, "addr");
    EXPECT_NE(events[0].message.find("->"), std::string::npos);
}

/**
 * @brief Сводка без цветов содержит счётчики и события
 */
TEST_F(StatusReporterTest, RenderPlain) {
    StatusReporter reporter(make_config(10));

    PoolStats stats;
    stats.height = 820000;
    stats.node_connected = true;
    stats.fallback_template = false;
    stats.tcp_sessions = 4;
    stats.websocket_sessions = 1;
    stats.authorized_miners = 3;
    stats.shares_accepted = 120;
    stats.shares_rejected = 2;
    stats.blocks_found = 1;
    stats.active_jobs = 7;
    reporter.update_stats(stats);

    EXPECT_EQ(reporter.stats().shares_accepted, 120u);

    auto empty = reporter.render_plain();
    EXPECT_NE(empty.find("(no events)"), std::string::npos);

    reporter.log_event(EventType::MINER_CONNECT, "Miner connected", "session 1");
    auto text = reporter.render_plain();

    EXPECT_EQ(text.find('\033'), std::string::npos);
    EXPECT_NE(text.find("height 820000"), std::string::npos);
    EXPECT_NE(text.find("CONNECTED"), std::string::npos);
    EXPECT_NE(text.find("tcp 4, websocket 1, authorized 3"), std::string::npos);
    EXPECT_NE(text.find("accepted 120, rejected 2, jobs 7"), std::string::npos);
    EXPECT_NE(text.find("[CONNECT] Miner connected (session 1)"), std::string::npos);
    EXPECT_EQ(text.find("(no events)"), std::string::npos);
}

TEST_F(StatusReporterTest, RenderShowsFallbackAndDisconnect) {
    StatusReporter reporter(make_config(10));

    PoolStats stats;
    stats.node_connected = false;
    stats.fallback_template = true;
    reporter.update_stats(stats);

    auto text = reporter.render_plain();
    EXPECT_NE(text.find("DISCONNECTED"), std::string::npos);
    EXPECT_NE(text.find("(fallback template)"), std::string::npos);
}

TEST_F(StatusReporterTest, StartRequiresInterval) {
    StatusReporter disabled(make_config(10, 0));
    disabled.start();
    EXPECT_FALSE(disabled.is_running());

    StatusReporter enabled(make_config(10, 3600));
    enabled.start();
    EXPECT_TRUE(enabled.is_running());
    enabled.stop();
    EXPECT_FALSE(enabled.is_running());
}

} // namespace bchpool::tests
