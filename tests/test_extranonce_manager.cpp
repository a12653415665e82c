/**
 * @file test_extranonce_manager.cpp
 * @brief Тесты выдачи extra_nonce1
 */

#include <gtest/gtest.h>

#include "mining/extranonce_manager.hpp"
#include "core/hex.hpp"

#include <set>
#include <thread>

namespace bchpool::tests {

using mining::ExtranonceManager;

class ExtranonceManagerTest : public ::testing::Test {};

TEST_F(ExtranonceManagerTest, FormatIsSaltThenCounter) {
    ExtranonceManager manager(0x0123456789abcdefULL, 5);
    EXPECT_EQ(manager.assign(1), "0123456789abcdef0000000000000005");
    EXPECT_EQ(manager.assign(2), "0123456789abcdef0000000000000006");
    EXPECT_EQ(manager.peek_next_counter(), 7u);
}

TEST_F(ExtranonceManagerTest, RandomSaltProducesHex) {
    ExtranonceManager manager;
    auto value = manager.assign(1);
    EXPECT_TRUE(is_hex(value, 32)) << value;
    EXPECT_EQ(manager.get(1), value);
}

/**
 * @brief Освобождённое значение не выдаётся повторно
 */
TEST_F(ExtranonceManagerTest, ReleasedValueNotReused) {
    ExtranonceManager manager(0, 1);
    auto first = manager.assign(10);
    manager.release(10);
    EXPECT_FALSE(manager.has(10));
    EXPECT_EQ(manager.get(10), std::nullopt);

    auto second = manager.assign(10);
    EXPECT_NE(first, second);
    EXPECT_TRUE(manager.has(10));
}

TEST_F(ExtranonceManagerTest, TracksActiveSessions) {
    ExtranonceManager manager(0, 1);
    (void)manager.assign(1);
    (void)manager.assign(2);
    (void)manager.assign(3);
    manager.release(2);

    EXPECT_EQ(manager.active_count(), 2u);
    auto sessions = manager.active_sessions();
    std::set<uint64_t> ids(sessions.begin(), sessions.end());
    EXPECT_EQ(ids, (std::set<uint64_t>{1, 3}));

    // Освобождение неизвестной сессии безопасно
    manager.release(42);
    EXPECT_EQ(manager.active_count(), 2u);
}

TEST_F(ExtranonceManagerTest, UniqueAcrossThreads) {
    ExtranonceManager manager;
    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 250;

    std::vector<std::vector<std::string>> produced(THREADS);
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < PER_THREAD; ++i) {
                produced[t].push_back(manager.assign(static_cast<uint64_t>(t * PER_THREAD + i)));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<std::string> unique;
    for (const auto& values : produced) {
        unique.insert(values.begin(), values.end());
    }
    EXPECT_EQ(unique.size(), static_cast<std::size_t>(THREADS * PER_THREAD));
    EXPECT_EQ(manager.active_count(), static_cast<std::size_t>(THREADS * PER_THREAD));
}

} // namespace bchpool::tests
