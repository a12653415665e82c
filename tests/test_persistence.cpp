/**
 * @file test_persistence.cpp
 * @brief Тесты in-memory хранилища
 */

#include <gtest/gtest.h>

#include "mining/persistence.hpp"

namespace bchpool::tests {

using namespace mining;

namespace {

ShareRecord make_share(const std::string& job_id, const std::string& address = "addr") {
    ShareRecord share;
    share.miner_address = address;
    share.worker = "rig";
    share.job_id = job_id;
    share.extra_nonce2 = "00000000";
    share.ntime = "6553f100";
    share.nonce = "00000001";
    share.difficulty = 1.0;
    share.accepted = true;
    share.created_at = std::chrono::system_clock::now();
    return share;
}

} // namespace

class PersistenceTest : public ::testing::Test {
protected:
    MemoryPersistence storage_{3};
};

TEST_F(PersistenceTest, RegisterMinerOnce) {
    auto first = storage_.register_miner("addr", "rig1");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->worker, "rig1");
    EXPECT_TRUE(first->is_active);

    // Повторная регистрация обновляет воркера, время регистрации сохраняется
    auto second = storage_.register_miner("addr", "rig2");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->worker, "rig2");
    EXPECT_EQ(second->registered_at, first->registered_at);
    EXPECT_EQ(storage_.miner_count(), 1u);
}

TEST_F(PersistenceTest, RegisterEmptyAddressFails) {
    auto miner = storage_.register_miner("", "rig");
    ASSERT_FALSE(miner.has_value());
    EXPECT_EQ(miner.error().code, ErrorCode::PersistenceFailure);
}

TEST_F(PersistenceTest, GetMinerByAddress) {
    auto missing = storage_.get_miner_by_address("addr");
    ASSERT_TRUE(missing.has_value());
    EXPECT_FALSE(missing->has_value());

    ASSERT_TRUE(storage_.register_miner("addr", "rig").has_value());
    auto found = storage_.get_miner_by_address("addr");
    ASSERT_TRUE(found.has_value());
    ASSERT_TRUE(found->has_value());
    EXPECT_EQ((*found)->address, "addr");
}

TEST_F(PersistenceTest, SetMinerActive) {
    EXPECT_FALSE(storage_.set_miner_active("addr", false));
    ASSERT_TRUE(storage_.register_miner("addr", "rig").has_value());
    EXPECT_TRUE(storage_.set_miner_active("addr", false));

    auto miner = storage_.get_miner_by_address("addr");
    ASSERT_TRUE(miner.has_value() && miner->has_value());
    EXPECT_FALSE((*miner)->is_active);
}

TEST_F(PersistenceTest, SharesBoundedOldestDropped) {
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(storage_.save_share(make_share("job_" + std::to_string(i))).has_value());
    }

    auto shares = storage_.shares();
    ASSERT_EQ(shares.size(), 3u);
    EXPECT_EQ(shares.front().job_id, "job_2");
    EXPECT_EQ(shares.back().job_id, "job_4");
}

TEST_F(PersistenceTest, SaveShareUpdatesLastSeen) {
    ASSERT_TRUE(storage_.register_miner("addr", "rig").has_value());
    auto share = make_share("job_1");
    share.created_at += std::chrono::hours(1);
    ASSERT_TRUE(storage_.save_share(share).has_value());

    auto miner = storage_.get_miner_by_address("addr");
    ASSERT_TRUE(miner.has_value() && miner->has_value());
    EXPECT_EQ((*miner)->last_seen, share.created_at);
}

TEST_F(PersistenceTest, SaveBlock) {
    const std::string hash(64, 'a');
    ASSERT_TRUE(storage_.save_block(101, hash, "addr").has_value());

    auto blocks = storage_.blocks();
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].height, 101u);
    EXPECT_EQ(blocks[0].hash, hash);
    EXPECT_EQ(blocks[0].miner_address, "addr");

    EXPECT_FALSE(storage_.save_block(102, "abcd", "addr").has_value());
}

} // namespace bchpool::tests
