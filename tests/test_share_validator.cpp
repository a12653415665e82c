/**
 * @file test_share_validator.cpp
 * @brief Тесты валидатора shares
 */

#include <gtest/gtest.h>

#include "mining/share_validator.hpp"
#include "bitcoin/target.hpp"
#include "core/hex.hpp"
#include "crypto/sha256.hpp"

#include <atomic>
#include <format>
#include <thread>

namespace bchpool::tests {

using namespace mining;
using namespace std::chrono_literals;

namespace {

constexpr const char* POOL_ADDRESS = "bchtest:qpm2qsznhks23z7629mms6s4cwef74vcwvqcw003ap";
constexpr const char* MINER = "bchtest:qqjr7yu573z4faxw8ltgvjwpntwys08fysk07zmvce";
constexpr const char* EN1 = "000102030405060708090a0b0c0d0e0f";

const auto NOW = std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000));

} // namespace

class ShareValidatorTest : public ::testing::Test {
protected:
    ShareValidatorTest()
        : assembler_(bitcoin::AssemblerConfig{})
        , registry_(assembler_, RegistryConfig{POOL_ADDRESS, 300s, 100, FallbackConfig{}})
        , validator_(registry_, assembler_, ValidatorConfig{4, 7200, 1000})
    {
    }

    void SetUp() override {
        auto tmpl = std::make_shared<bitcoin::BlockTemplate>();
        tmpl->height = 200;
        tmpl->prev_hash.fill(0x11);
        tmpl->bits = 0x207fffff;
        tmpl->curtime = 1'700'000'000;
        tmpl->version = 0x20000000;
        tmpl->coinbase_value = 5'000'000'000;
        ASSERT_TRUE(registry_.update_template(tmpl).has_value());

        auto job = registry_.create_job_for_miner(MINER, EN1);
        ASSERT_TRUE(job.has_value());
        job_ = *job;
    }

    /// Share, проходящий все проверки формата и времени
    ShareSubmission share(std::string nonce = "00000001", double difficulty = 0.0) const {
        ShareSubmission s;
        s.job_id = job_->job_id;
        s.extra_nonce2 = "00000000";
        s.ntime = "6553f100";
        s.nonce = std::move(nonce);
        s.miner_address = MINER;
        s.extra_nonce1 = EN1;
        s.difficulty = difficulty;
        return s;
    }

    bitcoin::BlockAssembler assembler_;
    JobRegistry registry_;
    ShareValidator validator_;
    JobPtr job_;
};

TEST_F(ShareValidatorTest, AcceptsValidShare) {
    auto result = validator_.validate(share(), NOW);
    ASSERT_TRUE(result.accepted) << to_string(result.reason) << " " << result.detail;

    EXPECT_EQ(result.job, job_);
    EXPECT_EQ(result.hash, crypto::sha256d(result.header));
    EXPECT_GT(result.share_difficulty, 0.0);
    EXPECT_EQ(result.is_block, bitcoin::meets_bits(result.hash, 0x207fffff));

    // Coinbase собран из частей задания
    auto expected = from_hex(job_->stratum.coinb1 + EN1 + "00000000" + job_->stratum.coinb2);
    ASSERT_TRUE(expected.has_value());
    EXPECT_EQ(result.coinbase, *expected);

    EXPECT_EQ(validator_.stats().accepted, 1u);
}

/**
 * @brief Пересчитанный заголовок совпадает с ручной сборкой
 */
TEST_F(ShareValidatorTest, HeaderMatchesManualAssembly) {
    auto result = validator_.validate(share("0000abcd"), NOW);
    ASSERT_TRUE(result.accepted);

    const Hash256 txid = crypto::sha256d(result.coinbase);
    const Hash256 root = assembler_.merkle_root(*job_->block_template, txid);
    auto header = assembler_.build_header(*job_->block_template, root, 1'700'000'000, 0xabcd);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(result.header, *header);
}

TEST_F(ShareValidatorTest, EmptyExtranonce1UsesJob) {
    auto s = share();
    s.extra_nonce1.clear();
    EXPECT_TRUE(validator_.validate(s, NOW).accepted);
}

TEST_F(ShareValidatorTest, UnknownJobRejected) {
    auto s = share();
    s.job_id = "job_0_00000000_missing";
    auto result = validator_.validate(s, NOW);
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.reason, RejectReason::JobNotFound);
    EXPECT_EQ(result.message(s.job_id), "Job job_0_00000000_missing not found");
}

TEST_F(ShareValidatorTest, InvalidFieldFormats) {
    auto s = share();
    s.extra_nonce2 = "000000";
    auto result = validator_.validate(s, NOW);
    EXPECT_EQ(result.reason, RejectReason::InvalidFormat);
    EXPECT_EQ(result.detail, "extranonce2");

    s = share();
    s.ntime = "6553f1zz";
    result = validator_.validate(s, NOW);
    EXPECT_EQ(result.reason, RejectReason::InvalidFormat);
    EXPECT_EQ(result.detail, "ntime");

    s = share();
    s.nonce = "123";
    result = validator_.validate(s, NOW);
    EXPECT_EQ(result.reason, RejectReason::InvalidFormat);
    EXPECT_EQ(result.message(s.job_id), "Invalid nonce");
}

/**
 * @brief Граница допустимого отклонения ntime: ровно 7200 секунд
 */
TEST_F(ShareValidatorTest, NtimeDriftBoundary) {
    auto s = share("00000010");
    s.ntime = "6553d4e0";  // now - 7200
    EXPECT_TRUE(validator_.validate(s, NOW).accepted);

    s = share("00000011");
    s.ntime = "6553d4df";  // now - 7201
    auto result = validator_.validate(s, NOW);
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.reason, RejectReason::StaleTime);

    s = share("00000012");
    s.ntime = "65540d20";  // now + 7200
    EXPECT_TRUE(validator_.validate(s, NOW).accepted);

    s = share("00000013");
    s.ntime = "65540d21";  // now + 7201
    EXPECT_EQ(validator_.validate(s, NOW).reason, RejectReason::StaleTime);
}

TEST_F(ShareValidatorTest, DuplicateNonceRejected) {
    EXPECT_TRUE(validator_.validate(share("00000042"), NOW).accepted);

    auto result = validator_.validate(share("00000042"), NOW);
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.reason, RejectReason::DuplicateNonce);
    EXPECT_EQ(result.message(job_->job_id), "Duplicate share");

    // Другой nonce того же задания принимается
    EXPECT_TRUE(validator_.validate(share("00000043"), NOW).accepted);
    EXPECT_EQ(validator_.tracked_nonces(job_->job_id), 2u);
}

/**
 * @brief Отклонённый по формату share не занимает nonce
 */
TEST_F(ShareValidatorTest, RejectedBeforeNonceCheckDoesNotRecord) {
    auto s = share("00000050");
    s.ntime = "00000000";
    EXPECT_EQ(validator_.validate(s, NOW).reason, RejectReason::StaleTime);
    EXPECT_TRUE(validator_.validate(share("00000050"), NOW).accepted);
}

TEST_F(ShareValidatorTest, BelowTargetRejected) {
    auto result = validator_.validate(share("00000001", 1e15), NOW);
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.reason, RejectReason::BelowTarget);
    EXPECT_EQ(result.message(job_->job_id), "Low difficulty share");

    auto stats = validator_.stats();
    EXPECT_EQ(stats.rejected, 1u);
    EXPECT_EQ(stats.rejected_by_reason[static_cast<std::size_t>(RejectReason::BelowTarget)], 1u);
}

TEST_F(ShareValidatorTest, RemovedJobForgetsNonces) {
    EXPECT_TRUE(validator_.validate(share("00000001"), NOW).accepted);
    EXPECT_EQ(validator_.stats().tracked_jobs, 1u);

    EXPECT_TRUE(registry_.remove_job(job_->job_id));
    EXPECT_EQ(validator_.tracked_nonces(job_->job_id), 0u);
    EXPECT_EQ(validator_.validate(share("00000001"), NOW).reason, RejectReason::JobNotFound);
}

TEST_F(ShareValidatorTest, CleanupNonceCache) {
    EXPECT_TRUE(validator_.validate(share("00000001"), NOW).accepted);
    EXPECT_EQ(validator_.cleanup_nonce_cache(), 0u);

    // Удаление в обход callback: запись остаётся до очистки
    registry_.set_job_removed_callback(nullptr);
    EXPECT_TRUE(registry_.remove_job(job_->job_id));
    EXPECT_EQ(validator_.tracked_nonces(job_->job_id), 1u);
    EXPECT_EQ(validator_.cleanup_nonce_cache(), 1u);
    EXPECT_EQ(validator_.tracked_nonces(job_->job_id), 0u);
}

TEST_F(ShareValidatorTest, NonceLedgerEvictsOldest) {
    ShareValidator small(registry_, assembler_, ValidatorConfig{4, 7200, 2});
    EXPECT_TRUE(small.validate(share("00000001"), NOW).accepted);
    EXPECT_TRUE(small.validate(share("00000002"), NOW).accepted);
    EXPECT_TRUE(small.validate(share("00000003"), NOW).accepted);
    EXPECT_EQ(small.tracked_nonces(job_->job_id), 2u);

    // Самый старый вытеснен и снова принимается
    EXPECT_TRUE(small.validate(share("00000001"), NOW).accepted);
    EXPECT_EQ(small.validate(share("00000003"), NOW).reason, RejectReason::DuplicateNonce);
}

/**
 * @brief Одновременная отправка одного nonce: ровно один принят
 */
TEST_F(ShareValidatorTest, ConcurrentDuplicateAcceptedOnce) {
    std::atomic<int> accepted{0};
    std::atomic<int> duplicates{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            auto result = validator_.validate(share("0000beef"), NOW);
            if (result.accepted) {
                ++accepted;
            } else if (result.reason == RejectReason::DuplicateNonce) {
                ++duplicates;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(accepted.load(), 1);
    EXPECT_EQ(duplicates.load(), 7);
}

TEST_F(ShareValidatorTest, ResetStats) {
    EXPECT_TRUE(validator_.validate(share("00000001"), NOW).accepted);
    validator_.reset_stats();
    auto stats = validator_.stats();
    EXPECT_EQ(stats.accepted, 0u);
    EXPECT_EQ(stats.rejected, 0u);
}

} // namespace bchpool::tests
