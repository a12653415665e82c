/**
 * @file share_validator.cpp
 * @brief Реализация валидатора shares
 */

#include "share_validator.hpp"
#include "../bitcoin/target.hpp"
#include "../core/hex.hpp"
#include "../crypto/sha256.hpp"
#include "../log/logger.hpp"

#include <atomic>
#include <deque>
#include <exception>
#include <format>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace bchpool::mining {

std::string ValidationResult::message(const std::string& job_id) const {
    switch (reason) {
        case RejectReason::JobNotFound:    return std::format("Job {} not found", job_id);
        case RejectReason::InvalidFormat:  return std::format("Invalid {}", detail);
        case RejectReason::StaleTime:      return "ntime out of range";
        case RejectReason::DuplicateNonce: return "Duplicate share";
        case RejectReason::BelowTarget:    return "Low difficulty share";
        case RejectReason::InternalError:  return detail.empty() ? "Internal error" : detail;
    }
    return "Unknown error";
}

namespace {

/**
 * @brief Учёт nonce одного задания с вытеснением самых старых
 */
struct NonceLedger {
    std::unordered_set<uint32_t> seen;
    std::deque<uint32_t> order;

    /// @return false если nonce уже был
    bool insert(uint32_t nonce, std::size_t capacity) {
        if (!seen.insert(nonce).second) {
            return false;
        }
        order.push_back(nonce);
        while (order.size() > capacity) {
            seen.erase(order.front());
            order.pop_front();
        }
        return true;
    }
};

} // namespace

struct ShareValidator::Impl {
    JobRegistry& registry;
    const bitcoin::BlockAssembler& assembler;
    ValidatorConfig config;

    mutable std::mutex nonce_mutex;
    std::unordered_map<std::string, NonceLedger> nonces;

    std::atomic<uint64_t> accepted_count{0};
    std::atomic<uint64_t> rejected_count{0};
    std::atomic<uint64_t> blocks_count{0};
    std::array<std::atomic<uint64_t>, REJECT_REASON_COUNT> rejected_by_reason{};

    Impl(JobRegistry& r, const bitcoin::BlockAssembler& a, ValidatorConfig cfg)
        : registry(r), assembler(a), config(cfg) {}

    bool record_nonce(const std::string& job_id, uint32_t nonce) {
        std::lock_guard<std::mutex> lock(nonce_mutex);
        return nonces[job_id].insert(nonce, config.nonces_per_job);
    }

    ValidationResult rejected(RejectReason reason, std::string detail = "") {
        rejected_count.fetch_add(1, std::memory_order_relaxed);
        rejected_by_reason[static_cast<std::size_t>(reason)].fetch_add(1, std::memory_order_relaxed);
        return ValidationResult::reject(reason, std::move(detail));
    }

    ValidationResult check(const ShareSubmission& share,
                           std::chrono::system_clock::time_point now) {
        // 1. Задание
        JobPtr job = registry.get_job(share.job_id);
        if (!job) {
            return rejected(RejectReason::JobNotFound);
        }

        // 2. Формат полей
        if (!is_hex(share.extra_nonce2, config.extranonce2_size * 2)) {
            return rejected(RejectReason::InvalidFormat, "extranonce2");
        }
        if (!is_hex(share.ntime, 8)) {
            return rejected(RejectReason::InvalidFormat, "ntime");
        }
        if (!is_hex(share.nonce, 8)) {
            return rejected(RejectReason::InvalidFormat, "nonce");
        }

        auto ntime = parse_hex_u32(share.ntime);
        auto nonce = parse_hex_u32(share.nonce);
        if (!ntime || !nonce) {
            return rejected(RejectReason::InvalidFormat, !ntime ? "ntime" : "nonce");
        }

        // 3. Время
        const int64_t now_seconds = std::chrono::duration_cast<std::chrono::seconds>(
            now.time_since_epoch()).count();
        const int64_t drift = static_cast<int64_t>(*ntime) - now_seconds;
        if (drift > config.max_ntime_drift || drift < -config.max_ntime_drift) {
            return rejected(RejectReason::StaleTime);
        }

        // 4. Уникальность nonce, атомарно относительно других submit того же задания
        if (!record_nonce(share.job_id, *nonce)) {
            return rejected(RejectReason::DuplicateNonce);
        }

        // 5. Пересчёт хеша
        const std::string& extra_nonce1 = share.extra_nonce1.empty() ? job->extra_nonce1 : share.extra_nonce1;
        if (extra_nonce1.empty()) {
            return rejected(RejectReason::InternalError, "extra_nonce1 unknown");
        }
        if (!job->block_template) {
            return rejected(RejectReason::InternalError, "job has no template");
        }

        auto coinbase = from_hex(job->stratum.coinb1 + extra_nonce1 + share.extra_nonce2 + job->stratum.coinb2);
        if (!coinbase) {
            return rejected(RejectReason::InternalError, coinbase.error().message);
        }

        const Hash256 txid = crypto::sha256d(*coinbase);
        const Hash256 root = assembler.merkle_root(*job->block_template, txid);

        auto solution = assembler.validate_solution(*job->block_template, root, *ntime, *nonce, share.difficulty);
        if (!solution) {
            return rejected(RejectReason::InternalError, solution.error().message);
        }

        // 6. Сложность
        if (!solution->accepted) {
            return rejected(RejectReason::BelowTarget);
        }

        ValidationResult result;
        result.accepted = true;
        result.job = std::move(job);
        result.hash = solution->hash;
        result.header = solution->header;
        result.coinbase = std::move(*coinbase);
        result.share_difficulty = bitcoin::difficulty_from_hash(solution->hash);
        result.is_block = assembler.meets_network_target(*result.job->block_template, solution->hash);

        accepted_count.fetch_add(1, std::memory_order_relaxed);
        if (result.is_block) {
            blocks_count.fetch_add(1, std::memory_order_relaxed);
        }
        return result;
    }
};

ShareValidator::ShareValidator(JobRegistry& registry,
                               const bitcoin::BlockAssembler& assembler,
                               ValidatorConfig config)
    : impl_(std::make_unique<Impl>(registry, assembler, config))
{
    registry.set_job_removed_callback([this](const std::string& job_id) {
        remove_job(job_id);
    });
}

ShareValidator::~ShareValidator() {
    impl_->registry.set_job_removed_callback(nullptr);
}

ValidationResult ShareValidator::validate(const ShareSubmission& share,
                                          std::chrono::system_clock::time_point now) {
    try {
        auto result = impl_->check(share, now);
        if (!result.accepted) {
            log::debug("ShareValidator", std::format("Share {} от {} отклонён: {} {}",
                                                     share.job_id, share.miner_address,
                                                     to_string(result.reason), result.detail));
        }
        return result;
    } catch (const std::exception& e) {
        log::error("ShareValidator", std::format("Ошибка проверки share {}: {}", share.job_id, e.what()));
        return impl_->rejected(RejectReason::InternalError, e.what());
    }
}

void ShareValidator::remove_job(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(impl_->nonce_mutex);
    impl_->nonces.erase(job_id);
}

std::size_t ShareValidator::cleanup_nonce_cache() {
    std::vector<std::string> tracked;
    {
        std::lock_guard<std::mutex> lock(impl_->nonce_mutex);
        tracked.reserve(impl_->nonces.size());
        for (const auto& [id, _] : impl_->nonces) {
            tracked.push_back(id);
        }
    }

    std::size_t removed = 0;
    for (const auto& id : tracked) {
        if (!impl_->registry.get_job(id)) {
            std::lock_guard<std::mutex> lock(impl_->nonce_mutex);
            removed += impl_->nonces.erase(id);
        }
    }
    return removed;
}

std::size_t ShareValidator::tracked_nonces(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(impl_->nonce_mutex);
    auto it = impl_->nonces.find(job_id);
    return it != impl_->nonces.end() ? it->second.order.size() : 0;
}

ValidatorStats ShareValidator::stats() const {
    ValidatorStats stats;
    stats.accepted = impl_->accepted_count.load(std::memory_order_relaxed);
    stats.rejected = impl_->rejected_count.load(std::memory_order_relaxed);
    stats.blocks = impl_->blocks_count.load(std::memory_order_relaxed);
    for (std::size_t i = 0; i < REJECT_REASON_COUNT; ++i) {
        stats.rejected_by_reason[i] = impl_->rejected_by_reason[i].load(std::memory_order_relaxed);
    }
    std::lock_guard<std::mutex> lock(impl_->nonce_mutex);
    stats.tracked_jobs = impl_->nonces.size();
    return stats;
}

void ShareValidator::reset_stats() {
    impl_->accepted_count.store(0, std::memory_order_relaxed);
    impl_->rejected_count.store(0, std::memory_order_relaxed);
    impl_->blocks_count.store(0, std::memory_order_relaxed);
    for (auto& counter : impl_->rejected_by_reason) {
        counter.store(0, std::memory_order_relaxed);
    }
}

} // namespace bchpool::mining
