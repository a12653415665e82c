/**
 * @file job_registry.cpp
 * @brief Реализация реестра заданий
 */

#include "job_registry.hpp"
#include "../core/hex.hpp"
#include "../log/logger.hpp"

#include <algorithm>
#include <atomic>
#include <deque>
#include <format>
#include <mutex>
#include <unordered_map>

namespace bchpool::mining {

namespace {

/// Счётчик job_id общий для всех реестров процесса
std::atomic<uint64_t> g_job_counter{0};

Bytes extranonce_bytes(const std::string& extra_nonce1) {
    if (!extra_nonce1.empty()) {
        if (auto bytes = from_hex(extra_nonce1)) {
            return std::move(*bytes);
        }
    }
    return Bytes(constants::EXTRANONCE1_SIZE, 0x00);
}

} // namespace

// =============================================================================
// Реализация
// =============================================================================

struct JobRegistry::Impl {
    const bitcoin::BlockAssembler& assembler;
    RegistryConfig config;

    mutable std::mutex mutex;

    std::unordered_map<std::string, JobPtr> jobs;

    /// Адрес -> job_id его personal заданий в порядке создания
    std::unordered_map<std::string, std::vector<std::string>> miner_jobs;

    JobPtr last_broadcast;
    bitcoin::BlockTemplatePtr current_template;
    bitcoin::BlockTemplate fallback_base;

    std::deque<JobHistoryRecord> history;

    JobRemovedCallback removed_callback;

    Impl(const bitcoin::BlockAssembler& a, RegistryConfig cfg)
        : assembler(a)
        , config(std::move(cfg))
    {
        fallback_base.height = 1;
        fallback_base.bits = config.fallback.bits;
        fallback_base.version = config.fallback.version;
        fallback_base.coinbase_value = config.fallback.coinbase_value;

        auto prev = from_hex(config.fallback.prev_block_hash);
        if (prev && prev->size() == fallback_base.prev_hash.size()) {
            std::copy(prev->begin(), prev->end(), fallback_base.prev_hash.begin());
        } else {
            log::warning("JobRegistry", "Некорректный prev_block_hash резервного шаблона, используется нулевой");
        }
    }

    bitcoin::BlockTemplatePtr make_fallback_template() const {
        auto tmpl = std::make_shared<bitcoin::BlockTemplate>(fallback_base);
        tmpl->curtime = static_cast<uint32_t>(
            std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count());
        return tmpl;
    }

    Result<JobPtr> build_job(bitcoin::BlockTemplatePtr tmpl,
                             const std::string& payout_address,
                             const std::string& extra_nonce1,
                             std::optional<std::string> owner,
                             bool clean_jobs,
                             bool is_fallback) const {
        auto stratum = assembler.create_stratum_job(*tmpl, payout_address, extranonce_bytes(extra_nonce1));
        if (!stratum) {
            return Forward<JobPtr>(stratum);
        }

        auto job = std::make_shared<Job>();
        job->job_id = create_job_id(owner);
        job->block_template = std::move(tmpl);
        job->payout_address = payout_address;
        job->stratum = std::move(*stratum);
        job->clean_jobs = clean_jobs;
        job->extra_nonce1 = extra_nonce1;
        job->owner = std::move(owner);
        job->created_at = std::chrono::system_clock::now();
        job->is_fallback = is_fallback;
        return JobPtr(std::move(job));
    }

    // Вызывается под mutex
    void insert_locked(JobPtr job) {
        if (job->owner) {
            miner_jobs[*job->owner].push_back(job->job_id);
        } else {
            last_broadcast = job;
        }

        history.push_back(JobHistoryRecord{
            job->job_id, job->owner, job->height(), job->created_at, job->is_fallback
        });
        while (history.size() > config.history_size) {
            history.pop_front();
        }

        const std::string id = job->job_id;
        jobs[id] = std::move(job);
    }

    // Вызывается под mutex
    bool erase_locked(const std::string& job_id) {
        auto it = jobs.find(job_id);
        if (it == jobs.end()) {
            return false;
        }

        const auto& job = it->second;
        if (job->owner) {
            auto owned = miner_jobs.find(*job->owner);
            if (owned != miner_jobs.end()) {
                std::erase(owned->second, job_id);
                if (owned->second.empty()) {
                    miner_jobs.erase(owned);
                }
            }
        }
        if (last_broadcast && last_broadcast->job_id == job_id) {
            last_broadcast.reset();
        }

        jobs.erase(it);
        return true;
    }

    void notify_removed(const std::vector<std::string>& removed) {
        JobRemovedCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex);
            callback = removed_callback;
        }
        if (!callback) {
            return;
        }
        for (const auto& id : removed) {
            callback(id);
        }
    }
};

// =============================================================================
// Публичный API
// =============================================================================

JobRegistry::JobRegistry(const bitcoin::BlockAssembler& assembler, RegistryConfig config)
    : impl_(std::make_unique<Impl>(assembler, std::move(config)))
{
}

JobRegistry::~JobRegistry() = default;

std::string JobRegistry::create_job_id(const std::optional<std::string>& owner,
                                       std::chrono::system_clock::time_point now) {
    uint64_t counter = g_job_counter.fetch_add(1, std::memory_order_relaxed) + 1;
    auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

    return std::format("job_{}_{:08x}_{}",
                       timestamp,
                       static_cast<uint32_t>(counter),
                       owner ? owner_suffix(*owner) : std::string("broadcast"));
}

std::string JobRegistry::owner_suffix(std::string_view address) {
    auto colon = address.find(':');
    if (colon != std::string_view::npos) {
        address.remove_prefix(colon + 1);
    }
    return std::string(address.substr(0, 8));
}

void JobRegistry::add_job(JobPtr job) {
    if (!job) {
        return;
    }
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->insert_locked(std::move(job));
}

bool JobRegistry::remove_job(const std::string& job_id) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        removed = impl_->erase_locked(job_id);
    }
    if (removed) {
        impl_->notify_removed({job_id});
    }
    return removed;
}

JobPtr JobRegistry::get_job(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->jobs.find(job_id);
    return it != impl_->jobs.end() ? it->second : nullptr;
}

JobPtr JobRegistry::get_job_for_miner(const std::string& address,
                                      const std::string& extra_nonce1) {
    const auto now = std::chrono::system_clock::now();
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);

        auto owned = impl_->miner_jobs.find(address);
        if (owned != impl_->miner_jobs.end()) {
            for (auto it = owned->second.rbegin(); it != owned->second.rend(); ++it) {
                auto job = impl_->jobs.find(*it);
                if (job != impl_->jobs.end() && !job->second->is_stale(now, impl_->config.max_job_age)) {
                    return job->second;
                }
            }
        }

        if (impl_->last_broadcast && !impl_->last_broadcast->is_stale(now, impl_->config.max_job_age)) {
            return impl_->last_broadcast;
        }
    }

    auto job = impl_->build_job(impl_->make_fallback_template(), address, extra_nonce1,
                                address, true, true);
    if (!job) {
        log::error("JobRegistry", std::format("Не удалось создать резервное задание для {}: {}",
                                              address, job.error().message));
        return nullptr;
    }

    log::warning("JobRegistry", std::format("Резервное задание {} для {}: нет реальных заданий",
                                            (*job)->job_id, address));
    add_job(*job);
    return *job;
}

Result<JobPtr> JobRegistry::update_template(bitcoin::BlockTemplatePtr tmpl) {
    if (!tmpl) {
        return Err<JobPtr>(ErrorCode::BlockInvalidTemplate, "Пустой шаблон блока");
    }

    bool clean_jobs = true;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->current_template) {
            clean_jobs = impl_->current_template->prev_hash != tmpl->prev_hash;
        }
    }

    auto job = impl_->build_job(tmpl, impl_->config.payout_address, "", std::nullopt,
                                clean_jobs, false);
    if (!job) {
        return job;
    }

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->current_template = std::move(tmpl);
        impl_->insert_locked(*job);
    }

    log::debug("JobRegistry", std::format("Broadcast задание {} (высота {}, clean_jobs={})",
                                          (*job)->job_id, (*job)->height(), clean_jobs));
    return job;
}

Result<JobPtr> JobRegistry::create_job_for_miner(const std::string& address,
                                                 const std::string& extra_nonce1,
                                                 bool clean_jobs) {
    bitcoin::BlockTemplatePtr tmpl = current_template();
    bool is_fallback = false;
    if (!tmpl) {
        tmpl = impl_->make_fallback_template();
        is_fallback = true;
    }

    auto job = impl_->build_job(std::move(tmpl), address, extra_nonce1, address,
                                clean_jobs, is_fallback);
    if (!job) {
        return job;
    }

    add_job(*job);
    return job;
}

std::vector<Result<JobPtr>> JobRegistry::broadcast(const std::vector<BroadcastTarget>& targets) {
    std::vector<Result<JobPtr>> jobs;
    jobs.reserve(targets.size());

    for (const auto& target : targets) {
        if (target.address.empty()) {
            auto job = last_broadcast_job();
            if (job) {
                jobs.emplace_back(std::move(job));
            } else {
                jobs.push_back(Err<JobPtr>(ErrorCode::MiningInvalidJob, "Нет broadcast задания"));
            }
            continue;
        }
        jobs.push_back(create_job_for_miner(target.address, target.extra_nonce1, true));
    }

    return jobs;
}

std::size_t JobRegistry::cleanup_old_jobs(std::chrono::seconds max_age,
                                          std::chrono::system_clock::time_point now) {
    std::vector<std::string> removed;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);

        std::vector<std::string> stale;
        for (const auto& [id, job] : impl_->jobs) {
            if (job->is_stale(now, max_age)) {
                stale.push_back(id);
            }
        }
        for (const auto& id : stale) {
            if (impl_->erase_locked(id)) {
                removed.push_back(id);
            }
        }
    }

    if (!removed.empty()) {
        log::info("JobRegistry", std::format("Удалено устаревших заданий: {}", removed.size()));
        impl_->notify_removed(removed);
    }
    return removed.size();
}

std::size_t JobRegistry::cleanup_miner_jobs(const std::string& address) {
    std::vector<std::string> removed;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);

        auto owned = impl_->miner_jobs.find(address);
        if (owned == impl_->miner_jobs.end()) {
            return 0;
        }

        const std::vector<std::string> ids = owned->second;
        for (const auto& id : ids) {
            if (impl_->erase_locked(id)) {
                removed.push_back(id);
            }
        }
        impl_->miner_jobs.erase(address);
    }

    impl_->notify_removed(removed);
    return removed.size();
}

bitcoin::BlockTemplatePtr JobRegistry::current_template() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->current_template;
}

bitcoin::BlockTemplatePtr JobRegistry::fallback_template() const {
    return impl_->make_fallback_template();
}

JobPtr JobRegistry::last_broadcast_job() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->last_broadcast;
}

std::vector<std::string> JobRegistry::miner_jobs(const std::string& address) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->miner_jobs.find(address);
    if (it == impl_->miner_jobs.end()) {
        return {};
    }
    return it->second;
}

std::vector<JobHistoryRecord> JobRegistry::history(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::size_t start = impl_->history.size() > limit ? impl_->history.size() - limit : 0;
    return {impl_->history.begin() + static_cast<std::ptrdiff_t>(start), impl_->history.end()};
}

RegistryStats JobRegistry::stats() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    RegistryStats stats;
    stats.active_jobs = impl_->jobs.size();
    for (const auto& [_, job] : impl_->jobs) {
        if (job->is_broadcast()) {
            ++stats.broadcast_jobs;
        } else {
            ++stats.personal_jobs;
        }
    }
    stats.subscribed_miners = impl_->miner_jobs.size();
    for (const auto& [_, ids] : impl_->miner_jobs) {
        stats.subscriptions += ids.size();
    }
    stats.job_counter = g_job_counter.load(std::memory_order_relaxed);
    stats.history_size = impl_->history.size();
    stats.has_broadcast_job = impl_->last_broadcast != nullptr;
    stats.has_template = impl_->current_template != nullptr;
    return stats;
}

const RegistryConfig& JobRegistry::config() const noexcept {
    return impl_->config;
}

void JobRegistry::set_job_removed_callback(JobRemovedCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->removed_callback = std::move(callback);
}

} // namespace bchpool::mining
