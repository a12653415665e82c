/**
 * @file session_manager.cpp
 * @brief Реализация сессий Stratum
 */

#include "session_manager.hpp"
#include "../core/hex.hpp"
#include "../log/logger.hpp"
#include "../log/status_reporter.hpp"

#include <atomic>
#include <format>
#include <mutex>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace bchpool::network {

namespace {

struct Session {
    uint64_t id = 0;
    std::shared_ptr<SessionTransport> transport;

    std::mutex mutex;
    SessionState state = SessionState::Connected;
    std::string address;
    std::string worker;
    std::string extra_nonce1;

    /// Задания, отправленные сессии
    std::unordered_set<std::string> jobs;

    uint64_t shares_accepted = 0;
    uint64_t shares_rejected = 0;
};

using SessionPtr = std::shared_ptr<Session>;

bool is_authorized(SessionState state) noexcept {
    return state == SessionState::Authorized || state == SessionState::Working;
}

bool is_subscribed(SessionState state) noexcept {
    return state != SessionState::Connected && state != SessionState::Closed;
}

int reject_code(mining::RejectReason reason) noexcept {
    switch (reason) {
        case mining::RejectReason::JobNotFound:    return constants::STRATUM_ERR_JOB_NOT_FOUND;
        case mining::RejectReason::DuplicateNonce: return constants::STRATUM_ERR_DUPLICATE;
        case mining::RejectReason::BelowTarget:    return constants::STRATUM_ERR_LOW_DIFFICULTY;
        default:                                   return constants::STRATUM_ERR_OTHER;
    }
}

/**
 * @brief Итог submit, обрабатываемый после освобождения блокировки сессии
 */
struct SubmitOutcome {
    mining::ShareSubmission share;
    std::string worker;
    mining::ValidationResult result;
};

} // namespace

// =============================================================================
// Реализация
// =============================================================================

struct SessionManager::Impl {
    SessionConfig config;
    SessionServices services;

    mutable std::mutex sessions_mutex;
    std::unordered_map<uint64_t, SessionPtr> sessions;

    std::atomic<uint64_t> next_session_id{1};
    std::atomic<uint64_t> total_connections{0};
    std::atomic<uint64_t> shares_accepted{0};
    std::atomic<uint64_t> shares_rejected{0};
    std::atomic<uint64_t> blocks_found{0};

    Impl(SessionConfig cfg, SessionServices svc)
        : config(std::move(cfg))
        , services(svc) {}

    SessionPtr find(uint64_t id) const {
        std::lock_guard<std::mutex> lock(sessions_mutex);
        auto it = sessions.find(id);
        return it != sessions.end() ? it->second : nullptr;
    }

    // =========================================================================
    // Отправка (под mutex сессии)
    // =========================================================================

    static void send(Session& session, std::string message) {
        if (!session.transport->send(std::move(message))) {
            log::debug("Session", std::format("Сессия {}: отправка в закрытое соединение", session.id));
        }
    }

    void send_job(Session& session, const mining::JobPtr& job) {
        send(session, encode_notify(*job));

        // Забываем задания, которых уже нет в реестре
        std::erase_if(session.jobs, [this](const std::string& id) {
            return !services.registry.get_job(id);
        });
        session.jobs.insert(job->job_id);

        if (session.state == SessionState::Authorized) {
            session.state = SessionState::Working;
        }
    }

    // =========================================================================
    // Обработчики запросов (под mutex сессии)
    // =========================================================================

    void on_subscribe(Session& session, const json& id, const SubscribeRequest& request) {
        if (session.extra_nonce1.empty()) {
            session.extra_nonce1 = services.extranonces.assign(session.id);
        }
        if (session.state == SessionState::Connected) {
            session.state = SessionState::Subscribed;
        }

        log::debug("Session", std::format("Сессия {} подписана ({}), extra_nonce1={}",
                                          session.id,
                                          request.user_agent.empty() ? "unknown" : request.user_agent,
                                          session.extra_nonce1));

        send(session, encode_subscribe_result(id, std::format("{:016x}", session.id),
                                              session.extra_nonce1, config.extranonce2_size));
        send(session, encode_set_difficulty(services.difficulty.current()));
    }

    void on_authorize(Session& session, const json& id, const AuthorizeRequest& request) {
        if (session.state == SessionState::Connected) {
            send(session, encode_error(id, constants::STRATUM_ERR_NOT_SUBSCRIBED, "Not subscribed"));
            return;
        }

        auto username = parse_username(request.username, config.default_worker);
        auto address = bitcoin::normalize_address(username.address, config.network);
        if (!address) {
            log::warning("Session", std::format("Сессия {}: некорректный адрес {}: {}",
                                                session.id, username.address, address.error().message));
            send(session, encode_error(id, constants::STRATUM_ERR_UNAUTHORIZED,
                                       std::format("Invalid address: {}", username.address)));
            return;
        }

        auto miner = services.persistence.register_miner(*address, username.worker);
        if (!miner) {
            log::warning("Session", std::format("Не удалось зарегистрировать майнера {}: {}",
                                                *address, miner.error().message));
        } else if (!miner->is_active) {
            send(session, encode_error(id, constants::STRATUM_ERR_UNAUTHORIZED, "Miner is deactivated"));
            return;
        }

        session.address = *address;
        session.worker = username.worker;
        session.state = SessionState::Authorized;
        send(session, encode_result(id, true));

        log::info("Session", std::format("Сессия {} авторизована: {}.{}",
                                         session.id, session.address, session.worker));
        if (services.reporter) {
            services.reporter->log_event(log::EventType::MINER_CONNECT,
                                         std::format("worker {}", session.worker), session.address);
        }

        if (auto job = resolve_job(session)) {
            send_job(session, job);
        }
    }

    /**
     * @brief Задание для только что авторизованного майнера
     *
     * Активное personal задание этой сессии используется повторно. Иначе вместо
     * найденного broadcast задания строится personal, чтобы coinbase платила
     * майнеру; broadcast остаётся, если построить не удалось.
     */
    mining::JobPtr resolve_job(const Session& session) {
        auto job = services.registry.get_job_for_miner(session.address, session.extra_nonce1);
        // Задание другой сессии с тем же адресом удаляется при её закрытии
        if (job && job->owner == session.address && job->extra_nonce1 == session.extra_nonce1) {
            return job;
        }

        auto personal = services.registry.create_job_for_miner(session.address, session.extra_nonce1);
        if (!personal) {
            log::warning("Session", std::format("Не удалось создать задание для {}: {}",
                                                session.address, personal.error().message));
            return job;
        }
        return *personal;
    }

    std::optional<SubmitOutcome> on_submit(Session& session, const json& id, const SubmitRequest& request) {
        if (!is_authorized(session.state)) {
            send(session, encode_error(id, constants::STRATUM_ERR_UNAUTHORIZED, "Unauthorized worker"));
            return std::nullopt;
        }

        SubmitOutcome outcome;
        outcome.share.job_id = request.job_id;
        outcome.share.extra_nonce2 = request.extra_nonce2;
        outcome.share.ntime = request.ntime;
        outcome.share.nonce = request.nonce;
        outcome.share.miner_address = session.address;
        outcome.share.extra_nonce1 = session.extra_nonce1;
        outcome.share.difficulty = services.difficulty.current();
        outcome.worker = session.worker;

        outcome.result = services.validator.validate(outcome.share);

        if (outcome.result.accepted) {
            ++session.shares_accepted;
            send(session, encode_result(id, true));
        } else {
            ++session.shares_rejected;
            send(session, encode_error(id, reject_code(outcome.result.reason),
                                       outcome.result.message(request.job_id)));
        }
        return outcome;
    }

    // =========================================================================
    // После ответа майнеру (без блокировки сессии)
    // =========================================================================

    void finish_submit(const SubmitOutcome& outcome) {
        const auto& result = outcome.result;

        mining::ShareRecord record;
        record.miner_address = outcome.share.miner_address;
        record.worker = outcome.worker;
        record.job_id = outcome.share.job_id;
        record.extra_nonce2 = outcome.share.extra_nonce2;
        record.ntime = outcome.share.ntime;
        record.nonce = outcome.share.nonce;
        record.difficulty = outcome.share.difficulty;
        record.accepted = result.accepted;
        record.created_at = std::chrono::system_clock::now();

        if (result.accepted) {
            shares_accepted.fetch_add(1, std::memory_order_relaxed);
            record.hash = hash_to_display_hex(result.hash);
            services.difficulty.record_share(outcome.share.miner_address, outcome.share.difficulty);
            if (services.reporter) {
                services.reporter->log_share(true, outcome.share.miner_address,
                                             std::format("job {}", outcome.share.job_id));
            }
        } else {
            shares_rejected.fetch_add(1, std::memory_order_relaxed);
            record.reject_reason = std::string(mining::to_string(result.reason));
            if (services.reporter) {
                services.reporter->log_share(false, outcome.share.miner_address,
                                             std::format("job {}: {}", outcome.share.job_id,
                                                         mining::to_string(result.reason)));
            }
        }

        if (auto saved = services.persistence.save_share(record); !saved) {
            log::warning("Session", std::format("Не удалось сохранить share: {}", saved.error().message));
        }

        if (result.accepted && result.is_block) {
            submit_block(outcome);
        }
    }

    void submit_block(const SubmitOutcome& outcome) {
        const auto& result = outcome.result;
        const auto& tmpl = *result.job->block_template;
        const std::string hash = hash_to_display_hex(result.hash);

        log::info("Session", std::format("Найден блок {} на высоте {} ({})",
                                         hash, tmpl.height, outcome.share.miner_address));

        Bytes block = services.assembler.assemble_block(result.header, result.coinbase, tmpl.transactions);
        auto submitted = services.node.submit_block(to_hex(block));
        if (!submitted) {
            log::error("Session", std::format("Блок {} отклонён узлом: {}", hash, submitted.error().message));
            if (services.reporter) {
                services.reporter->log_block(false, tmpl.height, outcome.share.miner_address,
                                             submitted.error().message);
            }
            return;
        }

        blocks_found.fetch_add(1, std::memory_order_relaxed);
        if (services.reporter) {
            services.reporter->log_block(true, tmpl.height, outcome.share.miner_address);
        }

        if (auto saved = services.persistence.save_block(tmpl.height, hash, outcome.share.miner_address); !saved) {
            log::error("Session", std::format("Не удалось сохранить блок {}: {}", hash, saved.error().message));
        }
    }
};

// =============================================================================
// SessionManager
// =============================================================================

SessionManager::SessionManager(SessionConfig config, SessionServices services)
    : impl_(std::make_unique<Impl>(std::move(config), services))
{
    impl_->services.difficulty.set_change_callback([this](double old_difficulty, double new_difficulty) {
        if (impl_->services.reporter) {
            impl_->services.reporter->log_difficulty("pool", old_difficulty, new_difficulty);
        }
        broadcast_difficulty(new_difficulty);
    });
}

SessionManager::~SessionManager() {
    impl_->services.difficulty.set_change_callback(nullptr);
    close_all();
}

uint64_t SessionManager::open_session(std::shared_ptr<SessionTransport> transport) {
    auto session = std::make_shared<Session>();
    session->id = impl_->next_session_id.fetch_add(1, std::memory_order_relaxed);
    session->transport = std::move(transport);

    log::debug("Session", std::format("Новая сессия {} ({}, {})", session->id,
                                      to_string(session->transport->kind()),
                                      session->transport->remote_address()));

    const uint64_t id = session->id;
    {
        std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
        impl_->sessions.emplace(id, std::move(session));
    }
    impl_->total_connections.fetch_add(1, std::memory_order_relaxed);
    return id;
}

void SessionManager::handle_message(uint64_t session_id, std::string_view message) {
    SessionPtr session = impl_->find(session_id);
    if (!session) {
        return;
    }

    auto request = parse_request(message);

    std::unique_lock<std::mutex> lock(session->mutex);
    if (session->state == SessionState::Closed) {
        return;
    }

    if (!request) {
        if (session->state == SessionState::Connected) {
            lock.unlock();
            log::warning("Session", std::format("Сессия {}: некорректное первое сообщение, соединение закрыто",
                                                session_id));
            session->transport->close();
            close_session(session_id);
            return;
        }
        Impl::send(*session, encode_error(nullptr, constants::STRATUM_ERR_OTHER, request.error().message));
        return;
    }

    std::optional<SubmitOutcome> submitted;

    std::visit([&](auto&& payload) {
        using T = std::decay_t<decltype(payload)>;

        if constexpr (std::is_same_v<T, SubscribeRequest>) {
            impl_->on_subscribe(*session, request->id, payload);
        }
        else if constexpr (std::is_same_v<T, AuthorizeRequest>) {
            impl_->on_authorize(*session, request->id, payload);
        }
        else if constexpr (std::is_same_v<T, SubmitRequest>) {
            submitted = impl_->on_submit(*session, request->id, payload);
        }
        else if constexpr (std::is_same_v<T, GetTransactionsRequest>) {
            Impl::send(*session, encode_result(request->id, json::array()));
        }
        else if constexpr (std::is_same_v<T, InvalidRequest>) {
            Impl::send(*session, encode_error(request->id, constants::STRATUM_ERR_OTHER,
                                              std::format("Invalid params for {}: {}", payload.method, payload.reason)));
        }
        else {
            static_assert(std::is_same_v<T, UnknownRequest>);
            log::debug("Session", std::format("Сессия {}: неизвестный метод {}", session_id, payload.method));
            Impl::send(*session, encode_error(request->id, constants::STRATUM_ERR_OTHER,
                                              std::format("Unknown method {}", payload.method)));
        }
    }, request->payload);

    lock.unlock();

    if (submitted) {
        impl_->finish_submit(*submitted);
    }
}

void SessionManager::close_session(uint64_t session_id) {
    SessionPtr session;
    {
        std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
        auto it = impl_->sessions.find(session_id);
        if (it == impl_->sessions.end()) {
            return;
        }
        session = std::move(it->second);
        impl_->sessions.erase(it);
    }

    std::vector<std::string> jobs;
    std::string address;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        session->state = SessionState::Closed;
        jobs.assign(session->jobs.begin(), session->jobs.end());
        session->jobs.clear();
        address = session->address;
    }

    impl_->services.extranonces.release(session_id);

    for (const auto& id : jobs) {
        auto job = impl_->services.registry.get_job(id);
        if (job && !job->is_broadcast()) {
            impl_->services.registry.remove_job(id);
        }
    }

    session->transport->close();

    log::debug("Session", std::format("Сессия {} закрыта", session_id));
    if (!address.empty() && impl_->services.reporter) {
        impl_->services.reporter->log_event(log::EventType::MINER_DISCONNECT,
                                            std::format("session {}", session_id), address);
    }
}

void SessionManager::close_all() {
    std::vector<uint64_t> ids;
    {
        std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
        for (const auto& [id, _] : impl_->sessions) {
            ids.push_back(id);
        }
    }
    for (auto id : ids) {
        close_session(id);
    }
}

std::size_t SessionManager::broadcast_jobs() {
    std::lock_guard<std::mutex> lock(impl_->sessions_mutex);

    std::vector<SessionPtr> recipients;
    std::vector<mining::BroadcastTarget> targets;
    for (const auto& [_, session] : impl_->sessions) {
        std::lock_guard<std::mutex> session_lock(session->mutex);
        if (!is_subscribed(session->state)) {
            continue;
        }
        recipients.push_back(session);
        targets.push_back(mining::BroadcastTarget{
            is_authorized(session->state) ? session->address : std::string(),
            session->extra_nonce1
        });
    }

    auto jobs = impl_->services.registry.broadcast(targets);

    std::size_t sent = 0;
    for (std::size_t i = 0; i < recipients.size(); ++i) {
        if (!jobs[i]) {
            log::debug("Session", std::format("Сессия {}: нет задания для рассылки: {}",
                                              recipients[i]->id, jobs[i].error().message));
            continue;
        }

        std::lock_guard<std::mutex> session_lock(recipients[i]->mutex);
        if (recipients[i]->state == SessionState::Closed) {
            continue;
        }
        impl_->send_job(*recipients[i], *jobs[i]);
        ++sent;
    }

    if (sent > 0) {
        log::debug("Session", std::format("Разослано заданий: {}", sent));
        if (impl_->services.reporter) {
            impl_->services.reporter->log_event(log::EventType::JOB_BROADCAST,
                                                std::format("{} jobs sent", sent));
        }
    }
    return sent;
}

std::size_t SessionManager::broadcast_difficulty(double difficulty) {
    const std::string message = encode_set_difficulty(difficulty);

    std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
    std::size_t sent = 0;
    for (const auto& [_, session] : impl_->sessions) {
        std::lock_guard<std::mutex> session_lock(session->mutex);
        if (!is_subscribed(session->state)) {
            continue;
        }
        Impl::send(*session, message);
        ++sent;
    }
    return sent;
}

std::optional<SessionInfo> SessionManager::session_info(uint64_t session_id) const {
    SessionPtr session = impl_->find(session_id);
    if (!session) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    SessionInfo info;
    info.id = session->id;
    info.transport = session->transport->kind();
    info.state = session->state;
    info.remote_address = session->transport->remote_address();
    info.address = session->address;
    info.worker = session->worker;
    info.extra_nonce1 = session->extra_nonce1;
    info.subscribed_jobs = session->jobs.size();
    info.shares_accepted = session->shares_accepted;
    info.shares_rejected = session->shares_rejected;
    return info;
}

std::size_t SessionManager::session_count() const {
    std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
    return impl_->sessions.size();
}

SessionManagerStats SessionManager::stats() const {
    SessionManagerStats stats;
    {
        std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
        for (const auto& [_, session] : impl_->sessions) {
            std::lock_guard<std::mutex> session_lock(session->mutex);
            if (session->transport->kind() == TransportKind::Tcp) {
                ++stats.tcp_sessions;
            } else {
                ++stats.websocket_sessions;
            }
            if (is_authorized(session->state)) {
                ++stats.authorized_sessions;
            }
        }
    }
    stats.total_connections = impl_->total_connections.load(std::memory_order_relaxed);
    stats.shares_accepted = impl_->shares_accepted.load(std::memory_order_relaxed);
    stats.shares_rejected = impl_->shares_rejected.load(std::memory_order_relaxed);
    stats.blocks_found = impl_->blocks_found.load(std::memory_order_relaxed);
    return stats;
}

} // namespace bchpool::network
