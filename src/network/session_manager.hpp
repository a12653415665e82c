/**
 * @file session_manager.hpp
 * @brief Сессии Stratum и их конечный автомат
 *
 * Состояния: Connected -> Subscribed -> Authorized -> Working, конечное Closed.
 *
 * - mining.subscribe: выдаёт extra_nonce1, отвечает подписками и размером
 *   extra_nonce2, затем шлёт mining.set_difficulty
 * - mining.authorize: "address[.worker]", регистрация в хранилище,
 *   затем mining.notify с заданием майнера
 * - mining.submit: ShareValidator, при сложности сети - сборка и отправка блока
 * - mining.get_transactions: пустой список
 *
 * Блокировки берутся в порядке: sessions_mutex -> mutex сессии -> реестр заданий.
 */

#pragma once

#include "protocol.hpp"
#include "transport.hpp"
#include "../bitcoin/address.hpp"
#include "../bitcoin/block_assembler.hpp"
#include "../bitcoin/node_client.hpp"
#include "../mining/difficulty_controller.hpp"
#include "../mining/extranonce_manager.hpp"
#include "../mining/job_registry.hpp"
#include "../mining/persistence.hpp"
#include "../mining/share_validator.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace bchpool::log {
class StatusReporter;
}

namespace bchpool::network {

enum class SessionState {
    Connected,
    Subscribed,
    Authorized,
    Working,
    Closed
};

[[nodiscard]] constexpr std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Connected:  return "connected";
        case SessionState::Subscribed: return "subscribed";
        case SessionState::Authorized: return "authorized";
        case SessionState::Working:    return "working";
        case SessionState::Closed:     return "closed";
    }
    return "unknown";
}

struct SessionConfig {
    bitcoin::Network network = bitcoin::Network::Testnet;
    std::string default_worker = "default";
    std::size_t extranonce2_size = constants::EXTRANONCE2_SIZE;
};

/**
 * @brief Сервисы, с которыми работают сессии
 */
struct SessionServices {
    mining::JobRegistry& registry;
    mining::ShareValidator& validator;
    mining::DifficultyController& difficulty;
    mining::ExtranonceManager& extranonces;
    mining::PersistenceService& persistence;
    const bitcoin::BlockAssembler& assembler;
    bitcoin::NodeClient& node;

    /// @brief Журнал событий, может отсутствовать
    log::StatusReporter* reporter = nullptr;
};

struct SessionInfo {
    uint64_t id = 0;
    TransportKind transport = TransportKind::Tcp;
    SessionState state = SessionState::Connected;
    std::string remote_address;
    std::string address;
    std::string worker;
    std::string extra_nonce1;
    std::size_t subscribed_jobs = 0;
    uint64_t shares_accepted = 0;
    uint64_t shares_rejected = 0;
};

struct SessionManagerStats {
    std::size_t tcp_sessions = 0;
    std::size_t websocket_sessions = 0;
    std::size_t authorized_sessions = 0;
    uint64_t total_connections = 0;
    uint64_t shares_accepted = 0;
    uint64_t shares_rejected = 0;
    uint64_t blocks_found = 0;
};

class SessionManager {
public:
    SessionManager(SessionConfig config, SessionServices services);

    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // =========================================================================
    // Жизненный цикл сессии
    // =========================================================================

    /**
     * @brief Зарегистрировать новое соединение
     *
     * @return Идентификатор сессии
     */
    uint64_t open_session(std::shared_ptr<SessionTransport> transport);

    /**
     * @brief Обработать одно входящее сообщение
     *
     * Нечитаемое сообщение в состоянии Connected закрывает соединение,
     * в остальных состояниях на него отвечают ошибкой.
     */
    void handle_message(uint64_t session_id, std::string_view message);

    /**
     * @brief Закрыть сессию: освободить extra_nonce1 и personal задания
     */
    void close_session(uint64_t session_id);

    void close_all();

    // =========================================================================
    // Рассылка
    // =========================================================================

    /**
     * @brief Свежее задание каждой подписанной сессии
     *
     * @return Количество отправленных mining.notify
     */
    std::size_t broadcast_jobs();

    /**
     * @brief mining.set_difficulty всем подписанным сессиям
     */
    std::size_t broadcast_difficulty(double difficulty);

    // =========================================================================
    // Информация
    // =========================================================================

    [[nodiscard]] std::optional<SessionInfo> session_info(uint64_t session_id) const;

    [[nodiscard]] std::size_t session_count() const;

    [[nodiscard]] SessionManagerStats stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bchpool::network
