/**
 * @file persistence.hpp
 * @brief Хранилище майнеров, shares и блоков
 *
 * Запись выполняется после ответа майнеру: ошибка хранилища
 * логируется и не отменяет уже принятый share или блок.
 */

#pragma once

#include "../core/types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bchpool::mining {

struct Miner {
    std::string address;
    std::string worker;
    bool is_active = true;
    std::chrono::system_clock::time_point registered_at{};
    std::chrono::system_clock::time_point last_seen{};
};

/**
 * @brief Запись о share (неизменяема после сохранения)
 */
struct ShareRecord {
    std::string miner_address;
    std::string worker;
    std::string job_id;
    std::string extra_nonce2;
    std::string ntime;
    std::string nonce;

    /// @brief Хеш заголовка в display порядке
    std::string hash;

    double difficulty = 0.0;
    bool accepted = false;
    std::string reject_reason;
    std::chrono::system_clock::time_point created_at{};
};

struct BlockRecord {
    uint32_t height = 0;

    /// @brief Хеш блока в display порядке
    std::string hash;

    std::string miner_address;
    std::chrono::system_clock::time_point found_at{};
};

// =============================================================================
// Интерфейс
// =============================================================================

class PersistenceService {
public:
    virtual ~PersistenceService() = default;

    /**
     * @brief Зарегистрировать майнера или обновить воркера существующего
     */
    [[nodiscard]] virtual Result<Miner> register_miner(const std::string& address,
                                                       const std::string& worker) = 0;

    [[nodiscard]] virtual Result<std::optional<Miner>> get_miner_by_address(const std::string& address) = 0;

    [[nodiscard]] virtual Result<void> save_share(const ShareRecord& share) = 0;

    [[nodiscard]] virtual Result<void> save_block(uint32_t height,
                                                  const std::string& hash,
                                                  const std::string& miner_address) = 0;
};

// =============================================================================
// In-memory реализация
// =============================================================================

class MemoryPersistence : public PersistenceService {
public:
    /**
     * @param max_shares Максимум хранимых записей shares
     */
    explicit MemoryPersistence(std::size_t max_shares = 100000);

    [[nodiscard]] Result<Miner> register_miner(const std::string& address,
                                               const std::string& worker) override;

    [[nodiscard]] Result<std::optional<Miner>> get_miner_by_address(const std::string& address) override;

    [[nodiscard]] Result<void> save_share(const ShareRecord& share) override;

    [[nodiscard]] Result<void> save_block(uint32_t height,
                                          const std::string& hash,
                                          const std::string& miner_address) override;

    /**
     * @brief Деактивировать или активировать майнера
     *
     * @return false если майнер не зарегистрирован
     */
    bool set_miner_active(const std::string& address, bool active);

    [[nodiscard]] std::size_t miner_count() const;
    [[nodiscard]] std::vector<ShareRecord> shares() const;
    [[nodiscard]] std::vector<BlockRecord> blocks() const;

private:
    std::size_t max_shares_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Miner> miners_;
    std::deque<ShareRecord> shares_;
    std::vector<BlockRecord> blocks_;
};

} // namespace bchpool::mining
