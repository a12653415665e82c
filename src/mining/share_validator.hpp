/**
 * @file share_validator.hpp
 * @brief Валидатор shares от майнеров
 *
 * Проверки выполняются по порядку, первая неудачная прерывает валидацию:
 * 1. Задание существует
 * 2. extra_nonce2, ntime и nonce - hex фиксированной ширины
 * 3. ntime в пределах max_ntime_drift от текущего времени
 * 4. Пара (job_id, nonce) ещё не встречалась
 * 5. Пересчёт coinbase -> merkle root -> заголовок -> SHA256d
 * 6. Хеш не больше target текущей сложности
 */

#pragma once

#include "job.hpp"
#include "job_registry.hpp"
#include "../bitcoin/block_assembler.hpp"

#include <array>
#include <chrono>
#include <memory>
#include <string>

namespace bchpool::mining {

// =============================================================================
// Причины отклонения
// =============================================================================

enum class RejectReason {
    JobNotFound,
    InvalidFormat,
    StaleTime,
    DuplicateNonce,
    BelowTarget,
    InternalError
};

inline constexpr std::size_t REJECT_REASON_COUNT = 6;

[[nodiscard]] constexpr std::string_view to_string(RejectReason reason) noexcept {
    switch (reason) {
        case RejectReason::JobNotFound:    return "job_not_found";
        case RejectReason::InvalidFormat:  return "invalid_format";
        case RejectReason::StaleTime:      return "stale_time";
        case RejectReason::DuplicateNonce: return "duplicate_nonce";
        case RejectReason::BelowTarget:    return "below_target";
        case RejectReason::InternalError:  return "internal_error";
    }
    return "unknown";
}

// =============================================================================
// Входные данные и результат
// =============================================================================

/**
 * @brief Параметры mining.submit вместе с контекстом сессии
 */
struct ShareSubmission {
    std::string job_id;
    std::string extra_nonce2;
    std::string ntime;
    std::string nonce;

    std::string miner_address;

    /// @brief extra_nonce1 сессии; пустой - берётся из задания
    std::string extra_nonce1;

    /// @brief Сложность пула для этого share
    double difficulty = 1.0;
};

struct ValidationResult {
    bool accepted = false;
    RejectReason reason = RejectReason::InternalError;

    /// @brief Имя поля для InvalidFormat или описание ошибки
    std::string detail;

    JobPtr job;

    /// @brief Данные пересчёта (заполнены для принятых shares)
    Hash256 hash{};
    bitcoin::BlockHeader header{};
    Bytes coinbase;
    double share_difficulty = 0.0;

    /// @brief Хеш удовлетворяет сложности сети
    bool is_block = false;

    [[nodiscard]] static ValidationResult reject(RejectReason reason, std::string detail = "") {
        ValidationResult result;
        result.reason = reason;
        result.detail = std::move(detail);
        return result;
    }

    /**
     * @brief Текст ошибки для ответа майнеру
     */
    [[nodiscard]] std::string message(const std::string& job_id) const;
};

struct ValidatorConfig {
    std::size_t extranonce2_size = constants::EXTRANONCE2_SIZE;
    int64_t max_ntime_drift = constants::MAX_NTIME_DRIFT;
    std::size_t nonces_per_job = constants::NONCES_PER_JOB;
};

struct ValidatorStats {
    uint64_t accepted = 0;
    uint64_t rejected = 0;
    uint64_t blocks = 0;
    std::array<uint64_t, REJECT_REASON_COUNT> rejected_by_reason{};
    std::size_t tracked_jobs = 0;
};

// =============================================================================
// Share Validator
// =============================================================================

class ShareValidator {
public:
    /**
     * @brief Создать валидатор
     *
     * Подписывается на удаление заданий в реестре, чтобы сбрасывать
     * учёт nonce удалённого задания.
     */
    ShareValidator(JobRegistry& registry,
                   const bitcoin::BlockAssembler& assembler,
                   ValidatorConfig config);

    ~ShareValidator();

    ShareValidator(const ShareValidator&) = delete;
    ShareValidator& operator=(const ShareValidator&) = delete;

    /**
     * @brief Валидировать share
     *
     * Не бросает исключений: любая ошибка возвращается как причина отклонения.
     */
    [[nodiscard]] ValidationResult validate(
        const ShareSubmission& share,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()
    );

    /**
     * @brief Забыть nonce задания
     */
    void remove_job(const std::string& job_id);

    /**
     * @brief Удалить учёт nonce для заданий, которых нет в реестре
     *
     * @return Количество удалённых записей
     */
    std::size_t cleanup_nonce_cache();

    [[nodiscard]] std::size_t tracked_nonces(const std::string& job_id) const;

    [[nodiscard]] ValidatorStats stats() const;

    void reset_stats();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bchpool::mining
