/**
 * @file job_registry.hpp
 * @brief Реестр заданий Stratum
 *
 * Отвечает за:
 * - Уникальные job_id: "job_{ts}_{counter:08x}_{suffix|broadcast}"
 * - Хранение активных заданий (personal и broadcast)
 * - Выбор задания для майнера: personal -> broadcast -> резервное
 * - Очистку устаревших заданий по времени создания
 * - Рассылку свежих заданий подключённым майнерам
 *
 * Все методы потокобезопасны. Callback удаления вызывается
 * после освобождения внутренней блокировки.
 */

#pragma once

#include "job.hpp"
#include "../core/config.hpp"
#include "../bitcoin/block_assembler.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bchpool::mining {

// =============================================================================
// Конфигурация и статистика
// =============================================================================

struct RegistryConfig {
    /// @brief Адрес выплаты broadcast заданий
    std::string payout_address;

    std::chrono::seconds max_job_age{constants::MAX_JOB_AGE};
    std::size_t history_size = constants::JOB_HISTORY_SIZE;

    /// @brief Параметры резервного шаблона
    FallbackConfig fallback;
};

/**
 * @brief Запись в истории созданных заданий
 */
struct JobHistoryRecord {
    std::string job_id;
    std::optional<std::string> owner;
    uint32_t height = 0;
    std::chrono::system_clock::time_point created_at{};
    bool is_fallback = false;
};

struct RegistryStats {
    std::size_t active_jobs = 0;
    std::size_t personal_jobs = 0;
    std::size_t broadcast_jobs = 0;
    std::size_t subscribed_miners = 0;
    std::size_t subscriptions = 0;
    uint64_t job_counter = 0;
    std::size_t history_size = 0;
    bool has_broadcast_job = false;
    bool has_template = false;
};

/**
 * @brief Майнер, получающий задание при рассылке
 */
struct BroadcastTarget {
    std::string address;
    std::string extra_nonce1;
};

using JobRemovedCallback = std::function<void(const std::string& job_id)>;

// =============================================================================
// Job Registry
// =============================================================================

class JobRegistry {
public:
    JobRegistry(const bitcoin::BlockAssembler& assembler, RegistryConfig config);

    ~JobRegistry();

    JobRegistry(const JobRegistry&) = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;

    // =========================================================================
    // Идентификаторы
    // =========================================================================

    /**
     * @brief Сгенерировать новый job_id
     *
     * Счётчик общий для процесса, поэтому id уникальны даже в пределах секунды.
     *
     * @param owner Адрес владельца; nullopt для broadcast
     */
    [[nodiscard]] static std::string create_job_id(
        const std::optional<std::string>& owner,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()
    );

    /**
     * @brief Суффикс job_id для адреса: первые 8 символов payload
     */
    [[nodiscard]] static std::string owner_suffix(std::string_view address);

    // =========================================================================
    // Хранение
    // =========================================================================

    /**
     * @brief Добавить задание (владелец берётся из job->owner)
     */
    void add_job(JobPtr job);

    /**
     * @brief Удалить задание вместе с подпиской владельца
     *
     * @return true если задание было в реестре
     */
    bool remove_job(const std::string& job_id);

    [[nodiscard]] JobPtr get_job(const std::string& job_id) const;

    /**
     * @brief Задание для майнера
     *
     * Порядок: последнее активное personal задание адреса, затем последнее
     * broadcast задание, затем новое задание из резервного шаблона.
     * Возвращает nullptr только если адрес не декодируется.
     */
    [[nodiscard]] JobPtr get_job_for_miner(const std::string& address,
                                           const std::string& extra_nonce1);

    // =========================================================================
    // Создание заданий
    // =========================================================================

    /**
     * @brief Принять новый шаблон и построить broadcast задание
     *
     * clean_jobs выставляется, если сменился предыдущий блок.
     */
    [[nodiscard]] Result<JobPtr> update_template(bitcoin::BlockTemplatePtr tmpl);

    /**
     * @brief Построить personal задание из последнего шаблона
     *
     * Без шаблона используется резервный.
     */
    [[nodiscard]] Result<JobPtr> create_job_for_miner(const std::string& address,
                                                      const std::string& extra_nonce1,
                                                      bool clean_jobs = true);

    /**
     * @brief Свежие задания для каждого майнера, clean_jobs = true
     *
     * Для пустого адреса возвращается текущее broadcast задание.
     */
    [[nodiscard]] std::vector<Result<JobPtr>> broadcast(const std::vector<BroadcastTarget>& targets);

    // =========================================================================
    // Очистка
    // =========================================================================

    /**
     * @brief Удалить задания старше max_age
     *
     * @return Количество удалённых заданий
     */
    std::size_t cleanup_old_jobs(
        std::chrono::seconds max_age,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()
    );

    /**
     * @brief Удалить все personal задания адреса
     */
    std::size_t cleanup_miner_jobs(const std::string& address);

    // =========================================================================
    // Состояние
    // =========================================================================

    [[nodiscard]] bitcoin::BlockTemplatePtr current_template() const;

    [[nodiscard]] bitcoin::BlockTemplatePtr fallback_template() const;

    [[nodiscard]] JobPtr last_broadcast_job() const;

    [[nodiscard]] std::vector<std::string> miner_jobs(const std::string& address) const;

    [[nodiscard]] std::vector<JobHistoryRecord> history(std::size_t limit) const;

    [[nodiscard]] RegistryStats stats() const;

    [[nodiscard]] const RegistryConfig& config() const noexcept;

    void set_job_removed_callback(JobRemovedCallback callback);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bchpool::mining
