/**
 * @file job.hpp
 * @brief Задание Stratum
 *
 * Задание (job) - единица работы, полученная из шаблона блока:
 * - job_id: "job_{unix_ts}_{counter:08x}_{suffix|broadcast}"
 * - поля mining.notify: prevhash, coinb1, coinb2, merkle_branch, version, nbits, ntime
 * - clean_jobs: майнер должен бросить текущую работу
 * - владелец: адрес майнера (personal) или отсутствует (broadcast)
 *
 * Майнер собирает coinbase как coinb1 + extra_nonce1 + extra_nonce2 + coinb2.
 * Задание неизменяемо после создания и разделяется через shared_ptr.
 */

#pragma once

#include "../core/types.hpp"
#include "../bitcoin/block_assembler.hpp"
#include "../bitcoin/node_client.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace bchpool::mining {

// =============================================================================
// Структура задания
// =============================================================================

struct Job {
    /// @brief Уникальный идентификатор задания
    std::string job_id;

    /// @brief Шаблон, из которого построено задание
    bitcoin::BlockTemplatePtr block_template;

    /// @brief Адрес, на который выплачивает coinbase задания
    std::string payout_address;

    /// @brief Поля mining.notify
    bitcoin::StratumJobData stratum;

    bool clean_jobs = true;

    /// @brief extra_nonce1 (hex) сессии, для которой собрано задание
    std::string extra_nonce1;

    /// @brief Адрес владельца; nullopt для broadcast задания
    std::optional<std::string> owner;

    /// @brief Время создания (unix time)
    std::chrono::system_clock::time_point created_at{};

    /// @brief Задание построено из резервного шаблона
    bool is_fallback = false;

    [[nodiscard]] bool is_broadcast() const noexcept { return !owner.has_value(); }

    [[nodiscard]] uint32_t height() const noexcept {
        return block_template ? block_template->height : 0;
    }

    /**
     * @brief Проверить, устарело ли задание
     *
     * Задание без времени создания считается устаревшим.
     *
     * @param now Текущее время
     * @param max_age Максимальный возраст
     */
    [[nodiscard]] bool is_stale(std::chrono::system_clock::time_point now,
                                std::chrono::seconds max_age) const noexcept {
        if (created_at.time_since_epoch().count() <= 0) {
            return true;
        }
        return now - created_at > max_age;
    }
};

using JobPtr = std::shared_ptr<const Job>;

} // namespace bchpool::mining
