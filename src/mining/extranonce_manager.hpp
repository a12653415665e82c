/**
 * @file extranonce_manager.hpp
 * @brief Выдача extra_nonce1 сессиям Stratum
 *
 * Каждая сессия ОБЯЗАНА иметь уникальный extra_nonce1: иначе два майнера
 * с одним заданием перебирают одно и то же пространство хешей.
 *
 * extra_nonce1 занимает 16 байт (32 hex символа):
 * - [0-7]  случайная соль процесса
 * - [8-15] монотонный счётчик
 *
 * Значения не переиспользуются после освобождения.
 */

#pragma once

#include "../core/types.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bchpool::mining {

class ExtranonceManager {
public:
    /**
     * @brief Создать менеджер со случайной солью
     */
    ExtranonceManager();

    /**
     * @brief Создать менеджер с заданной солью и стартовым счётчиком
     */
    ExtranonceManager(uint64_t salt, uint64_t start_value);

    ExtranonceManager(const ExtranonceManager&) = delete;
    ExtranonceManager& operator=(const ExtranonceManager&) = delete;

    /**
     * @brief Выдать новый extra_nonce1 сессии
     *
     * @param session_id Идентификатор сессии
     * @return std::string 32 hex символа
     */
    [[nodiscard]] std::string assign(uint64_t session_id);

    /**
     * @brief Освободить extra_nonce1 при отключении
     */
    void release(uint64_t session_id);

    [[nodiscard]] std::optional<std::string> get(uint64_t session_id) const;

    [[nodiscard]] bool has(uint64_t session_id) const;

    [[nodiscard]] std::size_t active_count() const;

    [[nodiscard]] uint64_t peek_next_counter() const noexcept;

    [[nodiscard]] std::vector<uint64_t> active_sessions() const;

private:
    uint64_t salt_;
    std::atomic<uint64_t> next_counter_;

    std::unordered_map<uint64_t, std::string> session_extranonces_;
    mutable std::mutex mutex_;
};

} // namespace bchpool::mining
