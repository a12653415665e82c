/**
 * @file extranonce_manager.cpp
 * @brief Реализация выдачи extra_nonce1
 */

#include "extranonce_manager.hpp"

#include <format>
#include <random>

namespace bchpool::mining {

namespace {

uint64_t random_salt() {
    std::random_device rd;
    std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
    return gen();
}

} // namespace

ExtranonceManager::ExtranonceManager()
    : ExtranonceManager(random_salt(), 1) {}

ExtranonceManager::ExtranonceManager(uint64_t salt, uint64_t start_value)
    : salt_(salt)
    , next_counter_(start_value) {}

std::string ExtranonceManager::assign(uint64_t session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t counter = next_counter_.fetch_add(1, std::memory_order_relaxed);
    std::string extranonce = std::format("{:016x}{:016x}", salt_, counter);

    session_extranonces_[session_id] = extranonce;
    return extranonce;
}

void ExtranonceManager::release(uint64_t session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_extranonces_.erase(session_id);
}

std::optional<std::string> ExtranonceManager::get(uint64_t session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = session_extranonces_.find(session_id);
    if (it != session_extranonces_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool ExtranonceManager::has(uint64_t session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_extranonces_.contains(session_id);
}

std::size_t ExtranonceManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_extranonces_.size();
}

uint64_t ExtranonceManager::peek_next_counter() const noexcept {
    return next_counter_.load(std::memory_order_relaxed);
}

std::vector<uint64_t> ExtranonceManager::active_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<uint64_t> sessions;
    sessions.reserve(session_extranonces_.size());

    for (const auto& [id, _] : session_extranonces_) {
        sessions.push_back(id);
    }

    return sessions;
}

} // namespace bchpool::mining
