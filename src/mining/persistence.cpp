/**
 * @file persistence.cpp
 * @brief In-memory хранилище
 */

#include "persistence.hpp"

#include <format>

namespace bchpool::mining {

MemoryPersistence::MemoryPersistence(std::size_t max_shares)
    : max_shares_(max_shares) {}

Result<Miner> MemoryPersistence::register_miner(const std::string& address,
                                                const std::string& worker) {
    if (address.empty()) {
        return Err<Miner>(ErrorCode::PersistenceFailure, "Пустой адрес майнера");
    }

    const auto now = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = miners_.try_emplace(address);
    Miner& miner = it->second;
    if (inserted) {
        miner.address = address;
        miner.registered_at = now;
    }
    miner.worker = worker;
    miner.last_seen = now;
    return miner;
}

Result<std::optional<Miner>> MemoryPersistence::get_miner_by_address(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = miners_.find(address);
    if (it == miners_.end()) {
        return std::optional<Miner>{};
    }
    return std::optional<Miner>{it->second};
}

Result<void> MemoryPersistence::save_share(const ShareRecord& share) {
    std::lock_guard<std::mutex> lock(mutex_);
    shares_.push_back(share);
    while (shares_.size() > max_shares_) {
        shares_.pop_front();
    }

    auto it = miners_.find(share.miner_address);
    if (it != miners_.end()) {
        it->second.last_seen = share.created_at;
    }
    return {};
}

Result<void> MemoryPersistence::save_block(uint32_t height,
                                           const std::string& hash,
                                           const std::string& miner_address) {
    if (hash.size() != 64) {
        return Err<void>(ErrorCode::PersistenceFailure,
                         std::format("Некорректный хеш блока: {}", hash));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    blocks_.push_back(BlockRecord{height, hash, miner_address, std::chrono::system_clock::now()});
    return {};
}

bool MemoryPersistence::set_miner_active(const std::string& address, bool active) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = miners_.find(address);
    if (it == miners_.end()) {
        return false;
    }
    it->second.is_active = active;
    return true;
}

std::size_t MemoryPersistence::miner_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return miners_.size();
}

std::vector<ShareRecord> MemoryPersistence::shares() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {shares_.begin(), shares_.end()};
}

std::vector<BlockRecord> MemoryPersistence::blocks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blocks_;
}

} // namespace bchpool::mining
