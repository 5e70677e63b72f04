/**
 * @file account_locks.cpp
 * @brief Implementation of the per-account lock registry
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hyperchain/account_locks.hpp"

namespace hyperchain {

std::unique_lock<std::mutex> AccountLockRegistry::acquire(const std::string& account_id) {
    std::mutex& account_mutex = get_or_create_mutex(account_id);
    return std::unique_lock<std::mutex>(account_mutex);
}

std::unique_lock<std::mutex> AccountLockRegistry::try_acquire(const std::string& account_id) {
    std::mutex& account_mutex = get_or_create_mutex(account_id);
    return std::unique_lock<std::mutex>(account_mutex, std::try_to_lock);
}

size_t AccountLockRegistry::tracked_accounts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return account_mutexes_.size();
}

std::mutex& AccountLockRegistry::get_or_create_mutex(const std::string& account_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = account_mutexes_.find(account_id);
    if (it == account_mutexes_.end()) {
        it = account_mutexes_.emplace(account_id, std::make_unique<std::mutex>()).first;
    }

    return *it->second;
}

} // namespace hyperchain
