/**
 * @file account_locks.hpp
 * @brief Per-account mutual exclusion
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Keyed mutex map: all evolution steps for one account run under that
 * account's lock while different accounts proceed in parallel.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace hyperchain {

/**
 * @brief AccountLockRegistry - one mutex per account identity
 *
 * Mutexes are created on first use and live as long as the registry
 * (accounts are never deleted). Thread-safe.
 */
class AccountLockRegistry {
public:
    AccountLockRegistry() = default;
    ~AccountLockRegistry() = default;

    // Disable copy and move
    AccountLockRegistry(const AccountLockRegistry&) = delete;
    AccountLockRegistry& operator=(const AccountLockRegistry&) = delete;
    AccountLockRegistry(AccountLockRegistry&&) = delete;
    AccountLockRegistry& operator=(AccountLockRegistry&&) = delete;

    /**
     * @brief Block until the account's lock is held
     * @param account_id Account identity
     * @return Owning lock, released on destruction
     */
    std::unique_lock<std::mutex> acquire(const std::string& account_id);

    /**
     * @brief Acquire the account's lock without blocking
     * @param account_id Account identity
     * @return Lock that owns the mutex only if it was free
     */
    std::unique_lock<std::mutex> try_acquire(const std::string& account_id);

    /**
     * @brief Number of accounts with a lock entry
     */
    size_t tracked_accounts() const;

private:
    /// Registry mutex (guards the map, never held while waiting on an account)
    mutable std::mutex mutex_;

    /// Per-account mutexes (stable addresses)
    std::map<std::string, std::unique_ptr<std::mutex>> account_mutexes_;

    std::mutex& get_or_create_mutex(const std::string& account_id);
};

} // namespace hyperchain
