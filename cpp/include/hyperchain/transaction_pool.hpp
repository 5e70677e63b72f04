/**
 * @file transaction_pool.hpp
 * @brief Pending transactions awaiting inclusion in a block
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Features:
 * - FIFO order across accounts, chained order within an account
 * - Pre-state snapshot per entry for divergence detection before append
 * - Per-account eviction of stale entries
 */

#pragma once

#include "hyperchain/account.hpp"
#include "hyperchain/transaction.hpp"
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hyperchain {

/**
 * @brief Transaction with the account states it was computed from and produces
 */
struct PendingEntry {
    uint64_t sequence = 0;       ///< Pool-assigned insertion number
    Transaction transaction;
    Account pre_state;           ///< Account state the transaction was computed on
    Account post_state;          ///< Account state after the transaction
};

/**
 * @brief TransactionPool - thread-safe queue of pending transactions
 *
 * Entries of one account form a chain: each entry's pre_state is the
 * previous entry's post_state. Any prefix of the pool therefore contains
 * a prefix of every account's chain.
 */
class TransactionPool {
public:
    TransactionPool() = default;

    // Disable copy and move
    TransactionPool(const TransactionPool&) = delete;
    TransactionPool& operator=(const TransactionPool&) = delete;
    TransactionPool(TransactionPool&&) = delete;
    TransactionPool& operator=(TransactionPool&&) = delete;

    /**
     * @brief Append an entry
     * @return Sequence number assigned to the entry
     */
    uint64_t add(const Transaction& transaction, const Account& pre_state, const Account& post_state);

    /**
     * @brief Post-state of the newest pending entry of an account
     * @return Account state or std::nullopt if the account has nothing pending
     */
    std::optional<Account> latest_state(const std::string& account_id) const;

    /**
     * @brief Oldest entries in pool order
     * @param max_entries Maximum number of entries returned
     */
    std::vector<PendingEntry> snapshot(size_t max_entries) const;

    /**
     * @brief Remove entries by sequence number (entries already gone are ignored)
     * @return Number of entries removed
     */
    size_t remove(const std::vector<uint64_t>& sequences);

    /**
     * @brief Remove every entry of an account
     * @return Removed entries in pool order
     */
    std::vector<PendingEntry> evict_account(const std::string& account_id);

    size_t size() const;
    size_t pending_for(const std::string& account_id) const;

    bool empty() const { return size() == 0; }

private:
    mutable std::mutex mutex_;
    std::deque<PendingEntry> entries_;
    uint64_t next_sequence_ = 1;
};

} // namespace hyperchain
