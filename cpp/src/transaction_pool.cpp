/**
 * @file transaction_pool.cpp
 * @brief Implementation of the pending transaction pool
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hyperchain/transaction_pool.hpp"
#include <algorithm>
#include <set>

namespace hyperchain {

uint64_t TransactionPool::add(const Transaction& transaction, const Account& pre_state, const Account& post_state) {
    std::lock_guard<std::mutex> lock(mutex_);

    PendingEntry entry;
    entry.sequence = next_sequence_++;
    entry.transaction = transaction;
    entry.pre_state = pre_state;
    entry.post_state = post_state;

    entries_.push_back(entry);
    return entry.sequence;
}

std::optional<Account> TransactionPool::latest_state(const std::string& account_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->transaction.account_id == account_id) {
            return it->post_state;
        }
    }

    return std::nullopt;
}

std::vector<PendingEntry> TransactionPool::snapshot(size_t max_entries) const {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t count = std::min(max_entries, entries_.size());
    return std::vector<PendingEntry>(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(count));
}

size_t TransactionPool::remove(const std::vector<uint64_t>& sequences) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::set<uint64_t> targets(sequences.begin(), sequences.end());
    size_t before = entries_.size();

    entries_.erase(
        std::remove_if(entries_.begin(), entries_.end(),
                       [&](const PendingEntry& entry) { return targets.count(entry.sequence) > 0; }),
        entries_.end());

    return before - entries_.size();
}

std::vector<PendingEntry> TransactionPool::evict_account(const std::string& account_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<PendingEntry> evicted;
    std::deque<PendingEntry> kept;

    for (auto& entry : entries_) {
        if (entry.transaction.account_id == account_id) {
            evicted.push_back(std::move(entry));
        } else {
            kept.push_back(std::move(entry));
        }
    }

    entries_.swap(kept);
    return evicted;
}

size_t TransactionPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t TransactionPool::pending_for(const std::string& account_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [&](const PendingEntry& entry) { return entry.transaction.account_id == account_id; }));
}

} // namespace hyperchain
