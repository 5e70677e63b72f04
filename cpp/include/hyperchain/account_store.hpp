/**
 * @file account_store.hpp
 * @brief Durable SCDA account table
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * SQLite-backed account records keyed by identity. Last-writer-wins at the
 * store level; callers serialize writes per account (see AccountLockRegistry).
 */

#pragma once

#include "hyperchain/account.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hyperchain {

/**
 * @brief AccountStore - SQLite persistence for accounts
 *
 * Thread-safe for concurrent access. Every stored change increments the
 * account's revision.
 */
class AccountStore {
public:
    /**
     * @brief Open (or create) the account database
     * @param database_path Path to SQLite database file (":memory:" allowed)
     * @throws std::runtime_error if the database cannot be opened
     */
    explicit AccountStore(const std::string& database_path);

    /**
     * @brief Destructor - closes database
     */
    ~AccountStore();

    // Disable copy and move
    AccountStore(const AccountStore&) = delete;
    AccountStore& operator=(const AccountStore&) = delete;
    AccountStore(AccountStore&&) = delete;
    AccountStore& operator=(AccountStore&&) = delete;

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * @brief Get account by identity
     * @param account_id Account identity
     * @return Account or std::nullopt if not found
     */
    std::optional<Account> get(const std::string& account_id) const;

    /**
     * @brief Get account by identity
     * @throws AccountNotFound if absent
     */
    Account require(const std::string& account_id) const;

    bool exists(const std::string& account_id) const;

    /**
     * @brief All account identities in ascending order
     */
    std::vector<std::string> list_account_ids() const;

    size_t count() const;

    // ========================================================================
    // Mutations
    // ========================================================================

    /**
     * @brief Insert a new account
     * @param account Initial account state
     * @return true if inserted, false if the identity already exists
     * @throws StorageError on database failure
     */
    bool register_account(const Account& account);

    /**
     * @brief Insert or replace an account
     * @param account Account state to store
     * @return Revision assigned to the stored record
     * @throws StorageError on database failure
     */
    uint64_t upsert(const Account& account);

    /**
     * @brief Insert or replace several accounts in one transaction
     *
     * Either every record is written or none is.
     *
     * @throws StorageError on database failure
     */
    void upsert_all(const std::vector<Account>& accounts);

private:
    /// Path to SQLite database
    std::string database_path_;

    /// SQLite database connection (opaque pointer)
    void* db_connection_;

    /// Mutex for thread-safe database access
    mutable std::mutex db_mutex_;

    bool initialize_database();

    /// Caller holds db_mutex_
    std::optional<Account> get_locked(const std::string& account_id) const;

    /// Caller holds db_mutex_
    uint64_t upsert_locked(const Account& account);
};

} // namespace hyperchain
