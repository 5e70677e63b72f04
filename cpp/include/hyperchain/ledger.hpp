/**
 * @file ledger.hpp
 * @brief Append-only PoHD block chain with SQLite persistence
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Features:
 * - Fixed genesis block, exempt from linkage and PoHD checks
 * - Atomic block validation (linkage, hash, PoHD, transaction consistency)
 * - Versioned chain tip for cheap staleness detection by miners
 * - Integrity verification of the stored chain
 * - JSON export for replication between nodes
 */

#pragma once

#include "hyperchain/block.hpp"
#include "hyperchain/errors.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hyperchain {

/**
 * @brief Latest accepted block, versioned by generation
 */
struct ChainTip {
    uint64_t index = 0;          ///< Index of the latest block
    Hash256 hash{};              ///< Hash of the latest block
    uint64_t timestamp = 0;      ///< Timestamp of the latest block
    uint64_t generation = 0;     ///< Incremented on every append
};

/**
 * @brief Result of validating a block
 */
struct BlockValidation {
    ErrorCode code = ErrorCode::NONE;   ///< NONE when the block is valid
    std::string reason;                 ///< Human-readable rejection reason

    bool ok() const { return code == ErrorCode::NONE; }

    static BlockValidation success() { return BlockValidation{}; }
    static BlockValidation reject(ErrorCode code, const std::string& reason) {
        return BlockValidation{code, reason};
    }
};

/**
 * @brief Transaction as recorded on the chain
 */
struct RecordedTransaction {
    uint64_t block_index = 0;
    uint32_t position = 0;       ///< Position within the block
    Transaction transaction;
};

/**
 * @brief Source of current account state for transaction checks
 */
using AccountLookup = std::function<std::optional<Account>(const std::string&)>;

/**
 * @brief Ledger - append-only chain of PoHD blocks
 *
 * Thread-safe for concurrent access. Appends are serialized; the first
 * valid block at an index wins and later candidates for the same index
 * fail linkage.
 */
class Ledger {
public:
    /**
     * @brief Open (or create) the ledger database
     *
     * Writes the genesis block into an empty database and verifies the
     * stored genesis of an existing one.
     *
     * @param database_path Path to SQLite database file (":memory:" allowed)
     * @param initial_difficulty Difficulty required of the first mined block
     * @param retarget_difficulty Adjust difficulty after each append
     * @param target_block_time Target interval used by retargeting
     * @throws std::runtime_error if the database cannot be opened or holds a foreign genesis
     */
    explicit Ledger(
        const std::string& database_path,
        uint32_t initial_difficulty = config::DEFAULT_DIFFICULTY,
        bool retarget_difficulty = false,
        std::chrono::seconds target_block_time = config::TARGET_BLOCK_TIME
    );

    /**
     * @brief Destructor - closes database
     */
    ~Ledger();

    // Disable copy and move
    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;
    Ledger(Ledger&&) = delete;
    Ledger& operator=(Ledger&&) = delete;

    // ========================================================================
    // Read API
    // ========================================================================

    /**
     * @brief Get block by index
     * @return Block or std::nullopt if not found
     */
    std::optional<Block> get_block(uint64_t index) const;

    /**
     * @brief Number of blocks including genesis
     */
    uint64_t get_chain_length() const;

    /**
     * @brief Snapshot of the chain tip
     */
    ChainTip get_tip() const;

    /**
     * @brief Current tip generation (lock-free)
     */
    uint64_t tip_generation() const { return generation_.load(); }

    /**
     * @brief Difficulty required of the next block
     */
    uint32_t current_difficulty() const;

    /**
     * @brief Total number of transactions on the chain
     */
    size_t total_transactions() const;

    /**
     * @brief Transactions that reference an account (as sender or recipient)
     * @param account_id Account identity
     * @return Recorded transactions in chain order
     */
    std::vector<RecordedTransaction> get_account_history(const std::string& account_id) const;

    // ========================================================================
    // Validation / Append
    // ========================================================================

    /**
     * @brief Validate a block against the current tip
     *
     * Checks, in order: index extends the tip, previous hash matches,
     * stated hash/position match recomputation and transactions are
     * present, difficulty and PoHD predicate hold, and every transaction
     * references existing accounts and is consistent with their state.
     * Never throws for a bad block.
     *
     * @param block Candidate block
     * @param accounts Current account state
     * @return Validation result
     */
    BlockValidation validate_block(const Block& block, const AccountLookup& accounts) const;

    /**
     * @brief Validate and append a block atomically
     * @param block Candidate block
     * @param accounts Current account state
     * @return Validation result; the chain is unchanged unless ok()
     */
    BlockValidation append_block(const Block& block, const AccountLookup& accounts);

    /**
     * @brief Verify linkage, hashes and PoHD of the whole stored chain
     * @return true if the chain is valid, false if tampering detected
     */
    bool verify_chain_integrity() const;

    // ========================================================================
    // Replication
    // ========================================================================

    /**
     * @brief Export blocks for replication to other nodes
     * @param since_index Only export blocks with index >= since_index
     * @return JSON document {"chain_length": n, "blocks": [...]}
     */
    std::string export_chain_json(uint64_t since_index = 0) const;

private:
    /// Path to SQLite database
    std::string database_path_;

    /// SQLite database connection (opaque pointer)
    void* db_connection_;

    /// Mutex for thread-safe database access
    mutable std::mutex db_mutex_;

    /// Serializes validate-then-append
    std::mutex append_mutex_;

    /// Guards tip_ and difficulty_
    mutable std::mutex tip_mutex_;
    ChainTip tip_;
    uint32_t difficulty_;

    std::atomic<uint64_t> generation_{0};

    uint32_t initial_difficulty_;
    bool retarget_difficulty_;
    std::chrono::seconds target_block_time_;

    bool initialize_database();
    bool persist_block(const Block& block);
    void load_tip();

    /// Caller holds db_mutex_
    std::optional<Block> get_block_locked(uint64_t index) const;

    /// Caller holds db_mutex_
    uint64_t get_chain_length_locked() const;

    BlockValidation check_transactions(const Block& block, const AccountLookup& accounts) const;
};

} // namespace hyperchain
