/**
 * @file hyper_node.hpp
 * @brief HyperChain node orchestrator - integrates all ledger core components
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * HyperNode coordinates all subsystems:
 * - Solution validation through an injected scoring oracle
 * - Per-account serialized evolution of account state
 * - Pending transaction pool and parallel PoHD mining
 * - Ledger append, external block ingestion and chain replication
 * - Source quarantine on corruption-class faults
 */

#pragma once

#include "hyperchain/account_locks.hpp"
#include "hyperchain/account_store.hpp"
#include "hyperchain/chain_config.hpp"
#include "hyperchain/evolution_engine.hpp"
#include "hyperchain/ledger.hpp"
#include "hyperchain/pohd_consensus.hpp"
#include "hyperchain/random_source.hpp"
#include "hyperchain/transaction_pool.hpp"
#include "hyperchain/validation_pipeline.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hyperchain {

/**
 * @brief Outcome of a solution submission
 */
struct SubmissionResult {
    bool accepted = false;              ///< Validation decision
    double quality = 0.0;               ///< Quality score in [0, 1]
    double complexity_delta = 0.0;      ///< ΔC (0 when rejected)
    std::optional<int> new_tier;        ///< Set when the tier changed
    double energy_after = 0.0;          ///< Energy after the attempt
    Transaction transaction;            ///< Pending transaction recording the attempt
};

/**
 * @brief Outcome of one block production run
 */
struct MiningReport {
    bool appended = false;              ///< Block accepted onto the chain
    MiningStatus status = MiningStatus::CANCELLED;
    Block block;                        ///< Appended block when appended
    size_t evicted = 0;                 ///< Stale pending transactions dropped
    size_t rounds = 0;                  ///< Nonce searches started
    uint64_t attempts = 0;              ///< Nonces hashed across all rounds
};

/**
 * @brief Outcome of a chain import
 */
struct ImportReport {
    size_t imported = 0;                ///< Blocks appended
    size_t skipped = 0;                 ///< Blocks already on the chain
    BlockValidation result;             ///< First failure, or success
};

/**
 * @brief HyperNode statistics
 */
struct NodeStats {
    uint64_t chain_length;              ///< Blocks including genesis
    size_t total_transactions;          ///< Transactions on the chain
    size_t pending_transactions;        ///< Transactions awaiting a block
    uint32_t current_difficulty;        ///< Difficulty of the next block
    size_t accounts;                    ///< Registered accounts
    size_t halted_sources;              ///< Quarantined block sources
    uint64_t uptime_seconds;            ///< Node uptime in seconds
};

/**
 * @brief HyperNode - ledger core orchestrator
 *
 * Thread-safe. Submissions for different accounts proceed in parallel;
 * submissions for one account are serialized. The scoring oracle is
 * called outside every account lock. Block production and external
 * ingestion share one commit path so that account state and the chain
 * advance together.
 */
class HyperNode {
public:
    /**
     * @brief Construct node with configuration
     * @param config Node configuration
     * @param oracle Scoring oracle used for every submission
     * @param rng Random source (nullptr: cryptographically seeded source)
     * @throws std::invalid_argument if the node id is invalid or the oracle is null
     * @throws std::runtime_error if the databases cannot be opened
     */
    HyperNode(
        const config::NodeConfig& config,
        std::shared_ptr<ScoringOracle> oracle,
        std::shared_ptr<RandomSource> rng = nullptr
    );

    /**
     * @brief Destructor - cancels any running search
     */
    ~HyperNode();

    // Disable copy and move
    HyperNode(const HyperNode&) = delete;
    HyperNode& operator=(const HyperNode&) = delete;
    HyperNode(HyperNode&&) = delete;
    HyperNode& operator=(HyperNode&&) = delete;

    std::string get_node_id() const { return config_.node_id; }

    // ========================================================================
    // Accounts
    // ========================================================================

    /**
     * @brief Register a new account with default state
     * @param account_id Account identity
     * @return Stored account
     * @throws ChainError(INVALID_ARGUMENT) if the id is invalid or already registered
     */
    Account register_account(const std::string& account_id);

    /**
     * @brief Committed account state (as of the last applied block)
     * @return Account or std::nullopt if not registered
     */
    std::optional<Account> get_account(const std::string& account_id) const;

    /**
     * @brief Account state after this node's pending transactions
     * @return Account or std::nullopt if not registered
     */
    std::optional<Account> get_working_account(const std::string& account_id) const;

    /**
     * @brief Queue passive energy regeneration for elapsed time
     *
     * Recorded as a REGENERATION transaction so replicas apply the same
     * energy change when the block arrives.
     *
     * @param account_id Account identity
     * @param elapsed_seconds Time since the last regeneration
     * @return The queued transaction
     * @throws AccountNotFound if the account does not exist
     */
    Transaction regenerate_energy(const std::string& account_id, uint64_t elapsed_seconds);

    // ========================================================================
    // Submissions
    // ========================================================================

    /**
     * @brief Validate a solution and apply its outcome to the account
     *
     * An accepted solution evolves the account; a rejected one consumes the
     * attempt cost only. Either way a pending transaction is queued.
     *
     * @param account_id Submitting account
     * @param problem Problem being solved
     * @param solution Submitted solution
     * @return Decision, quality and the queued transaction
     * @throws ChainError(INVALID_ARGUMENT) for an invalid problem
     * @throws AccountNotFound if the account does not exist
     * @throws InsufficientEnergy if energy < attempt cost (no mutation)
     * @throws OracleUnavailable if scoring fails (no mutation)
     */
    SubmissionResult submit_solution(
        const std::string& account_id,
        const Problem& problem,
        const Solution& solution
    );

    /**
     * @brief Queue a transfer between two registered accounts
     * @throws AccountNotFound if either account does not exist
     * @throws ChainError(INVALID_ARGUMENT) for a self-transfer or non-positive amount
     */
    Transaction submit_transfer(const std::string& sender_id, const std::string& recipient_id, double amount);

    size_t pending_transactions() const { return pool_.size(); }

    /// Accounts with a lock entry (registered accounts only)
    size_t tracked_account_locks() const { return account_locks_.tracked_accounts(); }

    // ========================================================================
    // Block Production
    // ========================================================================

    /**
     * @brief Mine and append a block from pending transactions
     *
     * Re-reads the chain tip before every search and restarts when it
     * changes. Pending transactions whose account diverged from their
     * recorded pre-state are dropped before (re-)mining.
     *
     * @param deadline Optional search deadline (soft failure when passed)
     * @return Report, or std::nullopt if nothing is pending
     */
    std::optional<MiningReport> mine_pending_block(
        std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt
    );

    /**
     * @brief Cancel a running search
     */
    void cancel_mining();

    // ========================================================================
    // Ingestion / Replication
    // ========================================================================

    /**
     * @brief Validate and append a block produced elsewhere
     *
     * Corruption-class rejections quarantine the source; later blocks from
     * it are rejected with SOURCE_HALTED.
     *
     * @param block Candidate block
     * @param source_id Identity of the supplying source
     * @return Validation result; nothing is applied unless ok()
     */
    BlockValidation ingest_external_block(const Block& block, const std::string& source_id);

    /**
     * @brief Import blocks exported by another node
     *
     * Blocks already on the chain with the same hash are skipped. Import
     * stops at the first rejected block.
     */
    ImportReport import_chain_json(const std::string& chain_json, const std::string& source_id);

    std::string export_chain_json(uint64_t since_index = 0) const;

    bool is_source_halted(const std::string& source_id) const;

    // ========================================================================
    // Read API
    // ========================================================================

    std::optional<Block> get_block(uint64_t index) const;

    uint64_t get_chain_length() const;

    std::vector<RecordedTransaction> get_account_history(const std::string& account_id) const;

    /**
     * @brief Verify the stored chain
     * @return true if intact
     */
    bool verify_chain() const;

    // ========================================================================
    // Statistics and Snapshots
    // ========================================================================

    NodeStats get_stats() const;

    /**
     * @brief Write the chain as JSON to a file
     * @param path Target file (empty: snapshot directory, named by chain length)
     * @return SHA-256 checksum of the written file, or std::nullopt on failure
     */
    std::optional<std::string> write_snapshot(const std::filesystem::path& path = {}) const;

    /**
     * @brief Print status to console
     */
    void print_status() const;

private:
    // ========================================================================
    // Member Variables
    // ========================================================================

    config::NodeConfig config_;

    /// Default snapshot directory
    std::filesystem::path snapshot_dir_;

    /// Start time
    std::chrono::steady_clock::time_point start_time_;

    std::unique_ptr<Ledger> ledger_;
    std::unique_ptr<AccountStore> accounts_;
    AccountLockRegistry account_locks_;
    ValidationPipeline pipeline_;
    std::shared_ptr<RandomSource> rng_;
    std::unique_ptr<PohdMiner> miner_;
    TransactionPool pool_;

    /// Serializes block production runs
    std::mutex mining_mutex_;
    MiningCancellation cancellation_;

    /// Serializes chain append together with the account store update
    std::mutex commit_mutex_;

    /// Quarantined sources
    mutable std::mutex sources_mutex_;
    std::set<std::string> halted_sources_;

    // ========================================================================
    // Private Methods
    // ========================================================================

    /// Store state of an account
    AccountLookup store_lookup() const;

    /// Latest pending state, else stored state
    std::optional<Account> working_state(const std::string& account_id) const;

    /**
     * @brief Accounts whose pending entries no longer apply to stored state
     * @param entries Pool prefix in order
     */
    std::set<std::string> find_diverged_accounts(const std::vector<PendingEntry>& entries) const;

    /// Apply a block's transactions to the account store by replay
    void replay_into_store(const Block& block);

    void halt_source(const std::string& source_id, const BlockValidation& validation);
};

} // namespace hyperchain
