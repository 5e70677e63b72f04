/**
 * @file hyper_node.cpp
 * @brief Implementation of the HyperChain node orchestrator
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Integrates validation, evolution, mining and the ledger into one node
 */

#include "hyperchain/hyper_node.hpp"
#include "hyperchain/utilities.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <map>

using json = nlohmann::json;

namespace hyperchain {

using namespace hyperchain::utilities;

// ============================================================================
// Constructor and Destructor
// ============================================================================

HyperNode::HyperNode(
    const config::NodeConfig& config,
    std::shared_ptr<ScoringOracle> oracle,
    std::shared_ptr<RandomSource> rng
)
    : config_(config)
    , start_time_(std::chrono::steady_clock::now())
    , pipeline_(std::move(oracle))
    , rng_(std::move(rng))
{
    if (!config::validate_identifier(config_.node_id)) {
        throw std::invalid_argument("Invalid node ID: " + config_.node_id);
    }

    if (config_.max_transactions_per_block == 0) {
        throw std::invalid_argument("max_transactions_per_block must be positive");
    }

    log_info("HyperNode: Initializing node '" + config_.node_id + "'");

    if (!ChainCrypto::initialize()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }

    std::filesystem::path db_dir;
    if (config_.data_dir.empty()) {
        db_dir = config::get_database_directory();
        snapshot_dir_ = config::get_snapshot_directory();
    } else {
        db_dir = config_.data_dir / "db";
        snapshot_dir_ = config_.data_dir / "snapshots";
        std::filesystem::create_directories(db_dir);
    }

    if (!rng_) {
        rng_ = std::make_shared<SecureRandomSource>();
    }

    uint32_t difficulty = std::clamp(config_.difficulty, config::MIN_DIFFICULTY, config::MAX_DIFFICULTY);
    if (difficulty != config_.difficulty) {
        log_warn("HyperNode: Difficulty " + std::to_string(config_.difficulty) +
                 " out of range, using " + std::to_string(difficulty));
    }

    ledger_ = std::make_unique<Ledger>(
        (db_dir / "ledger.db").string(),
        difficulty,
        config_.retarget_difficulty,
        config_.target_block_time
    );
    log_info("HyperNode: Opened ledger (" + std::to_string(ledger_->get_chain_length()) + " blocks)");

    accounts_ = std::make_unique<AccountStore>((db_dir / "accounts.db").string());
    log_info("HyperNode: Opened account store (" + std::to_string(accounts_->count()) + " accounts)");

    miner_ = std::make_unique<PohdMiner>(config_.mining_workers);
    log_info("HyperNode: Miner ready with " + std::to_string(miner_->worker_count()) + " workers");
}

HyperNode::~HyperNode() {
    cancellation_.cancel();
    log_info("HyperNode: Destroyed");
}

// ============================================================================
// Accounts
// ============================================================================

Account HyperNode::register_account(const std::string& account_id) {
    if (!config::validate_identifier(account_id)) {
        throw ChainError(ErrorCode::INVALID_ARGUMENT, "Invalid account ID: " + account_id);
    }

    Account account = make_genesis_account(account_id, current_unix_time());

    if (!accounts_->register_account(account)) {
        throw ChainError(ErrorCode::INVALID_ARGUMENT, "Account already registered: " + account_id);
    }

    log_info("HyperNode: Registered account '" + account_id + "'");
    return accounts_->require(account_id);
}

std::optional<Account> HyperNode::get_account(const std::string& account_id) const {
    return accounts_->get(account_id);
}

std::optional<Account> HyperNode::get_working_account(const std::string& account_id) const {
    return working_state(account_id);
}

Transaction HyperNode::regenerate_energy(const std::string& account_id, uint64_t elapsed_seconds) {
    if (!accounts_->exists(account_id)) {
        throw AccountNotFound(account_id);
    }

    auto account_lock = account_locks_.acquire(account_id);

    auto current = working_state(account_id);
    if (!current) {
        throw AccountNotFound(account_id);
    }

    EvolutionResult regeneration = EvolutionEngine::regenerate(*current, elapsed_seconds, current_unix_time());
    regeneration.account.revision = current->revision + 1;
    pool_.add(regeneration.transaction, *current, regeneration.account);

    log_debug("HyperNode: Queued regeneration of " + std::to_string(regeneration.energy_gained) +
              " energy for '" + account_id + "'");
    return regeneration.transaction;
}

// ============================================================================
// Submissions
// ============================================================================

SubmissionResult HyperNode::submit_solution(
    const std::string& account_id,
    const Problem& problem,
    const Solution& solution
) {
    if (!problem.is_valid()) {
        throw ChainError(ErrorCode::INVALID_ARGUMENT, "Invalid problem: " + problem.id);
    }

    auto snapshot = working_state(account_id);
    if (!snapshot) {
        throw AccountNotFound(account_id);
    }

    double cost = EvolutionEngine::attempt_cost(problem.difficulty);
    if (snapshot->energy < cost) {
        throw InsufficientEnergy(account_id, cost, snapshot->energy);
    }

    // Oracle call happens outside the account lock
    ValidationResult validation = pipeline_.validate(*snapshot, problem, solution, *rng_);

    auto account_lock = account_locks_.acquire(account_id);

    auto current = working_state(account_id);
    if (!current) {
        throw AccountNotFound(account_id);
    }

    uint64_t now = current_unix_time();
    EvolutionResult evolution = validation.accepted
        ? EvolutionEngine::apply_solution(*current, problem, validation.quality, *rng_, now)
        : EvolutionEngine::charge_attempt(*current, problem, validation.quality, now);

    evolution.account.revision = current->revision + 1;
    pool_.add(evolution.transaction, *current, evolution.account);

    SubmissionResult result;
    result.accepted = validation.accepted;
    result.quality = validation.quality;
    result.complexity_delta = evolution.complexity_delta;
    if (evolution.tier_changed) {
        result.new_tier = evolution.account.tier;
    }
    result.energy_after = evolution.account.energy;
    result.transaction = evolution.transaction;

    log_info("HyperNode: Submission by '" + account_id + "' for problem '" + problem.id + "' " +
             (validation.accepted ? "accepted" : "rejected") +
             " (quality " + std::to_string(validation.quality) + ")");

    return result;
}

Transaction HyperNode::submit_transfer(const std::string& sender_id, const std::string& recipient_id, double amount) {
    if (!std::isfinite(amount) || amount <= 0.0) {
        throw ChainError(ErrorCode::INVALID_ARGUMENT, "Transfer amount must be positive");
    }
    if (sender_id == recipient_id) {
        throw ChainError(ErrorCode::INVALID_ARGUMENT, "Transfer to self: " + sender_id);
    }
    if (!accounts_->exists(recipient_id)) {
        throw AccountNotFound(recipient_id);
    }
    if (!accounts_->exists(sender_id)) {
        throw AccountNotFound(sender_id);
    }

    auto account_lock = account_locks_.acquire(sender_id);

    auto current = working_state(sender_id);
    if (!current) {
        throw AccountNotFound(sender_id);
    }

    uint64_t now = current_unix_time();
    Transaction tx = make_transfer_transaction(sender_id, recipient_id, amount, now);

    Account next = *current;
    next.updated_at = now;
    next.revision = current->revision + 1;
    pool_.add(tx, *current, next);

    log_info("HyperNode: Queued transfer " + sender_id + " -> " + recipient_id);
    return tx;
}

// ============================================================================
// Block Production
// ============================================================================

std::optional<MiningReport> HyperNode::mine_pending_block(
    std::optional<std::chrono::steady_clock::time_point> deadline
) {
    std::lock_guard<std::mutex> mining_lock(mining_mutex_);
    cancellation_.reset();

    if (pool_.empty()) {
        return std::nullopt;
    }

    MiningReport report;

    while (true) {
        std::vector<PendingEntry> entries = pool_.snapshot(config_.max_transactions_per_block);
        if (entries.empty()) {
            log_info("HyperNode: No pending transactions left to mine");
            return report;
        }

        // Drop transactions computed on state that no longer holds
        std::set<std::string> diverged = find_diverged_accounts(entries);
        if (!diverged.empty()) {
            for (const auto& account_id : diverged) {
                auto account_lock = account_locks_.acquire(account_id);
                size_t dropped = pool_.evict_account(account_id).size();
                report.evicted += dropped;
                log_warn("HyperNode: Dropped " + std::to_string(dropped) +
                         " stale pending transactions of '" + account_id + "'");
            }
            continue;
        }

        ChainTip tip = ledger_->get_tip();

        Block candidate;
        candidate.index = tip.index + 1;
        candidate.timestamp = std::max(current_unix_time(), tip.timestamp);
        candidate.previous_hash = tip.hash;
        candidate.state = BlockState::PENDING;
        for (const auto& entry : entries) {
            candidate.transactions.push_back(entry.transaction);
        }

        MiningRequest request;
        request.difficulty = ledger_->current_difficulty();
        request.tip_generation = [this]() { return ledger_->tip_generation(); };
        request.expected_generation = tip.generation;
        request.deadline = deadline;
        candidate.difficulty = request.difficulty;

        report.rounds++;
        MiningOutcome outcome = miner_->mine(candidate, request, cancellation_);
        report.attempts += outcome.attempts;
        report.status = outcome.status;

        if (outcome.status == MiningStatus::STALE_TIP) {
            log_info("HyperNode: Chain tip moved during search, restarting");
            continue;
        }
        if (outcome.status != MiningStatus::FOUND) {
            return report;
        }

        BlockValidation validation;
        {
            std::lock_guard<std::mutex> commit_lock(commit_mutex_);

            validation = ledger_->append_block(outcome.block, store_lookup());

            if (validation.ok()) {
                std::vector<Account> post_states;
                std::vector<uint64_t> sequences;
                for (const auto& entry : entries) {
                    post_states.push_back(entry.post_state);
                    sequences.push_back(entry.sequence);
                }

                try {
                    accounts_->upsert_all(post_states);
                } catch (const StorageError& e) {
                    log_critical("HyperNode: Block " + std::to_string(outcome.block.index) +
                                 " appended but account update failed: " + e.what());
                    throw;
                }
                pool_.remove(sequences);
            }
        }

        if (validation.ok()) {
            report.appended = true;
            report.block = outcome.block;
            report.block.state = BlockState::ACCEPTED;

            log_info("HyperNode: Mined block " + std::to_string(report.block.index) + " with " +
                     std::to_string(entries.size()) + " transactions");
            return report;
        }

        switch (validation.code) {
            case ErrorCode::CHAIN_LINKAGE_ERROR:
            case ErrorCode::INVALID_NONCE:
                // Tip or difficulty changed between search and append
                log_info("HyperNode: Mined block superseded (" + validation.reason + "), re-mining");
                continue;

            case ErrorCode::STORAGE_ERROR:
                throw StorageError(validation.reason);

            default:
                break;
        }

        log_warn("HyperNode: Mined block rejected: " + error_code_to_string(validation.code) +
                 ": " + validation.reason);

        std::set<std::string> stale = find_diverged_accounts(entries);
        if (stale.empty()) {
            log_error("HyperNode: Rejected block has no identifiable stale account, dropping its transactions");
            for (const auto& entry : entries) {
                stale.insert(entry.transaction.account_id);
            }
        }

        for (const auto& account_id : stale) {
            auto account_lock = account_locks_.acquire(account_id);
            report.evicted += pool_.evict_account(account_id).size();
        }
    }
}

void HyperNode::cancel_mining() {
    cancellation_.cancel();
}

// ============================================================================
// Ingestion / Replication
// ============================================================================

BlockValidation HyperNode::ingest_external_block(const Block& block, const std::string& source_id) {
    if (is_source_halted(source_id)) {
        log_warn("HyperNode: Ignoring block " + std::to_string(block.index) +
                 " from halted source '" + source_id + "'");
        return BlockValidation::reject(ErrorCode::SOURCE_HALTED, "source '" + source_id + "' is halted");
    }

    BlockValidation validation;
    {
        std::lock_guard<std::mutex> commit_lock(commit_mutex_);

        validation = ledger_->append_block(block, store_lookup());
        if (validation.ok()) {
            replay_into_store(block);
        }
    }

    if (!validation.ok()) {
        if (is_corruption_error(validation.code)) {
            halt_source(source_id, validation);
        } else {
            log_warn("HyperNode: Rejected block " + std::to_string(block.index) + " from '" + source_id +
                     "': " + error_code_to_string(validation.code) + ": " + validation.reason);
        }
        return validation;
    }

    log_info("HyperNode: Ingested block " + std::to_string(block.index) + " from '" + source_id + "'");
    return validation;
}

ImportReport HyperNode::import_chain_json(const std::string& chain_json, const std::string& source_id) {
    ImportReport report;

    if (is_source_halted(source_id)) {
        report.result = BlockValidation::reject(ErrorCode::SOURCE_HALTED, "source '" + source_id + "' is halted");
        return report;
    }

    json document;
    try {
        document = json::parse(chain_json);
    } catch (const json::exception& e) {
        report.result = BlockValidation::reject(ErrorCode::MALFORMED_BLOCK,
                                                std::string("unparseable chain document: ") + e.what());
        halt_source(source_id, report.result);
        return report;
    }

    if (!document.is_object() || !document.contains("blocks") || !document["blocks"].is_array()) {
        report.result = BlockValidation::reject(ErrorCode::MALFORMED_BLOCK, "chain document has no block list");
        halt_source(source_id, report.result);
        return report;
    }

    for (const auto& block_json : document["blocks"]) {
        auto block = Block::from_json_object(block_json);
        if (!block) {
            report.result = BlockValidation::reject(ErrorCode::MALFORMED_BLOCK, "undecodable block");
            halt_source(source_id, report.result);
            return report;
        }

        ChainTip tip = ledger_->get_tip();
        if (block->index <= tip.index) {
            auto stored = ledger_->get_block(block->index);
            if (stored && ChainCrypto::constant_time_equal(stored->hash, block->hash)) {
                report.skipped++;
                continue;
            }
            report.result = BlockValidation::reject(ErrorCode::CHAIN_LINKAGE_ERROR,
                "block " + std::to_string(block->index) + " conflicts with the accepted chain");
            log_warn("HyperNode: Import from '" + source_id + "' stopped: " + report.result.reason);
            return report;
        }

        BlockValidation validation = ingest_external_block(*block, source_id);
        if (!validation.ok()) {
            report.result = validation;
            return report;
        }
        report.imported++;
    }

    log_info("HyperNode: Imported " + std::to_string(report.imported) + " blocks from '" + source_id +
             "' (" + std::to_string(report.skipped) + " already present)");
    return report;
}

std::string HyperNode::export_chain_json(uint64_t since_index) const {
    return ledger_->export_chain_json(since_index);
}

bool HyperNode::is_source_halted(const std::string& source_id) const {
    std::lock_guard<std::mutex> lock(sources_mutex_);
    return halted_sources_.count(source_id) > 0;
}

// ============================================================================
// Read API
// ============================================================================

std::optional<Block> HyperNode::get_block(uint64_t index) const {
    return ledger_->get_block(index);
}

uint64_t HyperNode::get_chain_length() const {
    return ledger_->get_chain_length();
}

std::vector<RecordedTransaction> HyperNode::get_account_history(const std::string& account_id) const {
    return ledger_->get_account_history(account_id);
}

bool HyperNode::verify_chain() const {
    return ledger_->verify_chain_integrity();
}

// ============================================================================
// Statistics and Snapshots
// ============================================================================

NodeStats HyperNode::get_stats() const {
    NodeStats stats{};

    stats.chain_length = ledger_->get_chain_length();
    stats.total_transactions = ledger_->total_transactions();
    stats.pending_transactions = pool_.size();
    stats.current_difficulty = ledger_->current_difficulty();
    stats.accounts = accounts_->count();
    {
        std::lock_guard<std::mutex> lock(sources_mutex_);
        stats.halted_sources = halted_sources_.size();
    }
    stats.uptime_seconds = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time_).count());

    return stats;
}

std::optional<std::string> HyperNode::write_snapshot(const std::filesystem::path& path) const {
    std::filesystem::path target = path;
    if (target.empty()) {
        target = snapshot_dir_ / ("chain-" + std::to_string(ledger_->get_chain_length()) + ".json");
    }

    if (!write_file(target.string(), ledger_->export_chain_json())) {
        log_error("HyperNode: Failed to write snapshot " + target.string());
        return std::nullopt;
    }

    auto checksum = calculate_file_hash(target.string());
    if (checksum) {
        log_info("HyperNode: Wrote snapshot " + target.string() + " (sha256 " + *checksum + ")");
    }
    return checksum;
}

void HyperNode::print_status() const {
    auto stats = get_stats();

    std::cout << "\n+----------------------------------------------------------------+\n";
    std::cout << "|              HyperChain Node Status                            |\n";
    std::cout << "+----------------------------------------------------------------+\n";
    std::cout << "| Node ID:          " << std::left << std::setw(44) << config_.node_id << " |\n";
    std::cout << "| Uptime:           " << std::left << std::setw(44) << format_duration(stats.uptime_seconds) << " |\n";
    std::cout << "+----------------------------------------------------------------+\n";
    std::cout << "| Chain Length:     " << std::left << std::setw(44) << stats.chain_length << " |\n";
    std::cout << "| Transactions:     " << std::left << std::setw(44) << stats.total_transactions << " |\n";
    std::cout << "| Pending:          " << std::left << std::setw(44) << stats.pending_transactions << " |\n";
    std::cout << "| Difficulty:       " << std::left << std::setw(44) << stats.current_difficulty << " |\n";
    std::cout << "+----------------------------------------------------------------+\n";
    std::cout << "| Accounts:         " << std::left << std::setw(44) << stats.accounts << " |\n";
    std::cout << "| Halted Sources:   " << std::left << std::setw(44) << stats.halted_sources << " |\n";
    std::cout << "+----------------------------------------------------------------+\n\n";
}

// ============================================================================
// Private Methods
// ============================================================================

AccountLookup HyperNode::store_lookup() const {
    const AccountStore* store = accounts_.get();
    return [store](const std::string& account_id) { return store->get(account_id); };
}

std::optional<Account> HyperNode::working_state(const std::string& account_id) const {
    auto pending = pool_.latest_state(account_id);
    if (pending) {
        return pending;
    }
    return accounts_->get(account_id);
}

std::set<std::string> HyperNode::find_diverged_accounts(const std::vector<PendingEntry>& entries) const {
    std::map<std::string, Account> working;
    std::set<std::string> diverged;

    for (const auto& entry : entries) {
        const std::string& account_id = entry.transaction.account_id;
        if (diverged.count(account_id) > 0) {
            continue;
        }

        auto it = working.find(account_id);
        if (it == working.end()) {
            auto stored = accounts_->get(account_id);
            if (!stored || stored->revision != entry.pre_state.revision) {
                diverged.insert(account_id);
                continue;
            }
            it = working.emplace(account_id, *stored).first;
        }

        if (entry.transaction.kind == TransactionKind::TRANSFER &&
            !accounts_->exists(entry.transaction.transfer.recipient_id)) {
            diverged.insert(account_id);
            continue;
        }

        if (EvolutionEngine::check_consistency(it->second, entry.transaction)) {
            diverged.insert(account_id);
            continue;
        }

        it->second = entry.post_state;
    }

    return diverged;
}

void HyperNode::replay_into_store(const Block& block) {
    std::map<std::string, Account> working;
    std::vector<Account> updates;

    for (const auto& tx : block.transactions) {
        if (tx.kind == TransactionKind::TRANSFER) {
            continue;
        }

        auto it = working.find(tx.account_id);
        if (it == working.end()) {
            it = working.emplace(tx.account_id, accounts_->require(tx.account_id)).first;
        }

        it->second = EvolutionEngine::replay(it->second, tx, block.timestamp);
        updates.push_back(it->second);
    }

    if (!updates.empty()) {
        accounts_->upsert_all(updates);
    }
}

void HyperNode::halt_source(const std::string& source_id, const BlockValidation& validation) {
    {
        std::lock_guard<std::mutex> lock(sources_mutex_);
        halted_sources_.insert(source_id);
    }

    log_critical("HyperNode: Halting ingestion from '" + source_id + "': " +
                 error_code_to_string(validation.code) + ": " + validation.reason);
}

} // namespace hyperchain
