/**
 * @file ledger.cpp
 * @brief Implementation of the PoHD block chain
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hyperchain/ledger.hpp"
#include "hyperchain/evolution_engine.hpp"
#include "hyperchain/pohd_consensus.hpp"
#include "hyperchain/utilities.hpp"
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include <map>
#include <stdexcept>

using json = nlohmann::json;

namespace hyperchain {

namespace {

const char* SELECT_BLOCK = R"(
    SELECT block_index, block_hash, difficulty, encoded
    FROM blocks
    WHERE block_index = ?
)";

std::optional<Block> read_block_row(sqlite3_stmt* stmt) {
    const void* data = sqlite3_column_blob(stmt, 3);
    int size = sqlite3_column_bytes(stmt, 3);
    std::vector<uint8_t> encoded(static_cast<const uint8_t*>(data),
                                 static_cast<const uint8_t*>(data) + size);

    auto hash = ChainCrypto::hex_to_hash(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)));
    if (!hash) {
        return std::nullopt;
    }

    try {
        Block block = Block::decode(encoded);
        block.hash = *hash;
        block.position = derive_position(block.hash);
        block.difficulty = static_cast<uint32_t>(sqlite3_column_int64(stmt, 2));
        block.state = BlockState::ACCEPTED;
        return block;
    } catch (const std::exception& ex) {
        utilities::log_critical("Ledger: Stored block " + std::to_string(sqlite3_column_int64(stmt, 0)) +
                                " cannot be decoded: " + ex.what());
        return std::nullopt;
    }
}

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

Ledger::Ledger(
    const std::string& database_path,
    uint32_t initial_difficulty,
    bool retarget_difficulty,
    std::chrono::seconds target_block_time
)
    : database_path_(database_path)
    , db_connection_(nullptr)
    , difficulty_(initial_difficulty)
    , initial_difficulty_(initial_difficulty)
    , retarget_difficulty_(retarget_difficulty)
    , target_block_time_(target_block_time)
{
    sqlite3* db = nullptr;
    int rc = sqlite3_open(database_path_.c_str(), &db);

    if (rc != SQLITE_OK) {
        if (db) {
            sqlite3_close(db);
        }
        throw std::runtime_error("Failed to open ledger database: " + database_path_);
    }

    db_connection_ = static_cast<void*>(db);

    if (!initialize_database()) {
        sqlite3_close(db);
        db_connection_ = nullptr;
        throw std::runtime_error("Failed to initialize ledger schema");
    }

    Block genesis = make_genesis_block();

    if (get_chain_length() == 0) {
        if (!persist_block(genesis)) {
            sqlite3_close(db);
            db_connection_ = nullptr;
            throw std::runtime_error("Failed to write genesis block");
        }
        utilities::log_info("Ledger: Created genesis block " + ChainCrypto::hash_to_hex(genesis.hash));
    } else {
        auto stored = get_block(0);
        if (!stored || !ChainCrypto::constant_time_equal(stored->hash, genesis.hash)) {
            sqlite3_close(db);
            db_connection_ = nullptr;
            throw std::runtime_error("Ledger database holds a foreign genesis block: " + database_path_);
        }
    }

    load_tip();
}

Ledger::~Ledger() {
    if (db_connection_) {
        sqlite3* db = static_cast<sqlite3*>(db_connection_);
        sqlite3_close(db);
        db_connection_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

bool Ledger::initialize_database() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    char* error_msg = nullptr;

    const char* create_blocks_table = R"(
        CREATE TABLE IF NOT EXISTS blocks (
            block_index INTEGER PRIMARY KEY,
            block_hash TEXT NOT NULL UNIQUE,
            previous_hash TEXT NOT NULL,
            timestamp INTEGER NOT NULL,
            nonce INTEGER NOT NULL,
            difficulty INTEGER NOT NULL,
            tx_count INTEGER NOT NULL,
            encoded BLOB NOT NULL
        );
    )";

    int rc = sqlite3_exec(db, create_blocks_table, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        if (error_msg) {
            utilities::log_error(std::string("Ledger: Schema error: ") + error_msg);
            sqlite3_free(error_msg);
        }
        return false;
    }

    const char* create_transactions_table = R"(
        CREATE TABLE IF NOT EXISTS transactions (
            block_index INTEGER NOT NULL,
            position INTEGER NOT NULL,
            tx_id TEXT NOT NULL,
            kind TEXT NOT NULL,
            account_id TEXT NOT NULL,
            recipient_id TEXT,
            encoded BLOB NOT NULL,
            PRIMARY KEY (block_index, position)
        );
        CREATE INDEX IF NOT EXISTS idx_transactions_account ON transactions(account_id);
        CREATE INDEX IF NOT EXISTS idx_transactions_recipient ON transactions(recipient_id);
    )";

    rc = sqlite3_exec(db, create_transactions_table, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        if (error_msg) {
            utilities::log_error(std::string("Ledger: Schema error: ") + error_msg);
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

void Ledger::load_tip() {
    uint64_t length = get_chain_length();
    auto latest = get_block(length - 1);
    if (!latest) {
        throw std::runtime_error("Ledger: Cannot load chain tip");
    }

    uint32_t difficulty = initial_difficulty_;
    if (retarget_difficulty_ && latest->index >= 2) {
        auto previous = get_block(latest->index - 1);
        if (previous) {
            uint64_t interval = latest->timestamp > previous->timestamp
                ? latest->timestamp - previous->timestamp : 0;
            difficulty = PohdConsensus::retarget(latest->difficulty, interval, target_block_time_);
        }
    }

    std::lock_guard<std::mutex> lock(tip_mutex_);
    tip_.index = latest->index;
    tip_.hash = latest->hash;
    tip_.timestamp = latest->timestamp;
    tip_.generation = generation_.load();
    difficulty_ = difficulty;
}

// ============================================================================
// Read API
// ============================================================================

std::optional<Block> Ledger::get_block_locked(uint64_t index) const {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, SELECT_BLOCK, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(index));

    std::optional<Block> block;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        block = read_block_row(stmt);
    }

    sqlite3_finalize(stmt);
    return block;
}

std::optional<Block> Ledger::get_block(uint64_t index) const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return get_block_locked(index);
}

uint64_t Ledger::get_chain_length_locked() const {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = "SELECT COUNT(*) FROM blocks";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return 0;
    }

    uint64_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);

    return count;
}

uint64_t Ledger::get_chain_length() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return get_chain_length_locked();
}

ChainTip Ledger::get_tip() const {
    std::lock_guard<std::mutex> lock(tip_mutex_);
    return tip_;
}

uint32_t Ledger::current_difficulty() const {
    std::lock_guard<std::mutex> lock(tip_mutex_);
    return difficulty_;
}

size_t Ledger::total_transactions() const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = "SELECT COUNT(*) FROM transactions";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return 0;
    }

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);

    return count;
}

std::vector<RecordedTransaction> Ledger::get_account_history(const std::string& account_id) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::vector<RecordedTransaction> history;

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT block_index, position, encoded
        FROM transactions
        WHERE account_id = ? OR recipient_id = ?
        ORDER BY block_index ASC, position ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return history;
    }

    sqlite3_bind_text(stmt, 1, account_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, account_id.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const void* data = sqlite3_column_blob(stmt, 2);
        int size = sqlite3_column_bytes(stmt, 2);
        std::vector<uint8_t> encoded(static_cast<const uint8_t*>(data),
                                     static_cast<const uint8_t*>(data) + size);

        try {
            ByteReader reader(encoded);
            RecordedTransaction record;
            record.block_index = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
            record.position = static_cast<uint32_t>(sqlite3_column_int64(stmt, 1));
            record.transaction = Transaction::decode(reader);
            history.push_back(record);
        } catch (const std::exception& ex) {
            utilities::log_critical("Ledger: Stored transaction cannot be decoded: " + std::string(ex.what()));
        }
    }

    sqlite3_finalize(stmt);

    return history;
}

// ============================================================================
// Validation
// ============================================================================

BlockValidation Ledger::check_transactions(const Block& block, const AccountLookup& accounts) const {
    // Working state so several transactions of one account chain correctly
    std::map<std::string, Account> working;

    auto lookup = [&](const std::string& id) -> std::optional<Account> {
        auto it = working.find(id);
        if (it != working.end()) {
            return it->second;
        }
        return accounts(id);
    };

    for (size_t i = 0; i < block.transactions.size(); i++) {
        const Transaction& tx = block.transactions[i];
        std::string where = "transaction " + std::to_string(i) + ": ";

        auto account = lookup(tx.account_id);
        if (!account) {
            return BlockValidation::reject(ErrorCode::ACCOUNT_NOT_FOUND,
                                           where + "unknown account " + tx.account_id);
        }

        if (tx.kind == TransactionKind::TRANSFER && !lookup(tx.transfer.recipient_id)) {
            return BlockValidation::reject(ErrorCode::ACCOUNT_NOT_FOUND,
                                           where + "unknown recipient " + tx.transfer.recipient_id);
        }

        auto inconsistency = EvolutionEngine::check_consistency(*account, tx);
        if (inconsistency) {
            return BlockValidation::reject(ErrorCode::MALFORMED_BLOCK, where + *inconsistency);
        }

        working[tx.account_id] = EvolutionEngine::replay(*account, tx, block.timestamp);
    }

    return BlockValidation::success();
}

BlockValidation Ledger::validate_block(const Block& block, const AccountLookup& accounts) const {
    ChainTip tip;
    uint32_t required_difficulty;
    {
        std::lock_guard<std::mutex> lock(tip_mutex_);
        tip = tip_;
        required_difficulty = difficulty_;
    }

    // (a) index extends the tip
    if (block.index != tip.index + 1) {
        return BlockValidation::reject(ErrorCode::CHAIN_LINKAGE_ERROR,
            "index " + std::to_string(block.index) + " does not extend tip " + std::to_string(tip.index));
    }

    // (b) previous hash links to the tip
    if (!ChainCrypto::constant_time_equal(block.previous_hash, tip.hash)) {
        return BlockValidation::reject(ErrorCode::CHAIN_LINKAGE_ERROR,
            "previous_hash does not match tip hash " + ChainCrypto::hash_to_hex(tip.hash));
    }

    // (c) stated hash and position match recomputation
    Hash256 recomputed = compute_block_hash(block);
    if (!ChainCrypto::constant_time_equal(recomputed, block.hash)) {
        return BlockValidation::reject(ErrorCode::MALFORMED_BLOCK,
            "stated hash " + ChainCrypto::hash_to_hex(block.hash) +
            " does not match recomputed " + ChainCrypto::hash_to_hex(recomputed));
    }
    if (!positions_equal(derive_position(recomputed), block.position)) {
        return BlockValidation::reject(ErrorCode::MALFORMED_BLOCK, "stated position does not match hash");
    }
    if (block.transactions.empty()) {
        return BlockValidation::reject(ErrorCode::MALFORMED_BLOCK, "non-genesis block without transactions");
    }

    // (d) PoHD predicate at the required difficulty
    if (block.difficulty != required_difficulty) {
        return BlockValidation::reject(ErrorCode::INVALID_NONCE,
            "block difficulty " + std::to_string(block.difficulty) +
            " differs from required " + std::to_string(required_difficulty));
    }
    if (!PohdConsensus::satisfies(block.position, required_difficulty)) {
        return BlockValidation::reject(ErrorCode::INVALID_NONCE,
            "nonce " + std::to_string(block.nonce) + " misses target distance " +
            std::to_string(PohdConsensus::target_distance(required_difficulty)));
    }

    // (e) transactions reference existing, consistent accounts
    return check_transactions(block, accounts);
}

// ============================================================================
// Append
// ============================================================================

bool Ledger::persist_block(const Block& block) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    if (sqlite3_exec(db, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) != SQLITE_OK) {
        utilities::log_error("Ledger: Begin failed: " + std::string(sqlite3_errmsg(db)));
        return false;
    }

    auto rollback = [&](const std::string& what) {
        utilities::log_error("Ledger: " + what + " failed: " + sqlite3_errmsg(db));
        sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
        return false;
    };

    const char* block_sql = R"(
        INSERT INTO blocks
        (block_index, block_hash, previous_hash, timestamp, nonce, difficulty, tx_count, encoded)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, block_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return rollback("Prepare block insert");
    }

    std::string hash_hex = ChainCrypto::hash_to_hex(block.hash);
    std::string previous_hex = ChainCrypto::hash_to_hex(block.previous_hash);
    std::vector<uint8_t> encoded = block.encode();

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(block.index));
    sqlite3_bind_text(stmt, 2, hash_hex.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, previous_hex.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(block.timestamp));
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(block.nonce));
    sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(block.difficulty));
    sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(block.transactions.size()));
    sqlite3_bind_blob(stmt, 8, encoded.data(), static_cast<int>(encoded.size()), SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return rollback("Block insert");
    }

    const char* tx_sql = R"(
        INSERT INTO transactions
        (block_index, position, tx_id, kind, account_id, recipient_id, encoded)
        VALUES (?, ?, ?, ?, ?, ?, ?)
    )";

    for (size_t i = 0; i < block.transactions.size(); i++) {
        const Transaction& tx = block.transactions[i];

        if (sqlite3_prepare_v2(db, tx_sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return rollback("Prepare transaction insert");
        }

        ByteWriter writer;
        tx.encode(writer);
        std::string tx_id = ChainCrypto::hash_to_hex(tx.id());
        std::string kind = transaction_kind_to_string(tx.kind);

        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(block.index));
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(i));
        sqlite3_bind_text(stmt, 3, tx_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, kind.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, tx.account_id.c_str(), -1, SQLITE_TRANSIENT);
        if (tx.kind == TransactionKind::TRANSFER) {
            sqlite3_bind_text(stmt, 6, tx.transfer.recipient_id.c_str(), -1, SQLITE_TRANSIENT);
        } else {
            sqlite3_bind_null(stmt, 6);
        }
        sqlite3_bind_blob(stmt, 7, writer.bytes().data(), static_cast<int>(writer.bytes().size()),
                          SQLITE_TRANSIENT);

        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return rollback("Transaction insert");
        }
    }

    if (sqlite3_exec(db, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
        return rollback("Commit");
    }

    return true;
}

BlockValidation Ledger::append_block(const Block& block, const AccountLookup& accounts) {
    std::lock_guard<std::mutex> append_lock(append_mutex_);

    BlockValidation validation = validate_block(block, accounts);
    if (!validation.ok()) {
        return validation;
    }

    if (!persist_block(block)) {
        return BlockValidation::reject(ErrorCode::STORAGE_ERROR,
                                       "failed to persist block " + std::to_string(block.index));
    }

    {
        std::lock_guard<std::mutex> lock(tip_mutex_);

        if (retarget_difficulty_ && tip_.index >= 1) {
            uint64_t interval = block.timestamp > tip_.timestamp ? block.timestamp - tip_.timestamp : 0;
            uint32_t next = PohdConsensus::retarget(block.difficulty, interval, target_block_time_);
            if (next != difficulty_) {
                utilities::log_info("Ledger: Difficulty retargeted " + std::to_string(difficulty_) +
                                    " -> " + std::to_string(next));
            }
            difficulty_ = next;
        }

        tip_.index = block.index;
        tip_.hash = block.hash;
        tip_.timestamp = block.timestamp;
        tip_.generation = generation_.fetch_add(1) + 1;
    }

    utilities::log_info("Ledger: Appended block " + std::to_string(block.index) + " (" +
                        std::to_string(block.transactions.size()) + " transactions, hash " +
                        ChainCrypto::hash_to_hex(block.hash).substr(0, 16) + ")");

    return validation;
}

bool Ledger::verify_chain_integrity() const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    uint64_t chain_length = get_chain_length_locked();

    if (chain_length == 0) {
        utilities::log_critical("Ledger: Chain is empty (genesis missing)");
        return false;
    }

    Block genesis = make_genesis_block();
    std::optional<Block> previous;

    for (uint64_t i = 0; i < chain_length; i++) {
        auto block_opt = get_block_locked(i);

        if (!block_opt) {
            utilities::log_critical("Ledger: Missing block " + std::to_string(i));
            return false;
        }

        const Block& block = *block_opt;

        // Verify block hash
        Hash256 calculated = compute_block_hash(block);
        if (!ChainCrypto::constant_time_equal(calculated, block.hash)) {
            utilities::log_critical("Ledger: Hash mismatch at block " + std::to_string(i));
            return false;
        }

        if (i == 0) {
            if (!ChainCrypto::constant_time_equal(block.hash, genesis.hash)) {
                utilities::log_critical("Ledger: Genesis block altered");
                return false;
            }
        } else {
            // Verify linkage and PoHD (except genesis block)
            if (block.index != i || !ChainCrypto::constant_time_equal(block.previous_hash, previous->hash)) {
                utilities::log_critical("Ledger: Chain broken at block " + std::to_string(i));
                return false;
            }
            if (!PohdConsensus::satisfies(block.position, block.difficulty)) {
                utilities::log_critical("Ledger: PoHD predicate fails at block " + std::to_string(i));
                return false;
            }
            if (block.transactions.empty()) {
                utilities::log_critical("Ledger: Empty block " + std::to_string(i));
                return false;
            }
        }

        previous = block;
    }

    return true;
}

// ============================================================================
// Replication
// ============================================================================

std::string Ledger::export_chain_json(uint64_t since_index) const {
    try {
        uint64_t length = get_chain_length();

        json blocks = json::array();
        for (uint64_t i = since_index; i < length; i++) {
            auto block = get_block(i);
            if (!block) {
                break;
            }
            blocks.push_back(block->to_json_object());
        }

        json j;
        j["chain_length"] = length;
        j["blocks"] = blocks;
        return j.dump();

    } catch (const std::exception& ex) {
        utilities::log_error("Ledger: Export failed: " + std::string(ex.what()));
        return "{}";
    }
}

} // namespace hyperchain
