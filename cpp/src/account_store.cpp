/**
 * @file account_store.cpp
 * @brief Implementation of the SQLite account table
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hyperchain/account_store.hpp"
#include "hyperchain/byte_codec.hpp"
#include "hyperchain/errors.hpp"
#include "hyperchain/utilities.hpp"
#include <sqlite3.h>
#include <stdexcept>

namespace hyperchain {

namespace {

// Axis arrays are stored as 8 big-endian binary64 values so reals round-trip exactly
std::vector<uint8_t> encode_axes(const std::array<double, config::DIMENSIONS>& values) {
    ByteWriter writer;
    for (double value : values) {
        writer.write_f64(value);
    }
    return writer.take();
}

std::array<double, config::DIMENSIONS> decode_axes(const void* data, int size) {
    std::array<double, config::DIMENSIONS> values{};
    if (data == nullptr || size != static_cast<int>(config::DIMENSIONS * sizeof(double))) {
        throw StorageError("AccountStore: corrupt axis column");
    }

    std::vector<uint8_t> bytes(static_cast<const uint8_t*>(data),
                               static_cast<const uint8_t*>(data) + size);
    ByteReader reader(bytes);
    for (auto& value : values) {
        value = reader.read_f64();
    }
    return values;
}

const char* SELECT_COLUMNS = R"(
    SELECT account_id, complexity_index, energy, tier, knowledge, position,
           problems_solved, total_difficulty, created_at, updated_at, revision
    FROM accounts
)";

Account read_account_row(sqlite3_stmt* stmt) {
    Account account;
    account.account_id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    account.complexity_index = sqlite3_column_double(stmt, 1);
    account.energy = sqlite3_column_double(stmt, 2);
    account.tier = sqlite3_column_int(stmt, 3);
    account.knowledge = decode_axes(sqlite3_column_blob(stmt, 4), sqlite3_column_bytes(stmt, 4));
    account.position = decode_axes(sqlite3_column_blob(stmt, 5), sqlite3_column_bytes(stmt, 5));
    account.problems_solved = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
    account.total_difficulty = sqlite3_column_double(stmt, 7);
    account.created_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 8));
    account.updated_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 9));
    account.revision = static_cast<uint64_t>(sqlite3_column_int64(stmt, 10));
    return account;
}

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

AccountStore::AccountStore(const std::string& database_path)
    : database_path_(database_path)
    , db_connection_(nullptr)
{
    sqlite3* db = nullptr;
    int rc = sqlite3_open(database_path_.c_str(), &db);

    if (rc != SQLITE_OK) {
        if (db) {
            sqlite3_close(db);
        }
        throw std::runtime_error("Failed to open account database: " + database_path_);
    }

    db_connection_ = static_cast<void*>(db);

    if (!initialize_database()) {
        sqlite3_close(db);
        db_connection_ = nullptr;
        throw std::runtime_error("Failed to initialize account schema");
    }

    utilities::log_debug("AccountStore: Opened " + database_path_);
}

AccountStore::~AccountStore() {
    if (db_connection_) {
        sqlite3* db = static_cast<sqlite3*>(db_connection_);
        sqlite3_close(db);
        db_connection_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

bool AccountStore::initialize_database() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    char* error_msg = nullptr;

    const char* create_accounts_table = R"(
        CREATE TABLE IF NOT EXISTS accounts (
            account_id TEXT PRIMARY KEY,
            complexity_index REAL NOT NULL,
            energy REAL NOT NULL,
            tier INTEGER NOT NULL,
            knowledge BLOB NOT NULL,
            position BLOB NOT NULL,
            problems_solved INTEGER NOT NULL,
            total_difficulty REAL NOT NULL,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            revision INTEGER NOT NULL,
            CONSTRAINT valid_energy CHECK (energy >= 0.0),
            CONSTRAINT valid_tier CHECK (tier >= 1 AND tier <= 4)
        );
        CREATE INDEX IF NOT EXISTS idx_accounts_tier ON accounts(tier);
    )";

    int rc = sqlite3_exec(db, create_accounts_table, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        if (error_msg) {
            utilities::log_error(std::string("AccountStore: Schema error: ") + error_msg);
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Account> AccountStore::get_locked(const std::string& account_id) const {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    std::string sql = std::string(SELECT_COLUMNS) + " WHERE account_id = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        throw StorageError("AccountStore: prepare failed: " + std::string(sqlite3_errmsg(db)));
    }

    sqlite3_bind_text(stmt, 1, account_id.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<Account> result;
    try {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            result = read_account_row(stmt);
        }
    } catch (...) {
        sqlite3_finalize(stmt);
        throw;
    }

    sqlite3_finalize(stmt);
    return result;
}

std::optional<Account> AccountStore::get(const std::string& account_id) const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return get_locked(account_id);
}

Account AccountStore::require(const std::string& account_id) const {
    auto account = get(account_id);
    if (!account) {
        throw AccountNotFound(account_id);
    }
    return *account;
}

bool AccountStore::exists(const std::string& account_id) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = "SELECT 1 FROM accounts WHERE account_id = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, account_id.c_str(), -1, SQLITE_TRANSIENT);

    bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);

    return found;
}

std::vector<std::string> AccountStore::list_account_ids() const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::vector<std::string> ids;

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = "SELECT account_id FROM accounts ORDER BY account_id ASC";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return ids;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ids.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
    }

    sqlite3_finalize(stmt);

    return ids;
}

size_t AccountStore::count() const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = "SELECT COUNT(*) FROM accounts";

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

// ============================================================================
// Mutations
// ============================================================================

bool AccountStore::register_account(const Account& account) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        INSERT OR IGNORE INTO accounts
        (account_id, complexity_index, energy, tier, knowledge, position,
         problems_solved, total_difficulty, created_at, updated_at, revision)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 1)
    )";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        throw StorageError("AccountStore: prepare failed: " + std::string(sqlite3_errmsg(db)));
    }

    auto knowledge = encode_axes(account.knowledge);
    auto position = encode_axes(account.position);

    sqlite3_bind_text(stmt, 1, account.account_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 2, account.complexity_index);
    sqlite3_bind_double(stmt, 3, account.energy);
    sqlite3_bind_int(stmt, 4, account.tier);
    sqlite3_bind_blob(stmt, 5, knowledge.data(), static_cast<int>(knowledge.size()), SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 6, position.data(), static_cast<int>(position.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(account.problems_solved));
    sqlite3_bind_double(stmt, 8, account.total_difficulty);
    sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(account.created_at));
    sqlite3_bind_int64(stmt, 10, static_cast<sqlite3_int64>(account.updated_at));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw StorageError("AccountStore: insert failed: " + std::string(sqlite3_errmsg(db)));
    }

    return sqlite3_changes(db) == 1;
}

uint64_t AccountStore::upsert_locked(const Account& account) {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    auto current = get_locked(account.account_id);
    uint64_t revision = current ? current->revision + 1 : 1;

    const char* sql = R"(
        INSERT OR REPLACE INTO accounts
        (account_id, complexity_index, energy, tier, knowledge, position,
         problems_solved, total_difficulty, created_at, updated_at, revision)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        throw StorageError("AccountStore: prepare failed: " + std::string(sqlite3_errmsg(db)));
    }

    auto knowledge = encode_axes(account.knowledge);
    auto position = encode_axes(account.position);

    sqlite3_bind_text(stmt, 1, account.account_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 2, account.complexity_index);
    sqlite3_bind_double(stmt, 3, account.energy);
    sqlite3_bind_int(stmt, 4, account.tier);
    sqlite3_bind_blob(stmt, 5, knowledge.data(), static_cast<int>(knowledge.size()), SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 6, position.data(), static_cast<int>(position.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(account.problems_solved));
    sqlite3_bind_double(stmt, 8, account.total_difficulty);
    sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(account.created_at));
    sqlite3_bind_int64(stmt, 10, static_cast<sqlite3_int64>(account.updated_at));
    sqlite3_bind_int64(stmt, 11, static_cast<sqlite3_int64>(revision));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw StorageError("AccountStore: upsert failed for " + account.account_id +
                           ": " + sqlite3_errmsg(db));
    }

    return revision;
}

uint64_t AccountStore::upsert(const Account& account) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return upsert_locked(account);
}

void AccountStore::upsert_all(const std::vector<Account>& accounts) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    if (sqlite3_exec(db, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) != SQLITE_OK) {
        throw StorageError("AccountStore: begin failed: " + std::string(sqlite3_errmsg(db)));
    }

    try {
        for (const auto& account : accounts) {
            upsert_locked(account);
        }
    } catch (const StorageError&) {
        sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }

    if (sqlite3_exec(db, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
        std::string message = sqlite3_errmsg(db);
        sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
        throw StorageError("AccountStore: commit failed: " + message);
    }
}

} // namespace hyperchain
