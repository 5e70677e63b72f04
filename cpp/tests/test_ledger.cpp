/**
 * @file test_ledger.cpp
 * @brief Unit tests for the block ledger
 *
 * Tests ledger including:
 * - Genesis initialization
 * - Block validation (linkage, hash, PoHD, transactions)
 * - Atomic append and tip tracking
 * - Account history and export
 * - Persistence across reopen
 * - Difficulty retargeting
 * - Chain integrity verification
 */

#include <gtest/gtest.h>
#include "hyperchain/evolution_engine.hpp"
#include "hyperchain/ledger.hpp"
#include "hyperchain/pohd_consensus.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <sqlite3.h>
#include <unistd.h>

using namespace hyperchain;
namespace fs = std::filesystem;

// Test fixture for ledger tests
class LedgerTest : public ::testing::Test {
protected:
    static constexpr uint64_t NOW = 1750000000;

    void SetUp() override {
        // Create temporary test directory (one per test and process)
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = fs::temp_directory_path() /
            ("hyperchain_ledger_test_" + std::string(info->name()) + "_" + std::to_string(getpid()));
        fs::create_directories(test_dir_);

        db_path_ = (test_dir_ / "ledger.db").string();
        ledger_ = std::make_unique<Ledger>(db_path_, 1);

        accounts_["alice"] = make_genesis_account("alice", NOW - 100);
        accounts_["bob"] = make_genesis_account("bob", NOW - 100);
    }

    void TearDown() override {
        ledger_.reset();

        // Clean up test directory
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    AccountLookup lookup() {
        return [this](const std::string& id) -> std::optional<Account> {
            auto it = accounts_.find(id);
            if (it == accounts_.end()) {
                return std::nullopt;
            }
            return it->second;
        };
    }

    Transaction solve(const std::string& account_id, double difficulty = 0.5) {
        Problem problem;
        problem.id = "problem-" + std::to_string(++problem_counter_);
        problem.difficulty = difficulty;
        problem.required_domains = {KnowledgeDomain::MATHEMATICS};

        SeededRandomSource rng(problem_counter_);
        auto result = EvolutionEngine::apply_solution(accounts_.at(account_id), problem, 0.9, rng, NOW);
        return result.transaction;
    }

    // Builds a block on the current tip and searches a nonce for it
    Block mine_on_tip(std::vector<Transaction> transactions, uint64_t timestamp = NOW) {
        ChainTip tip = ledger_->get_tip();

        Block block;
        block.index = tip.index + 1;
        block.timestamp = timestamp;
        block.transactions = std::move(transactions);
        block.previous_hash = tip.hash;
        block.difficulty = ledger_->current_difficulty();

        auto nonce = PohdConsensus::find_nonce(block, block.difficulty, 0, 10000000);
        EXPECT_TRUE(nonce.has_value());
        block.nonce = nonce.value_or(0);
        block.seal();
        return block;
    }

    // Applies an appended block to the test's account map
    void commit(const Block& block) {
        for (const auto& tx : block.transactions) {
            accounts_[tx.account_id] = EvolutionEngine::replay(accounts_[tx.account_id], tx, block.timestamp);
        }
    }

    fs::path test_dir_;
    std::string db_path_;
    std::unique_ptr<Ledger> ledger_;
    std::map<std::string, Account> accounts_;
    uint64_t problem_counter_ = 0;
};

// ============================================================================
// Genesis Tests
// ============================================================================

TEST_F(LedgerTest, GenesisOnlyChain) {
    EXPECT_EQ(ledger_->get_chain_length(), 1u);
    EXPECT_TRUE(ledger_->verify_chain_integrity());

    auto genesis = ledger_->get_block(0);
    ASSERT_TRUE(genesis.has_value());
    EXPECT_EQ(genesis->hash, make_genesis_block().hash);
    EXPECT_EQ(genesis->state, BlockState::ACCEPTED);

    ChainTip tip = ledger_->get_tip();
    EXPECT_EQ(tip.index, 0u);
    EXPECT_EQ(tip.hash, genesis->hash);
    EXPECT_EQ(ledger_->current_difficulty(), 1u);
    EXPECT_EQ(ledger_->total_transactions(), 0u);
}

TEST_F(LedgerTest, MissingBlock) {
    EXPECT_FALSE(ledger_->get_block(5).has_value());
}

// ============================================================================
// Append Tests
// ============================================================================

TEST_F(LedgerTest, MinedBlockValidatesAndAppends) {
    Block block = mine_on_tip({solve("alice")});

    EXPECT_TRUE(ledger_->validate_block(block, lookup()).ok());

    uint64_t generation = ledger_->tip_generation();
    auto result = ledger_->append_block(block, lookup());
    ASSERT_TRUE(result.ok()) << result.reason;

    EXPECT_EQ(ledger_->get_chain_length(), 2u);
    EXPECT_EQ(ledger_->get_tip().hash, block.hash);
    EXPECT_EQ(ledger_->tip_generation(), generation + 1);
    EXPECT_EQ(ledger_->total_transactions(), 1u);

    auto stored = ledger_->get_block(1);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->hash, block.hash);
    EXPECT_EQ(stored->nonce, block.nonce);
    EXPECT_EQ(stored->difficulty, block.difficulty);
    EXPECT_EQ(stored->state, BlockState::ACCEPTED);
    ASSERT_EQ(stored->transactions.size(), 1u);
    EXPECT_EQ(stored->transactions[0].id(), block.transactions[0].id());

    EXPECT_TRUE(ledger_->verify_chain_integrity());
}

TEST_F(LedgerTest, SeveralBlocksChain) {
    for (int i = 0; i < 3; i++) {
        Block block = mine_on_tip({solve("alice"), solve("bob")}, NOW + i);
        ASSERT_TRUE(ledger_->append_block(block, lookup()).ok());
        commit(block);
    }

    EXPECT_EQ(ledger_->get_chain_length(), 4u);
    EXPECT_EQ(ledger_->total_transactions(), 6u);
    EXPECT_TRUE(ledger_->verify_chain_integrity());
}

TEST_F(LedgerTest, ChainedTransactionsOfOneAccount) {
    // Second transaction starts from the first one's result
    Problem problem;
    problem.id = "chained";
    problem.difficulty = 0.5;

    SeededRandomSource rng(5);
    auto first = EvolutionEngine::apply_solution(accounts_["alice"], problem, 0.9, rng, NOW);
    auto second = EvolutionEngine::apply_solution(first.account, problem, 0.9, rng, NOW);

    Block block = mine_on_tip({first.transaction, second.transaction});
    EXPECT_TRUE(ledger_->append_block(block, lookup()).ok());
}

// ============================================================================
// Rejection Tests
// ============================================================================

TEST_F(LedgerTest, WrongIndexIsLinkageError) {
    Block block = mine_on_tip({solve("alice")});
    block.index = 2;
    block.seal();

    auto result = ledger_->validate_block(block, lookup());
    EXPECT_EQ(result.code, ErrorCode::CHAIN_LINKAGE_ERROR);
}

TEST_F(LedgerTest, WrongPreviousHashIsLinkageError) {
    Block block = mine_on_tip({solve("alice")});
    block.previous_hash = ChainCrypto::zero_hash();
    block.seal();

    auto result = ledger_->append_block(block, lookup());
    EXPECT_EQ(result.code, ErrorCode::CHAIN_LINKAGE_ERROR);
    EXPECT_EQ(ledger_->get_chain_length(), 1u);
}

TEST_F(LedgerTest, ReplayedBlockIsLinkageError) {
    Block block = mine_on_tip({solve("alice")});
    ASSERT_TRUE(ledger_->append_block(block, lookup()).ok());

    EXPECT_EQ(ledger_->append_block(block, lookup()).code, ErrorCode::CHAIN_LINKAGE_ERROR);
    EXPECT_EQ(ledger_->get_chain_length(), 2u);
}

TEST_F(LedgerTest, HashMismatchIsMalformedEvenWhenPredicateHolds) {
    Block block = mine_on_tip({solve("alice")});

    // Stated hash from a different nonce; still satisfies PoHD on its own
    Block other = block;
    other.nonce = *PohdConsensus::find_nonce(block, block.difficulty, block.nonce + 1, 10000000);
    other.seal();
    ASSERT_TRUE(PohdConsensus::satisfies(other.position, block.difficulty));

    block.hash = other.hash;
    block.position = other.position;

    EXPECT_EQ(ledger_->validate_block(block, lookup()).code, ErrorCode::MALFORMED_BLOCK);
}

TEST_F(LedgerTest, PositionMismatchIsMalformed) {
    Block block = mine_on_tip({solve("alice")});
    block.position.fill(0.5);

    EXPECT_EQ(ledger_->validate_block(block, lookup()).code, ErrorCode::MALFORMED_BLOCK);
}

TEST_F(LedgerTest, EmptyBlockIsMalformed) {
    Block block = mine_on_tip({});
    EXPECT_EQ(ledger_->validate_block(block, lookup()).code, ErrorCode::MALFORMED_BLOCK);
}

TEST_F(LedgerTest, MissedTargetIsInvalidNonce) {
    ledger_.reset();
    fs::remove(db_path_);
    ledger_ = std::make_unique<Ledger>(db_path_, 8);

    ChainTip tip = ledger_->get_tip();

    Block block;
    block.index = tip.index + 1;
    block.timestamp = NOW;
    block.transactions = {solve("alice")};
    block.previous_hash = tip.hash;
    block.difficulty = 8;

    // Find a nonce that misses the target
    uint64_t nonce = 0;
    while (true) {
        block.nonce = nonce++;
        block.seal();
        if (!PohdConsensus::satisfies(block.position, 8)) {
            break;
        }
    }

    EXPECT_EQ(ledger_->validate_block(block, lookup()).code, ErrorCode::INVALID_NONCE);
}

TEST_F(LedgerTest, WrongDifficultyIsInvalidNonce) {
    Block block = mine_on_tip({solve("alice")});
    block.difficulty = 3;

    EXPECT_EQ(ledger_->validate_block(block, lookup()).code, ErrorCode::INVALID_NONCE);
}

TEST_F(LedgerTest, UnknownAccountRejected) {
    accounts_["carol"] = make_genesis_account("carol", NOW);
    Transaction tx = solve("carol");
    accounts_.erase("carol");

    Block block = mine_on_tip({tx});
    EXPECT_EQ(ledger_->validate_block(block, lookup()).code, ErrorCode::ACCOUNT_NOT_FOUND);
}

TEST_F(LedgerTest, UnknownRecipientRejected) {
    Block block = mine_on_tip({make_transfer_transaction("alice", "nobody", 1.0, NOW)});
    EXPECT_EQ(ledger_->validate_block(block, lookup()).code, ErrorCode::ACCOUNT_NOT_FOUND);
}

TEST_F(LedgerTest, InconsistentEvolutionIsMalformed) {
    Transaction tx = solve("alice");
    tx.evolution.complexity_delta *= 2.0;
    tx.evolution.complexity_after = tx.evolution.complexity_before + tx.evolution.complexity_delta;

    Block block = mine_on_tip({tx});
    EXPECT_EQ(ledger_->validate_block(block, lookup()).code, ErrorCode::MALFORMED_BLOCK);
}

TEST_F(LedgerTest, RejectedBlockIsNotPartiallyApplied) {
    Transaction good = solve("alice");
    Transaction bad = solve("bob");
    bad.evolution.complexity_before = 3.0;

    Block block = mine_on_tip({good, bad});
    auto result = ledger_->append_block(block, lookup());

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(ledger_->get_chain_length(), 1u);
    EXPECT_EQ(ledger_->total_transactions(), 0u);
    EXPECT_TRUE(ledger_->get_account_history("alice").empty());
}

// ============================================================================
// History and Export Tests
// ============================================================================

TEST_F(LedgerTest, AccountHistoryIncludesTransfers) {
    Block first = mine_on_tip({solve("alice")}, NOW);
    ASSERT_TRUE(ledger_->append_block(first, lookup()).ok());
    commit(first);

    Block second = mine_on_tip({make_transfer_transaction("bob", "alice", 2.0, NOW + 1)}, NOW + 1);
    ASSERT_TRUE(ledger_->append_block(second, lookup()).ok());

    auto history = ledger_->get_account_history("alice");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].block_index, 1u);
    EXPECT_EQ(history[0].transaction.kind, TransactionKind::EVOLUTION);
    EXPECT_EQ(history[1].block_index, 2u);
    EXPECT_EQ(history[1].transaction.kind, TransactionKind::TRANSFER);

    EXPECT_EQ(ledger_->get_account_history("bob").size(), 1u);
    EXPECT_TRUE(ledger_->get_account_history("nobody").empty());
}

TEST_F(LedgerTest, ExportChainJson) {
    Block block = mine_on_tip({solve("alice")});
    ASSERT_TRUE(ledger_->append_block(block, lookup()).ok());

    auto j = nlohmann::json::parse(ledger_->export_chain_json());
    EXPECT_EQ(j["chain_length"], 2);
    ASSERT_EQ(j["blocks"].size(), 2u);
    EXPECT_EQ(j["blocks"][1]["hash"], ChainCrypto::hash_to_hex(block.hash));

    auto since = nlohmann::json::parse(ledger_->export_chain_json(1));
    EXPECT_EQ(since["blocks"].size(), 1u);
}

// ============================================================================
// Persistence Tests
// ============================================================================

TEST_F(LedgerTest, ReopenKeepsTip) {
    Block block = mine_on_tip({solve("alice")});
    ASSERT_TRUE(ledger_->append_block(block, lookup()).ok());

    ledger_.reset();
    ledger_ = std::make_unique<Ledger>(db_path_, 1);

    EXPECT_EQ(ledger_->get_chain_length(), 2u);
    EXPECT_EQ(ledger_->get_tip().hash, block.hash);
    EXPECT_TRUE(ledger_->verify_chain_integrity());
}

TEST_F(LedgerTest, ForeignGenesisRejected) {
    ledger_.reset();

    {
        sqlite3* db = nullptr;
        ASSERT_EQ(sqlite3_open(db_path_.c_str(), &db), SQLITE_OK);
        sqlite3_exec(db, "UPDATE blocks SET block_hash = '00' WHERE block_index = 0", nullptr, nullptr, nullptr);
        sqlite3_close(db);
    }

    EXPECT_THROW(Ledger(db_path_, 1), std::runtime_error);
}

TEST_F(LedgerTest, TamperedStorageFailsIntegrity) {
    Block block = mine_on_tip({solve("alice")});
    ASSERT_TRUE(ledger_->append_block(block, lookup()).ok());
    ledger_.reset();

    {
        sqlite3* db = nullptr;
        ASSERT_EQ(sqlite3_open(db_path_.c_str(), &db), SQLITE_OK);
        std::string sql = "UPDATE blocks SET block_hash = '" + std::string(64, 'a') + "' WHERE block_index = 1";
        sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr);
        sqlite3_close(db);
    }

    ledger_ = std::make_unique<Ledger>(db_path_, 1);
    EXPECT_FALSE(ledger_->verify_chain_integrity());
}

// ============================================================================
// Retarget Tests
// ============================================================================

TEST_F(LedgerTest, RetargetAfterFastBlocks) {
    ledger_.reset();
    fs::remove(db_path_);
    ledger_ = std::make_unique<Ledger>(db_path_, 2, true, std::chrono::seconds(10));

    // First block after genesis keeps the initial difficulty
    Block first = mine_on_tip({solve("alice")}, NOW);
    ASSERT_TRUE(ledger_->append_block(first, lookup()).ok());
    commit(first);
    EXPECT_EQ(ledger_->current_difficulty(), 2u);

    // One second apart: faster than half the target
    Block second = mine_on_tip({solve("alice")}, NOW + 1);
    ASSERT_TRUE(ledger_->append_block(second, lookup()).ok());
    EXPECT_EQ(ledger_->current_difficulty(), 3u);

    // Reopening recomputes the same difficulty
    ledger_.reset();
    ledger_ = std::make_unique<Ledger>(db_path_, 2, true, std::chrono::seconds(10));
    EXPECT_EQ(ledger_->current_difficulty(), 3u);
}

TEST_F(LedgerTest, RetargetDisabledKeepsDifficulty) {
    for (int i = 0; i < 3; i++) {
        Block block = mine_on_tip({solve("alice")}, NOW + i);
        ASSERT_TRUE(ledger_->append_block(block, lookup()).ok());
        commit(block);
    }
    EXPECT_EQ(ledger_->current_difficulty(), 1u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
