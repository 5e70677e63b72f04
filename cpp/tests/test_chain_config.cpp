/**
 * @file test_chain_config.cpp
 * @brief Unit tests for protocol constants, node configuration and utilities
 *
 * Tests configuration including:
 * - Protocol constants
 * - Identifier validation
 * - JSON node configuration with defaults and environment overrides
 * - Data directory layout
 * - Time formatting and file helpers
 */

#include <gtest/gtest.h>
#include "hyperchain/chain_config.hpp"
#include "hyperchain/utilities.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace hyperchain;
using namespace hyperchain::config;
namespace fs = std::filesystem;

// Test fixture for configuration tests
class ChainConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = fs::temp_directory_path() /
            ("hyperchain_config_test_" + std::string(info->name()) + "_" + std::to_string(getpid()));
        fs::create_directories(test_dir_);

        unsetenv("HYPERCHAIN_NODE_ID");
        unsetenv("HYPERCHAIN_DIFFICULTY");
        unsetenv("HYPERCHAIN_LOG_LEVEL");
    }

    void TearDown() override {
        unsetenv("HYPERCHAIN_NODE_ID");
        unsetenv("HYPERCHAIN_DIFFICULTY");
        unsetenv("HYPERCHAIN_LOG_LEVEL");
        unsetenv("HYPERCHAIN_DATA_DIR");

        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    fs::path write_config(const std::string& content) {
        fs::path path = test_dir_ / "node.json";
        std::ofstream file(path);
        file << content;
        return path;
    }

    fs::path test_dir_;
};

// ============================================================================
// Protocol Constants Tests
// ============================================================================

TEST_F(ChainConfigTest, EvolutionConstants) {
    EXPECT_DOUBLE_EQ(ENERGY_CONSUMPTION_FACTOR, 10.0);
    EXPECT_DOUBLE_EQ(ENERGY_REWARD_FACTOR, 50.0);
    EXPECT_DOUBLE_EQ(EVOLUTIONARY_RESISTANCE, 1.5);
    EXPECT_DOUBLE_EQ(INITIAL_COMPLEXITY, 1.0);
    EXPECT_DOUBLE_EQ(INITIAL_ENERGY, 100.0);
    EXPECT_DOUBLE_EQ(KNOWLEDGE_GAIN_FACTOR, 0.1);
}

TEST_F(ChainConfigTest, TierThresholdsAscending) {
    EXPECT_DOUBLE_EQ(TIER_2_THRESHOLD, 10.0);
    EXPECT_DOUBLE_EQ(TIER_3_THRESHOLD, 100.0);
    EXPECT_DOUBLE_EQ(TIER_4_THRESHOLD, 1000.0);
    EXPECT_LT(TIER_2_THRESHOLD, TIER_3_THRESHOLD);
    EXPECT_LT(TIER_3_THRESHOLD, TIER_4_THRESHOLD);
}

TEST_F(ChainConfigTest, ConsensusConstants) {
    EXPECT_EQ(DIMENSIONS, 8u);
    EXPECT_EQ(DEFAULT_DIFFICULTY, 4u);
    EXPECT_LE(MIN_DIFFICULTY, DEFAULT_DIFFICULTY);
    EXPECT_GE(MAX_DIFFICULTY, DEFAULT_DIFFICULTY);
    EXPECT_EQ(TARGET_BLOCK_TIME, std::chrono::seconds(10));
    EXPECT_EQ(MAX_TRANSACTIONS_PER_BLOCK, 100u);
    EXPECT_GT(MINING_POLL_INTERVAL, 0u);
}

// ============================================================================
// Identifier Validation Tests
// ============================================================================

TEST_F(ChainConfigTest, ValidIdentifiers) {
    EXPECT_TRUE(validate_identifier("alice"));
    EXPECT_TRUE(validate_identifier("node_01"));
    EXPECT_TRUE(validate_identifier("scda-42"));
    EXPECT_TRUE(validate_identifier(std::string(MAX_IDENTIFIER_LENGTH, 'a')));
}

TEST_F(ChainConfigTest, InvalidIdentifiers) {
    EXPECT_FALSE(validate_identifier(""));
    EXPECT_FALSE(validate_identifier("has space"));
    EXPECT_FALSE(validate_identifier("../etc"));
    EXPECT_FALSE(validate_identifier("semi;colon"));
    EXPECT_FALSE(validate_identifier(std::string(MAX_IDENTIFIER_LENGTH + 1, 'a')));
}

TEST_F(ChainConfigTest, CustomMaxLength) {
    EXPECT_TRUE(validate_identifier("abcd", 4));
    EXPECT_FALSE(validate_identifier("abcde", 4));
}

// ============================================================================
// Node Configuration Tests
// ============================================================================

TEST_F(ChainConfigTest, MissingFileYieldsDefaults) {
    auto config = load_node_config(test_dir_ / "absent.json");
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->node_id, "hyperchain-node");
    EXPECT_EQ(config->difficulty, DEFAULT_DIFFICULTY);
    EXPECT_FALSE(config->retarget_difficulty);
    EXPECT_EQ(config->max_transactions_per_block, MAX_TRANSACTIONS_PER_BLOCK);
    EXPECT_EQ(config->mining_workers, 0u);
    EXPECT_EQ(config->log_level, "info");
}

TEST_F(ChainConfigTest, LoadsValuesFromFile) {
    auto path = write_config(R"({
        "node_id": "miner-7",
        "difficulty": 6,
        "retarget_difficulty": true,
        "target_block_time": 30,
        "max_transactions_per_block": 25,
        "mining_workers": 2,
        "log_level": "debug"
    })");

    auto config = load_node_config(path);
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->node_id, "miner-7");
    EXPECT_EQ(config->difficulty, 6u);
    EXPECT_TRUE(config->retarget_difficulty);
    EXPECT_EQ(config->target_block_time, std::chrono::seconds(30));
    EXPECT_EQ(config->max_transactions_per_block, 25u);
    EXPECT_EQ(config->mining_workers, 2u);
    EXPECT_EQ(config->log_level, "debug");
}

TEST_F(ChainConfigTest, PartialFileKeepsDefaults) {
    auto path = write_config(R"({"difficulty": 2})");

    auto config = load_node_config(path);
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->difficulty, 2u);
    EXPECT_EQ(config->node_id, "hyperchain-node");
    EXPECT_EQ(config->target_block_time, TARGET_BLOCK_TIME);
}

TEST_F(ChainConfigTest, MalformedFileRejected) {
    auto path = write_config("{ not json");
    EXPECT_FALSE(load_node_config(path).has_value());
}

TEST_F(ChainConfigTest, InvalidNodeIdRejected) {
    auto path = write_config(R"({"node_id": "bad id"})");
    EXPECT_FALSE(load_node_config(path).has_value());
}

TEST_F(ChainConfigTest, ZeroTransactionsPerBlockRejected) {
    auto path = write_config(R"({"max_transactions_per_block": 0})");
    EXPECT_FALSE(load_node_config(path).has_value());
}

TEST_F(ChainConfigTest, EnvironmentOverridesFile) {
    auto path = write_config(R"({"node_id": "from-file", "difficulty": 3})");

    setenv("HYPERCHAIN_NODE_ID", "from-env", 1);
    setenv("HYPERCHAIN_DIFFICULTY", "7", 1);
    setenv("HYPERCHAIN_LOG_LEVEL", "warn", 1);

    auto config = load_node_config(path);
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->node_id, "from-env");
    EXPECT_EQ(config->difficulty, 7u);
    EXPECT_EQ(config->log_level, "warn");
}

TEST_F(ChainConfigTest, InvalidDifficultyOverrideIgnored) {
    NodeConfig config;
    config.difficulty = 5;

    setenv("HYPERCHAIN_DIFFICULTY", "hard", 1);
    apply_environment_overrides(config);

    EXPECT_EQ(config.difficulty, 5u);
}

// ============================================================================
// Data Directory Tests
// ============================================================================

TEST_F(ChainConfigTest, DataDirectoryFromEnvironment) {
    fs::path data_dir = test_dir_ / "data";
    setenv("HYPERCHAIN_DATA_DIR", data_dir.c_str(), 1);

    EXPECT_EQ(get_data_directory(), data_dir);
    EXPECT_TRUE(fs::exists(data_dir));

    EXPECT_EQ(get_database_directory(), data_dir / "db");
    EXPECT_EQ(get_log_directory(), data_dir / "logs");
    EXPECT_EQ(get_snapshot_directory(), data_dir / "snapshots");
    EXPECT_TRUE(fs::is_directory(data_dir / "db"));
    EXPECT_TRUE(fs::is_directory(data_dir / "logs"));
    EXPECT_TRUE(fs::is_directory(data_dir / "snapshots"));
}

// ============================================================================
// Utilities Tests
// ============================================================================

TEST_F(ChainConfigTest, ParseLogLevel) {
    EXPECT_EQ(utilities::parse_log_level("debug"), utilities::LogLevel::DEBUG);
    EXPECT_EQ(utilities::parse_log_level("INFO"), utilities::LogLevel::INFO);
    EXPECT_EQ(utilities::parse_log_level("warning"), utilities::LogLevel::WARN);
    EXPECT_EQ(utilities::parse_log_level("Critical"), utilities::LogLevel::CRITICAL);
    EXPECT_FALSE(utilities::parse_log_level("verbose").has_value());
}

TEST_F(ChainConfigTest, FormatTimestamp) {
    EXPECT_EQ(utilities::format_timestamp(GENESIS_TIMESTAMP), "2025-01-01T00:00:00Z");
}

TEST_F(ChainConfigTest, FormatDuration) {
    EXPECT_EQ(utilities::format_duration(0), "0s");
    EXPECT_EQ(utilities::format_duration(59), "59s");
    EXPECT_EQ(utilities::format_duration(60), "1m");
    EXPECT_EQ(utilities::format_duration(3725), "1h 2m 5s");
}

TEST_F(ChainConfigTest, WriteReadAndHashFile) {
    std::string path = (test_dir_ / "nested" / "data.txt").string();

    ASSERT_TRUE(utilities::write_file(path, "abc"));

    auto content = utilities::read_file(path);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "abc");

    auto hash = utilities::calculate_file_hash(path);
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(*hash, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ChainConfigTest, ReadMissingFile) {
    EXPECT_FALSE(utilities::read_file((test_dir_ / "missing.txt").string()).has_value());
    EXPECT_FALSE(utilities::calculate_file_hash((test_dir_ / "missing.txt").string()).has_value());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
