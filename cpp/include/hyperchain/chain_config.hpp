/**
 * @file chain_config.hpp
 * @brief Protocol constants, data directories and node configuration
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <string>
#include <filesystem>
#include <optional>

namespace hyperchain {
namespace config {

// ============================================================================
// Hypercube Geometry
// ============================================================================

/// Number of axes of the hypercube (one per knowledge domain)
constexpr size_t DIMENSIONS = 8;

/// Coordinate of the hypercube center on every axis
constexpr double HYPERCUBE_CENTER = 0.5;

// ============================================================================
// Evolution Constants
// ============================================================================

/// Energy consumed per unit of difficulty on every attempt (k1)
constexpr double ENERGY_CONSUMPTION_FACTOR = 10.0;

/// Energy rewarded per unit of difficulty and complexity on success (k2)
constexpr double ENERGY_REWARD_FACTOR = 50.0;

/// Evolutionary resistance exponent (alpha)
constexpr double EVOLUTIONARY_RESISTANCE = 1.5;

/// Complexity index of a newly registered account
constexpr double INITIAL_COMPLEXITY = 1.0;

/// Energy of a newly registered account
constexpr double INITIAL_ENERGY = 100.0;

/// Knowledge gain multiplier (difficulty * quality * factor)
constexpr double KNOWLEDGE_GAIN_FACTOR = 0.1;

/// Complexity threshold for tier 2 (Multi-Cellular)
constexpr double TIER_2_THRESHOLD = 10.0;

/// Complexity threshold for tier 3 (Humanity)
constexpr double TIER_3_THRESHOLD = 100.0;

/// Complexity threshold for tier 4 (Galactic)
constexpr double TIER_4_THRESHOLD = 1000.0;

/// Highest reachable tier
constexpr int MAX_TIER = 4;

/// Energy cap per tier (cap = factor * tier)
constexpr double ENERGY_CAP_PER_TIER = 1000.0;

/// Evolutionary leap displacement per tier (magnitude = factor * new_tier)
constexpr double LEAP_MAGNITUDE_PER_TIER = 0.2;

/// Passive energy regeneration per minute at tier 0 multipliers
constexpr double PASSIVE_REGEN_PER_MINUTE = 1.0;

// ============================================================================
// Validation Constants
// ============================================================================

/// Mean of correctness/completeness/coherence must exceed this
constexpr double INTERNAL_GATE_THRESHOLD = 0.7;

/// Probabilistic draw must exceed this
constexpr double PROBABILISTIC_GATE_THRESHOLD = 0.5;

/// Standard deviation of the probabilistic draw
constexpr double PROBABILISTIC_GATE_STDDEV = 0.1;

/// Complexity that saturates the probabilistic gate mean at 1.0
constexpr double PROBABILISTIC_GATE_SATURATION = 10.0;

// ============================================================================
// Consensus Constants
// ============================================================================

/// Default PoHD difficulty
constexpr uint32_t DEFAULT_DIFFICULTY = 4;

/// Lower bound for difficulty retargeting
constexpr uint32_t MIN_DIFFICULTY = 1;

/// Upper bound for difficulty retargeting
constexpr uint32_t MAX_DIFFICULTY = 10;

/// Target interval between blocks used by retargeting
constexpr auto TARGET_BLOCK_TIME = std::chrono::seconds(10);

/// Maximum transactions assembled into one block
constexpr size_t MAX_TRANSACTIONS_PER_BLOCK = 100;

/// Nonces tried by a worker between cancellation/tip checks
constexpr uint64_t MINING_POLL_INTERVAL = 1024;

/// Fixed genesis timestamp (2025-01-01T00:00:00Z)
constexpr uint64_t GENESIS_TIMESTAMP = 1735689600;

/// Relative tolerance for recomputed evolution values
constexpr double EVOLUTION_TOLERANCE = 1e-9;

// ============================================================================
// Input Limits
// ============================================================================

/// Maximum identifier length (account ID, node ID, problem ID)
constexpr size_t MAX_IDENTIFIER_LENGTH = 64;

/// Maximum JSON document accepted for import (16MB)
constexpr size_t MAX_JSON_SIZE = 16 * 1024 * 1024;

// ============================================================================
// Runtime Node Configuration
// ============================================================================

/**
 * @brief Runtime settings of a HyperChain node
 */
struct NodeConfig {
    std::string node_id = "hyperchain-node";                ///< Node identifier
    std::filesystem::path data_dir;                          ///< Empty: use get_data_directory()
    uint32_t difficulty = DEFAULT_DIFFICULTY;                ///< Initial PoHD difficulty
    bool retarget_difficulty = false;                        ///< Adjust difficulty after each block
    std::chrono::seconds target_block_time = TARGET_BLOCK_TIME;
    size_t max_transactions_per_block = MAX_TRANSACTIONS_PER_BLOCK;
    size_t mining_workers = 0;                               ///< 0: hardware concurrency
    std::string log_level = "info";                          ///< debug|info|warn|error|critical
    std::string log_file;                                    ///< Empty: console only
};

/**
 * @brief Load node configuration from a JSON file
 *
 * Missing keys keep their defaults. Environment variables
 * HYPERCHAIN_NODE_ID, HYPERCHAIN_DIFFICULTY and HYPERCHAIN_LOG_LEVEL
 * override file values.
 *
 * @param config_path Path to JSON config file (may not exist)
 * @return NodeConfig, or std::nullopt if the file exists but is invalid
 */
std::optional<NodeConfig> load_node_config(const std::filesystem::path& config_path);

/**
 * @brief Apply HYPERCHAIN_* environment overrides to a configuration
 * @param config Configuration to update in place
 */
void apply_environment_overrides(NodeConfig& config);

// ============================================================================
// Data Directories
// ============================================================================

/**
 * @brief Get HyperChain data directory from environment or use default
 * @return Filesystem path to data directory
 */
std::filesystem::path get_data_directory();

/**
 * @brief Get database directory
 * @return Filesystem path to database directory
 */
std::filesystem::path get_database_directory();

/**
 * @brief Get log directory
 * @return Filesystem path to log directory
 */
std::filesystem::path get_log_directory();

/**
 * @brief Get snapshot directory
 * @return Filesystem path to snapshot directory
 */
std::filesystem::path get_snapshot_directory();

// ============================================================================
// Input Validation
// ============================================================================

/**
 * @brief Validate identifier (alphanumeric + underscore/hyphen only)
 * @param identifier String to validate
 * @param max_length Maximum allowed length
 * @return true if valid, false otherwise
 */
bool validate_identifier(const std::string& identifier, size_t max_length = MAX_IDENTIFIER_LENGTH);

} // namespace config
} // namespace hyperchain
