/**
 * @file chain_config.cpp
 * @brief Implementation of node configuration and directory helpers
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hyperchain/chain_config.hpp"
#include "hyperchain/utilities.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>

using json = nlohmann::json;

namespace hyperchain {
namespace config {

// ============================================================================
// Node Configuration
// ============================================================================

std::optional<NodeConfig> load_node_config(const std::filesystem::path& config_path) {
    NodeConfig config;

    if (!config_path.empty() && std::filesystem::exists(config_path)) {
        try {
            std::ifstream file(config_path);
            if (!file.is_open()) {
                utilities::log_error("Config: Failed to open " + config_path.string());
                return std::nullopt;
            }

            json j = json::parse(file);

            config.node_id = j.value("node_id", config.node_id);
            if (j.contains("data_dir")) {
                config.data_dir = j["data_dir"].get<std::string>();
            }
            config.difficulty = j.value("difficulty", config.difficulty);
            config.retarget_difficulty = j.value("retarget_difficulty", config.retarget_difficulty);
            config.target_block_time = std::chrono::seconds(
                j.value("target_block_time", static_cast<int64_t>(config.target_block_time.count())));
            config.max_transactions_per_block =
                j.value("max_transactions_per_block", config.max_transactions_per_block);
            config.mining_workers = j.value("mining_workers", config.mining_workers);
            config.log_level = j.value("log_level", config.log_level);
            config.log_file = j.value("log_file", config.log_file);

        } catch (const json::exception& e) {
            utilities::log_error("Config: Invalid config file " + config_path.string() + ": " + e.what());
            return std::nullopt;
        }
    }

    apply_environment_overrides(config);

    if (!validate_identifier(config.node_id)) {
        utilities::log_error("Config: Invalid node id '" + config.node_id + "'");
        return std::nullopt;
    }

    if (config.max_transactions_per_block == 0) {
        utilities::log_error("Config: max_transactions_per_block must be positive");
        return std::nullopt;
    }

    return config;
}

void apply_environment_overrides(NodeConfig& config) {
    std::string node_id = utilities::get_env("HYPERCHAIN_NODE_ID");
    if (!node_id.empty()) {
        config.node_id = node_id;
    }

    std::string difficulty = utilities::get_env("HYPERCHAIN_DIFFICULTY");
    if (!difficulty.empty()) {
        try {
            config.difficulty = static_cast<uint32_t>(std::stoul(difficulty));
        } catch (const std::exception&) {
            utilities::log_warn("Config: Ignoring invalid HYPERCHAIN_DIFFICULTY '" + difficulty + "'");
        }
    }

    std::string log_level = utilities::get_env("HYPERCHAIN_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log_level = log_level;
    }
}

// ============================================================================
// Data Directories
// ============================================================================

std::filesystem::path get_data_directory() {
    // Check for environment variable HYPERCHAIN_DATA_DIR
    const char* env_data_dir = std::getenv("HYPERCHAIN_DATA_DIR");

    std::filesystem::path data_dir;
    if (env_data_dir != nullptr && std::strlen(env_data_dir) > 0) {
        data_dir = env_data_dir;
    } else {
#ifdef _WIN32
        data_dir = "C:\\ProgramData\\HyperChain";
#else
        data_dir = "/opt/hyperchain/var";
#endif
    }

    if (!std::filesystem::exists(data_dir)) {
        std::filesystem::create_directories(data_dir);
    }

    return data_dir;
}

namespace {

std::filesystem::path ensure_subdirectory(const char* name) {
    std::filesystem::path dir = get_data_directory() / name;

    if (!std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir);
    }

    return dir;
}

} // namespace

std::filesystem::path get_database_directory() {
    return ensure_subdirectory("db");
}

std::filesystem::path get_log_directory() {
    return ensure_subdirectory("logs");
}

std::filesystem::path get_snapshot_directory() {
    return ensure_subdirectory("snapshots");
}

// ============================================================================
// Input Validation
// ============================================================================

bool validate_identifier(const std::string& identifier, size_t max_length) {
    if (identifier.empty() || identifier.length() > max_length) {
        return false;
    }

    // Alphanumeric + underscore + hyphen only
    return std::all_of(identifier.begin(), identifier.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    });
}

} // namespace config
} // namespace hyperchain
