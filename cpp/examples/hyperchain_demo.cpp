/**
 * @file hyperchain_demo.cpp
 * @brief Single-process demo - submit solutions, mine a block, replicate the chain
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates minimal node usage:
 * - Load configuration and initialize logging
 * - Register accounts and submit solutions
 * - Mine pending transactions into a block
 * - Replicate the chain into a second node
 */

#include "hyperchain/hyper_node.hpp"
#include "hyperchain/scoring_oracle.hpp"
#include "hyperchain/utilities.hpp"
#include <iostream>

using namespace hyperchain;

namespace {

std::vector<Problem> demo_problems() {
    Problem energy;
    energy.id = "thermo-001";
    energy.difficulty = 0.5;
    energy.required_domains = {KnowledgeDomain::PHYSICS, KnowledgeDomain::MATHEMATICS};
    energy.keywords = {"entropy", "energy", "temperature"};

    Problem sorting;
    sorting.id = "algo-042";
    sorting.difficulty = 0.3;
    sorting.required_domains = {KnowledgeDomain::COMPUTER_SCIENCE};
    sorting.keywords = {"merge", "complexity", "stable"};

    return {energy, sorting};
}

void print_account(const Account& account) {
    std::cout << "  " << account.account_id
              << ": C=" << account.complexity_index
              << " E=" << account.energy
              << " tier=" << account.tier << " (" << tier_name(account.tier) << ")"
              << " solved=" << account.problems_solved << "\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = argc >= 2 ? argv[1] : "";

    auto config = config::load_node_config(config_path);
    if (!config) {
        std::cerr << "Invalid configuration: " << config_path << "\n";
        return 1;
    }

    auto level = utilities::parse_log_level(config->log_level);
    std::string log_file = config->log_file;
    if (log_file.empty()) {
        log_file = (config::get_log_directory() / "hyperchain.log").string();
    }
    utilities::initialize_logging(log_file, level ? *level : utilities::LogLevel::INFO);

    try {
        std::cout << "\n=== HyperChain Demo ===\n\n";

        auto oracle = std::make_shared<HeuristicScoringOracle>();
        HyperNode node(*config, oracle);

        for (const std::string id : {"alice", "bob"}) {
            if (!node.get_account(id)) {
                node.register_account(id);
            }
        }

        Solution answer;
        answer.answer = "Entropy rises as energy spreads; temperature fixes the exchange rate between "
                        "energy and entropy. A stable merge keeps equal keys in order at n log n complexity.";
        answer.methodology = "Derived from the second law and a comparison of merge strategies.";

        for (const auto& problem : demo_problems()) {
            for (const std::string id : {"alice", "bob"}) {
                try {
                    auto result = node.submit_solution(id, problem, answer);
                    std::cout << id << " -> " << problem.id << ": "
                              << (result.accepted ? "accepted" : "rejected")
                              << " quality=" << result.quality
                              << " dC=" << result.complexity_delta << "\n";
                } catch (const InsufficientEnergy& e) {
                    std::cout << id << " -> " << problem.id << ": " << e.what() << "\n";
                }
            }
        }

        std::cout << "\nMining " << node.pending_transactions() << " pending transaction(s)...\n";
        auto report = node.mine_pending_block();
        if (report && report->appended) {
            std::cout << "Block " << report->block.index << " accepted after " << report->attempts
                      << " attempts at " << utilities::format_timestamp(report->block.timestamp)
                      << ", hash " << ChainCrypto::hash_to_hex(report->block.hash) << "\n";
        } else {
            std::cout << "No block produced\n";
        }

        std::cout << "\nAccounts:\n";
        for (const std::string id : {"alice", "bob"}) {
            auto account = node.get_account(id);
            if (account) {
                print_account(*account);
            }
        }

        // Replicate into a second node
        config::NodeConfig replica_config = *config;
        replica_config.node_id = config->node_id + "-replica";
        replica_config.data_dir = (config->data_dir.empty() ? config::get_data_directory() : config->data_dir) / "replica";

        HyperNode replica(replica_config, oracle);
        for (const std::string id : {"alice", "bob"}) {
            if (!replica.get_account(id)) {
                replica.register_account(id);
            }
        }

        auto import = replica.import_chain_json(node.export_chain_json(), node.get_node_id());
        std::cout << "\nReplica imported " << import.imported << " block(s), skipped " << import.skipped;
        if (!import.result.ok()) {
            std::cout << " (stopped: " << error_code_to_string(import.result.code) << ": " << import.result.reason << ")";
        }
        std::cout << "\n";

        auto checksum = node.write_snapshot();
        if (checksum) {
            std::cout << "Snapshot checksum: " << *checksum << "\n";
        }

        std::cout << "Chain valid: " << (node.verify_chain() ? "yes" : "no") << "\n";
        node.print_status();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
