/**
 * @file account.cpp
 * @brief Implementation of account state, tier rules and serialization
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hyperchain/account.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <set>

using json = nlohmann::json;

namespace hyperchain {

// ============================================================================
// Knowledge Domains
// ============================================================================

const std::array<KnowledgeDomain, config::DIMENSIONS>& all_knowledge_domains() {
    static const std::array<KnowledgeDomain, config::DIMENSIONS> domains = {
        KnowledgeDomain::PHYSICS,
        KnowledgeDomain::BIOLOGY,
        KnowledgeDomain::MATHEMATICS,
        KnowledgeDomain::COMPUTER_SCIENCE,
        KnowledgeDomain::CHEMISTRY,
        KnowledgeDomain::PHILOSOPHY,
        KnowledgeDomain::ENGINEERING,
        KnowledgeDomain::COSMOLOGY
    };
    return domains;
}

std::string knowledge_domain_to_string(KnowledgeDomain domain) {
    switch (domain) {
        case KnowledgeDomain::PHYSICS: return "physics";
        case KnowledgeDomain::BIOLOGY: return "biology";
        case KnowledgeDomain::MATHEMATICS: return "mathematics";
        case KnowledgeDomain::COMPUTER_SCIENCE: return "computer_science";
        case KnowledgeDomain::CHEMISTRY: return "chemistry";
        case KnowledgeDomain::PHILOSOPHY: return "philosophy";
        case KnowledgeDomain::ENGINEERING: return "engineering";
        case KnowledgeDomain::COSMOLOGY: return "cosmology";
        default: return "unknown";
    }
}

std::optional<KnowledgeDomain> string_to_knowledge_domain(const std::string& name) {
    if (name == "physics") return KnowledgeDomain::PHYSICS;
    if (name == "biology") return KnowledgeDomain::BIOLOGY;
    if (name == "mathematics") return KnowledgeDomain::MATHEMATICS;
    if (name == "computer_science") return KnowledgeDomain::COMPUTER_SCIENCE;
    if (name == "chemistry") return KnowledgeDomain::CHEMISTRY;
    if (name == "philosophy") return KnowledgeDomain::PHILOSOPHY;
    if (name == "engineering") return KnowledgeDomain::ENGINEERING;
    if (name == "cosmology") return KnowledgeDomain::COSMOLOGY;
    return std::nullopt;
}

// ============================================================================
// Tier Rules
// ============================================================================

int tier_for_complexity(double complexity_index) {
    if (complexity_index >= config::TIER_4_THRESHOLD) return 4;
    if (complexity_index >= config::TIER_3_THRESHOLD) return 3;
    if (complexity_index >= config::TIER_2_THRESHOLD) return 2;
    return 1;
}

std::string tier_name(int tier) {
    switch (tier) {
        case 1: return "Single-Cell";
        case 2: return "Multi-Cellular";
        case 3: return "Humanity";
        case 4: return "Galactic";
        default: return "Unknown";
    }
}

double energy_cap_for_tier(int tier) {
    return config::ENERGY_CAP_PER_TIER * static_cast<double>(tier);
}

double tier_energy_bonus(int tier) {
    switch (tier) {
        case 1: return 100.0;
        case 2: return 200.0;
        case 3: return 500.0;
        case 4: return 1000.0;
        default: return 0.0;
    }
}

// ============================================================================
// Account
// ============================================================================

Account make_genesis_account(const std::string& account_id, uint64_t timestamp) {
    Account account;
    account.account_id = account_id;
    account.complexity_index = config::INITIAL_COMPLEXITY;
    account.energy = config::INITIAL_ENERGY;
    account.tier = tier_for_complexity(account.complexity_index);
    account.knowledge.fill(0.0);
    account.position.fill(config::HYPERCUBE_CENTER);
    account.created_at = timestamp;
    account.updated_at = timestamp;
    return account;
}

std::optional<std::string> find_invariant_violation(const Account& account) {
    if (!std::isfinite(account.complexity_index) || account.complexity_index <= 0.0) {
        return "complexity_index must be positive";
    }

    if (account.tier != tier_for_complexity(account.complexity_index)) {
        return "tier " + std::to_string(account.tier) + " inconsistent with complexity " +
               std::to_string(account.complexity_index);
    }

    if (!std::isfinite(account.energy) || account.energy < 0.0) {
        return "energy must be non-negative";
    }

    if (account.energy > energy_cap_for_tier(account.tier)) {
        return "energy exceeds tier cap";
    }

    for (size_t i = 0; i < config::DIMENSIONS; i++) {
        if (!(account.knowledge[i] >= 0.0 && account.knowledge[i] <= 1.0)) {
            return "knowledge out of range on axis " + std::to_string(i);
        }
        if (!(account.position[i] >= 0.0 && account.position[i] <= 1.0)) {
            return "position out of range on axis " + std::to_string(i);
        }
    }

    return std::nullopt;
}

json Account::to_json_object() const {
    json j;
    j["account_id"] = account_id;
    j["complexity_index"] = complexity_index;
    j["energy"] = energy;
    j["tier"] = tier;

    json knowledge_json = json::object();
    for (KnowledgeDomain domain : all_knowledge_domains()) {
        knowledge_json[knowledge_domain_to_string(domain)] = knowledge[domain_axis(domain)];
    }
    j["knowledge"] = knowledge_json;

    j["position_8d"] = position;
    j["problems_solved"] = problems_solved;
    j["total_difficulty"] = total_difficulty;
    j["created_at"] = created_at;
    j["updated_at"] = updated_at;
    j["revision"] = revision;
    return j;
}

std::optional<Account> Account::from_json_object(const json& j) {
    try {
        Account account;
        account.account_id = j.at("account_id").get<std::string>();
        account.complexity_index = j.at("complexity_index").get<double>();
        account.energy = j.at("energy").get<double>();
        account.tier = j.at("tier").get<int>();

        account.knowledge.fill(0.0);
        const auto& knowledge_json = j.at("knowledge");
        for (auto it = knowledge_json.begin(); it != knowledge_json.end(); ++it) {
            auto domain = string_to_knowledge_domain(it.key());
            if (!domain) {
                return std::nullopt;
            }
            account.knowledge[domain_axis(*domain)] = it.value().get<double>();
        }

        const auto& position_json = j.at("position_8d");
        if (!position_json.is_array() || position_json.size() != config::DIMENSIONS) {
            return std::nullopt;
        }
        for (size_t i = 0; i < config::DIMENSIONS; i++) {
            account.position[i] = position_json[i].get<double>();
        }

        account.problems_solved = j.value("problems_solved", static_cast<uint64_t>(0));
        account.total_difficulty = j.value("total_difficulty", 0.0);
        account.created_at = j.value("created_at", static_cast<uint64_t>(0));
        account.updated_at = j.value("updated_at", static_cast<uint64_t>(0));
        account.revision = j.value("revision", static_cast<uint64_t>(0));

        return account;

    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::string Account::to_json() const {
    try {
        return to_json_object().dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<Account> Account::from_json(const std::string& json_str) {
    try {
        return from_json_object(json::parse(json_str));
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Problem
// ============================================================================

bool Problem::is_valid() const {
    if (!config::validate_identifier(id)) {
        return false;
    }

    if (!std::isfinite(difficulty) || difficulty < 0.0 || difficulty > 1.0) {
        return false;
    }

    // required_domains is a set
    std::set<KnowledgeDomain> unique(required_domains.begin(), required_domains.end());
    return unique.size() == required_domains.size();
}

} // namespace hyperchain
