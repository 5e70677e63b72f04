/**
 * @file account.hpp
 * @brief Single-Cell Digital Account (SCDA) state, problems and solutions
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Account state types and the tier rules derived from complexity:
 * - Knowledge domains and their hypercube axes
 * - Tier thresholds, names, energy caps and level-up bonuses
 * - JSON serialization for storage and export
 */

#pragma once

#include "hyperchain/chain_config.hpp"
#include <nlohmann/json_fwd.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hyperchain {

/**
 * @brief Knowledge domains, one per hypercube axis (value = axis index)
 */
enum class KnowledgeDomain {
    PHYSICS = 0,             ///< Axis 0
    BIOLOGY = 1,             ///< Axis 1
    MATHEMATICS = 2,         ///< Axis 2
    COMPUTER_SCIENCE = 3,    ///< Axis 3
    CHEMISTRY = 4,           ///< Axis 4
    PHILOSOPHY = 5,          ///< Axis 5
    ENGINEERING = 6,         ///< Axis 6
    COSMOLOGY = 7            ///< Axis 7
};

/// Per-domain knowledge in [0, 1], indexed by domain axis
using KnowledgeVector = std::array<double, config::DIMENSIONS>;

/// Point in the unit hypercube
using Position8D = std::array<double, config::DIMENSIONS>;

/**
 * @brief All domains in axis order
 */
const std::array<KnowledgeDomain, config::DIMENSIONS>& all_knowledge_domains();

/**
 * @brief Convert KnowledgeDomain to its canonical name (e.g. "computer_science")
 */
std::string knowledge_domain_to_string(KnowledgeDomain domain);

/**
 * @brief Parse canonical domain name
 * @return Domain or std::nullopt if unknown
 */
std::optional<KnowledgeDomain> string_to_knowledge_domain(const std::string& name);

/**
 * @brief Axis index of a domain
 */
inline size_t domain_axis(KnowledgeDomain domain) {
    return static_cast<size_t>(domain);
}

// ============================================================================
// Tier Rules
// ============================================================================

/**
 * @brief Tier derived from complexity index (1..4, thresholds 10/100/1000)
 */
int tier_for_complexity(double complexity_index);

/**
 * @brief Display name of a tier ("Single-Cell", "Multi-Cellular", "Humanity", "Galactic")
 */
std::string tier_name(int tier);

/**
 * @brief Upper bound of account energy at a tier
 */
double energy_cap_for_tier(int tier);

/**
 * @brief One-time energy bonus granted on reaching a tier
 */
double tier_energy_bonus(int tier);

// ============================================================================
// Account
// ============================================================================

/**
 * @brief SCDA record
 *
 * Mutated only through EvolutionEngine. revision increases with every
 * stored change and is used to detect divergence of pending state.
 */
struct Account {
    std::string account_id;                  ///< Immutable identity
    double complexity_index = config::INITIAL_COMPLEXITY;
    double energy = config::INITIAL_ENERGY;
    int tier = 1;                            ///< Always tier_for_complexity(complexity_index)
    KnowledgeVector knowledge{};             ///< Domain knowledge in [0, 1]
    Position8D position{};                   ///< Hypercube position in [0, 1]^8
    uint64_t problems_solved = 0;
    double total_difficulty = 0.0;
    uint64_t created_at = 0;                 ///< Unix timestamp
    uint64_t updated_at = 0;                 ///< Unix timestamp
    uint64_t revision = 0;                   ///< Store revision

    /**
     * @brief Knowledge level of one domain
     */
    double knowledge_of(KnowledgeDomain domain) const {
        return knowledge[domain_axis(domain)];
    }

    /**
     * @brief Serialize account to JSON
     * @return JSON string
     */
    std::string to_json() const;

    /**
     * @brief Deserialize account from JSON
     * @param json JSON string
     * @return Account or std::nullopt if invalid
     */
    static std::optional<Account> from_json(const std::string& json);

    nlohmann::json to_json_object() const;
    static std::optional<Account> from_json_object(const nlohmann::json& j);
};

/**
 * @brief Default state of a newly registered account
 *
 * Complexity 1.0, energy 100.0, tier 1, zero knowledge, centered position.
 *
 * @param account_id Account identity
 * @param timestamp Creation time (Unix seconds)
 */
Account make_genesis_account(const std::string& account_id, uint64_t timestamp);

/**
 * @brief Check account invariants (tier/complexity consistency, energy range,
 *        knowledge and position bounds)
 * @return Description of the first violated invariant, or std::nullopt
 */
std::optional<std::string> find_invariant_violation(const Account& account);

// ============================================================================
// Problem / Solution
// ============================================================================

/**
 * @brief Problem supplied by an external collaborator
 */
struct Problem {
    std::string id;                                  ///< Problem identifier
    double difficulty = 0.0;                         ///< D in [0, 1]
    std::vector<KnowledgeDomain> required_domains;   ///< Subset of the 8 domains
    std::vector<std::string> keywords;               ///< Terms an answer is expected to address

    /**
     * @brief Whether id is a valid identifier and difficulty lies in [0, 1]
     */
    bool is_valid() const;
};

/**
 * @brief Solution submitted for a problem
 */
struct Solution {
    std::string answer;          ///< Solution body
    std::string methodology;     ///< Description of the approach
};

} // namespace hyperchain
