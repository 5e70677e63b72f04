/**
 * @file evolution_engine.cpp
 * @brief Implementation of SCDA evolution rules
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hyperchain/evolution_engine.hpp"
#include "hyperchain/errors.hpp"
#include "hyperchain/utilities.hpp"
#include <algorithm>
#include <cmath>

namespace hyperchain {

namespace {

double clamp_energy(double energy, int tier) {
    return std::clamp(energy, 0.0, energy_cap_for_tier(tier));
}

double distance_to_center(const Position8D& position) {
    double sum = 0.0;
    for (double coordinate : position) {
        double d = coordinate - config::HYPERCUBE_CENTER;
        sum += d * d;
    }
    return std::sqrt(sum);
}

void require_energy(const Account& account, double cost) {
    if (account.energy < cost) {
        throw InsufficientEnergy(account.account_id, cost, account.energy);
    }
}

} // namespace

// ============================================================================
// Formulas
// ============================================================================

double EvolutionEngine::complexity_gain(double difficulty, double complexity_index) {
    return difficulty / std::pow(complexity_index, config::EVOLUTIONARY_RESISTANCE);
}

double EvolutionEngine::attempt_cost(double difficulty) {
    return config::ENERGY_CONSUMPTION_FACTOR * difficulty;
}

Position8D EvolutionEngine::update_position(
    const Position8D& position,
    double complexity_index,
    const std::vector<KnowledgeDomain>& domains,
    double difficulty,
    double quality
) {
    std::array<double, config::DIMENSIONS> direction{};
    for (KnowledgeDomain domain : domains) {
        direction[domain_axis(domain)] += difficulty * quality;
    }

    double norm = 0.0;
    for (double component : direction) {
        norm += component * component;
    }
    norm = std::sqrt(norm);

    if (norm == 0.0) {
        return position;
    }

    double learning_rate = 1.0 / (1.0 + complexity_index);

    Position8D updated = position;
    for (size_t i = 0; i < config::DIMENSIONS; i++) {
        updated[i] = std::clamp(position[i] + learning_rate * direction[i] / norm, 0.0, 1.0);
    }

    return updated;
}

// ============================================================================
// Transitions
// ============================================================================

EvolutionResult EvolutionEngine::apply_solution(
    const Account& account,
    const Problem& problem,
    double quality,
    RandomSource& rng,
    uint64_t timestamp
) {
    // 1. Attempt cost precondition
    double energy_consumed = attempt_cost(problem.difficulty);
    require_energy(account, energy_consumed);

    EvolutionResult result;
    result.account = account;
    Account& next = result.account;

    // 2. Consume
    next.energy -= energy_consumed;

    // 3. Complexity gain against evolutionary resistance
    double complexity_delta = complexity_gain(problem.difficulty, account.complexity_index);
    next.complexity_index = account.complexity_index + complexity_delta;

    // 4. Reward uses the updated complexity
    int reached_tier = tier_for_complexity(next.complexity_index);
    double energy_gained = config::ENERGY_REWARD_FACTOR * problem.difficulty * next.complexity_index;
    next.energy = clamp_energy(next.energy + energy_gained, reached_tier);

    // 5. Knowledge
    double knowledge_gain = problem.difficulty * quality * config::KNOWLEDGE_GAIN_FACTOR;
    for (KnowledgeDomain domain : problem.required_domains) {
        size_t axis = domain_axis(domain);
        next.knowledge[axis] = std::min(1.0, next.knowledge[axis] + knowledge_gain);
    }

    // 6. Position
    next.position = update_position(next.position, next.complexity_index,
                                    problem.required_domains, problem.difficulty, quality);

    // 7. Counters
    next.problems_solved += 1;
    next.total_difficulty += problem.difficulty;

    // 8. Tier transition
    if (reached_tier > account.tier) {
        next.tier = reached_tier;
        result.tier_changed = true;
        result.tier_bonus = tier_energy_bonus(reached_tier);
        next.energy = clamp_energy(next.energy + result.tier_bonus, reached_tier);

        // Evolutionary leap: random unit direction scaled by 0.2 * new tier
        std::array<double, config::DIMENSIONS> leap{};
        double norm = 0.0;
        for (auto& component : leap) {
            component = rng.normal(0.0, 1.0);
            norm += component * component;
        }
        norm = std::sqrt(norm);

        if (norm > 0.0) {
            double magnitude = config::LEAP_MAGNITUDE_PER_TIER * static_cast<double>(reached_tier);
            for (size_t i = 0; i < config::DIMENSIONS; i++) {
                next.position[i] = std::clamp(next.position[i] + magnitude * leap[i] / norm, 0.0, 1.0);
            }
        }

        utilities::log_info("EvolutionEngine: " + account.account_id + " evolved to tier " +
                            std::to_string(reached_tier) + " (" + tier_name(reached_tier) + ")");
    }

    next.updated_at = timestamp;

    // 9. Record
    Transaction& tx = result.transaction;
    tx.kind = TransactionKind::EVOLUTION;
    tx.account_id = account.account_id;
    tx.timestamp = timestamp;
    tx.evolution.problem_id = problem.id;
    tx.evolution.difficulty = problem.difficulty;
    tx.evolution.quality = quality;
    tx.evolution.complexity_before = account.complexity_index;
    tx.evolution.complexity_delta = complexity_delta;
    tx.evolution.complexity_after = next.complexity_index;
    tx.evolution.energy_delta = next.energy - account.energy;
    tx.evolution.old_tier = account.tier;
    tx.evolution.new_tier = next.tier;

    result.energy_consumed = energy_consumed;
    result.energy_gained = energy_gained;
    result.complexity_delta = complexity_delta;

    return result;
}

EvolutionResult EvolutionEngine::charge_attempt(
    const Account& account,
    const Problem& problem,
    double quality,
    uint64_t timestamp
) {
    double energy_consumed = attempt_cost(problem.difficulty);
    require_energy(account, energy_consumed);

    EvolutionResult result;
    result.account = account;
    result.account.energy = account.energy - energy_consumed;
    result.account.updated_at = timestamp;

    Transaction& tx = result.transaction;
    tx.kind = TransactionKind::ATTEMPT_CHARGE;
    tx.account_id = account.account_id;
    tx.timestamp = timestamp;
    tx.evolution.problem_id = problem.id;
    tx.evolution.difficulty = problem.difficulty;
    tx.evolution.quality = quality;
    tx.evolution.complexity_before = account.complexity_index;
    tx.evolution.complexity_delta = 0.0;
    tx.evolution.complexity_after = account.complexity_index;
    tx.evolution.energy_delta = -energy_consumed;
    tx.evolution.old_tier = account.tier;
    tx.evolution.new_tier = account.tier;

    result.energy_consumed = energy_consumed;

    return result;
}

double EvolutionEngine::passive_regeneration(const Account& account, uint64_t elapsed_seconds) {
    const double max_distance = std::sqrt(static_cast<double>(config::DIMENSIONS) * 0.25);

    double minutes = static_cast<double>(elapsed_seconds) / 60.0;
    double tier_multiplier = 1.0 + 0.5 * static_cast<double>(account.tier);
    double centrality = 1.0 - distance_to_center(account.position) / max_distance;
    double position_multiplier = 1.0 + 0.5 * centrality;

    return config::PASSIVE_REGEN_PER_MINUTE * minutes * tier_multiplier * position_multiplier;
}

double EvolutionEngine::max_passive_regeneration(int tier, uint64_t elapsed_seconds) {
    double minutes = static_cast<double>(elapsed_seconds) / 60.0;
    return config::PASSIVE_REGEN_PER_MINUTE * minutes * (1.0 + 0.5 * static_cast<double>(tier)) * 1.5;
}

EvolutionResult EvolutionEngine::regenerate(const Account& account, uint64_t elapsed_seconds, uint64_t timestamp) {
    EvolutionResult result;
    result.account = account;
    result.account.energy = clamp_energy(account.energy + passive_regeneration(account, elapsed_seconds), account.tier);
    result.account.updated_at = timestamp;

    Transaction& tx = result.transaction;
    tx.kind = TransactionKind::REGENERATION;
    tx.account_id = account.account_id;
    tx.timestamp = timestamp;
    tx.regeneration.elapsed_seconds = elapsed_seconds;
    tx.regeneration.energy_delta = result.account.energy - account.energy;

    result.energy_gained = tx.regeneration.energy_delta;

    return result;
}

// ============================================================================
// Verification / Replay
// ============================================================================

bool EvolutionEngine::nearly_equal(double a, double b) {
    if (!std::isfinite(a) || !std::isfinite(b)) {
        return false;
    }
    double scale = std::max(1.0, std::max(std::fabs(a), std::fabs(b)));
    return std::fabs(a - b) <= config::EVOLUTION_TOLERANCE * scale;
}

std::optional<std::string> EvolutionEngine::check_consistency(const Account& current, const Transaction& tx) {
    if (tx.account_id != current.account_id) {
        return "transaction account does not match";
    }

    if (tx.kind == TransactionKind::TRANSFER) {
        if (!std::isfinite(tx.transfer.amount) || tx.transfer.amount <= 0.0) {
            return "transfer amount must be positive";
        }
        if (tx.transfer.recipient_id == tx.account_id) {
            return "transfer to self";
        }
        return std::nullopt;
    }

    if (tx.kind == TransactionKind::REGENERATION) {
        double delta = tx.regeneration.energy_delta;
        if (!std::isfinite(delta) || delta < 0.0) {
            return "regeneration energy_delta must be non-negative";
        }
        double bound = max_passive_regeneration(current.tier, tx.regeneration.elapsed_seconds);
        if (delta > bound && !nearly_equal(delta, bound)) {
            return "regeneration energy_delta " + std::to_string(delta) +
                   " exceeds the bound " + std::to_string(bound) + " for the elapsed time";
        }
        if (current.energy + delta > energy_cap_for_tier(current.tier) * (1.0 + config::EVOLUTION_TOLERANCE)) {
            return "regeneration exceeds the tier energy cap";
        }
        return std::nullopt;
    }

    const EvolutionPayload& p = tx.evolution;

    if (!(p.difficulty >= 0.0 && p.difficulty <= 1.0)) {
        return "difficulty out of range";
    }
    if (!(p.quality >= 0.0 && p.quality <= 1.0)) {
        return "quality out of range";
    }
    if (!nearly_equal(p.complexity_before, current.complexity_index)) {
        return "complexity_before " + std::to_string(p.complexity_before) +
               " diverges from account complexity " + std::to_string(current.complexity_index);
    }
    if (p.old_tier != current.tier || p.old_tier != tier_for_complexity(p.complexity_before)) {
        return "old_tier inconsistent";
    }

    double cost = attempt_cost(p.difficulty);
    if (current.energy < cost && !nearly_equal(current.energy, cost)) {
        return "account energy below attempt cost";
    }

    if (tx.kind == TransactionKind::ATTEMPT_CHARGE) {
        if (p.complexity_delta != 0.0 || p.complexity_after != p.complexity_before ||
            p.new_tier != p.old_tier) {
            return "attempt charge changes evolution state";
        }
        if (!nearly_equal(p.energy_delta, -cost)) {
            return "attempt charge energy_delta mismatch";
        }
        return std::nullopt;
    }

    double expected_delta = complexity_gain(p.difficulty, p.complexity_before);
    if (!nearly_equal(p.complexity_delta, expected_delta)) {
        return "complexity_delta " + std::to_string(p.complexity_delta) +
               " does not match recomputed " + std::to_string(expected_delta);
    }
    if (!nearly_equal(p.complexity_after, p.complexity_before + p.complexity_delta)) {
        return "complexity_after mismatch";
    }
    if (p.new_tier != tier_for_complexity(p.complexity_after) || p.new_tier < p.old_tier) {
        return "new_tier inconsistent";
    }

    double max_energy = energy_cap_for_tier(p.new_tier);
    if (current.energy + p.energy_delta < 0.0 ||
        current.energy + p.energy_delta > max_energy * (1.0 + config::EVOLUTION_TOLERANCE)) {
        return "energy_delta leaves energy out of range";
    }

    return std::nullopt;
}

Account EvolutionEngine::replay(const Account& account, const Transaction& tx, uint64_t timestamp) {
    Account next = account;
    next.updated_at = timestamp;

    if (tx.kind == TransactionKind::TRANSFER) {
        return next;
    }

    if (tx.kind == TransactionKind::REGENERATION) {
        next.energy = clamp_energy(account.energy + tx.regeneration.energy_delta, account.tier);
        return next;
    }

    const EvolutionPayload& p = tx.evolution;
    next.complexity_index = p.complexity_after;
    next.tier = tier_for_complexity(next.complexity_index);
    next.energy = clamp_energy(account.energy + p.energy_delta, next.tier);

    if (tx.kind == TransactionKind::EVOLUTION) {
        next.problems_solved += 1;
        next.total_difficulty += p.difficulty;
    }

    return next;
}

} // namespace hyperchain
