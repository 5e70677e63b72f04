/**
 * @file evolution_engine.hpp
 * @brief SCDA evolution rules
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Pure functions over account snapshots:
 * - Solution application (energy, complexity, knowledge, position, tier)
 * - Attempt charging for rejected solutions
 * - Passive energy regeneration
 * - Recomputation checks and replay of recorded transactions
 */

#pragma once

#include "hyperchain/account.hpp"
#include "hyperchain/random_source.hpp"
#include "hyperchain/transaction.hpp"
#include <optional>
#include <string>
#include <vector>

namespace hyperchain {

/**
 * @brief Outcome of an evolution step
 */
struct EvolutionResult {
    Account account;                 ///< New account state
    Transaction transaction;         ///< Transaction recording the step
    double energy_consumed = 0.0;    ///< k1 * D
    double energy_gained = 0.0;      ///< k2 * D * C_new (0 for attempt charges)
    double tier_bonus = 0.0;         ///< One-time level-up bonus (before clamping)
    double complexity_delta = 0.0;   ///< ΔC
    bool tier_changed = false;
};

/**
 * @brief EvolutionEngine - deterministic account state transitions
 *
 * All methods are stateless. Inputs are never modified; a failed
 * precondition leaves no partial result. Given identical inputs and
 * random source state, outputs are identical.
 */
class EvolutionEngine {
public:
    // ========================================================================
    // Formulas
    // ========================================================================

    /**
     * @brief ΔC = difficulty / complexity^alpha
     */
    static double complexity_gain(double difficulty, double complexity_index);

    /**
     * @brief Energy consumed by one attempt (k1 * difficulty)
     */
    static double attempt_cost(double difficulty);

    /**
     * @brief Move a position toward the solved problem's domains
     *
     * eta = 1 / (1 + complexity); V = normalize(sum of domain basis vectors
     * scaled by difficulty * quality); result is clamped to [0, 1].
     *
     * @param position Current position
     * @param complexity_index Complexity used for the learning rate
     * @param domains Required domains of the problem
     * @param difficulty Problem difficulty
     * @param quality Solution quality
     * @return Updated position (unchanged if V is the zero vector)
     */
    static Position8D update_position(
        const Position8D& position,
        double complexity_index,
        const std::vector<KnowledgeDomain>& domains,
        double difficulty,
        double quality
    );

    // ========================================================================
    // Transitions
    // ========================================================================

    /**
     * @brief Apply an accepted solution to an account snapshot
     *
     * Consumes the attempt cost, adds complexity and reward, raises domain
     * knowledge, moves the position and handles tier transitions (bonus and
     * evolutionary leap drawn from rng).
     *
     * @param account Account snapshot
     * @param problem Solved problem
     * @param quality Validation quality in [0, 1]
     * @param rng Random source for the evolutionary leap
     * @param timestamp Event time (Unix seconds)
     * @return New state and EVOLUTION transaction
     * @throws InsufficientEnergy if energy < k1 * difficulty
     */
    static EvolutionResult apply_solution(
        const Account& account,
        const Problem& problem,
        double quality,
        RandomSource& rng,
        uint64_t timestamp
    );

    /**
     * @brief Charge the attempt cost for a rejected solution
     *
     * Only energy changes; complexity, tier, knowledge, position and
     * counters are untouched.
     *
     * @return New state and ATTEMPT_CHARGE transaction
     * @throws InsufficientEnergy if energy < k1 * difficulty
     */
    static EvolutionResult charge_attempt(
        const Account& account,
        const Problem& problem,
        double quality,
        uint64_t timestamp
    );

    /**
     * @brief Passive energy regenerated over an elapsed interval
     *
     * 1.0/min * (1 + 0.5 * tier) * (1 + 0.5 * (1 - distance_to_center / max_distance))
     */
    static double passive_regeneration(const Account& account, uint64_t elapsed_seconds);

    /**
     * @brief Add passive regeneration to an account, clamped to the tier cap
     *
     * @return New state and REGENERATION transaction (energy_gained holds
     *         the clamped increase)
     */
    static EvolutionResult regenerate(const Account& account, uint64_t elapsed_seconds, uint64_t timestamp);

    /**
     * @brief Largest regeneration any position can earn at a tier
     *
     * Uses the position multiplier at the hypercube center, since positions
     * are not replicated.
     */
    static double max_passive_regeneration(int tier, uint64_t elapsed_seconds);

    // ========================================================================
    // Verification / Replay
    // ========================================================================

    /**
     * @brief Check that a recorded transaction is consistent with the
     *        account's current state
     *
     * Recomputes ΔC, complexity after and tiers from the declared inputs
     * (relative tolerance 1e-9).
     *
     * @param current Current state of the originating account
     * @param tx Transaction to check
     * @return Description of the inconsistency, or std::nullopt
     */
    static std::optional<std::string> check_consistency(const Account& current, const Transaction& tx);

    /**
     * @brief Apply a recorded transaction's deltas to an account
     *
     * Replays complexity, energy (clamped to [0, cap]), tier and counters.
     * Knowledge and position are not replicated.
     */
    static Account replay(const Account& account, const Transaction& tx, uint64_t timestamp);

    /**
     * @brief Relative comparison used by recomputation checks
     */
    static bool nearly_equal(double a, double b);
};

} // namespace hyperchain
