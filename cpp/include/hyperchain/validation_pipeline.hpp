/**
 * @file validation_pipeline.hpp
 * @brief Accept/reject decision and quality score for submitted solutions
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Combines scoring oracle sub-scores (internal gate) with an independent
 * probabilistic gate drawn from an injected random source.
 */

#pragma once

#include "hyperchain/account.hpp"
#include "hyperchain/random_source.hpp"
#include "hyperchain/scoring_oracle.hpp"
#include <memory>

namespace hyperchain {

/**
 * @brief Outcome of validating one solution
 */
struct ValidationResult {
    bool accepted = false;              ///< internal_gate AND probabilistic_gate
    double quality = 0.0;               ///< Quality score in [0, 1]
    bool internal_gate = false;         ///< Mean core score above threshold
    bool probabilistic_gate = false;    ///< Normal draw above threshold
    double probabilistic_draw = 0.0;    ///< Value drawn for the probabilistic gate
    OracleScores scores;                ///< Sub-scores from the oracle
};

/**
 * @brief ValidationPipeline - stateless solution validation
 *
 * Performs no state mutation. Thread-safe if the oracle is.
 */
class ValidationPipeline {
public:
    /**
     * @brief Construct pipeline with a scoring oracle
     * @param oracle Oracle consulted for every submission
     * @throws std::invalid_argument if oracle is null
     */
    explicit ValidationPipeline(std::shared_ptr<ScoringOracle> oracle);

    /**
     * @brief Score and decide a submission
     *
     * Must be called outside any account lock: the oracle may block.
     *
     * @param account Snapshot of the submitting account
     * @param problem Problem being solved
     * @param solution Submitted solution
     * @param rng Random source for the probabilistic gate
     * @return Decision and quality
     * @throws OracleUnavailable if the oracle fails or returns out-of-range scores
     */
    ValidationResult validate(
        const Account& account,
        const Problem& problem,
        const Solution& solution,
        RandomSource& rng
    ) const;

    /**
     * @brief Apply the gate and quality formulas to given sub-scores
     *
     * Draws exactly one value from rng.
     *
     * @param scores Oracle sub-scores (in range)
     * @param complexity_index Complexity of the submitting account
     * @param rng Random source
     */
    static ValidationResult evaluate(
        const OracleScores& scores,
        double complexity_index,
        RandomSource& rng
    );

private:
    std::shared_ptr<ScoringOracle> oracle_;
};

} // namespace hyperchain
