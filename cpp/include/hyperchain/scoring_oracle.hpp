/**
 * @file scoring_oracle.hpp
 * @brief Scoring oracle interface and in-process heuristic scorer
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "hyperchain/account.hpp"

namespace hyperchain {

/**
 * @brief Sub-scores returned by a scoring oracle, each in [0, 1]
 */
struct OracleScores {
    double correctness = 0.0;
    double completeness = 0.0;
    double coherence = 0.0;
    double novelty = 0.0;

    /**
     * @brief Whether every sub-score is a finite value in [0, 1]
     */
    bool in_range() const;

    /**
     * @brief Mean of correctness, completeness and coherence
     */
    double core_mean() const {
        return (correctness + completeness + coherence) / 3.0;
    }
};

/**
 * @brief External scorer of solutions (LLM, heuristic or test stub)
 *
 * Implementations must not mutate ledger state. A failure (timeout,
 * transport error) is reported by throwing OracleUnavailable.
 */
class ScoringOracle {
public:
    virtual ~ScoringOracle() = default;

    /**
     * @brief Score a solution
     * @param problem Problem being solved
     * @param solution Submitted solution
     * @param knowledge Knowledge vector of the submitting account
     * @return Sub-scores
     * @throws OracleUnavailable if the oracle cannot answer
     */
    virtual OracleScores score(
        const Problem& problem,
        const Solution& solution,
        const KnowledgeVector& knowledge
    ) = 0;
};

/**
 * @brief HeuristicScoringOracle - text heuristics, no external model
 *
 * - correctness: fraction of problem keywords present in answer or methodology
 * - completeness: answer length relative to difficulty * 200 characters
 * - coherence: methodology length relative to 50 characters
 * - novelty: lexical diversity of the answer
 */
class HeuristicScoringOracle : public ScoringOracle {
public:
    HeuristicScoringOracle() = default;

    OracleScores score(
        const Problem& problem,
        const Solution& solution,
        const KnowledgeVector& knowledge
    ) override;
};

} // namespace hyperchain
