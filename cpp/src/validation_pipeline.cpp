/**
 * @file validation_pipeline.cpp
 * @brief Implementation of the two-gate validation pipeline
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hyperchain/validation_pipeline.hpp"
#include "hyperchain/errors.hpp"
#include "hyperchain/utilities.hpp"
#include <algorithm>
#include <stdexcept>

namespace hyperchain {

ValidationPipeline::ValidationPipeline(std::shared_ptr<ScoringOracle> oracle)
    : oracle_(std::move(oracle))
{
    if (!oracle_) {
        throw std::invalid_argument("ValidationPipeline requires a scoring oracle");
    }
}

ValidationResult ValidationPipeline::validate(
    const Account& account,
    const Problem& problem,
    const Solution& solution,
    RandomSource& rng
) const {
    OracleScores scores;

    try {
        scores = oracle_->score(problem, solution, account.knowledge);
    } catch (const OracleUnavailable&) {
        throw;
    } catch (const std::exception& ex) {
        throw OracleUnavailable(std::string("Scoring oracle failed: ") + ex.what());
    }

    if (!scores.in_range()) {
        utilities::log_warn("ValidationPipeline: Oracle returned out-of-range scores for " + problem.id);
        throw OracleUnavailable("Scoring oracle returned out-of-range scores");
    }

    ValidationResult result = evaluate(scores, account.complexity_index, rng);

    utilities::log_debug("ValidationPipeline: " + account.account_id + " / " + problem.id +
                         (result.accepted ? " accepted" : " rejected") +
                         " quality=" + std::to_string(result.quality));

    return result;
}

ValidationResult ValidationPipeline::evaluate(
    const OracleScores& scores,
    double complexity_index,
    RandomSource& rng
) {
    ValidationResult result;
    result.scores = scores;

    double core_mean = scores.core_mean();
    result.internal_gate = core_mean > config::INTERNAL_GATE_THRESHOLD;

    // Irreducible uncertainty: mean grows with complexity, saturating at 1.0
    double gate_mean = std::min(1.0, complexity_index / config::PROBABILISTIC_GATE_SATURATION);
    result.probabilistic_draw = rng.normal(gate_mean, config::PROBABILISTIC_GATE_STDDEV);
    result.probabilistic_gate = result.probabilistic_draw > config::PROBABILISTIC_GATE_THRESHOLD;

    result.accepted = result.internal_gate && result.probabilistic_gate;

    double quality = 0.5 * core_mean + 0.3 * scores.novelty +
                     0.2 * (result.probabilistic_gate ? 1.0 : 0.0);
    result.quality = std::clamp(quality, 0.0, 1.0);

    return result;
}

} // namespace hyperchain
