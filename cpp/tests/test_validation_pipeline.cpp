/**
 * @file test_validation_pipeline.cpp
 * @brief Unit tests for the validation pipeline and scoring oracles
 *
 * Tests validation including:
 * - Internal and probabilistic gates
 * - Quality formula
 * - Oracle failures and out-of-range scores
 * - Heuristic oracle score ranges
 * - Seeded random source determinism
 */

#include <gtest/gtest.h>
#include "hyperchain/errors.hpp"
#include "hyperchain/validation_pipeline.hpp"
#include <cmath>
#include <memory>
#include <stdexcept>

using namespace hyperchain;

namespace {

// Oracle returning fixed sub-scores
class FixedOracle : public ScoringOracle {
public:
    explicit FixedOracle(OracleScores scores) : scores_(scores) {}

    OracleScores score(const Problem&, const Solution&, const KnowledgeVector&) override {
        calls++;
        return scores_;
    }

    int calls = 0;

private:
    OracleScores scores_;
};

// Oracle that always fails
class FailingOracle : public ScoringOracle {
public:
    OracleScores score(const Problem&, const Solution&, const KnowledgeVector&) override {
        throw std::runtime_error("model endpoint timed out");
    }
};

// Random source returning a fixed normal draw and recording the requested mean
class FixedRandomSource : public RandomSource {
public:
    explicit FixedRandomSource(double value) : value_(value) {}

    double normal(double mean, double stddev) override {
        last_mean = mean;
        last_stddev = stddev;
        draws++;
        return value_;
    }

    double uniform() override { return 0.5; }

    double last_mean = 0.0;
    double last_stddev = 0.0;
    int draws = 0;

private:
    double value_;
};

OracleScores make_scores(double correctness, double completeness, double coherence, double novelty) {
    OracleScores scores;
    scores.correctness = correctness;
    scores.completeness = completeness;
    scores.coherence = coherence;
    scores.novelty = novelty;
    return scores;
}

} // namespace

// Test fixture for validation pipeline tests
class ValidationPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        account_ = make_genesis_account("alice", 1700000000);

        problem_.id = "thermo-001";
        problem_.difficulty = 0.5;
        problem_.required_domains = {KnowledgeDomain::PHYSICS};
        problem_.keywords = {"entropy", "energy"};

        solution_.answer = "Entropy increases as energy disperses.";
        solution_.methodology = "Second law of thermodynamics.";
    }

    Account account_;
    Problem problem_;
    Solution solution_;
};

// ============================================================================
// Gate Tests
// ============================================================================

TEST_F(ValidationPipelineTest, BothGatesPassAccepts) {
    ValidationPipeline pipeline(std::make_shared<FixedOracle>(make_scores(0.9, 0.8, 0.7, 0.5)));
    FixedRandomSource rng(0.9);

    auto result = pipeline.validate(account_, problem_, solution_, rng);

    EXPECT_TRUE(result.internal_gate);
    EXPECT_TRUE(result.probabilistic_gate);
    EXPECT_TRUE(result.accepted);
    EXPECT_DOUBLE_EQ(result.probabilistic_draw, 0.9);
    EXPECT_NEAR(result.quality, 0.5 * 0.8 + 0.3 * 0.5 + 0.2, 1e-12);
}

TEST_F(ValidationPipelineTest, ProbabilisticGateFailureRejects) {
    ValidationPipeline pipeline(std::make_shared<FixedOracle>(make_scores(0.9, 0.8, 0.7, 0.5)));
    FixedRandomSource rng(0.1);

    auto result = pipeline.validate(account_, problem_, solution_, rng);

    EXPECT_TRUE(result.internal_gate);
    EXPECT_FALSE(result.probabilistic_gate);
    EXPECT_FALSE(result.accepted);
    EXPECT_NEAR(result.quality, 0.5 * 0.8 + 0.3 * 0.5, 1e-12);
}

TEST_F(ValidationPipelineTest, InternalGateFailureRejects) {
    ValidationPipeline pipeline(std::make_shared<FixedOracle>(make_scores(0.69, 0.69, 0.69, 1.0)));
    FixedRandomSource rng(0.9);

    auto result = pipeline.validate(account_, problem_, solution_, rng);

    EXPECT_FALSE(result.internal_gate);
    EXPECT_TRUE(result.probabilistic_gate);
    EXPECT_FALSE(result.accepted);
}

TEST_F(ValidationPipelineTest, InternalGateJustAboveThreshold) {
    ValidationPipeline pipeline(std::make_shared<FixedOracle>(make_scores(0.71, 0.71, 0.71, 0.0)));
    FixedRandomSource rng(0.9);

    EXPECT_TRUE(pipeline.validate(account_, problem_, solution_, rng).internal_gate);
}

TEST_F(ValidationPipelineTest, ProbabilisticGateIsStrict) {
    FixedRandomSource at_threshold(config::PROBABILISTIC_GATE_THRESHOLD);
    auto result = ValidationPipeline::evaluate(make_scores(1, 1, 1, 1), 1.0, at_threshold);

    EXPECT_FALSE(result.probabilistic_gate);
}

TEST_F(ValidationPipelineTest, GateMeanGrowsWithComplexity) {
    OracleScores scores = make_scores(1, 1, 1, 1);

    FixedRandomSource newborn(0.0);
    ValidationPipeline::evaluate(scores, 1.0, newborn);
    EXPECT_DOUBLE_EQ(newborn.last_mean, 0.1);
    EXPECT_DOUBLE_EQ(newborn.last_stddev, config::PROBABILISTIC_GATE_STDDEV);

    FixedRandomSource mature(0.0);
    ValidationPipeline::evaluate(scores, 5.0, mature);
    EXPECT_DOUBLE_EQ(mature.last_mean, 0.5);

    FixedRandomSource saturated(0.0);
    ValidationPipeline::evaluate(scores, 250.0, saturated);
    EXPECT_DOUBLE_EQ(saturated.last_mean, 1.0);
}

TEST_F(ValidationPipelineTest, EvaluateDrawsExactlyOnce) {
    FixedRandomSource rng(0.9);
    ValidationPipeline::evaluate(make_scores(1, 1, 1, 1), 1.0, rng);
    EXPECT_EQ(rng.draws, 1);
}

TEST_F(ValidationPipelineTest, QualityStaysInUnitInterval) {
    FixedRandomSource pass(0.9);
    auto best = ValidationPipeline::evaluate(make_scores(1, 1, 1, 1), 20.0, pass);
    EXPECT_DOUBLE_EQ(best.quality, 1.0);

    FixedRandomSource fail(0.0);
    auto worst = ValidationPipeline::evaluate(make_scores(0, 0, 0, 0), 1.0, fail);
    EXPECT_DOUBLE_EQ(worst.quality, 0.0);
}

// ============================================================================
// Oracle Failure Tests
// ============================================================================

TEST_F(ValidationPipelineTest, OracleExceptionBecomesOracleUnavailable) {
    ValidationPipeline pipeline(std::make_shared<FailingOracle>());
    FixedRandomSource rng(0.9);

    try {
        pipeline.validate(account_, problem_, solution_, rng);
        FAIL() << "Expected OracleUnavailable";
    } catch (const OracleUnavailable& e) {
        EXPECT_EQ(e.code(), ErrorCode::ORACLE_UNAVAILABLE);
    }

    // No draw consumed when the oracle fails
    EXPECT_EQ(rng.draws, 0);
}

TEST_F(ValidationPipelineTest, OutOfRangeScoresRejected) {
    ValidationPipeline pipeline(std::make_shared<FixedOracle>(make_scores(1.2, 0.8, 0.7, 0.5)));
    FixedRandomSource rng(0.9);

    EXPECT_THROW(pipeline.validate(account_, problem_, solution_, rng), OracleUnavailable);
}

TEST_F(ValidationPipelineTest, NanScoresRejected) {
    ValidationPipeline pipeline(std::make_shared<FixedOracle>(make_scores(0.9, std::nan(""), 0.7, 0.5)));
    FixedRandomSource rng(0.9);

    EXPECT_THROW(pipeline.validate(account_, problem_, solution_, rng), OracleUnavailable);
}

TEST_F(ValidationPipelineTest, NullOracleRejected) {
    EXPECT_THROW(ValidationPipeline(nullptr), std::invalid_argument);
}

// ============================================================================
// Heuristic Oracle Tests
// ============================================================================

TEST_F(ValidationPipelineTest, HeuristicOracleScoresInRange) {
    HeuristicScoringOracle oracle;

    auto scores = oracle.score(problem_, solution_, account_.knowledge);
    EXPECT_TRUE(scores.in_range());
    EXPECT_DOUBLE_EQ(scores.correctness, 1.0);
}

TEST_F(ValidationPipelineTest, HeuristicOracleKeywordCoverage) {
    HeuristicScoringOracle oracle;

    Solution partial;
    partial.answer = "Only entropy is mentioned here.";
    partial.methodology = "Guesswork.";

    auto scores = oracle.score(problem_, partial, account_.knowledge);
    EXPECT_DOUBLE_EQ(scores.correctness, 0.5);
    EXPECT_LT(scores.coherence, 1.0);
}

TEST_F(ValidationPipelineTest, HeuristicOracleEmptySolution) {
    HeuristicScoringOracle oracle;

    auto scores = oracle.score(problem_, Solution{}, account_.knowledge);
    EXPECT_TRUE(scores.in_range());
    EXPECT_DOUBLE_EQ(scores.correctness, 0.0);
    EXPECT_DOUBLE_EQ(scores.completeness, 0.0);
    EXPECT_DOUBLE_EQ(scores.novelty, 0.0);
}

// ============================================================================
// Random Source Tests
// ============================================================================

TEST_F(ValidationPipelineTest, SeededSourceIsReproducible) {
    SeededRandomSource a(2025);
    SeededRandomSource b(2025);

    for (int i = 0; i < 32; i++) {
        EXPECT_EQ(a.normal(0.5, 0.1), b.normal(0.5, 0.1));
        EXPECT_EQ(a.uniform(), b.uniform());
    }
}

TEST_F(ValidationPipelineTest, SeededPipelineIsReproducible) {
    auto oracle = std::make_shared<FixedOracle>(make_scores(0.9, 0.9, 0.9, 0.5));
    ValidationPipeline pipeline(oracle);

    SeededRandomSource a(11);
    SeededRandomSource b(11);

    auto first = pipeline.validate(account_, problem_, solution_, a);
    auto second = pipeline.validate(account_, problem_, solution_, b);

    EXPECT_EQ(first.accepted, second.accepted);
    EXPECT_EQ(first.probabilistic_draw, second.probabilistic_draw);
    EXPECT_EQ(first.quality, second.quality);
    EXPECT_EQ(oracle->calls, 2);
}

TEST_F(ValidationPipelineTest, SecureSourceUniformRange) {
    SecureRandomSource rng;

    for (int i = 0; i < 100; i++) {
        double value = rng.uniform();
        EXPECT_GE(value, 0.0);
        EXPECT_LT(value, 1.0);
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
