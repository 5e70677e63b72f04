/**
 * @file scoring_oracle.cpp
 * @brief Implementation of the heuristic scoring oracle
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hyperchain/scoring_oracle.hpp"
#include "hyperchain/utilities.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <sstream>

namespace hyperchain {

namespace {

/// Characters of answer expected per unit of difficulty
constexpr double ANSWER_LENGTH_PER_DIFFICULTY = 200.0;

/// Methodology length that earns full coherence
constexpr double MIN_METHODOLOGY_LENGTH = 50.0;

bool in_unit_interval(double value) {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

std::vector<std::string> tokenize_words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;

    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        } else if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }

    return words;
}

} // namespace

bool OracleScores::in_range() const {
    return in_unit_interval(correctness) && in_unit_interval(completeness) &&
           in_unit_interval(coherence) && in_unit_interval(novelty);
}

OracleScores HeuristicScoringOracle::score(
    const Problem& problem,
    const Solution& solution,
    const KnowledgeVector& knowledge
) {
    (void)knowledge;

    OracleScores scores;

    // Keyword coverage
    std::string solution_text = utilities::to_lowercase(solution.answer + " " + solution.methodology);
    if (problem.keywords.empty()) {
        scores.correctness = solution.answer.empty() ? 0.0 : 1.0;
    } else {
        size_t matches = 0;
        for (const auto& keyword : problem.keywords) {
            if (solution_text.find(utilities::to_lowercase(keyword)) != std::string::npos) {
                matches++;
            }
        }
        scores.correctness = static_cast<double>(matches) / static_cast<double>(problem.keywords.size());
    }

    // Harder problems need longer answers
    double min_length = std::max(1.0, problem.difficulty * ANSWER_LENGTH_PER_DIFFICULTY);
    scores.completeness = std::min(1.0, static_cast<double>(solution.answer.size()) / min_length);

    scores.coherence = std::min(1.0, static_cast<double>(solution.methodology.size()) / MIN_METHODOLOGY_LENGTH);

    auto words = tokenize_words(solution.answer);
    if (!words.empty()) {
        std::set<std::string> unique(words.begin(), words.end());
        scores.novelty = static_cast<double>(unique.size()) / static_cast<double>(words.size());
    }

    utilities::log_debug("HeuristicScoringOracle: Scored " + problem.id +
                         " correctness=" + std::to_string(scores.correctness) +
                         " completeness=" + std::to_string(scores.completeness) +
                         " coherence=" + std::to_string(scores.coherence) +
                         " novelty=" + std::to_string(scores.novelty));

    return scores;
}

} // namespace hyperchain
