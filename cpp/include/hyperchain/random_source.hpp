/**
 * @file random_source.hpp
 * @brief Injectable random sources for validation and evolutionary leaps
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <random>

namespace hyperchain {

/**
 * @brief Source of random draws consumed by the validation pipeline and
 *        the evolution engine
 *
 * Implementations must be safe to share between threads.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * @brief Draw from a normal distribution
     * @param mean Distribution mean
     * @param stddev Standard deviation (> 0)
     */
    virtual double normal(double mean, double stddev) = 0;

    /**
     * @brief Draw uniformly from [0, 1)
     */
    virtual double uniform() = 0;
};

/**
 * @brief Deterministic source for reproducible runs and tests
 *
 * Two instances constructed with the same seed produce the same sequence.
 */
class SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(uint64_t seed);

    double normal(double mean, double stddev) override;
    double uniform() override;

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
};

/**
 * @brief Production source backed by libsodium's CSPRNG
 */
class SecureRandomSource : public RandomSource {
public:
    SecureRandomSource() = default;

    double normal(double mean, double stddev) override;
    double uniform() override;
};

} // namespace hyperchain
