/**
 * @file random_source.cpp
 * @brief Implementation of seeded and CSPRNG-backed random sources
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hyperchain/random_source.hpp"
#include "hyperchain/chain_crypto.hpp"
#include <cmath>

namespace hyperchain {

// ============================================================================
// SeededRandomSource
// ============================================================================

SeededRandomSource::SeededRandomSource(uint64_t seed)
    : engine_(seed) {
}

double SeededRandomSource::normal(double mean, double stddev) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::normal_distribution<double> dist(mean, stddev);
    return dist(engine_);
}

double SeededRandomSource::uniform() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(engine_);
}

// ============================================================================
// SecureRandomSource
// ============================================================================

double SecureRandomSource::uniform() {
    // 53 random mantissa bits -> [0, 1)
    uint64_t bits = ChainCrypto::random_u64() >> 11;
    return static_cast<double>(bits) * (1.0 / 9007199254740992.0);
}

double SecureRandomSource::normal(double mean, double stddev) {
    // Box-Muller transform
    double u1 = uniform();
    while (u1 <= 0.0) {
        u1 = uniform();
    }
    double u2 = uniform();

    constexpr double two_pi = 6.283185307179586;
    double z = std::sqrt(-2.0 * std::log(u1)) * std::cos(two_pi * u2);
    return mean + stddev * z;
}

} // namespace hyperchain
