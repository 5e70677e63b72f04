/**
 * @file pohd_consensus.hpp
 * @brief Proof of HyperDistance consensus and parallel nonce search
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A block is valid when its hash-derived coordinate lies closer to the
 * hypercube center than max_distance * 0.5^(difficulty / 4).
 */

#pragma once

#include "hyperchain/block.hpp"
#include <asio/thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace hyperchain {

/**
 * @brief PohdConsensus - stateless PoHD predicate
 */
class PohdConsensus {
public:
    /**
     * @brief Largest possible distance to the center, sqrt(8 * 0.25)
     */
    static double max_distance();

    /**
     * @brief Euclidean distance from a coordinate to the hypercube center
     */
    static double distance_to_center(const Position8D& position);

    /**
     * @brief Acceptance radius for a difficulty
     * @return max_distance * 0.5^(difficulty / 4)
     */
    static double target_distance(uint32_t difficulty);

    /**
     * @brief PoHD predicate: distance < target_distance
     */
    static bool satisfies(const Position8D& position, uint32_t difficulty);

    /**
     * @brief Recompute the block hash for its nonce and test the predicate
     */
    static bool verify_nonce(const Block& block, uint32_t difficulty);

    /**
     * @brief Sequential nonce search starting at start_nonce
     *
     * Deterministic: returns the smallest satisfying nonce in range.
     *
     * @param block Candidate block (nonce ignored)
     * @param difficulty PoHD difficulty
     * @param start_nonce First nonce tried
     * @param max_attempts Give up after this many nonces
     * @return Satisfying nonce, or std::nullopt if none in range
     */
    static std::optional<uint64_t> find_nonce(
        const Block& block,
        uint32_t difficulty,
        uint64_t start_nonce,
        uint64_t max_attempts
    );

    /**
     * @brief Difficulty for the next block
     *
     * +1 if the last interval was shorter than half the target, -1 if longer
     * than twice the target, bounded to [MIN_DIFFICULTY, MAX_DIFFICULTY].
     */
    static uint32_t retarget(uint32_t current, uint64_t interval_seconds, std::chrono::seconds target);
};

/**
 * @brief Precomputed hash state for one block prefix
 *
 * Hashing a nonce costs one SHA-256 finalization over 8 bytes.
 */
class NonceHasher {
public:
    explicit NonceHasher(const Block& block);

    Hash256 hash(uint64_t nonce) const;

private:
    crypto_hash_sha256_state prefix_state_;
};

/**
 * @brief Cancellation flag shared with a running search
 */
class MiningCancellation {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Result of a nonce search
 */
enum class MiningStatus {
    FOUND,               ///< Block sealed with a satisfying nonce
    CANCELLED,           ///< Cancellation requested
    STALE_TIP,           ///< Chain tip changed during the search
    DEADLINE_EXCEEDED    ///< External deadline passed (soft failure)
};

std::string mining_status_to_string(MiningStatus status);

/**
 * @brief Search parameters
 */
struct MiningRequest {
    uint32_t difficulty = config::DEFAULT_DIFFICULTY;
    std::function<uint64_t()> tip_generation;        ///< Current tip generation (optional)
    uint64_t expected_generation = 0;                ///< Generation the candidate extends
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

struct MiningOutcome {
    MiningStatus status = MiningStatus::CANCELLED;
    Block block;                                     ///< Sealed block when FOUND
    uint64_t attempts = 0;                           ///< Nonces hashed by all workers
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief PohdMiner - parallel, cancellable nonce search
 *
 * Workers on an asio::thread_pool search disjoint strided nonce ranges
 * (worker k tries k, k + N, k + 2N, ...). The first satisfying nonce wins
 * and stops the others. Workers poll cancellation, the tip generation and
 * the deadline every MINING_POLL_INTERVAL nonces. With one worker the
 * search returns the smallest satisfying nonce.
 */
class PohdMiner {
public:
    /**
     * @brief Construct miner
     * @param worker_count Number of search threads (0: hardware concurrency)
     */
    explicit PohdMiner(size_t worker_count = 0);

    /**
     * @brief Destructor - joins worker threads
     */
    ~PohdMiner();

    // Disable copy and move
    PohdMiner(const PohdMiner&) = delete;
    PohdMiner& operator=(const PohdMiner&) = delete;
    PohdMiner(PohdMiner&&) = delete;
    PohdMiner& operator=(PohdMiner&&) = delete;

    /**
     * @brief Search a nonce for a candidate block
     *
     * Blocks until a nonce is found or the search is cancelled, goes stale
     * or passes its deadline. Calls must not overlap on one miner.
     *
     * @param candidate Block with all fields except nonce fixed
     * @param request Search parameters
     * @param cancellation Cancellation flag (may be set from any thread)
     * @return Outcome; outcome.block is sealed when status is FOUND
     */
    MiningOutcome mine(const Block& candidate, const MiningRequest& request, MiningCancellation& cancellation);

    size_t worker_count() const { return worker_count_; }

private:
    size_t worker_count_;
    asio::thread_pool pool_;
};

} // namespace hyperchain
