/**
 * @file pohd_consensus.cpp
 * @brief Implementation of the PoHD predicate and parallel miner
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hyperchain/pohd_consensus.hpp"
#include "hyperchain/utilities.hpp"
#include <asio/post.hpp>
#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace hyperchain {

// ============================================================================
// PohdConsensus
// ============================================================================

double PohdConsensus::max_distance() {
    return std::sqrt(static_cast<double>(config::DIMENSIONS) * 0.25);
}

double PohdConsensus::distance_to_center(const Position8D& position) {
    double sum = 0.0;
    for (double coordinate : position) {
        double d = coordinate - config::HYPERCUBE_CENTER;
        sum += d * d;
    }
    return std::sqrt(sum);
}

double PohdConsensus::target_distance(uint32_t difficulty) {
    return max_distance() * std::pow(0.5, static_cast<double>(difficulty) / 4.0);
}

bool PohdConsensus::satisfies(const Position8D& position, uint32_t difficulty) {
    return distance_to_center(position) < target_distance(difficulty);
}

bool PohdConsensus::verify_nonce(const Block& block, uint32_t difficulty) {
    return satisfies(derive_position(compute_block_hash(block)), difficulty);
}

std::optional<uint64_t> PohdConsensus::find_nonce(
    const Block& block,
    uint32_t difficulty,
    uint64_t start_nonce,
    uint64_t max_attempts
) {
    NonceHasher hasher(block);

    for (uint64_t attempt = 0; attempt < max_attempts; attempt++) {
        uint64_t nonce = start_nonce + attempt;
        if (satisfies(derive_position(hasher.hash(nonce)), difficulty)) {
            return nonce;
        }
    }

    return std::nullopt;
}

uint32_t PohdConsensus::retarget(uint32_t current, uint64_t interval_seconds, std::chrono::seconds target) {
    uint64_t target_seconds = static_cast<uint64_t>(target.count());
    uint32_t next = current;

    if (interval_seconds * 2 < target_seconds) {
        next = current + 1;
    } else if (interval_seconds > target_seconds * 2 && current > 0) {
        next = current - 1;
    }

    return std::clamp(next, config::MIN_DIFFICULTY, config::MAX_DIFFICULTY);
}

// ============================================================================
// NonceHasher
// ============================================================================

NonceHasher::NonceHasher(const Block& block) {
    std::vector<uint8_t> prefix = block.encode_prefix();
    crypto_hash_sha256_init(&prefix_state_);
    crypto_hash_sha256_update(&prefix_state_, prefix.data(), prefix.size());
}

Hash256 NonceHasher::hash(uint64_t nonce) const {
    uint8_t nonce_bytes[8];
    for (int i = 0; i < 8; i++) {
        nonce_bytes[i] = static_cast<uint8_t>((nonce >> (56 - 8 * i)) & 0xFF);
    }

    crypto_hash_sha256_state state = prefix_state_;
    crypto_hash_sha256_update(&state, nonce_bytes, sizeof(nonce_bytes));

    Hash256 digest;
    crypto_hash_sha256_final(&state, digest.data());
    return digest;
}

// ============================================================================
// PohdMiner
// ============================================================================

std::string mining_status_to_string(MiningStatus status) {
    switch (status) {
        case MiningStatus::FOUND: return "FOUND";
        case MiningStatus::CANCELLED: return "CANCELLED";
        case MiningStatus::STALE_TIP: return "STALE_TIP";
        case MiningStatus::DEADLINE_EXCEEDED: return "DEADLINE_EXCEEDED";
        default: return "UNKNOWN";
    }
}

namespace {

size_t resolve_worker_count(size_t requested) {
    if (requested > 0) {
        return requested;
    }
    return std::max<size_t>(1, std::thread::hardware_concurrency());
}

} // namespace

PohdMiner::PohdMiner(size_t worker_count)
    : worker_count_(resolve_worker_count(worker_count))
    , pool_(worker_count_)
{
}

PohdMiner::~PohdMiner() {
    pool_.join();
}

MiningOutcome PohdMiner::mine(
    const Block& candidate,
    const MiningRequest& request,
    MiningCancellation& cancellation
) {
    auto start_time = std::chrono::steady_clock::now();

    const NonceHasher hasher(candidate);
    const uint64_t stride = worker_count_;

    // Shared search state
    std::atomic<bool> stop{false};
    std::atomic<uint64_t> total_attempts{0};
    std::mutex result_mutex;
    std::condition_variable done_cv;
    size_t running = worker_count_;
    std::optional<uint64_t> winning_nonce;
    MiningStatus stop_reason = MiningStatus::CANCELLED;

    auto finish_with = [&](MiningStatus reason, std::optional<uint64_t> nonce) {
        std::lock_guard<std::mutex> lock(result_mutex);
        if (!stop.exchange(true)) {
            stop_reason = reason;
            winning_nonce = nonce;
        }
    };

    for (size_t worker = 0; worker < worker_count_; worker++) {
        asio::post(pool_, [&, worker]() {
            uint64_t local_attempts = 0;

            for (uint64_t nonce = worker; !stop.load(std::memory_order_relaxed); nonce += stride) {
                if (local_attempts % config::MINING_POLL_INTERVAL == 0) {
                    if (cancellation.is_cancelled()) {
                        finish_with(MiningStatus::CANCELLED, std::nullopt);
                        break;
                    }
                    if (request.tip_generation && request.tip_generation() != request.expected_generation) {
                        finish_with(MiningStatus::STALE_TIP, std::nullopt);
                        break;
                    }
                    if (request.deadline && std::chrono::steady_clock::now() >= *request.deadline) {
                        finish_with(MiningStatus::DEADLINE_EXCEEDED, std::nullopt);
                        break;
                    }
                }

                local_attempts++;

                if (PohdConsensus::satisfies(derive_position(hasher.hash(nonce)), request.difficulty)) {
                    finish_with(MiningStatus::FOUND, nonce);
                    break;
                }
            }

            total_attempts.fetch_add(local_attempts);

            std::lock_guard<std::mutex> lock(result_mutex);
            running--;
            done_cv.notify_all();
        });
    }

    {
        std::unique_lock<std::mutex> lock(result_mutex);
        done_cv.wait(lock, [&]() { return running == 0; });
    }

    MiningOutcome outcome;
    outcome.status = stop_reason;
    outcome.attempts = total_attempts.load();
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    outcome.block = candidate;

    if (stop_reason == MiningStatus::FOUND && winning_nonce) {
        outcome.block.nonce = *winning_nonce;
        outcome.block.difficulty = request.difficulty;
        outcome.block.seal();
        outcome.block.state = BlockState::MINING;

        utilities::log_info("PohdMiner: Found nonce " + std::to_string(*winning_nonce) +
                            " for block " + std::to_string(candidate.index) +
                            " after " + std::to_string(outcome.attempts) + " attempts (" +
                            std::to_string(outcome.elapsed.count()) + " ms)");
    } else {
        utilities::log_info("PohdMiner: Search for block " + std::to_string(candidate.index) +
                            " stopped: " + mining_status_to_string(stop_reason));
    }

    return outcome;
}

} // namespace hyperchain
