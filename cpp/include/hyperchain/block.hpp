/**
 * @file block.hpp
 * @brief Ledger block, canonical hash and derived hypercube coordinate
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * hash = SHA-256(index || timestamp || transactions || previous_hash || nonce)
 * position_8d[i] = big-endian u32 chunk i of hash / 0xFFFFFFFF
 */

#pragma once

#include "hyperchain/account.hpp"
#include "hyperchain/byte_codec.hpp"
#include "hyperchain/chain_crypto.hpp"
#include "hyperchain/transaction.hpp"
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hyperchain {

/**
 * @brief Block lifecycle states
 */
enum class BlockState {
    PENDING,     ///< Assembled, hash/nonce/position not fixed
    MINING,      ///< Nonce search in progress
    ACCEPTED     ///< Appended to the chain (terminal)
};

std::string block_state_to_string(BlockState state);

/**
 * @brief Ledger block
 */
struct Block {
    uint64_t index = 0;                      ///< Height, 0 for genesis
    uint64_t timestamp = 0;                  ///< Unix timestamp (seconds)
    std::vector<Transaction> transactions;   ///< Non-empty except genesis
    Hash256 previous_hash{};                 ///< Hash of block index - 1
    uint64_t nonce = 0;                      ///< PoHD nonce
    Hash256 hash{};                          ///< Stated hash
    Position8D position{};                   ///< Stated coordinate (derived from hash)
    uint32_t difficulty = 0;                 ///< Difficulty the block was mined at (not hashed)
    BlockState state = BlockState::PENDING;

    bool is_genesis() const { return index == 0; }

    /**
     * @brief Canonical encoding of every hashed field except the nonce
     */
    std::vector<uint8_t> encode_prefix() const;

    /**
     * @brief Canonical encoding of every hashed field (prefix || nonce)
     */
    std::vector<uint8_t> encode() const;

    /**
     * @brief Decode hashed fields from a canonical encoding
     *
     * hash and position are left zeroed; callers set or derive them.
     *
     * @throws std::out_of_range on truncated input
     * @throws std::invalid_argument on trailing bytes or unknown transaction kind
     */
    static Block decode(const std::vector<uint8_t>& bytes);

    /**
     * @brief Recompute hash and position from the current fields
     */
    void seal();

    /**
     * @brief Serialize block to JSON
     * @return JSON string
     */
    std::string to_json() const;

    /**
     * @brief Deserialize block from JSON
     *
     * Stated hash and position are taken as given; validation recomputes them.
     *
     * @param json JSON string
     * @return Block or std::nullopt if invalid
     */
    static std::optional<Block> from_json(const std::string& json);

    nlohmann::json to_json_object() const;
    static std::optional<Block> from_json_object(const nlohmann::json& j);
};

/**
 * @brief Compute the block hash H over the canonical encoding
 */
Hash256 compute_block_hash(const Block& block);

/**
 * @brief Derive the 8D coordinate from a digest
 */
Position8D derive_position(const Hash256& hash);

/**
 * @brief Exact comparison of two coordinates
 */
bool positions_equal(const Position8D& a, const Position8D& b);

/**
 * @brief Fixed genesis block
 *
 * Index 0, timestamp 1735689600, no transactions, zero previous hash,
 * nonce 0, accepted.
 */
Block make_genesis_block();

} // namespace hyperchain
