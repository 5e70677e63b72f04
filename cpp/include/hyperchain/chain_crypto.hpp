/**
 * @file chain_crypto.hpp
 * @brief Hashing and randomness primitives for the HyperChain ledger
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * SHA-256 block hashing, hex conversion and OS-backed random bytes (libsodium).
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <sodium.h>

namespace hyperchain {

/// 32-byte SHA-256 digest
using Hash256 = std::array<uint8_t, crypto_hash_sha256_BYTES>;

/**
 * @brief ChainCrypto - Cryptographic helpers for the ledger
 *
 * Thread-safe and stateless. initialize() must succeed before any other call.
 */
class ChainCrypto {
public:
    /**
     * @brief Initialize libsodium (call once at startup)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    // ========================================================================
    // Hashing
    // ========================================================================

    /**
     * @brief SHA-256 of a byte buffer
     * @param data Input bytes
     * @return 32-byte digest
     */
    static Hash256 sha256(const std::vector<uint8_t>& data);

    /**
     * @brief All-zero digest used as the genesis predecessor hash
     */
    static Hash256 zero_hash();

    // ========================================================================
    // Encoding
    // ========================================================================

    /**
     * @brief Convert digest to lowercase hex (64 characters)
     */
    static std::string hash_to_hex(const Hash256& hash);

    /**
     * @brief Parse 64-character hex string into digest
     * @param hex Hex string
     * @return Digest, or std::nullopt if length or characters are invalid
     */
    static std::optional<Hash256> hex_to_hash(const std::string& hex);

    // ========================================================================
    // Utility Functions
    // ========================================================================

    /**
     * @brief Generate cryptographically secure random bytes
     * @param size Number of bytes to generate
     * @return Random bytes
     */
    static std::vector<uint8_t> random_bytes(size_t size);

    /**
     * @brief Generate a uniformly distributed 64-bit value
     */
    static uint64_t random_u64();

    /**
     * @brief Constant-time digest comparison
     * @return true if digests are equal
     */
    static bool constant_time_equal(const Hash256& a, const Hash256& b);
};

} // namespace hyperchain
