/**
 * @file chain_crypto.cpp
 * @brief Implementation of ledger hashing and randomness helpers
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - SHA-256: Block hash function
 * - randombytes: OS-backed CSPRNG
 * - libsodium: Industry-standard implementation
 */

#include "hyperchain/chain_crypto.hpp"
#include <cstring>
#include <iomanip>
#include <sstream>

namespace hyperchain {

// ============================================================================
// Initialization
// ============================================================================

bool ChainCrypto::initialize() {
    // Initialize libsodium (safe to call multiple times)
    if (sodium_init() < 0) {
        return false;
    }
    return true;
}

// ============================================================================
// Hashing
// ============================================================================

Hash256 ChainCrypto::sha256(const std::vector<uint8_t>& data) {
    Hash256 digest;
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

Hash256 ChainCrypto::zero_hash() {
    Hash256 digest;
    digest.fill(0);
    return digest;
}

// ============================================================================
// Encoding
// ============================================================================

std::string ChainCrypto::hash_to_hex(const Hash256& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : hash) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    return oss.str();
}

std::optional<Hash256> ChainCrypto::hex_to_hash(const std::string& hex) {
    if (hex.length() != crypto_hash_sha256_BYTES * 2) {
        return std::nullopt;
    }

    Hash256 digest;
    size_t bin_len = 0;
    const char* hex_end = nullptr;

    int result = sodium_hex2bin(
        digest.data(),
        digest.size(),
        hex.c_str(),
        hex.length(),
        nullptr,
        &bin_len,
        &hex_end
    );

    if (result != 0 || bin_len != digest.size() || hex_end != hex.c_str() + hex.length()) {
        return std::nullopt;
    }

    return digest;
}

// ============================================================================
// Utility Functions
// ============================================================================

std::vector<uint8_t> ChainCrypto::random_bytes(size_t size) {
    std::vector<uint8_t> bytes(size);
    randombytes_buf(bytes.data(), size);
    return bytes;
}

uint64_t ChainCrypto::random_u64() {
    uint64_t value = 0;
    randombytes_buf(&value, sizeof(value));
    return value;
}

bool ChainCrypto::constant_time_equal(const Hash256& a, const Hash256& b) {
    // Use libsodium's constant-time comparison to prevent timing attacks
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace hyperchain
