/**
 * @file byte_codec.hpp
 * @brief Canonical big-endian binary encoding
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The encoding is the sole input of the block hash:
 * - Integers: big-endian, fixed width
 * - Reals: IEEE-754 binary64 bit pattern, big-endian
 * - Strings: u32 length prefix followed by raw bytes
 * - Digests: 32 raw bytes
 */

#pragma once

#include "hyperchain/chain_crypto.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace hyperchain {

/**
 * @brief Appends canonically encoded fields to a byte buffer
 */
class ByteWriter {
public:
    void write_u8(uint8_t value);
    void write_u32(uint32_t value);
    void write_u64(uint64_t value);
    void write_f64(double value);
    void write_string(const std::string& value);
    void write_hash(const Hash256& hash);

    const std::vector<uint8_t>& bytes() const { return buffer_; }
    std::vector<uint8_t> take() { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

/**
 * @brief Reads canonically encoded fields
 *
 * Every read throws std::out_of_range when the buffer is exhausted.
 */
class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& data);

    uint8_t read_u8();
    uint32_t read_u32();
    uint64_t read_u64();
    double read_f64();
    std::string read_string();
    Hash256 read_hash();

    /// Bytes not yet consumed
    size_t remaining() const { return data_.size() - offset_; }

private:
    void require(size_t count) const;

    const std::vector<uint8_t>& data_;
    size_t offset_ = 0;
};

} // namespace hyperchain
