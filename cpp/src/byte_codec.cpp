/**
 * @file byte_codec.cpp
 * @brief Implementation of canonical big-endian encoding
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hyperchain/byte_codec.hpp"
#include <cstring>
#include <stdexcept>

namespace hyperchain {

// ============================================================================
// ByteWriter
// ============================================================================

void ByteWriter::write_u8(uint8_t value) {
    buffer_.push_back(value);
}

void ByteWriter::write_u32(uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

void ByteWriter::write_u64(uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

void ByteWriter::write_f64(double value) {
    static_assert(sizeof(double) == sizeof(uint64_t), "binary64 required");

    uint64_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    write_u64(bits);
}

void ByteWriter::write_string(const std::string& value) {
    if (value.size() > UINT32_MAX) {
        throw std::length_error("ByteWriter: string exceeds u32 length prefix");
    }

    write_u32(static_cast<uint32_t>(value.size()));
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

void ByteWriter::write_hash(const Hash256& hash) {
    buffer_.insert(buffer_.end(), hash.begin(), hash.end());
}

// ============================================================================
// ByteReader
// ============================================================================

ByteReader::ByteReader(const std::vector<uint8_t>& data)
    : data_(data) {
}

void ByteReader::require(size_t count) const {
    if (count > remaining()) {
        throw std::out_of_range("ByteReader: truncated input");
    }
}

uint8_t ByteReader::read_u8() {
    require(1);
    return data_[offset_++];
}

uint32_t ByteReader::read_u32() {
    require(4);
    uint32_t value = 0;
    for (int i = 0; i < 4; i++) {
        value = (value << 8) | data_[offset_++];
    }
    return value;
}

uint64_t ByteReader::read_u64() {
    require(8);
    uint64_t value = 0;
    for (int i = 0; i < 8; i++) {
        value = (value << 8) | data_[offset_++];
    }
    return value;
}

double ByteReader::read_f64() {
    uint64_t bits = read_u64();
    double value = 0.0;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

std::string ByteReader::read_string() {
    uint32_t length = read_u32();
    require(length);

    std::string value(data_.begin() + offset_, data_.begin() + offset_ + length);
    offset_ += length;
    return value;
}

Hash256 ByteReader::read_hash() {
    Hash256 hash;
    require(hash.size());
    std::memcpy(hash.data(), data_.data() + offset_, hash.size());
    offset_ += hash.size();
    return hash;
}

} // namespace hyperchain
