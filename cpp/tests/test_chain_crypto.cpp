/**
 * @file test_chain_crypto.cpp
 * @brief Unit tests for hashing primitives and canonical byte encoding
 *
 * Tests cryptographic helpers including:
 * - SHA-256 known answers
 * - Hex conversion
 * - Random bytes
 * - Big-endian byte writer/reader
 */

#include <gtest/gtest.h>
#include "hyperchain/byte_codec.hpp"
#include "hyperchain/chain_crypto.hpp"
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>

using namespace hyperchain;

// Test fixture for crypto tests
class ChainCryptoTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(ChainCrypto::initialize());
    }
};

// ============================================================================
// Hashing Tests
// ============================================================================

TEST_F(ChainCryptoTest, Sha256EmptyInput) {
    Hash256 hash = ChainCrypto::sha256({});
    EXPECT_EQ(ChainCrypto::hash_to_hex(hash),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(ChainCryptoTest, Sha256KnownAnswer) {
    std::vector<uint8_t> data = {'a', 'b', 'c'};
    EXPECT_EQ(ChainCrypto::hash_to_hex(ChainCrypto::sha256(data)),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ChainCryptoTest, Sha256Deterministic) {
    std::vector<uint8_t> data = {1, 2, 3, 4, 5};
    EXPECT_EQ(ChainCrypto::sha256(data), ChainCrypto::sha256(data));

    std::vector<uint8_t> other = {1, 2, 3, 4, 6};
    EXPECT_NE(ChainCrypto::sha256(data), ChainCrypto::sha256(other));
}

TEST_F(ChainCryptoTest, ZeroHash) {
    Hash256 zero = ChainCrypto::zero_hash();
    for (uint8_t byte : zero) {
        EXPECT_EQ(byte, 0);
    }
    EXPECT_EQ(ChainCrypto::hash_to_hex(zero), std::string(64, '0'));
}

// ============================================================================
// Hex Conversion Tests
// ============================================================================

TEST_F(ChainCryptoTest, HexRoundTrip) {
    std::vector<uint8_t> data = {'h', 'y', 'p', 'e', 'r'};
    Hash256 hash = ChainCrypto::sha256(data);

    auto parsed = ChainCrypto::hex_to_hash(ChainCrypto::hash_to_hex(hash));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, hash);
}

TEST_F(ChainCryptoTest, HexRejectsWrongLength) {
    EXPECT_FALSE(ChainCrypto::hex_to_hash("abcd").has_value());
    EXPECT_FALSE(ChainCrypto::hex_to_hash(std::string(66, 'a')).has_value());
    EXPECT_FALSE(ChainCrypto::hex_to_hash("").has_value());
}

TEST_F(ChainCryptoTest, HexRejectsNonHex) {
    EXPECT_FALSE(ChainCrypto::hex_to_hash(std::string(64, 'z')).has_value());
}

// ============================================================================
// Randomness and Comparison Tests
// ============================================================================

TEST_F(ChainCryptoTest, RandomBytesSizeAndVariety) {
    auto a = ChainCrypto::random_bytes(32);
    auto b = ChainCrypto::random_bytes(32);

    EXPECT_EQ(a.size(), 32u);
    EXPECT_EQ(b.size(), 32u);
    EXPECT_NE(a, b);
}

TEST_F(ChainCryptoTest, RandomU64Varies) {
    std::set<uint64_t> values;
    for (int i = 0; i < 16; i++) {
        values.insert(ChainCrypto::random_u64());
    }
    EXPECT_GT(values.size(), 1u);
}

TEST_F(ChainCryptoTest, ConstantTimeEqual) {
    Hash256 a = ChainCrypto::sha256({1});
    Hash256 b = a;
    Hash256 c = ChainCrypto::sha256({2});

    EXPECT_TRUE(ChainCrypto::constant_time_equal(a, b));
    EXPECT_FALSE(ChainCrypto::constant_time_equal(a, c));
}

// ============================================================================
// Byte Codec Tests
// ============================================================================

TEST_F(ChainCryptoTest, WriterIsBigEndian) {
    ByteWriter writer;
    writer.write_u32(0x01020304);
    writer.write_u64(0x0A0B0C0D0E0F1011ULL);

    std::vector<uint8_t> expected = {
        0x01, 0x02, 0x03, 0x04,
        0x0A, 0x0B, 0x0C, 0x0D, 0x0E, 0x0F, 0x10, 0x11
    };
    EXPECT_EQ(writer.bytes(), expected);
}

TEST_F(ChainCryptoTest, StringIsLengthPrefixed) {
    ByteWriter writer;
    writer.write_string("ab");

    std::vector<uint8_t> expected = {0x00, 0x00, 0x00, 0x02, 'a', 'b'};
    EXPECT_EQ(writer.bytes(), expected);
}

TEST_F(ChainCryptoTest, DoubleUsesIeeeBitPattern) {
    ByteWriter writer;
    writer.write_f64(1.0);

    // 1.0 = 0x3FF0000000000000
    std::vector<uint8_t> expected = {0x3F, 0xF0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    EXPECT_EQ(writer.bytes(), expected);
}

TEST_F(ChainCryptoTest, ReaderReadsWhatWriterWrote) {
    Hash256 hash = ChainCrypto::sha256({9, 9});

    ByteWriter writer;
    writer.write_u8(7);
    writer.write_u32(123456);
    writer.write_u64(std::numeric_limits<uint64_t>::max());
    writer.write_f64(-0.125);
    writer.write_string("mathematics");
    writer.write_hash(hash);

    std::vector<uint8_t> bytes = writer.take();
    ByteReader reader(bytes);

    EXPECT_EQ(reader.read_u8(), 7);
    EXPECT_EQ(reader.read_u32(), 123456u);
    EXPECT_EQ(reader.read_u64(), std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(reader.read_f64(), -0.125);
    EXPECT_EQ(reader.read_string(), "mathematics");
    EXPECT_EQ(reader.read_hash(), hash);
    EXPECT_EQ(reader.remaining(), 0u);
}

TEST_F(ChainCryptoTest, ReaderThrowsWhenExhausted) {
    std::vector<uint8_t> bytes = {0x00, 0x01};
    ByteReader reader(bytes);

    EXPECT_THROW(reader.read_u32(), std::out_of_range);
}

TEST_F(ChainCryptoTest, ReaderRejectsTruncatedString) {
    std::vector<uint8_t> bytes = {0x00, 0x00, 0x00, 0x05, 'a', 'b'};
    ByteReader reader(bytes);

    EXPECT_THROW(reader.read_string(), std::out_of_range);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
