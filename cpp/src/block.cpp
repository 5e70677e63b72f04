/**
 * @file block.cpp
 * @brief Implementation of block encoding, hashing and serialization
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hyperchain/block.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace hyperchain {

std::string block_state_to_string(BlockState state) {
    switch (state) {
        case BlockState::PENDING: return "PENDING";
        case BlockState::MINING: return "MINING";
        case BlockState::ACCEPTED: return "ACCEPTED";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Canonical Encoding
// ============================================================================

std::vector<uint8_t> Block::encode_prefix() const {
    ByteWriter writer;
    writer.write_u64(index);
    writer.write_u64(timestamp);
    writer.write_u32(static_cast<uint32_t>(transactions.size()));
    for (const auto& tx : transactions) {
        tx.encode(writer);
    }
    writer.write_hash(previous_hash);
    return writer.take();
}

std::vector<uint8_t> Block::encode() const {
    std::vector<uint8_t> bytes = encode_prefix();

    ByteWriter nonce_writer;
    nonce_writer.write_u64(nonce);
    bytes.insert(bytes.end(), nonce_writer.bytes().begin(), nonce_writer.bytes().end());

    return bytes;
}

Block Block::decode(const std::vector<uint8_t>& bytes) {
    ByteReader reader(bytes);

    Block block;
    block.index = reader.read_u64();
    block.timestamp = reader.read_u64();

    uint32_t tx_count = reader.read_u32();
    block.transactions.reserve(tx_count);
    for (uint32_t i = 0; i < tx_count; i++) {
        block.transactions.push_back(Transaction::decode(reader));
    }

    block.previous_hash = reader.read_hash();
    block.nonce = reader.read_u64();

    if (reader.remaining() != 0) {
        throw std::invalid_argument("Trailing bytes after block encoding");
    }

    return block;
}

void Block::seal() {
    hash = compute_block_hash(*this);
    position = derive_position(hash);
}

Hash256 compute_block_hash(const Block& block) {
    return ChainCrypto::sha256(block.encode());
}

Position8D derive_position(const Hash256& hash) {
    Position8D position{};

    for (size_t i = 0; i < config::DIMENSIONS; i++) {
        uint32_t chunk = (static_cast<uint32_t>(hash[i * 4]) << 24) |
                         (static_cast<uint32_t>(hash[i * 4 + 1]) << 16) |
                         (static_cast<uint32_t>(hash[i * 4 + 2]) << 8) |
                         static_cast<uint32_t>(hash[i * 4 + 3]);
        position[i] = static_cast<double>(chunk) / static_cast<double>(0xFFFFFFFFu);
    }

    return position;
}

bool positions_equal(const Position8D& a, const Position8D& b) {
    for (size_t i = 0; i < config::DIMENSIONS; i++) {
        if (a[i] != b[i]) {
            return false;
        }
    }
    return true;
}

Block make_genesis_block() {
    Block genesis;
    genesis.index = 0;
    genesis.timestamp = config::GENESIS_TIMESTAMP;
    genesis.previous_hash = ChainCrypto::zero_hash();
    genesis.nonce = 0;
    genesis.difficulty = 0;
    genesis.seal();
    genesis.state = BlockState::ACCEPTED;
    return genesis;
}

// ============================================================================
// JSON Serialization
// ============================================================================

json Block::to_json_object() const {
    json j;
    j["index"] = index;
    j["timestamp"] = timestamp;
    j["previous_hash"] = ChainCrypto::hash_to_hex(previous_hash);
    j["nonce"] = nonce;
    j["hash"] = ChainCrypto::hash_to_hex(hash);
    j["position_8d"] = position;
    j["difficulty"] = difficulty;
    j["state"] = block_state_to_string(state);   // informational, not read back

    json tx_array = json::array();
    for (const auto& tx : transactions) {
        tx_array.push_back(tx.to_json_object());
    }
    j["transactions"] = tx_array;

    return j;
}

std::optional<Block> Block::from_json_object(const json& j) {
    try {
        Block block;
        block.index = j.at("index").get<uint64_t>();
        block.timestamp = j.at("timestamp").get<uint64_t>();
        block.nonce = j.at("nonce").get<uint64_t>();
        block.difficulty = j.value("difficulty", static_cast<uint32_t>(0));

        auto previous_hash = ChainCrypto::hex_to_hash(j.at("previous_hash").get<std::string>());
        auto hash = ChainCrypto::hex_to_hash(j.at("hash").get<std::string>());
        if (!previous_hash || !hash) {
            return std::nullopt;
        }
        block.previous_hash = *previous_hash;
        block.hash = *hash;

        if (j.contains("position_8d")) {
            const auto& position_json = j.at("position_8d");
            if (!position_json.is_array() || position_json.size() != config::DIMENSIONS) {
                return std::nullopt;
            }
            for (size_t i = 0; i < config::DIMENSIONS; i++) {
                block.position[i] = position_json[i].get<double>();
            }
        } else {
            block.position = derive_position(block.hash);
        }

        for (const auto& tx_json : j.at("transactions")) {
            auto tx = Transaction::from_json_object(tx_json);
            if (!tx) {
                return std::nullopt;
            }
            block.transactions.push_back(*tx);
        }

        block.state = BlockState::PENDING;
        return block;

    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::string Block::to_json() const {
    try {
        return to_json_object().dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<Block> Block::from_json(const std::string& json_str) {
    try {
        return from_json_object(json::parse(json_str));
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

} // namespace hyperchain
