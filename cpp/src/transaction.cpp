/**
 * @file transaction.cpp
 * @brief Implementation of transaction encoding and serialization
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hyperchain/transaction.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace hyperchain {

// ============================================================================
// Kind String Conversion
// ============================================================================

std::string transaction_kind_to_string(TransactionKind kind) {
    switch (kind) {
        case TransactionKind::EVOLUTION: return "EVOLUTION";
        case TransactionKind::TRANSFER: return "TRANSFER";
        case TransactionKind::ATTEMPT_CHARGE: return "ATTEMPT_CHARGE";
        case TransactionKind::REGENERATION: return "REGENERATION";
        default: return "UNKNOWN";
    }
}

std::optional<TransactionKind> string_to_transaction_kind(const std::string& str) {
    if (str == "EVOLUTION") return TransactionKind::EVOLUTION;
    if (str == "TRANSFER") return TransactionKind::TRANSFER;
    if (str == "ATTEMPT_CHARGE") return TransactionKind::ATTEMPT_CHARGE;
    if (str == "REGENERATION") return TransactionKind::REGENERATION;
    return std::nullopt;
}

// ============================================================================
// Canonical Encoding
// ============================================================================

void Transaction::encode(ByteWriter& writer) const {
    writer.write_u8(static_cast<uint8_t>(kind));
    writer.write_string(account_id);
    writer.write_u64(timestamp);

    if (kind == TransactionKind::TRANSFER) {
        writer.write_string(transfer.recipient_id);
        writer.write_f64(transfer.amount);
        return;
    }

    if (kind == TransactionKind::REGENERATION) {
        writer.write_u64(regeneration.elapsed_seconds);
        writer.write_f64(regeneration.energy_delta);
        return;
    }

    writer.write_string(evolution.problem_id);
    writer.write_f64(evolution.difficulty);
    writer.write_f64(evolution.quality);
    writer.write_f64(evolution.complexity_before);
    writer.write_f64(evolution.complexity_delta);
    writer.write_f64(evolution.complexity_after);
    writer.write_f64(evolution.energy_delta);
    writer.write_u32(static_cast<uint32_t>(evolution.old_tier));
    writer.write_u32(static_cast<uint32_t>(evolution.new_tier));
}

Transaction Transaction::decode(ByteReader& reader) {
    Transaction tx;

    uint8_t tag = reader.read_u8();
    if (tag < static_cast<uint8_t>(TransactionKind::EVOLUTION) ||
        tag > static_cast<uint8_t>(TransactionKind::REGENERATION)) {
        throw std::invalid_argument("Unknown transaction kind tag " + std::to_string(tag));
    }
    tx.kind = static_cast<TransactionKind>(tag);
    tx.account_id = reader.read_string();
    tx.timestamp = reader.read_u64();

    if (tx.kind == TransactionKind::TRANSFER) {
        tx.transfer.recipient_id = reader.read_string();
        tx.transfer.amount = reader.read_f64();
        return tx;
    }

    if (tx.kind == TransactionKind::REGENERATION) {
        tx.regeneration.elapsed_seconds = reader.read_u64();
        tx.regeneration.energy_delta = reader.read_f64();
        return tx;
    }

    tx.evolution.problem_id = reader.read_string();
    tx.evolution.difficulty = reader.read_f64();
    tx.evolution.quality = reader.read_f64();
    tx.evolution.complexity_before = reader.read_f64();
    tx.evolution.complexity_delta = reader.read_f64();
    tx.evolution.complexity_after = reader.read_f64();
    tx.evolution.energy_delta = reader.read_f64();
    tx.evolution.old_tier = static_cast<int>(reader.read_u32());
    tx.evolution.new_tier = static_cast<int>(reader.read_u32());

    return tx;
}

Hash256 Transaction::id() const {
    ByteWriter writer;
    encode(writer);
    return ChainCrypto::sha256(writer.bytes());
}

// ============================================================================
// JSON Serialization
// ============================================================================

json Transaction::to_json_object() const {
    json j;
    j["kind"] = transaction_kind_to_string(kind);
    j["account_id"] = account_id;
    j["timestamp"] = timestamp;

    if (kind == TransactionKind::TRANSFER) {
        j["payload"] = {
            {"recipient_id", transfer.recipient_id},
            {"amount", transfer.amount}
        };
    } else if (kind == TransactionKind::REGENERATION) {
        j["payload"] = {
            {"elapsed_seconds", regeneration.elapsed_seconds},
            {"energy_delta", regeneration.energy_delta}
        };
    } else {
        j["payload"] = {
            {"problem_id", evolution.problem_id},
            {"difficulty", evolution.difficulty},
            {"quality", evolution.quality},
            {"complexity_before", evolution.complexity_before},
            {"complexity_delta", evolution.complexity_delta},
            {"complexity_after", evolution.complexity_after},
            {"energy_delta", evolution.energy_delta},
            {"old_tier", evolution.old_tier},
            {"new_tier", evolution.new_tier}
        };
    }

    return j;
}

std::optional<Transaction> Transaction::from_json_object(const json& j) {
    try {
        Transaction tx;

        auto kind_opt = string_to_transaction_kind(j.at("kind").get<std::string>());
        if (!kind_opt) {
            return std::nullopt;
        }
        tx.kind = *kind_opt;
        tx.account_id = j.at("account_id").get<std::string>();
        tx.timestamp = j.at("timestamp").get<uint64_t>();

        const json& payload = j.at("payload");
        if (tx.kind == TransactionKind::TRANSFER) {
            tx.transfer.recipient_id = payload.at("recipient_id").get<std::string>();
            tx.transfer.amount = payload.at("amount").get<double>();
        } else if (tx.kind == TransactionKind::REGENERATION) {
            tx.regeneration.elapsed_seconds = payload.at("elapsed_seconds").get<uint64_t>();
            tx.regeneration.energy_delta = payload.at("energy_delta").get<double>();
        } else {
            tx.evolution.problem_id = payload.at("problem_id").get<std::string>();
            tx.evolution.difficulty = payload.at("difficulty").get<double>();
            tx.evolution.quality = payload.at("quality").get<double>();
            tx.evolution.complexity_before = payload.at("complexity_before").get<double>();
            tx.evolution.complexity_delta = payload.at("complexity_delta").get<double>();
            tx.evolution.complexity_after = payload.at("complexity_after").get<double>();
            tx.evolution.energy_delta = payload.at("energy_delta").get<double>();
            tx.evolution.old_tier = payload.at("old_tier").get<int>();
            tx.evolution.new_tier = payload.at("new_tier").get<int>();
        }

        return tx;

    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::string Transaction::to_json() const {
    try {
        return to_json_object().dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<Transaction> Transaction::from_json(const std::string& json_str) {
    try {
        return from_json_object(json::parse(json_str));
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Construction Helpers
// ============================================================================

Transaction make_transfer_transaction(
    const std::string& sender_id,
    const std::string& recipient_id,
    double amount,
    uint64_t timestamp
) {
    Transaction tx;
    tx.kind = TransactionKind::TRANSFER;
    tx.account_id = sender_id;
    tx.timestamp = timestamp;
    tx.transfer.recipient_id = recipient_id;
    tx.transfer.amount = amount;
    return tx;
}

} // namespace hyperchain
