/**
 * @file transaction.hpp
 * @brief Ledger transaction types and canonical encoding
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Transactions recorded in blocks:
 * - EVOLUTION: accepted solution applied by the evolution engine
 * - TRANSFER: generic transfer between two accounts
 * - ATTEMPT_CHARGE: energy consumed by a rejected attempt
 * - REGENERATION: passive energy regeneration over elapsed time
 */

#pragma once

#include "hyperchain/byte_codec.hpp"
#include "hyperchain/chain_crypto.hpp"
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hyperchain {

/**
 * @brief Transaction kinds (value is the canonical wire tag)
 */
enum class TransactionKind : uint8_t {
    EVOLUTION = 1,           ///< Accepted solution
    TRANSFER = 2,            ///< Generic transfer
    ATTEMPT_CHARGE = 3,      ///< Rejected attempt cost
    REGENERATION = 4         ///< Passive energy regeneration
};

std::string transaction_kind_to_string(TransactionKind kind);
std::optional<TransactionKind> string_to_transaction_kind(const std::string& str);

/**
 * @brief Payload of EVOLUTION and ATTEMPT_CHARGE transactions
 *
 * For ATTEMPT_CHARGE, complexity_delta is 0, complexity_after equals
 * complexity_before and the tiers are equal.
 */
struct EvolutionPayload {
    std::string problem_id;          ///< Problem identifier
    double difficulty = 0.0;         ///< Problem difficulty D
    double quality = 0.0;            ///< Validation quality score
    double complexity_before = 0.0;  ///< C before the event
    double complexity_delta = 0.0;   ///< ΔC = D / C^alpha
    double complexity_after = 0.0;   ///< C + ΔC
    double energy_delta = 0.0;       ///< Net energy change (after clamping)
    int old_tier = 1;
    int new_tier = 1;
};

/**
 * @brief Payload of TRANSFER transactions
 */
struct TransferPayload {
    std::string recipient_id;        ///< Receiving account
    double amount = 0.0;             ///< Amount (> 0)
};

/**
 * @brief Payload of REGENERATION transactions
 */
struct RegenerationPayload {
    uint64_t elapsed_seconds = 0;    ///< Elapsed time credited
    double energy_delta = 0.0;       ///< Energy added (after clamping to the cap)
};

/**
 * @brief Ledger transaction, immutable once included in a block
 */
struct Transaction {
    TransactionKind kind = TransactionKind::EVOLUTION;
    std::string account_id;          ///< Originating account
    uint64_t timestamp = 0;          ///< Unix timestamp (seconds)
    EvolutionPayload evolution;      ///< Set for EVOLUTION and ATTEMPT_CHARGE
    TransferPayload transfer;        ///< Set for TRANSFER
    RegenerationPayload regeneration; ///< Set for REGENERATION

    /**
     * @brief Append canonical encoding (field order is fixed and hashed)
     */
    void encode(ByteWriter& writer) const;

    /**
     * @brief Read one canonically encoded transaction
     * @throws std::out_of_range on truncated input
     * @throws std::invalid_argument on unknown kind
     */
    static Transaction decode(ByteReader& reader);

    /**
     * @brief SHA-256 of the canonical encoding
     */
    Hash256 id() const;

    /**
     * @brief Serialize transaction to JSON
     * @return JSON string
     */
    std::string to_json() const;

    /**
     * @brief Deserialize transaction from JSON
     * @param json JSON string
     * @return Transaction or std::nullopt if invalid
     */
    static std::optional<Transaction> from_json(const std::string& json);

    nlohmann::json to_json_object() const;
    static std::optional<Transaction> from_json_object(const nlohmann::json& j);
};

/**
 * @brief Build a TRANSFER transaction
 */
Transaction make_transfer_transaction(
    const std::string& sender_id,
    const std::string& recipient_id,
    double amount,
    uint64_t timestamp
);

} // namespace hyperchain
