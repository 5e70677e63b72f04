/**
 * @file errors.hpp
 * @brief Error taxonomy for HyperChain requests and block ingestion
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Request-level failures are thrown as ChainError subclasses.
 * Block rejection is reported as a value (see BlockValidation in ledger.hpp).
 */

#pragma once

#include <stdexcept>
#include <string>

namespace hyperchain {

/**
 * @brief Error codes reported by the ledger core
 */
enum class ErrorCode {
    NONE,                    ///< No error
    VALIDATION_REJECTED,     ///< Solution did not pass validation (normal outcome)
    ORACLE_UNAVAILABLE,      ///< Scoring oracle failed or timed out
    INSUFFICIENT_ENERGY,     ///< Account cannot pay the attempt cost
    CHAIN_LINKAGE_ERROR,     ///< Block index or previous hash does not extend the tip
    INVALID_NONCE,           ///< Block does not satisfy the PoHD predicate
    MALFORMED_BLOCK,         ///< Hash/position mismatch or inconsistent transaction
    ACCOUNT_NOT_FOUND,       ///< Referenced account does not exist
    INVALID_ARGUMENT,        ///< Caller supplied invalid input
    SOURCE_HALTED,           ///< Block source quarantined after a corruption-class fault
    STORAGE_ERROR            ///< Database failure
};

/**
 * @brief Convert ErrorCode to string
 * @param code Error code
 * @return String representation (e.g. "MALFORMED_BLOCK")
 */
std::string error_code_to_string(ErrorCode code);

/**
 * @brief Whether a block rejection with this code must halt its source
 *
 * Corruption-class faults (MALFORMED_BLOCK) are never auto-corrected.
 */
bool is_corruption_error(ErrorCode code);

/**
 * @brief Base exception for request-level ledger errors
 */
class ChainError : public std::runtime_error {
public:
    ChainError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief Scoring oracle failed; caller may retry the submission later
 */
class OracleUnavailable : public ChainError {
public:
    explicit OracleUnavailable(const std::string& message)
        : ChainError(ErrorCode::ORACLE_UNAVAILABLE, message) {}
};

/**
 * @brief Account energy is below the attempt cost; no mutation occurred
 */
class InsufficientEnergy : public ChainError {
public:
    InsufficientEnergy(const std::string& account_id, double required, double available)
        : ChainError(ErrorCode::INSUFFICIENT_ENERGY,
                     "Insufficient energy for " + account_id + ": required " +
                     std::to_string(required) + ", available " + std::to_string(available)),
          required_(required), available_(available) {}

    double required() const noexcept { return required_; }
    double available() const noexcept { return available_; }

private:
    double required_;
    double available_;
};

/**
 * @brief Referenced account does not exist
 */
class AccountNotFound : public ChainError {
public:
    explicit AccountNotFound(const std::string& account_id)
        : ChainError(ErrorCode::ACCOUNT_NOT_FOUND, "Account not found: " + account_id) {}
};

/**
 * @brief Underlying SQLite operation failed
 */
class StorageError : public ChainError {
public:
    explicit StorageError(const std::string& message)
        : ChainError(ErrorCode::STORAGE_ERROR, message) {}
};

} // namespace hyperchain
