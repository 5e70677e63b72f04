/**
 * @file errors.cpp
 * @brief Error code string conversion
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hyperchain/errors.hpp"

namespace hyperchain {

std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::VALIDATION_REJECTED: return "VALIDATION_REJECTED";
        case ErrorCode::ORACLE_UNAVAILABLE: return "ORACLE_UNAVAILABLE";
        case ErrorCode::INSUFFICIENT_ENERGY: return "INSUFFICIENT_ENERGY";
        case ErrorCode::CHAIN_LINKAGE_ERROR: return "CHAIN_LINKAGE_ERROR";
        case ErrorCode::INVALID_NONCE: return "INVALID_NONCE";
        case ErrorCode::MALFORMED_BLOCK: return "MALFORMED_BLOCK";
        case ErrorCode::ACCOUNT_NOT_FOUND: return "ACCOUNT_NOT_FOUND";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::SOURCE_HALTED: return "SOURCE_HALTED";
        case ErrorCode::STORAGE_ERROR: return "STORAGE_ERROR";
        default: return "UNKNOWN";
    }
}

bool is_corruption_error(ErrorCode code) {
    return code == ErrorCode::MALFORMED_BLOCK;
}

} // namespace hyperchain
