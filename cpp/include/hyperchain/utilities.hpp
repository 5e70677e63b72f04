/**
 * @file utilities.hpp
 * @brief Common utility functions for HyperChain
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout HyperChain:
 * - Logging and error reporting
 * - Time formatting
 * - File I/O helpers
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace hyperchain {
namespace utilities {

/// Severity of a node log record
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Install the process-wide "hyperchain" logger
 *
 * Logging before this call installs a console-only logger at INFO.
 *
 * @param log_file Rotating log file (empty: console only)
 * @param level Minimum severity written to every sink
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Parse log level name ("debug", "info", "warn", "error", "critical")
 * @param name Level name (case-insensitive)
 * @return Log level, or std::nullopt if unknown
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/// Write one record to the active logger
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);

/**
 * @brief Log critical message
 *
 * Reserved for faults that halt processing of a block source or indicate
 * corrupted chain state.
 *
 * @param message Message to log
 */
void log_critical(const std::string& message);

/**
 * @brief Current wall-clock time as Unix seconds
 */
uint64_t current_unix_time();

/**
 * @brief Format a block or transaction timestamp as UTC ISO 8601
 * @return e.g. "2025-01-01T00:00:00Z"
 */
std::string format_timestamp(uint64_t timestamp);

/**
 * @brief Format node uptime, largest unit first
 * @return e.g. "1d 2h 5s"; "0s" for zero
 */
std::string format_duration(uint64_t seconds);

/// Whole file contents, or std::nullopt (logged) on failure
std::optional<std::string> read_file(const std::string& file_path);

/**
 * @brief Write string to file, creating parent directories
 * @param file_path Path to file
 * @param content Content to write
 * @return true if successful, false otherwise
 */
bool write_file(const std::string& file_path, const std::string& content);

/**
 * @brief SHA-256 checksum of a file, streamed in chunks
 * @param file_path Snapshot or other file to checksum
 * @return Lowercase hex digest, or std::nullopt if the file cannot be read
 */
std::optional<std::string> calculate_file_hash(const std::string& file_path);

/**
 * @brief Convert string to lowercase
 */
std::string to_lowercase(const std::string& str);

/// Environment variable value; unset or empty yields default_value
std::string get_env(const std::string& name, const std::string& default_value = "");

} // namespace utilities
} // namespace hyperchain
