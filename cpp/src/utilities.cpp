/**
 * @file utilities.cpp
 * @brief Implementation of common utility functions for HyperChain
 *
 * HyperChain - Proof of HyperDistance ledger core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "hyperchain/utilities.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <memory>
#include <mutex>

// OpenSSL for SHA-256 snapshot checksums
#include <openssl/evp.h>

namespace hyperchain {
namespace utilities {

namespace {
    constexpr const char* LOGGER_NAME = "hyperchain";
    constexpr size_t LOG_FILE_MAX_BYTES = 10 * 1024 * 1024;
    constexpr size_t LOG_FILE_COUNT = 3;
    constexpr size_t HASH_CHUNK_BYTES = 64 * 1024;

    std::shared_ptr<spdlog::logger> g_logger;
    std::once_flag g_default_logging;
    std::mutex g_logger_mutex;

    spdlog::level::level_enum to_spdlog_level(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:    return spdlog::level::debug;
            case LogLevel::INFO:     return spdlog::level::info;
            case LogLevel::WARN:     return spdlog::level::warn;
            case LogLevel::ERROR:    return spdlog::level::err;
            case LogLevel::CRITICAL: return spdlog::level::critical;
            default:                 return spdlog::level::info;
        }
    }

    std::shared_ptr<spdlog::logger> active_logger() {
        {
            std::lock_guard<std::mutex> lock(g_logger_mutex);
            if (g_logger) {
                return g_logger;
            }
        }

        // First use without explicit setup: console only
        std::call_once(g_default_logging, []() { initialize_logging(); });

        std::lock_guard<std::mutex> lock(g_logger_mutex);
        return g_logger ? g_logger : spdlog::default_logger();
    }

    using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
}

// ============================================================================
// LOGGING FUNCTIONS
// ============================================================================

void initialize_logging(const std::string& log_file, LogLevel level) {
    auto spd_level = to_spdlog_level(level);

    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

        // Rotating file sink
        if (!log_file.empty()) {
            std::filesystem::path path(log_file);
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path());
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, LOG_FILE_MAX_BYTES, LOG_FILE_COUNT));
        }

        auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        logger->set_level(spd_level);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

        // Quarantine reports
        logger->flush_on(spdlog::level::critical);

        std::lock_guard<std::mutex> lock(g_logger_mutex);
        g_logger = logger;
        spdlog::set_default_logger(logger);

    } catch (const spdlog::spdlog_ex& ex) {
        fprintf(stderr, "Log initialization failed: %s\n", ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        fprintf(stderr, "Log directory unavailable: %s\n", ex.what());
    }
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower = to_lowercase(name);
    if (lower == "warning") {
        lower = "warn";
    }

    // spdlog maps unknown names to "off"
    switch (spdlog::level::from_str(lower)) {
        case spdlog::level::debug:    return LogLevel::DEBUG;
        case spdlog::level::info:     return LogLevel::INFO;
        case spdlog::level::warn:     return LogLevel::WARN;
        case spdlog::level::err:      return LogLevel::ERROR;
        case spdlog::level::critical: return LogLevel::CRITICAL;
        default:                      return std::nullopt;
    }
}

void log(LogLevel level, const std::string& message) {
    auto logger = active_logger();
    if (!logger) {
        fprintf(stderr, "%s\n", message.c_str());
        return;
    }
    logger->log(to_spdlog_level(level), message);
}

void log_debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void log_info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void log_warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void log_error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void log_critical(const std::string& message) {
    log(LogLevel::CRITICAL, message);
}

// ============================================================================
// TIME FORMATTING FUNCTIONS
// ============================================================================

uint64_t current_unix_time() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

std::string format_timestamp(uint64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm utc{};
    gmtime_r(&time, &utc);

    char buffer[32];
    if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc) == 0) {
        return std::to_string(timestamp);
    }
    return buffer;
}

std::string format_duration(uint64_t seconds) {
    const std::array<std::pair<uint64_t, const char*>, 4> units = {{
        {86400, "d"}, {3600, "h"}, {60, "m"}, {1, "s"}
    }};

    std::ostringstream oss;
    uint64_t remaining = seconds;

    for (const auto& unit : units) {
        uint64_t count = remaining / unit.first;
        remaining %= unit.first;
        if (count == 0) {
            continue;
        }
        if (oss.tellp() > 0) {
            oss << " ";
        }
        oss << count << unit.second;
    }

    std::string result = oss.str();
    return result.empty() ? "0s" : result;
}

// ============================================================================
// FILE I/O FUNCTIONS
// ============================================================================

std::optional<std::string> read_file(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::in | std::ios::binary);
    if (!file) {
        log_error("Cannot open " + file_path + " for reading");
        return std::nullopt;
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        log_error("Read error on " + file_path);
        return std::nullopt;
    }
    return content.str();
}

bool write_file(const std::string& file_path, const std::string& content) {
    std::filesystem::path path(file_path);

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            log_error("Cannot create directory for " + file_path + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(file_path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file) {
        log_error("Cannot open " + file_path + " for writing");
        return false;
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file) {
        log_error("Write error on " + file_path);
        return false;
    }
    return true;
}

std::optional<std::string> calculate_file_hash(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::in | std::ios::binary);
    if (!file) {
        log_error("Cannot open " + file_path + " for hashing");
        return std::nullopt;
    }

    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        log_error("SHA-256 context setup failed");
        return std::nullopt;
    }

    std::vector<char> chunk(HASH_CHUNK_BYTES);
    while (file) {
        file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::streamsize got = file.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), chunk.data(), static_cast<size_t>(got)) != 1) {
            log_error("SHA-256 update failed for " + file_path);
            return std::nullopt;
        }
    }
    if (file.bad()) {
        log_error("Read error while hashing " + file_path);
        return std::nullopt;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_length) != 1) {
        log_error("SHA-256 finalization failed for " + file_path);
        return std::nullopt;
    }

    static const char* hex = "0123456789abcdef";
    std::string result;
    result.reserve(digest_length * 2);
    for (unsigned int i = 0; i < digest_length; i++) {
        result.push_back(hex[digest[i] >> 4]);
        result.push_back(hex[digest[i] & 0x0F]);
    }
    return result;
}

// ============================================================================
// STRING / ENVIRONMENT FUNCTIONS
// ============================================================================

std::string to_lowercase(const std::string& str) {
    std::string result(str.size(), '\0');
    std::transform(str.begin(), str.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string get_env(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return default_value;
    }
    return value;
}

} // namespace utilities
} // namespace hyperchain
