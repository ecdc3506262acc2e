/**
 * @file utilities.hpp
 * @brief Common utility functions for LanClip
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout LanClip:
 * - Logging and error reporting
 * - Size formatting
 * - File I/O helpers
 * - String and UTF-8 helpers
 * - Network helpers
 * - Bounded retry with exponential backoff
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <thread>

namespace lanclip {
namespace utilities {

/**
 * @brief Log levels for LanClip logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Parse log level name ("debug", "info", "warn", "error", "critical")
 * @param name Level name, case-insensitive
 * @return LogLevel or std::nullopt if unknown
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Log a message with specified level
 * @param level Log level
 * @param message Message to log
 */
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

/**
 * @brief Format byte count in human-readable format
 * @param size Size in bytes
 * @return Formatted string (e.g., "512 B", "1.5 MB")
 */
std::string format_file_size(uint64_t size);

/**
 * @brief Read entire file into byte vector
 * @param file_path Path to file
 * @return File contents or std::nullopt if error
 */
std::optional<std::vector<uint8_t>> read_file_binary(const std::string& file_path);

/**
 * @brief Write byte vector to file, creating parent directories
 * @param file_path Path to file
 * @param content Content to write
 * @return true if successful, false otherwise
 */
bool write_file_binary(const std::string& file_path, const std::vector<uint8_t>& content);

/**
 * @brief Trim whitespace from string
 */
std::string trim_string(const std::string& str);

/**
 * @brief Convert string to lowercase
 */
std::string to_lowercase(const std::string& str);

/**
 * @brief Check that bytes form well-formed UTF-8
 * @param data Bytes to check
 * @param size Number of bytes
 * @return true if valid UTF-8 (overlongs and surrogates rejected)
 */
bool is_valid_utf8(const uint8_t* data, size_t size);

bool is_valid_utf8(const std::string& str);

/**
 * @brief Truncate string to at most max_bytes without splitting a UTF-8 sequence
 */
std::string truncate_utf8(const std::string& str, size_t max_bytes);

/**
 * @brief Strip markup tags from HTML, keeping text content
 *
 * Unterminated tags swallow the rest of the input.
 */
std::string extract_plain_text_from_html(const std::string& html);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

/**
 * @brief Get hostname of current machine
 * @return Hostname or "unknown" if unable to determine
 */
std::string get_hostname();

/**
 * @brief Get IP addresses of interfaces that are up
 * @return Vector of IP address strings
 */
std::vector<std::string> get_local_ip_addresses();

/**
 * @brief Get the first non-loopback IPv4 address of an interface that is up
 * @return Address string or std::nullopt if the host has no usable network
 */
std::optional<std::string> get_primary_ipv4_address();

/**
 * @brief Sleep for specified milliseconds
 * @param milliseconds Duration to sleep
 */
void sleep_ms(uint64_t milliseconds);

/**
 * @brief Run an attempt repeatedly until it succeeds or attempts run out
 *
 * Waits base_delay * 2^n before retry n (1-based). Never throws on
 * exhaustion; the caller decides what a failed retry means.
 *
 * @param attempt Callable returning true on success
 * @param max_attempts Maximum number of attempts (at least one is made)
 * @param base_delay Base delay for the exponential backoff
 * @return true if an attempt succeeded
 */
template <typename Attempt>
bool retry_with_backoff(
    Attempt&& attempt,
    size_t max_attempts,
    std::chrono::milliseconds base_delay
) {
    for (size_t n = 1; ; ++n) {
        if (attempt()) {
            return true;
        }
        if (n >= max_attempts) {
            return false;
        }
        std::this_thread::sleep_for(base_delay * (1LL << n));
    }
}

} // namespace utilities
} // namespace lanclip
