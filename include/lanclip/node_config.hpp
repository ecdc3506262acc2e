/**
 * @file node_config.hpp
 * @brief Protocol constants and runtime configuration for LanClip nodes
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <string>
#include <optional>
#include <filesystem>

namespace lanclip {
namespace config {

// ============================================================================
// Protocol Configuration
// ============================================================================

/// Wire protocol version carried in the XVER chunk (1-byte peer name length)
constexpr uint32_t PROTOCOL_VERSION = 1;

/// UDP discovery and TCP transfer port
constexpr uint16_t DEFAULT_PORT = 53300;

/// Default multicast discovery group
constexpr const char* DEFAULT_MULTICAST_GROUP = "239.255.255.250";

/// Default broadcast discovery address
constexpr const char* DEFAULT_BROADCAST_ADDRESS = "255.255.255.255";

/// Maximum peer name length in bytes
constexpr size_t MAX_PEER_NAME_LENGTH = 255;

/// Maximum filename length
constexpr size_t MAX_FILENAME_LENGTH = 255;

/// Maximum discovery datagram size
constexpr size_t MAX_DATAGRAM_SIZE = 2048;

/// Maximum clipboard payload accepted over TCP (256MB)
constexpr size_t MAX_STREAM_MESSAGE_SIZE = 256 * 1024 * 1024;

/// Read buffer for TCP payloads
constexpr size_t STREAM_READ_CHUNK = 64 * 1024;

// ============================================================================
// Timing Configuration
// ============================================================================

/// Engine loop sleep between iterations
constexpr auto TICK_INTERVAL = std::chrono::milliseconds(1000);

/// Quiet period before a network change triggers a rebind
constexpr auto NETWORK_CHANGE_DEBOUNCE = std::chrono::milliseconds(2000);

/// Periodic full reset-and-reannounce
constexpr auto REDISCOVER_INTERVAL = std::chrono::seconds(5 * 60);

/// Longest silence tolerated while reading one inbound TCP payload
constexpr auto STREAM_READ_TIMEOUT = std::chrono::milliseconds(5000);

/// Sleep between would-block polls while reading a TCP payload
constexpr auto STREAM_POLL_INTERVAL = std::chrono::milliseconds(5);

/// Upper bound for establishing an outbound TCP connection
constexpr auto CONNECT_TIMEOUT = std::chrono::milliseconds(3000);

/// Poll interval while waiting for a usable network at startup
constexpr auto NETWORK_WAIT_INTERVAL = std::chrono::milliseconds(2000);

/// Poll interval of the interface monitor
constexpr auto INTERFACE_POLL_INTERVAL = std::chrono::milliseconds(3000);

// ============================================================================
// Command Queue Configuration
// ============================================================================

/// Attempts to acquire the command queue lock before giving up
constexpr size_t LOCK_RETRY_ATTEMPTS = 5;

/// Base delay of the lock retry backoff
constexpr auto LOCK_RETRY_BASE_DELAY = std::chrono::milliseconds(100);

// ============================================================================
// Runtime Configuration
// ============================================================================

/**
 * @brief How discovery announcements are addressed
 */
enum class DiscoveryMode {
    MULTICAST,
    BROADCAST
};

/**
 * @brief Node configuration, loaded from JSON with compiled-in defaults
 */
struct NodeConfig {
    std::string peer_name;                        ///< Announced name (empty: host name)
    uint16_t port = DEFAULT_PORT;                 ///< UDP/TCP port
    DiscoveryMode discovery_mode = DiscoveryMode::MULTICAST;
    std::string multicast_group = DEFAULT_MULTICAST_GROUP;
    std::string broadcast_address = DEFAULT_BROADCAST_ADDRESS;
    std::string interface_address;                ///< Local IPv4 to use (empty: autodetect)

    std::chrono::milliseconds tick_interval = TICK_INTERVAL;
    std::chrono::milliseconds network_change_debounce = NETWORK_CHANGE_DEBOUNCE;
    std::chrono::seconds rediscover_interval = REDISCOVER_INTERVAL;
    std::chrono::milliseconds stream_read_timeout = STREAM_READ_TIMEOUT;
    std::chrono::milliseconds network_wait_interval = NETWORK_WAIT_INTERVAL;
    std::chrono::milliseconds interface_poll_interval = INTERFACE_POLL_INTERVAL;

    std::string log_level = "info";
    std::string log_file;
    std::string data_dir;                         ///< Empty: get_data_directory()

    /**
     * @brief Serialize configuration to JSON
     * @return JSON string
     */
    std::string to_json() const;

    /**
     * @brief Deserialize configuration from JSON
     *
     * Missing keys keep their defaults. Wrong types, unknown discovery
     * modes, invalid log levels or a zero port make the whole load fail.
     *
     * @param json JSON string
     * @return NodeConfig or std::nullopt if invalid
     */
    static std::optional<NodeConfig> from_json(const std::string& json);

    /**
     * @brief Load configuration from a JSON file
     * @param path File path
     * @return NodeConfig or std::nullopt if unreadable or invalid
     */
    static std::optional<NodeConfig> load_from_file(const std::string& path);

    /**
     * @brief Name announced to peers: peer_name or host name, at most 255 bytes
     */
    std::string effective_peer_name() const;
};

std::string discovery_mode_to_string(DiscoveryMode mode);

std::optional<DiscoveryMode> string_to_discovery_mode(const std::string& str);

// ============================================================================
// Directories
// ============================================================================

/**
 * @brief Get LanClip data directory from LANCLIP_DATA_DIR or use default
 * @return Filesystem path to data directory
 */
std::filesystem::path get_data_directory();

/**
 * @brief Get received clipboard content directory
 * @param data_dir Data directory override (empty: get_data_directory())
 */
std::filesystem::path get_received_directory(const std::string& data_dir = "");

/**
 * @brief Get log directory
 * @param data_dir Data directory override (empty: get_data_directory())
 */
std::filesystem::path get_log_directory(const std::string& data_dir = "");

// ============================================================================
// Validation
// ============================================================================

/**
 * @brief Sanitize a peer-supplied filename to prevent path traversal
 *
 * Strips directory components and separators, nul bytes and surrounding
 * whitespace, replaces reserved characters with underscores, rejects "."
 * and "..", and truncates to MAX_FILENAME_LENGTH keeping the extension.
 *
 * @param filename Untrusted filename
 * @return Safe filename, "untitled" if nothing usable remains
 */
std::string sanitize_filename(const std::string& filename);

/**
 * @brief Check if path is within base directory after canonicalization
 */
bool is_safe_path(const std::filesystem::path& path, const std::filesystem::path& base_dir);

} // namespace config
} // namespace lanclip
