/**
 * @file node_config.cpp
 * @brief Implementation of node configuration loading and validation
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanclip/node_config.hpp"
#include "lanclip/utilities.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

using json = nlohmann::json;

namespace lanclip {
namespace config {

namespace {
    template <typename Duration>
    void read_duration(const json& j, const char* key, Duration& out, bool allow_zero = false) {
        if (!j.contains(key)) {
            return;
        }
        auto count = j.at(key).get<int64_t>();
        if (count < 0) {
            throw std::invalid_argument(std::string(key) + " must not be negative");
        }
        if (count == 0 && !allow_zero) {
            throw std::invalid_argument(std::string(key) + " must be positive");
        }
        out = Duration(count);
    }

    void read_string(const json& j, const char* key, std::string& out) {
        if (j.contains(key)) {
            out = j.at(key).get<std::string>();
        }
    }
}

// ============================================================================
// Discovery Mode
// ============================================================================

std::string discovery_mode_to_string(DiscoveryMode mode) {
    switch (mode) {
        case DiscoveryMode::MULTICAST: return "multicast";
        case DiscoveryMode::BROADCAST: return "broadcast";
        default: return "unknown";
    }
}

std::optional<DiscoveryMode> string_to_discovery_mode(const std::string& str) {
    std::string lowered = utilities::to_lowercase(str);
    if (lowered == "multicast") return DiscoveryMode::MULTICAST;
    if (lowered == "broadcast") return DiscoveryMode::BROADCAST;
    return std::nullopt;
}

// ============================================================================
// NodeConfig
// ============================================================================

std::string NodeConfig::to_json() const {
    json j;
    j["peer_name"] = peer_name;
    j["port"] = port;
    j["discovery_mode"] = discovery_mode_to_string(discovery_mode);
    j["multicast_group"] = multicast_group;
    j["broadcast_address"] = broadcast_address;
    j["interface_address"] = interface_address;
    j["tick_interval_ms"] = tick_interval.count();
    j["network_change_debounce_ms"] = network_change_debounce.count();
    j["rediscover_interval_s"] = rediscover_interval.count();
    j["stream_read_timeout_ms"] = stream_read_timeout.count();
    j["network_wait_interval_ms"] = network_wait_interval.count();
    j["interface_poll_interval_ms"] = interface_poll_interval.count();
    j["log_level"] = log_level;
    j["log_file"] = log_file;
    j["data_dir"] = data_dir;

    return j.dump(2);
}

std::optional<NodeConfig> NodeConfig::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            utilities::log_error("Config: Top-level JSON value must be an object");
            return std::nullopt;
        }

        NodeConfig cfg;

        read_string(j, "peer_name", cfg.peer_name);
        if (cfg.peer_name.size() > MAX_PEER_NAME_LENGTH || !utilities::is_valid_utf8(cfg.peer_name)) {
            utilities::log_error("Config: peer_name must be valid UTF-8 of at most 255 bytes");
            return std::nullopt;
        }

        if (j.contains("port")) {
            auto port = j.at("port").get<int64_t>();
            if (port <= 0 || port > 65535) {
                utilities::log_error("Config: port out of range: " + std::to_string(port));
                return std::nullopt;
            }
            cfg.port = static_cast<uint16_t>(port);
        }

        if (j.contains("discovery_mode")) {
            auto mode = string_to_discovery_mode(j.at("discovery_mode").get<std::string>());
            if (!mode) {
                utilities::log_error("Config: Unknown discovery_mode");
                return std::nullopt;
            }
            cfg.discovery_mode = *mode;
        }

        read_string(j, "multicast_group", cfg.multicast_group);
        read_string(j, "broadcast_address", cfg.broadcast_address);
        read_string(j, "interface_address", cfg.interface_address);

        read_duration(j, "tick_interval_ms", cfg.tick_interval);
        read_duration(j, "network_change_debounce_ms", cfg.network_change_debounce, true);
        read_duration(j, "rediscover_interval_s", cfg.rediscover_interval);
        read_duration(j, "stream_read_timeout_ms", cfg.stream_read_timeout);
        read_duration(j, "network_wait_interval_ms", cfg.network_wait_interval);
        read_duration(j, "interface_poll_interval_ms", cfg.interface_poll_interval);

        read_string(j, "log_level", cfg.log_level);
        if (!utilities::parse_log_level(cfg.log_level)) {
            utilities::log_error("Config: Unknown log_level: " + cfg.log_level);
            return std::nullopt;
        }
        read_string(j, "log_file", cfg.log_file);
        read_string(j, "data_dir", cfg.data_dir);

        return cfg;

    } catch (const std::exception& e) {
        utilities::log_error("Config: Failed to parse configuration: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::optional<NodeConfig> NodeConfig::load_from_file(const std::string& path) {
    auto content = utilities::read_file_binary(path);
    if (!content) {
        return std::nullopt;
    }
    return from_json(std::string(content->begin(), content->end()));
}

std::string NodeConfig::effective_peer_name() const {
    std::string name = peer_name.empty() ? utilities::get_hostname() : peer_name;
    return utilities::truncate_utf8(name, MAX_PEER_NAME_LENGTH);
}

// ============================================================================
// Directories
// ============================================================================

std::filesystem::path get_data_directory() {
    const char* env_data_dir = std::getenv("LANCLIP_DATA_DIR");

    std::filesystem::path data_dir;
    if (env_data_dir != nullptr && std::strlen(env_data_dir) > 0) {
        data_dir = env_data_dir;
    } else {
        const char* home = std::getenv("HOME");
        if (home != nullptr && std::strlen(home) > 0) {
            data_dir = std::filesystem::path(home) / ".lanclip";
        } else {
            data_dir = std::filesystem::temp_directory_path() / "lanclip";
        }
    }

    if (!std::filesystem::exists(data_dir)) {
        std::filesystem::create_directories(data_dir);
    }

    return data_dir;
}

std::filesystem::path get_received_directory(const std::string& data_dir) {
    std::filesystem::path base = data_dir.empty() ? get_data_directory() : std::filesystem::path(data_dir);
    std::filesystem::path received_dir = base / "received";

    if (!std::filesystem::exists(received_dir)) {
        std::filesystem::create_directories(received_dir);
    }

    return received_dir;
}

std::filesystem::path get_log_directory(const std::string& data_dir) {
    std::filesystem::path base = data_dir.empty() ? get_data_directory() : std::filesystem::path(data_dir);
    std::filesystem::path log_dir = base / "logs";

    if (!std::filesystem::exists(log_dir)) {
        std::filesystem::create_directories(log_dir);
    }

    return log_dir;
}

// ============================================================================
// Validation
// ============================================================================

std::string sanitize_filename(const std::string& filename) {
    // Keep only the last path component
    std::string sanitized = filename;
    auto last_sep = sanitized.find_last_of("/\\");
    if (last_sep != std::string::npos) {
        sanitized = sanitized.substr(last_sep + 1);
    }

    sanitized.erase(
        std::remove(sanitized.begin(), sanitized.end(), '\0'),
        sanitized.end()
    );

    sanitized = utilities::trim_string(sanitized);

    const std::string dangerous_chars = "<>:\"|?*;";
    for (char& c : sanitized) {
        if (dangerous_chars.find(c) != std::string::npos ||
            std::iscntrl(static_cast<unsigned char>(c))) {
            c = '_';
        }
    }

    if (sanitized.empty() || sanitized == "." || sanitized == "..") {
        return "untitled";
    }

    if (sanitized.length() > MAX_FILENAME_LENGTH) {
        auto dot = sanitized.find_last_of('.');
        std::string extension;
        if (dot != std::string::npos && dot > 0 && sanitized.length() - dot <= 16) {
            extension = sanitized.substr(dot);
        }
        sanitized = utilities::truncate_utf8(
            sanitized.substr(0, sanitized.length() - extension.length()),
            MAX_FILENAME_LENGTH - extension.length()) + extension;
    }

    return sanitized;
}

bool is_safe_path(const std::filesystem::path& path, const std::filesystem::path& base_dir) {
    try {
        std::filesystem::path canonical_path = std::filesystem::weakly_canonical(path);
        std::filesystem::path canonical_base = std::filesystem::weakly_canonical(base_dir);

        auto relative = std::filesystem::relative(canonical_path, canonical_base);

        if (relative.empty() || relative.native().rfind("..", 0) == 0) {
            return false;
        }

        return true;

    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
}

} // namespace config
} // namespace lanclip
