/**
 * @file utilities.cpp
 * @brief Implementation of common utility functions for LanClip
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanclip/utilities.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <mutex>

#include <unistd.h>
#include <sys/socket.h>
#include <netdb.h>
#include <net/if.h>
#include <arpa/inet.h>
#include <ifaddrs.h>

namespace lanclip {
namespace utilities {

namespace {
    // Global logger instance
    std::shared_ptr<spdlog::logger> g_logger;
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

    std::shared_ptr<spdlog::logger> logger() {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        return g_logger;
    }
}

// ============================================================================
// LOGGING FUNCTIONS
// ============================================================================

void initialize_logging(const std::string& log_file, LogLevel level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(level));
        sinks.push_back(console_sink);

        // Rotating file sink, 10MB per file, 3 files max
        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 10, 3);
            file_sink->set_level(to_spdlog_level(level));
            sinks.push_back(file_sink);
        }

        auto new_logger = std::make_shared<spdlog::logger>("lanclip", sinks.begin(), sinks.end());
        new_logger->set_level(to_spdlog_level(level));
        new_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

        {
            std::lock_guard<std::mutex> lock(g_logger_mutex);
            g_logger = new_logger;
        }
        spdlog::set_default_logger(new_logger);

    } catch (const spdlog::spdlog_ex& ex) {
        std::fprintf(stderr, "Log initialization failed: %s\n", ex.what());
    }
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lowered = to_lowercase(trim_string(name));
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

void log(LogLevel level, const std::string& message) {
    auto current = logger();
    if (!current) {
        initialize_logging();
        current = logger();
        if (!current) {
            return;
        }
    }

    switch (level) {
        case LogLevel::DEBUG:    current->debug(message); break;
        case LogLevel::INFO:     current->info(message); break;
        case LogLevel::WARN:     current->warn(message); break;
        case LogLevel::ERROR:    current->error(message); break;
        case LogLevel::CRITICAL: current->critical(message); break;
    }
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
// FORMATTING FUNCTIONS
// ============================================================================

std::string format_file_size(uint64_t size) {
    if (size < 1024) {
        return std::to_string(size) + " B";
    }

    const char* units[] = {"KB", "MB", "GB", "TB"};
    int unit_index = -1;
    double size_d = static_cast<double>(size);

    while (size_d >= 1024.0 && unit_index < 3) {
        size_d /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size_d << " " << units[unit_index];
    return oss.str();
}

// ============================================================================
// FILE I/O FUNCTIONS
// ============================================================================

std::optional<std::vector<uint8_t>> read_file_binary(const std::string& file_path) {
    try {
        std::ifstream file(file_path, std::ios::binary | std::ios::ate);
        if (!file.is_open()) {
            log_error("Failed to open file for binary reading: " + file_path);
            return std::nullopt;
        }

        auto size = file.tellg();
        if (size < 0) {
            log_error("Failed to determine size of file: " + file_path);
            return std::nullopt;
        }
        file.seekg(0, std::ios::beg);

        std::vector<uint8_t> buffer(static_cast<size_t>(size));
        if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
            log_error("Failed to read binary file: " + file_path);
            return std::nullopt;
        }

        return buffer;

    } catch (const std::exception& ex) {
        log_error("Exception reading binary file " + file_path + ": " + ex.what());
        return std::nullopt;
    }
}

bool write_file_binary(const std::string& file_path, const std::vector<uint8_t>& content) {
    try {
        std::filesystem::path path(file_path);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            log_error("Failed to open file for binary writing: " + file_path);
            return false;
        }

        file.write(reinterpret_cast<const char*>(content.data()),
                   static_cast<std::streamsize>(content.size()));
        return file.good();

    } catch (const std::exception& ex) {
        log_error("Exception writing binary file " + file_path + ": " + ex.what());
        return false;
    }
}

// ============================================================================
// STRING MANIPULATION FUNCTIONS
// ============================================================================

std::string trim_string(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
        [](unsigned char ch) { return std::isspace(ch); });

    auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char ch) { return std::isspace(ch); }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::string to_lowercase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool is_valid_utf8(const uint8_t* data, size_t size) {
    size_t i = 0;
    while (i < size) {
        uint8_t lead = data[i];

        if (lead < 0x80) {
            i++;
            continue;
        }

        size_t length;
        uint32_t code_point;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (size - i < length) {
            return false;
        }

        for (size_t k = 1; k < length; ++k) {
            uint8_t cont = data[i + k];
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cont & 0x3F);
        }

        // Overlong encodings, surrogates, out of range
        if ((length == 2 && code_point < 0x80) ||
            (length == 3 && code_point < 0x800) ||
            (length == 4 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }

        i += length;
    }

    return true;
}

bool is_valid_utf8(const std::string& str) {
    return is_valid_utf8(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

std::string truncate_utf8(const std::string& str, size_t max_bytes) {
    if (str.size() <= max_bytes) {
        return str;
    }

    size_t cut = max_bytes;
    // Step back over continuation bytes so the cut lands on a lead byte
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
        cut--;
    }
    return str.substr(0, cut);
}

std::string extract_plain_text_from_html(const std::string& html) {
    std::string result;
    result.reserve(html.size());

    bool in_tag = false;
    for (char c : html) {
        if (c == '<') {
            in_tag = true;
            continue;
        }
        if (c == '>') {
            in_tag = false;
            continue;
        }
        if (!in_tag) {
            result += c;
        }
    }

    return result;
}

// ============================================================================
// ENVIRONMENT/NETWORK FUNCTIONS
// ============================================================================

std::string get_env(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

std::string get_hostname() {
    char hostname[256];

    if (gethostname(hostname, sizeof(hostname)) != 0) {
        return "unknown";
    }
    hostname[sizeof(hostname) - 1] = '\0';

    return std::string(hostname);
}

std::vector<std::string> get_local_ip_addresses() {
    std::vector<std::string> addresses;

    struct ifaddrs *ifaddr, *ifa;

    if (getifaddrs(&ifaddr) == -1) {
        return addresses;
    }

    for (ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || !(ifa->ifa_flags & IFF_UP)) continue;

        int family = ifa->ifa_addr->sa_family;

        if (family == AF_INET || family == AF_INET6) {
            char host[NI_MAXHOST];

            int result = getnameinfo(ifa->ifa_addr,
                (family == AF_INET) ? sizeof(struct sockaddr_in) : sizeof(struct sockaddr_in6),
                host, NI_MAXHOST, nullptr, 0, NI_NUMERICHOST);

            if (result == 0) {
                addresses.push_back(std::string(host));
            }
        }
    }

    freeifaddrs(ifaddr);

    std::sort(addresses.begin(), addresses.end());
    return addresses;
}

std::optional<std::string> get_primary_ipv4_address() {
    struct ifaddrs *ifaddr, *ifa;

    if (getifaddrs(&ifaddr) == -1) {
        return std::nullopt;
    }

    std::optional<std::string> found;

    for (ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) continue;
        if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) continue;

        char host[INET_ADDRSTRLEN];
        auto* sin = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        if (inet_ntop(AF_INET, &sin->sin_addr, host, sizeof(host)) != nullptr) {
            found = std::string(host);
            break;
        }
    }

    freeifaddrs(ifaddr);
    return found;
}

// ============================================================================
// OTHER UTILITY FUNCTIONS
// ============================================================================

void sleep_ms(uint64_t milliseconds) {
    std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
}

} // namespace utilities
} // namespace lanclip
