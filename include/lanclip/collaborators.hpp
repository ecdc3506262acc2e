/**
 * @file collaborators.hpp
 * @brief Host-side interfaces consumed by the session engine
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The engine is written against these abstract classes only. Each has one
 * concrete host implementation (SpoolClipboard, ConsoleMenu,
 * InterfaceMonitor) and in-memory fakes in the tests.
 */

#pragma once

#include "lanclip/message_types.hpp"

#include <functional>
#include <optional>
#include <string>

namespace lanclip {

// ============================================================================
// Clipboard
// ============================================================================

/**
 * @brief Local clipboard reader/writer
 *
 * Called synchronously from the engine worker.
 */
class Clipboard {
public:
    virtual ~Clipboard() = default;

    /**
     * @brief Read current clipboard contents
     * @return Contents, or std::nullopt if empty or unreadable (logged)
     */
    virtual std::optional<ClipboardData> read() = 0;

    /**
     * @brief Replace clipboard contents
     * @return true on success
     */
    virtual bool write(const ClipboardData& data) = 0;
};

// ============================================================================
// Task Menu
// ============================================================================

/**
 * @brief One menu entry
 */
struct MenuEntry {
    std::string label;        ///< Text shown to the user
    std::string attributes;   ///< Opaque tag, the peer endpoint for dynamic entries
    bool dynamic = false;     ///< Added by the engine per peer

    bool operator==(const MenuEntry& other) const {
        return label == other.label && attributes == other.attributes && dynamic == other.dynamic;
    }
};

/// Label of the static entry that triggers discovery
constexpr const char* DISCOVER_ENTRY_LABEL = "Discover";

/// Invoked on the menu worker when an entry is clicked
using MenuCallback = std::function<void(const MenuEntry&)>;

/// Selects entries for removal
using MenuMatcher = std::function<bool(const MenuEntry&)>;

/**
 * @brief User-facing menu of actions
 *
 * Mutators are called from the engine worker while run() blocks the host
 * worker, so implementations synchronize internally.
 */
class TaskMenu {
public:
    virtual ~TaskMenu() = default;

    virtual bool add_dynamic_entry(const MenuEntry& entry, MenuCallback on_click) = 0;

    virtual bool add_static_entry(const MenuEntry& entry, MenuCallback on_click) = 0;

    /**
     * @brief Remove every entry the matcher accepts
     * @return true if at least one entry was removed
     */
    virtual bool remove_entry(const MenuMatcher& matcher) = 0;

    virtual bool remove_all_dynamic() = 0;

    /**
     * @brief Run the menu loop until stop() or the user quits
     */
    virtual void run() = 0;

    virtual void stop() = 0;
};

// ============================================================================
// Network Monitor
// ============================================================================

/// Invoked on the monitor's own thread when the network changes
using NetworkChangeCallback = std::function<void()>;

/**
 * @brief Notifier of network configuration changes
 */
class NetworkMonitor {
public:
    virtual ~NetworkMonitor() = default;

    virtual bool init(NetworkChangeCallback callback) = 0;

    virtual bool start_listening() = 0;

    virtual void stop() = 0;
};

} // namespace lanclip
