/**
 * @file interface_monitor.hpp
 * @brief Network change notifier polling local interface addresses
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "lanclip/collaborators.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lanclip {

/// Snapshot of the host's interface addresses
using AddressSource = std::function<std::vector<std::string>()>;

/**
 * @brief NetworkMonitor that polls interface addresses on its own thread
 *
 * Any difference between two consecutive snapshots invokes the callback,
 * whatever the direction of the change.
 */
class InterfaceMonitor : public NetworkMonitor {
public:
    /**
     * @param poll_interval Time between snapshots
     * @param source Address snapshot provider (default: utilities::get_local_ip_addresses)
     */
    explicit InterfaceMonitor(std::chrono::milliseconds poll_interval, AddressSource source = nullptr);

    ~InterfaceMonitor() override;

    // Disable copy and move
    InterfaceMonitor(const InterfaceMonitor&) = delete;
    InterfaceMonitor& operator=(const InterfaceMonitor&) = delete;
    InterfaceMonitor(InterfaceMonitor&&) = delete;
    InterfaceMonitor& operator=(InterfaceMonitor&&) = delete;

    bool init(NetworkChangeCallback callback) override;

    bool start_listening() override;

    void stop() override;

    /**
     * @brief Take one snapshot and compare with the previous one
     * @return true if the address set changed (callback invoked)
     */
    bool poll_once();

    bool is_listening() const { return running_.load(); }

private:
    void monitor_loop();

    std::chrono::milliseconds poll_interval_;
    AddressSource source_;
    NetworkChangeCallback callback_;
    std::vector<std::string> last_snapshot_;

    std::thread thread_;
    std::atomic<bool> running_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

} // namespace lanclip
