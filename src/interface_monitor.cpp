/**
 * @file interface_monitor.cpp
 * @brief Implementation of the interface-polling network monitor
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanclip/interface_monitor.hpp"
#include "lanclip/utilities.hpp"

#include <algorithm>

namespace lanclip {

InterfaceMonitor::InterfaceMonitor(std::chrono::milliseconds poll_interval, AddressSource source)
    : poll_interval_(poll_interval)
    , source_(source ? std::move(source) : AddressSource(utilities::get_local_ip_addresses))
    , running_(false)
{
}

InterfaceMonitor::~InterfaceMonitor() {
    stop();
}

bool InterfaceMonitor::init(NetworkChangeCallback callback) {
    if (running_.load()) {
        utilities::log_warn("Monitor: Cannot init while listening");
        return false;
    }
    if (!callback) {
        utilities::log_error("Monitor: Callback cannot be empty");
        return false;
    }

    callback_ = std::move(callback);
    last_snapshot_ = source_();
    std::sort(last_snapshot_.begin(), last_snapshot_.end());
    return true;
}

bool InterfaceMonitor::start_listening() {
    if (!callback_) {
        utilities::log_error("Monitor: start_listening before init");
        return false;
    }
    if (running_.exchange(true)) {
        return true;
    }

    try {
        thread_ = std::thread(&InterfaceMonitor::monitor_loop, this);
    } catch (const std::exception& e) {
        utilities::log_error("Monitor: Failed to start thread: " + std::string(e.what()));
        running_ = false;
        return false;
    }

    utilities::log_info("Monitor: Watching " + std::to_string(last_snapshot_.size()) + " interface addresses");
    return true;
}

void InterfaceMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        running_ = false;
    }
    wait_cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

bool InterfaceMonitor::poll_once() {
    std::vector<std::string> snapshot = source_();
    std::sort(snapshot.begin(), snapshot.end());

    if (snapshot == last_snapshot_) {
        return false;
    }

    utilities::log_info("Monitor: Interface addresses changed (" + std::to_string(last_snapshot_.size()) +
                        " -> " + std::to_string(snapshot.size()) + ")");
    last_snapshot_ = std::move(snapshot);

    if (callback_) {
        callback_();
    }
    return true;
}

void InterfaceMonitor::monitor_loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            wait_cv_.wait_for(lock, poll_interval_, [this]() { return !running_.load(); });
        }
        if (!running_.load()) {
            break;
        }

        try {
            poll_once();
        } catch (const std::exception& e) {
            utilities::log_error("Monitor: Poll failed: " + std::string(e.what()));
        }
    }
}

} // namespace lanclip
