/**
 * @file test_interface_monitor.cpp
 * @brief Unit tests for the interface-polling network monitor
 *
 * Tests the interface monitor including:
 * - Initialization rules
 * - Change detection independent of address order
 * - Background polling and prompt stop
 */

#include <gtest/gtest.h>
#include "lanclip/interface_monitor.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace lanclip;

// Test fixture for interface monitor tests
class InterfaceMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        addresses_ = {"192.168.1.10", "10.0.0.4"};
    }

    AddressSource source() {
        return [this]() {
            std::lock_guard<std::mutex> lock(mutex_);
            return addresses_;
        };
    }

    void set_addresses(std::vector<std::string> addresses) {
        std::lock_guard<std::mutex> lock(mutex_);
        addresses_ = std::move(addresses);
    }

    std::mutex mutex_;
    std::vector<std::string> addresses_;
};

TEST_F(InterfaceMonitorTest, InitRequiresCallback) {
    InterfaceMonitor monitor(std::chrono::milliseconds(10), source());
    EXPECT_FALSE(monitor.init(nullptr));
    EXPECT_FALSE(monitor.start_listening());
}

TEST_F(InterfaceMonitorTest, NoChangeNoCallback) {
    int changes = 0;
    InterfaceMonitor monitor(std::chrono::milliseconds(10), source());
    ASSERT_TRUE(monitor.init([&]() { changes++; }));

    EXPECT_FALSE(monitor.poll_once());
    EXPECT_EQ(changes, 0);
}

TEST_F(InterfaceMonitorTest, ReorderedAddressesAreNotAChange) {
    int changes = 0;
    InterfaceMonitor monitor(std::chrono::milliseconds(10), source());
    ASSERT_TRUE(monitor.init([&]() { changes++; }));

    set_addresses({"10.0.0.4", "192.168.1.10"});
    EXPECT_FALSE(monitor.poll_once());
    EXPECT_EQ(changes, 0);
}

TEST_F(InterfaceMonitorTest, AddressChangeNotifiesOnce) {
    int changes = 0;
    InterfaceMonitor monitor(std::chrono::milliseconds(10), source());
    ASSERT_TRUE(monitor.init([&]() { changes++; }));

    set_addresses({"192.168.1.11", "10.0.0.4"});
    EXPECT_TRUE(monitor.poll_once());
    EXPECT_FALSE(monitor.poll_once());
    EXPECT_EQ(changes, 1);

    set_addresses({});
    EXPECT_TRUE(monitor.poll_once());
    EXPECT_EQ(changes, 2);
}

TEST_F(InterfaceMonitorTest, BackgroundPollingDetectsChange) {
    std::atomic<int> changes{0};
    InterfaceMonitor monitor(std::chrono::milliseconds(10), source());
    ASSERT_TRUE(monitor.init([&]() { changes++; }));
    ASSERT_TRUE(monitor.start_listening());
    EXPECT_TRUE(monitor.is_listening());
    EXPECT_FALSE(monitor.init([]() {}));

    set_addresses({"172.16.0.2"});

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (changes.load() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    monitor.stop();
    EXPECT_FALSE(monitor.is_listening());
    EXPECT_EQ(changes.load(), 1);
}

TEST_F(InterfaceMonitorTest, StopIsPromptWithLongInterval) {
    InterfaceMonitor monitor(std::chrono::hours(1), source());
    ASSERT_TRUE(monitor.init([]() {}));
    ASSERT_TRUE(monitor.start_listening());

    auto start = std::chrono::steady_clock::now();
    monitor.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));

    monitor.stop();
}

TEST_F(InterfaceMonitorTest, DefaultSourceReadsHostInterfaces) {
    InterfaceMonitor monitor(std::chrono::milliseconds(10));
    ASSERT_TRUE(monitor.init([]() {}));
    EXPECT_FALSE(monitor.poll_once());
}
