/**
 * @file test_transport.cpp
 * @brief Unit tests for UDP discovery and TCP transfer adapters
 *
 * Tests transport adapters over loopback including:
 * - Non-blocking accept with nothing pending
 * - Connect, send and read to end of stream
 * - Connection refused, idle read timeout and oversized payloads
 * - Slow senders that keep data flowing
 * - Datagram send/receive and the datagram size limit
 * - AsioTransport open/close lifecycle
 */

#include <gtest/gtest.h>
#include "lanclip/transport.hpp"

#include <chrono>
#include <thread>
#include <vector>

using namespace lanclip;

namespace {
    const asio::ip::address kLoopback = asio::ip::make_address("127.0.0.1");

    std::optional<Datagram> receive_within(DiscoverySocket& socket, std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            auto datagram = socket.receive();
            if (datagram) {
                return datagram;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return std::nullopt;
    }

    TransportStatus accept_within(StreamListener& listener, std::vector<uint8_t>& out,
                                  std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        TransportStatus status = TransportStatus::BLOCKED;
        while (std::chrono::steady_clock::now() < deadline) {
            status = listener.accept_and_read(out);
            if (status != TransportStatus::BLOCKED) {
                return status;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return status;
    }
}

// Test fixture for stream tests
class StreamTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        listener_ = std::make_unique<StreamListener>(io_context_, std::chrono::milliseconds(2000));
        ASSERT_TRUE(listener_->bind(kLoopback, 0));
        port_ = listener_->local_port();
        ASSERT_NE(port_, 0);
    }

    void TearDown() override {
        listener_.reset();
    }

    asio::ip::tcp::endpoint target() const {
        return asio::ip::tcp::endpoint(kLoopback, port_);
    }

    asio::io_context io_context_;
    std::unique_ptr<StreamListener> listener_;
    uint16_t port_ = 0;
};

// ============================================================================
// Status Tests
// ============================================================================

TEST(TransportStatusTest, Names) {
    EXPECT_EQ(transport_status_to_string(TransportStatus::OK), "OK");
    EXPECT_EQ(transport_status_to_string(TransportStatus::BLOCKED), "BLOCKED");
    EXPECT_EQ(transport_status_to_string(TransportStatus::CONNECT_ERROR), "CONNECT_ERROR");
    EXPECT_EQ(transport_status_to_string(TransportStatus::READ_ERROR), "READ_ERROR");
}

// ============================================================================
// Stream Tests
// ============================================================================

TEST_F(StreamTransportTest, AcceptWithNothingPendingIsBlocked) {
    std::vector<uint8_t> out = {1, 2, 3};
    EXPECT_EQ(listener_->accept_and_read(out), TransportStatus::BLOCKED);
    EXPECT_TRUE(out.empty());
}

TEST_F(StreamTransportTest, SendThenRead) {
    std::vector<uint8_t> payload = {'X', 'C', 'O', 'P', 0, 0, 0, 0};
    ASSERT_EQ(connect_and_send(target(), payload), TransportStatus::OK);

    std::vector<uint8_t> out;
    EXPECT_EQ(accept_within(*listener_, out, std::chrono::milliseconds(2000)), TransportStatus::OK);
    EXPECT_EQ(out, payload);
}

TEST_F(StreamTransportTest, LargePayloadArrivesWhole) {
    std::vector<uint8_t> payload(3 * 1024 * 1024 + 17);
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>(i * 31);
    }

    TransportStatus send_status = TransportStatus::BLOCKED;
    std::thread sender([&]() {
        send_status = connect_and_send(target(), payload);
    });

    std::vector<uint8_t> out;
    TransportStatus read_status = accept_within(*listener_, out, std::chrono::milliseconds(5000));
    sender.join();

    EXPECT_EQ(send_status, TransportStatus::OK);
    EXPECT_EQ(read_status, TransportStatus::OK);
    EXPECT_EQ(out, payload);
}

TEST_F(StreamTransportTest, EmptyPayload) {
    ASSERT_EQ(connect_and_send(target(), {}), TransportStatus::OK);

    std::vector<uint8_t> out = {9};
    EXPECT_EQ(accept_within(*listener_, out, std::chrono::milliseconds(2000)), TransportStatus::OK);
    EXPECT_TRUE(out.empty());
}

TEST_F(StreamTransportTest, ConnectToClosedPortFails) {
    listener_->close();
    EXPECT_FALSE(listener_->is_open());

    EXPECT_EQ(connect_and_send(target(), {1, 2, 3}, std::chrono::milliseconds(1000)),
              TransportStatus::CONNECT_ERROR);
}

TEST_F(StreamTransportTest, StalledSenderTimesOut) {
    StreamListener listener(io_context_, std::chrono::milliseconds(100));
    ASSERT_TRUE(listener.bind(kLoopback, 0));

    asio::ip::tcp::socket client(io_context_);
    client.connect(asio::ip::tcp::endpoint(kLoopback, listener.local_port()));
    asio::write(client, asio::buffer(std::vector<uint8_t>{1, 2}));

    std::vector<uint8_t> out;
    EXPECT_EQ(accept_within(listener, out, std::chrono::milliseconds(2000)), TransportStatus::READ_ERROR);
}

TEST_F(StreamTransportTest, SlowSteadySenderOutlastsTimeout) {
    StreamListener listener(io_context_, std::chrono::milliseconds(200), 1024 * 1024);
    ASSERT_TRUE(listener.bind(kLoopback, 0));
    uint16_t port = listener.local_port();

    constexpr size_t kChunks = 15;
    constexpr size_t kChunkSize = 1024;

    std::thread sender([port]() {
        asio::io_context io_context;
        asio::ip::tcp::socket client(io_context);
        client.connect(asio::ip::tcp::endpoint(kLoopback, port));
        std::vector<uint8_t> chunk(kChunkSize, 0x5A);
        for (size_t i = 0; i < kChunks; ++i) {
            asio::write(client, asio::buffer(chunk));
            std::this_thread::sleep_for(std::chrono::milliseconds(40));
        }
        client.shutdown(asio::ip::tcp::socket::shutdown_send);
        client.close();
    });

    std::vector<uint8_t> out;
    TransportStatus status = accept_within(listener, out, std::chrono::milliseconds(5000));
    sender.join();

    EXPECT_EQ(status, TransportStatus::OK);
    EXPECT_EQ(out.size(), kChunks * kChunkSize);
}

TEST_F(StreamTransportTest, OversizedPayloadRejected) {
    StreamListener listener(io_context_, std::chrono::milliseconds(2000), 16);
    ASSERT_TRUE(listener.bind(kLoopback, 0));

    ASSERT_EQ(connect_and_send(asio::ip::tcp::endpoint(kLoopback, listener.local_port()),
                               std::vector<uint8_t>(100, 0xAB)),
              TransportStatus::OK);

    std::vector<uint8_t> out;
    EXPECT_EQ(accept_within(listener, out, std::chrono::milliseconds(2000)), TransportStatus::READ_ERROR);
    EXPECT_TRUE(out.empty());
}

// ============================================================================
// Discovery Socket Tests
// ============================================================================

TEST(DiscoverySocketTest, ReceiveWithNothingPending) {
    asio::io_context io_context;
    DiscoverySocket socket(io_context);
    ASSERT_TRUE(socket.bind(kLoopback.to_v4(), 0, config::DiscoveryMode::BROADCAST,
                            asio::ip::address_v4::any()));

    EXPECT_FALSE(socket.receive().has_value());
    EXPECT_FALSE(socket.failed());
}

TEST(DiscoverySocketTest, DatagramToOwnPort) {
    asio::io_context io_context;
    DiscoverySocket socket(io_context);
    ASSERT_TRUE(socket.bind(kLoopback.to_v4(), 0, config::DiscoveryMode::BROADCAST,
                            asio::ip::address_v4::any()));

    asio::ip::udp::endpoint self(kLoopback, socket.local_port());
    std::vector<uint8_t> bytes = {'X', 'C', 'O', 'P', 0, 0, 0, 0};
    ASSERT_TRUE(socket.send_to(self, bytes));

    auto datagram = receive_within(socket, std::chrono::milliseconds(2000));
    ASSERT_TRUE(datagram.has_value());
    EXPECT_EQ(datagram->data, bytes);
    EXPECT_EQ(datagram->sender.address(), kLoopback);
    EXPECT_EQ(datagram->sender.port(), socket.local_port());
}

TEST(DiscoverySocketTest, OversizedDatagramRefused) {
    asio::io_context io_context;
    DiscoverySocket socket(io_context);
    ASSERT_TRUE(socket.bind(kLoopback.to_v4(), 0, config::DiscoveryMode::BROADCAST,
                            asio::ip::address_v4::any()));

    asio::ip::udp::endpoint self(kLoopback, socket.local_port());
    EXPECT_FALSE(socket.send_to(self, std::vector<uint8_t>(config::MAX_DATAGRAM_SIZE + 1, 0)));
    EXPECT_TRUE(socket.send_to(self, std::vector<uint8_t>(config::MAX_DATAGRAM_SIZE, 0)));
}

TEST(DiscoverySocketTest, ClosedSocket) {
    asio::io_context io_context;
    DiscoverySocket socket(io_context);

    EXPECT_FALSE(socket.is_open());
    EXPECT_FALSE(socket.receive().has_value());
    EXPECT_FALSE(socket.send_to(asio::ip::udp::endpoint(kLoopback, 9), {1}));
    EXPECT_EQ(socket.local_port(), 0);
}

// ============================================================================
// AsioTransport Tests
// ============================================================================

TEST(AsioTransportTest, OpenOnLoopbackInterface) {
    config::NodeConfig cfg;
    cfg.port = 0;
    cfg.discovery_mode = config::DiscoveryMode::BROADCAST;
    cfg.interface_address = "127.0.0.1";
    cfg.broadcast_address = "127.255.255.255";

    AsioTransport transport(cfg);
    EXPECT_FALSE(transport.is_open());

    ASSERT_TRUE(transport.open());
    EXPECT_TRUE(transport.is_open());
    EXPECT_EQ(transport.local_address(), kLoopback);
    EXPECT_EQ(transport.discovery_target().address(), asio::ip::make_address("127.255.255.255"));

    std::vector<uint8_t> out;
    EXPECT_EQ(transport.accept_and_read(out), TransportStatus::BLOCKED);

    transport.close();
    EXPECT_FALSE(transport.is_open());
}

TEST(AsioTransportTest, ReopenAfterClose) {
    config::NodeConfig cfg;
    cfg.port = 0;
    cfg.discovery_mode = config::DiscoveryMode::BROADCAST;
    cfg.interface_address = "127.0.0.1";

    AsioTransport transport(cfg);
    ASSERT_TRUE(transport.open());
    transport.close();
    EXPECT_TRUE(transport.open());
    EXPECT_TRUE(transport.is_open());
}

TEST(AsioTransportTest, InvalidInterfaceAddress) {
    config::NodeConfig cfg;
    cfg.port = 0;
    cfg.interface_address = "not-an-address";

    AsioTransport transport(cfg);
    EXPECT_FALSE(transport.open());
    EXPECT_FALSE(transport.is_open());
}

TEST(AsioTransportTest, InvalidBroadcastAddress) {
    config::NodeConfig cfg;
    cfg.port = 0;
    cfg.discovery_mode = config::DiscoveryMode::BROADCAST;
    cfg.interface_address = "127.0.0.1";
    cfg.broadcast_address = "300.1.1.1";

    AsioTransport transport(cfg);
    EXPECT_FALSE(transport.open());
}
