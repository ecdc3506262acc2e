/**
 * @file transport.cpp
 * @brief Implementation of UDP discovery and TCP transfer adapters
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanclip/transport.hpp"
#include "lanclip/utilities.hpp"

#include <algorithm>
#include <thread>

namespace lanclip {

namespace {
    bool is_would_block(const asio::error_code& ec) {
        return ec == asio::error::would_block || ec == asio::error::try_again;
    }

    // ICMP feedback from an earlier send, not a socket failure
    bool is_transient_datagram_error(const asio::error_code& ec) {
        return ec == asio::error::connection_refused || ec == asio::error::connection_reset;
    }
}

std::string transport_status_to_string(TransportStatus status) {
    switch (status) {
        case TransportStatus::OK: return "OK";
        case TransportStatus::BLOCKED: return "BLOCKED";
        case TransportStatus::CONNECT_ERROR: return "CONNECT_ERROR";
        case TransportStatus::WRITE_ERROR: return "WRITE_ERROR";
        case TransportStatus::READ_ERROR: return "READ_ERROR";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// DiscoverySocket
// ============================================================================

DiscoverySocket::DiscoverySocket(asio::io_context& io_context)
    : socket_(io_context)
    , recv_buffer_{}
    , failed_(false)
{
}

DiscoverySocket::~DiscoverySocket() {
    close();
}

bool DiscoverySocket::bind(
    const asio::ip::address_v4& local_ip,
    uint16_t port,
    config::DiscoveryMode mode,
    const asio::ip::address_v4& multicast_group
) {
    close();

    try {
        socket_.open(asio::ip::udp::v4());
        socket_.set_option(asio::socket_base::reuse_address(true));
        socket_.bind(asio::ip::udp::endpoint(asio::ip::address_v4::any(), port));

        if (mode == config::DiscoveryMode::MULTICAST) {
            socket_.set_option(asio::ip::multicast::join_group(multicast_group, local_ip));
            socket_.set_option(asio::ip::multicast::outbound_interface(local_ip));
        } else {
            socket_.set_option(asio::socket_base::broadcast(true));
        }

        socket_.non_blocking(true);
        failed_ = false;

        utilities::log_info("Transport: Discovery socket bound on port " +
                            std::to_string(local_port()) + " (" +
                            config::discovery_mode_to_string(mode) + " via " +
                            local_ip.to_string() + ")");
        return true;

    } catch (const std::exception& e) {
        utilities::log_error("Transport: Failed to bind discovery socket: " + std::string(e.what()));
        close();
        return false;
    }
}

std::optional<Datagram> DiscoverySocket::receive() {
    if (!socket_.is_open() || failed_) {
        return std::nullopt;
    }

    asio::error_code ec;
    Datagram datagram;
    size_t received = socket_.receive_from(asio::buffer(recv_buffer_), datagram.sender, 0, ec);

    if (ec) {
        if (!is_would_block(ec) && !is_transient_datagram_error(ec)) {
            utilities::log_error("Transport: Discovery receive failed: " + ec.message());
            failed_ = true;
        }
        return std::nullopt;
    }

    if (received == 0) {
        return std::nullopt;
    }

    datagram.data.assign(recv_buffer_.begin(), recv_buffer_.begin() + received);
    return datagram;
}

bool DiscoverySocket::send_to(const asio::ip::udp::endpoint& target, const std::vector<uint8_t>& bytes) {
    if (!socket_.is_open()) {
        utilities::log_warn("Transport: Discovery socket not open, dropping datagram to " +
                            target.address().to_string());
        return false;
    }

    if (bytes.size() > config::MAX_DATAGRAM_SIZE) {
        utilities::log_error("Transport: Datagram of " + std::to_string(bytes.size()) +
                             " bytes exceeds limit");
        return false;
    }

    asio::error_code ec;
    socket_.send_to(asio::buffer(bytes), target, 0, ec);
    if (ec) {
        utilities::log_warn("Transport: Failed to send datagram to " +
                            target.address().to_string() + ": " + ec.message());
        return false;
    }

    return true;
}

void DiscoverySocket::close() {
    if (socket_.is_open()) {
        asio::error_code ec;
        socket_.close(ec);
    }
}

bool DiscoverySocket::is_open() const {
    return socket_.is_open();
}

uint16_t DiscoverySocket::local_port() const {
    asio::error_code ec;
    auto endpoint = socket_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

// ============================================================================
// StreamListener
// ============================================================================

StreamListener::StreamListener(
    asio::io_context& io_context,
    std::chrono::milliseconds read_timeout,
    size_t max_message_size
)
    : io_context_(io_context)
    , acceptor_(io_context)
    , read_timeout_(read_timeout)
    , max_message_size_(max_message_size)
{
}

StreamListener::~StreamListener() {
    close();
}

bool StreamListener::bind(const asio::ip::address& address, uint16_t port) {
    close();

    try {
        asio::ip::tcp::endpoint endpoint(address, port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        acceptor_.non_blocking(true);

        utilities::log_info("Transport: Stream listener on " + address.to_string() + ":" +
                            std::to_string(local_port()));
        return true;

    } catch (const std::exception& e) {
        utilities::log_error("Transport: Failed to bind stream listener: " + std::string(e.what()));
        close();
        return false;
    }
}

TransportStatus StreamListener::accept_and_read(std::vector<uint8_t>& out) {
    out.clear();

    if (!acceptor_.is_open()) {
        return TransportStatus::BLOCKED;
    }

    asio::ip::tcp::socket socket(io_context_);
    asio::ip::tcp::endpoint peer;
    asio::error_code ec;

    acceptor_.accept(socket, peer, ec);
    if (ec) {
        if (is_would_block(ec)) {
            return TransportStatus::BLOCKED;
        }
        utilities::log_error("Transport: Accept failed: " + ec.message());
        return TransportStatus::READ_ERROR;
    }

    socket.non_blocking(true, ec);
    if (ec) {
        utilities::log_error("Transport: Cannot make stream non-blocking: " + ec.message());
        return TransportStatus::READ_ERROR;
    }

    std::vector<uint8_t> chunk(config::STREAM_READ_CHUNK);
    auto deadline = std::chrono::steady_clock::now() + read_timeout_;

    while (true) {
        size_t n = socket.read_some(asio::buffer(chunk), ec);

        if (ec == asio::error::eof) {
            break;
        }

        if (is_would_block(ec)) {
            if (std::chrono::steady_clock::now() >= deadline) {
                utilities::log_error("Transport: Timed out reading from " + peer.address().to_string() +
                                     " after " + utilities::format_file_size(out.size()));
                return TransportStatus::READ_ERROR;
            }
            std::this_thread::sleep_for(config::STREAM_POLL_INTERVAL);
            continue;
        }

        if (ec) {
            utilities::log_error("Transport: Read from " + peer.address().to_string() +
                                 " failed: " + ec.message());
            return TransportStatus::READ_ERROR;
        }

        if (out.size() + n > max_message_size_) {
            utilities::log_error("Transport: Payload from " + peer.address().to_string() +
                                 " exceeds " + utilities::format_file_size(max_message_size_));
            out.clear();
            return TransportStatus::READ_ERROR;
        }

        out.insert(out.end(), chunk.begin(), chunk.begin() + n);
        deadline = std::chrono::steady_clock::now() + read_timeout_;
    }

    utilities::log_debug("Transport: Received " + utilities::format_file_size(out.size()) +
                         " from " + peer.address().to_string());
    return TransportStatus::OK;
}

void StreamListener::close() {
    if (acceptor_.is_open()) {
        asio::error_code ec;
        acceptor_.close(ec);
    }
}

bool StreamListener::is_open() const {
    return acceptor_.is_open();
}

uint16_t StreamListener::local_port() const {
    asio::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

// ============================================================================
// Outbound Stream
// ============================================================================

TransportStatus connect_and_send(
    const asio::ip::tcp::endpoint& target,
    const std::vector<uint8_t>& bytes,
    std::chrono::milliseconds connect_timeout
) {
    asio::io_context io_context;
    asio::ip::tcp::socket socket(io_context);

    asio::error_code connect_ec = asio::error::would_block;
    socket.async_connect(target, [&connect_ec](const asio::error_code& ec) {
        connect_ec = ec;
    });
    io_context.run_for(connect_timeout);

    if (connect_ec == asio::error::would_block) {
        utilities::log_error("Transport: Connect to " + target.address().to_string() + " timed out");
        return TransportStatus::CONNECT_ERROR;
    }
    if (connect_ec) {
        utilities::log_error("Transport: Connect to " + target.address().to_string() +
                             " failed: " + connect_ec.message());
        return TransportStatus::CONNECT_ERROR;
    }

    size_t written = 0;
    while (written < bytes.size()) {
        asio::error_code ec;
        size_t n = socket.write_some(asio::buffer(bytes.data() + written, bytes.size() - written), ec);
        if (ec) {
            utilities::log_error("Transport: Write to " + target.address().to_string() + " failed after " +
                                 std::to_string(written) + " bytes: " + ec.message());
            return TransportStatus::WRITE_ERROR;
        }
        written += n;
        utilities::log_debug("Transport: Wrote " + std::to_string(written) + "/" +
                             std::to_string(bytes.size()) + " bytes");
    }

    asio::error_code ec;
    socket.shutdown(asio::ip::tcp::socket::shutdown_send, ec);
    socket.close(ec);

    return TransportStatus::OK;
}

// ============================================================================
// AsioTransport
// ============================================================================

AsioTransport::AsioTransport(const config::NodeConfig& config)
    : config_(config)
    , io_context_()
    , discovery_(io_context_)
    , listener_(io_context_, config.stream_read_timeout)
{
}

AsioTransport::~AsioTransport() {
    close();
}

std::optional<asio::ip::address_v4> AsioTransport::resolve_local_address() const {
    try {
        if (!config_.interface_address.empty()) {
            return asio::ip::make_address_v4(config_.interface_address);
        }
        auto primary = utilities::get_primary_ipv4_address();
        if (!primary) {
            return std::nullopt;
        }
        return asio::ip::make_address_v4(*primary);

    } catch (const std::exception& e) {
        utilities::log_error("Transport: Invalid interface address: " + std::string(e.what()));
        return std::nullopt;
    }
}

bool AsioTransport::open() {
    close();

    auto local = resolve_local_address();
    if (!local) {
        utilities::log_error("Transport: No usable IPv4 interface");
        return false;
    }

    asio::ip::address_v4 group;
    try {
        group = asio::ip::make_address_v4(config_.multicast_group);
        if (config_.discovery_mode == config::DiscoveryMode::MULTICAST) {
            discovery_target_ = asio::ip::udp::endpoint(group, config_.port);
        } else {
            discovery_target_ = asio::ip::udp::endpoint(
                asio::ip::make_address_v4(config_.broadcast_address), config_.port);
        }
    } catch (const std::exception& e) {
        utilities::log_error("Transport: Invalid discovery address: " + std::string(e.what()));
        return false;
    }

    if (!discovery_.bind(*local, config_.port, config_.discovery_mode, group)) {
        return false;
    }

    if (!listener_.bind(asio::ip::address_v4::any(), config_.port)) {
        discovery_.close();
        return false;
    }

    local_address_ = *local;
    return true;
}

void AsioTransport::close() {
    discovery_.close();
    listener_.close();
}

bool AsioTransport::is_open() const {
    return discovery_.is_open() && !discovery_.failed() && listener_.is_open();
}

asio::ip::address AsioTransport::local_address() const {
    return local_address_;
}

asio::ip::udp::endpoint AsioTransport::discovery_target() const {
    return discovery_target_;
}

std::optional<Datagram> AsioTransport::receive_datagram() {
    return discovery_.receive();
}

bool AsioTransport::send_datagram(const asio::ip::udp::endpoint& target, const std::vector<uint8_t>& bytes) {
    return discovery_.send_to(target, bytes);
}

TransportStatus AsioTransport::accept_and_read(std::vector<uint8_t>& out) {
    return listener_.accept_and_read(out);
}

TransportStatus AsioTransport::connect_and_send(const asio::ip::tcp::endpoint& target,
                                                const std::vector<uint8_t>& bytes) {
    return lanclip::connect_and_send(target, bytes);
}

bool AsioTransport::network_available() const {
    if (!config_.interface_address.empty()) {
        auto addresses = utilities::get_local_ip_addresses();
        return std::find(addresses.begin(), addresses.end(), config_.interface_address) != addresses.end();
    }
    return utilities::get_primary_ipv4_address().has_value();
}

} // namespace lanclip
