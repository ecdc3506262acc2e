/**
 * @file transport.hpp
 * @brief UDP discovery and TCP transfer adapters
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every operation here is non-blocking or bounded by a timeout so that the
 * session engine loop never stalls. Asio errors never escape: they are
 * logged and turned into a TransportStatus, std::nullopt or false.
 */

#pragma once

#include "lanclip/node_config.hpp"

#include <asio.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanclip {

/**
 * @brief Outcome of a stream operation
 */
enum class TransportStatus {
    OK,              ///< Operation completed
    BLOCKED,         ///< Nothing ready (expected, not an error)
    CONNECT_ERROR,   ///< Could not reach the peer
    WRITE_ERROR,     ///< Connection broke while sending
    READ_ERROR       ///< Connection broke, timed out or overflowed while reading
};

std::string transport_status_to_string(TransportStatus status);

/**
 * @brief A received discovery datagram
 */
struct Datagram {
    asio::ip::udp::endpoint sender;   ///< Source address and port
    std::vector<uint8_t> data;        ///< Datagram contents
};

/**
 * @brief Non-blocking UDP socket for discovery traffic
 */
class DiscoverySocket {
public:
    explicit DiscoverySocket(asio::io_context& io_context);
    ~DiscoverySocket();

    DiscoverySocket(const DiscoverySocket&) = delete;
    DiscoverySocket& operator=(const DiscoverySocket&) = delete;
    DiscoverySocket(DiscoverySocket&&) = delete;
    DiscoverySocket& operator=(DiscoverySocket&&) = delete;

    /**
     * @brief Bind to 0.0.0.0:port
     *
     * Multicast mode joins the group on the local interface; broadcast mode
     * enables SO_BROADCAST. An already open socket is closed first.
     *
     * @param local_ip Local interface address
     * @param port Port (0 picks an ephemeral port)
     * @param mode Discovery addressing mode
     * @param multicast_group Group to join in multicast mode
     * @return true if bound
     */
    bool bind(const asio::ip::address_v4& local_ip,
              uint16_t port,
              config::DiscoveryMode mode,
              const asio::ip::address_v4& multicast_group);

    /**
     * @brief Receive one datagram if one is pending
     * @return Datagram, or std::nullopt if nothing is ready or on error
     */
    std::optional<Datagram> receive();

    /**
     * @brief Send a datagram, best effort
     * @return true if the datagram was handed to the OS
     */
    bool send_to(const asio::ip::udp::endpoint& target, const std::vector<uint8_t>& bytes);

    void close();

    bool is_open() const;

    /**
     * @brief Whether a hard receive/send error occurred since bind
     */
    bool failed() const { return failed_; }

    uint16_t local_port() const;

private:
    asio::ip::udp::socket socket_;
    std::array<uint8_t, config::MAX_DATAGRAM_SIZE> recv_buffer_;
    bool failed_;
};

/**
 * @brief Non-blocking TCP acceptor that reads one payload per connection
 */
class StreamListener {
public:
    /**
     * @param io_context Context owning the sockets
     * @param read_timeout Longest silence tolerated while reading a connection
     * @param max_message_size Upper bound for one payload
     */
    StreamListener(asio::io_context& io_context,
                   std::chrono::milliseconds read_timeout,
                   size_t max_message_size = config::MAX_STREAM_MESSAGE_SIZE);
    ~StreamListener();

    StreamListener(const StreamListener&) = delete;
    StreamListener& operator=(const StreamListener&) = delete;
    StreamListener(StreamListener&&) = delete;
    StreamListener& operator=(StreamListener&&) = delete;

    /**
     * @brief Bind and listen, non-blocking accept
     * @param address Local address
     * @param port Port (0 picks an ephemeral port)
     */
    bool bind(const asio::ip::address& address, uint16_t port);

    /**
     * @brief Accept one pending connection and read it to end of stream
     *
     * The read timeout restarts whenever bytes arrive, so only a stalled
     * sender is cut off.
     * @param out Receives the payload (cleared first)
     * @return OK, BLOCKED if no connection is pending, READ_ERROR
     */
    TransportStatus accept_and_read(std::vector<uint8_t>& out);

    void close();

    bool is_open() const;

    uint16_t local_port() const;

private:
    asio::io_context& io_context_;
    asio::ip::tcp::acceptor acceptor_;
    std::chrono::milliseconds read_timeout_;
    size_t max_message_size_;
};

/**
 * @brief Open a short-lived connection, write all bytes, close
 *
 * @param target Peer endpoint
 * @param bytes Payload
 * @param connect_timeout Upper bound for establishing the connection
 * @return OK, CONNECT_ERROR or WRITE_ERROR
 */
TransportStatus connect_and_send(const asio::ip::tcp::endpoint& target,
                                 const std::vector<uint8_t>& bytes,
                                 std::chrono::milliseconds connect_timeout = config::CONNECT_TIMEOUT);

// ============================================================================
// Network Transport
// ============================================================================

/**
 * @brief Sockets of one network epoch, as seen by the session engine
 */
class NetworkTransport {
public:
    virtual ~NetworkTransport() = default;

    /**
     * @brief (Re)bind discovery and stream sockets
     * @return true if both sockets are bound
     */
    virtual bool open() = 0;

    virtual void close() = 0;

    /**
     * @brief Whether the sockets are bound and have not failed
     */
    virtual bool is_open() const = 0;

    /**
     * @brief Address of the local interface in use
     */
    virtual asio::ip::address local_address() const = 0;

    /**
     * @brief Multicast group or broadcast address announcements go to
     */
    virtual asio::ip::udp::endpoint discovery_target() const = 0;

    virtual std::optional<Datagram> receive_datagram() = 0;

    virtual bool send_datagram(const asio::ip::udp::endpoint& target,
                               const std::vector<uint8_t>& bytes) = 0;

    virtual TransportStatus accept_and_read(std::vector<uint8_t>& out) = 0;

    virtual TransportStatus connect_and_send(const asio::ip::tcp::endpoint& target,
                                             const std::vector<uint8_t>& bytes) = 0;

    /**
     * @brief Whether a usable (non-loopback IPv4) interface is up
     */
    virtual bool network_available() const = 0;
};

/**
 * @brief NetworkTransport over real asio sockets
 */
class AsioTransport : public NetworkTransport {
public:
    explicit AsioTransport(const config::NodeConfig& config);
    ~AsioTransport() override;

    AsioTransport(const AsioTransport&) = delete;
    AsioTransport& operator=(const AsioTransport&) = delete;
    AsioTransport(AsioTransport&&) = delete;
    AsioTransport& operator=(AsioTransport&&) = delete;

    bool open() override;
    void close() override;
    bool is_open() const override;
    asio::ip::address local_address() const override;
    asio::ip::udp::endpoint discovery_target() const override;
    std::optional<Datagram> receive_datagram() override;
    bool send_datagram(const asio::ip::udp::endpoint& target,
                       const std::vector<uint8_t>& bytes) override;
    TransportStatus accept_and_read(std::vector<uint8_t>& out) override;
    TransportStatus connect_and_send(const asio::ip::tcp::endpoint& target,
                                     const std::vector<uint8_t>& bytes) override;
    bool network_available() const override;

private:
    std::optional<asio::ip::address_v4> resolve_local_address() const;

    config::NodeConfig config_;
    asio::io_context io_context_;
    DiscoverySocket discovery_;
    StreamListener listener_;

    asio::ip::address local_address_;
    asio::ip::udp::endpoint discovery_target_;
};

} // namespace lanclip
