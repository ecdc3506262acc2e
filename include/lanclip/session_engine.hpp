/**
 * @file session_engine.hpp
 * @brief Peer discovery and clipboard session engine
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Single-threaded cooperative event loop:
 * - Announce/acknowledge discovery over UDP
 * - Copy requests over UDP, payload delivery over TCP
 * - Periodic rediscovery
 * - Debounced rebind after network changes
 * - Commands from other workers through the CommandQueue
 * - Disconnect broadcast on shutdown
 */

#pragma once

#include "lanclip/collaborators.hpp"
#include "lanclip/command_queue.hpp"
#include "lanclip/message_types.hpp"
#include "lanclip/node_config.hpp"
#include "lanclip/transport.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace lanclip {

/**
 * @brief SessionEngine - owns the peer table and drives the protocol
 *
 * Each tick:
 * 1. Rebind if a network change has settled or the sockets failed
 * 2. Rediscover if the rediscovery interval elapsed
 * 3. Take at most one pending command
 * 4. Handle at most one datagram
 * 5. Handle at most one inbound stream
 * 6. Dispatch the command taken in step 3
 *
 * The peer table is touched only from the thread running the engine.
 */
class SessionEngine {
public:
    /// Label of the static menu entry that triggers rediscovery
    static constexpr const char* DISCOVER_LABEL = DISCOVER_ENTRY_LABEL;

    /**
     * @brief Construct SessionEngine
     * @param config Node configuration
     * @param transport Sockets (opened by start())
     * @param clipboard Local clipboard
     * @param menu Task menu receiving per-peer entries
     * @param commands Queue polled once per tick
     * @throws std::invalid_argument if any collaborator is null
     */
    SessionEngine(
        const config::NodeConfig& config,
        std::shared_ptr<NetworkTransport> transport,
        std::shared_ptr<Clipboard> clipboard,
        std::shared_ptr<TaskMenu> menu,
        std::shared_ptr<CommandQueue> commands
    );

    ~SessionEngine();

    // Disable copy and move
    SessionEngine(const SessionEngine&) = delete;
    SessionEngine& operator=(const SessionEngine&) = delete;
    SessionEngine(SessionEngine&&) = delete;
    SessionEngine& operator=(SessionEngine&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Wait for the network, install the Discover entry, bind, announce
     *
     * A failed bind is not fatal; it is retried on every tick.
     *
     * @return false if STOP arrived while waiting for the network
     */
    bool start();

    /**
     * @brief Run one loop iteration without sleeping
     * @return false once STOP has been dispatched
     */
    bool tick();

    /**
     * @brief start(), then tick every tick_interval until STOP, then shutdown()
     */
    void run();

    /**
     * @brief Remove menu entries, broadcast XDIS, close sockets
     *
     * Idempotent.
     */
    void shutdown();

    bool is_running() const { return running_.load(); }

    // ========================================================================
    // Peer Table
    // ========================================================================

    std::map<asio::ip::address, PeerData> get_peers() const { return peers_; }

    size_t peer_count() const { return peers_.size(); }

    bool has_peer(const asio::ip::address& address) const { return peers_.count(address) > 0; }

    const PeerData& self() const { return self_; }

    /**
     * @brief Menu label for a peer
     */
    static std::string menu_label(const PeerData& peer);

    /**
     * @brief Menu attribute for a peer endpoint ("ip:port")
     */
    static std::string endpoint_attribute(const asio::ip::udp::endpoint& endpoint);

    // ========================================================================
    // Statistics
    // ========================================================================

    uint64_t datagrams_sent() const { return datagrams_sent_.load(); }
    uint64_t datagrams_received() const { return datagrams_received_.load(); }
    uint64_t payloads_sent() const { return payloads_sent_.load(); }
    uint64_t payloads_received() const { return payloads_received_.load(); }
    uint64_t rebinds() const { return rebinds_.load(); }

private:
    using Clock = std::chrono::steady_clock;

    // ========================================================================
    // Loop Steps
    // ========================================================================

    void recover_if_due(Clock::time_point now);
    void rediscover_if_due(Clock::time_point now);
    void poll_datagram();
    void poll_stream();
    bool dispatch_command(const SessionCommand& command, Clock::time_point now);

    // ========================================================================
    // Message Handling
    // ========================================================================

    void handle_datagram(const Datagram& datagram);
    void handle_stream_payload(const std::vector<uint8_t>& bytes);
    void serve_copy_request(const asio::ip::udp::endpoint& requester);

    // ========================================================================
    // Helpers
    // ========================================================================

    bool wait_for_network();
    bool send_message(const asio::ip::udp::endpoint& target, const Message& message);
    void announce();
    void rediscover(Clock::time_point now);
    void reset_epoch();
    void add_peer(const asio::ip::udp::endpoint& sender, const PeerData& peer);
    void remove_peer(const asio::ip::udp::endpoint& sender);
    bool is_self(const asio::ip::address& address) const;

    // ========================================================================
    // Member Variables
    // ========================================================================

    config::NodeConfig config_;
    PeerData self_;

    std::shared_ptr<NetworkTransport> transport_;
    std::shared_ptr<Clipboard> clipboard_;
    std::shared_ptr<TaskMenu> menu_;
    std::shared_ptr<CommandQueue> commands_;

    /// Known peers by address
    std::map<asio::ip::address, PeerData> peers_;

    /// Time of the last unsettled network change notification
    std::optional<Clock::time_point> pending_change_;

    /// Sockets are down and must be rebound on the next tick
    bool needs_rebind_;

    Clock::time_point last_discovery_;

    std::atomic<bool> running_;
    bool shut_down_;

    std::atomic<uint64_t> datagrams_sent_;
    std::atomic<uint64_t> datagrams_received_;
    std::atomic<uint64_t> payloads_sent_;
    std::atomic<uint64_t> payloads_received_;
    std::atomic<uint64_t> rebinds_;
};

} // namespace lanclip
