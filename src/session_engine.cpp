/**
 * @file session_engine.cpp
 * @brief Implementation of the peer discovery and clipboard session engine
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanclip/session_engine.hpp"
#include "lanclip/message_codec.hpp"
#include "lanclip/wire_format.hpp"
#include "lanclip/utilities.hpp"

#include <stdexcept>
#include <thread>

namespace lanclip {

namespace {
    // Address part of an "ip:port" attribute
    std::string attribute_address(const std::string& attribute) {
        auto colon = attribute.find_last_of(':');
        return colon == std::string::npos ? attribute : attribute.substr(0, colon);
    }
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

SessionEngine::SessionEngine(
    const config::NodeConfig& config,
    std::shared_ptr<NetworkTransport> transport,
    std::shared_ptr<Clipboard> clipboard,
    std::shared_ptr<TaskMenu> menu,
    std::shared_ptr<CommandQueue> commands
)
    : config_(config)
    , transport_(std::move(transport))
    , clipboard_(std::move(clipboard))
    , menu_(std::move(menu))
    , commands_(std::move(commands))
    , needs_rebind_(false)
    , last_discovery_(Clock::now())
    , running_(false)
    , shut_down_(false)
    , datagrams_sent_(0)
    , datagrams_received_(0)
    , payloads_sent_(0)
    , payloads_received_(0)
    , rebinds_(0)
{
    if (!transport_) {
        throw std::invalid_argument("SessionEngine: transport cannot be null");
    }
    if (!clipboard_) {
        throw std::invalid_argument("SessionEngine: clipboard cannot be null");
    }
    if (!menu_) {
        throw std::invalid_argument("SessionEngine: menu cannot be null");
    }
    if (!commands_) {
        throw std::invalid_argument("SessionEngine: command queue cannot be null");
    }

    self_.peer_name = config_.effective_peer_name();
}

SessionEngine::~SessionEngine() {
    if (running_.load()) {
        shutdown();
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

bool SessionEngine::start() {
    if (running_.exchange(true)) {
        utilities::log_warn("Engine: Already running");
        return true;
    }

    shut_down_ = false;

    if (!wait_for_network()) {
        running_ = false;
        return false;
    }

    auto commands = commands_;
    MenuEntry discover_entry{DISCOVER_LABEL, "", false};
    if (!menu_->add_static_entry(discover_entry, [commands](const MenuEntry&) {
            commands->push(SessionCommand::discover());
        })) {
        utilities::log_warn("Engine: Could not add Discover menu entry");
    }

    last_discovery_ = Clock::now();

    if (transport_->open()) {
        utilities::log_info("Engine: Online as '" + self_.peer_name + "' on " +
                            transport_->local_address().to_string());
        announce();
    } else {
        utilities::log_error("Engine: Initial bind failed, retrying every tick");
        needs_rebind_ = true;
    }

    return true;
}

bool SessionEngine::tick() {
    if (!running_.load()) {
        return false;
    }

    auto now = Clock::now();

    recover_if_due(now);
    rediscover_if_due(now);

    std::optional<SessionCommand> command = commands_->try_pop();

    poll_datagram();
    poll_stream();

    if (command && !dispatch_command(*command, now)) {
        running_ = false;
        return false;
    }

    return true;
}

void SessionEngine::run() {
    if (!start()) {
        utilities::log_info("Engine: Stopped before the network came up");
        return;
    }

    while (running_.load()) {
        std::this_thread::sleep_for(config_.tick_interval);
        tick();
    }

    shutdown();
}

void SessionEngine::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    running_ = false;

    utilities::log_info("Engine: Shutting down");

    menu_->remove_entry([](const MenuEntry& entry) {
        return !entry.dynamic && entry.label == DISCOVER_LABEL;
    });
    menu_->remove_all_dynamic();

    if (transport_->is_open()) {
        send_message(transport_->discovery_target(), Message::disconnect());
    }

    transport_->close();
    peers_.clear();
}

bool SessionEngine::wait_for_network() {
    while (!transport_->network_available()) {
        utilities::log_info("Engine: Waiting for network...");

        auto deadline = Clock::now() + config_.network_wait_interval;
        do {
            auto command = commands_->try_pop();
            if (command && command->type == SessionCommand::Type::STOP) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } while (Clock::now() < deadline);
    }
    return true;
}

// ============================================================================
// Loop Steps
// ============================================================================

void SessionEngine::recover_if_due(Clock::time_point now) {
    if (!needs_rebind_ && !transport_->is_open()) {
        utilities::log_warn("Engine: Sockets failed, rebuilding");
        needs_rebind_ = true;
    }

    bool settled = pending_change_ && (now - *pending_change_) >= config_.network_change_debounce;
    if (!settled && !needs_rebind_) {
        return;
    }

    if (settled) {
        utilities::log_info("Engine: Network change settled, rebinding");
        pending_change_.reset();
    }

    reset_epoch();

    if (!transport_->open()) {
        utilities::log_error("Engine: Rebind failed, node offline until next attempt");
        needs_rebind_ = true;
        return;
    }

    needs_rebind_ = false;
    rebinds_++;
    last_discovery_ = now;
    announce();
}

void SessionEngine::rediscover_if_due(Clock::time_point now) {
    if (needs_rebind_) {
        return;
    }
    if (now - last_discovery_ >= config_.rediscover_interval) {
        utilities::log_debug("Engine: Periodic rediscovery");
        rediscover(now);
    }
}

void SessionEngine::poll_datagram() {
    if (needs_rebind_) {
        return;
    }

    auto datagram = transport_->receive_datagram();
    if (datagram) {
        handle_datagram(*datagram);
    }
}

void SessionEngine::poll_stream() {
    if (needs_rebind_) {
        return;
    }

    std::vector<uint8_t> bytes;
    TransportStatus status = transport_->accept_and_read(bytes);

    if (status == TransportStatus::BLOCKED) {
        return;
    }
    if (status != TransportStatus::OK) {
        utilities::log_warn("Engine: Inbound stream dropped: " + transport_status_to_string(status));
        return;
    }

    handle_stream_payload(bytes);
}

bool SessionEngine::dispatch_command(const SessionCommand& command, Clock::time_point now) {
    switch (command.type) {
        case SessionCommand::Type::STOP:
            utilities::log_info("Engine: Stop requested");
            return false;

        case SessionCommand::Type::DISCOVER:
            utilities::log_info("Engine: Rediscovery requested");
            rediscover(now);
            break;

        case SessionCommand::Type::NETWORK_CHANGE:
            utilities::log_debug("Engine: Network change notified");
            pending_change_ = now;
            break;

        case SessionCommand::Type::SEND:
            if (command.kind == MessageKind::COPY_REQUEST) {
                utilities::log_info("Engine: Requesting clipboard from " + endpoint_attribute(command.target));
                send_message(command.target, Message::copy_request());
            } else {
                utilities::log_warn("Engine: Unsupported outbound command " +
                                    MessageHelpers::message_kind_to_string(command.kind));
            }
            break;
    }

    return true;
}

// ============================================================================
// Message Handling
// ============================================================================

void SessionEngine::handle_datagram(const Datagram& datagram) {
    datagrams_received_++;

    if (is_self(datagram.sender.address())) {
        return;
    }

    Message message;
    try {
        message = MessageCodec::decode(datagram.data);
    } catch (const CodecError& e) {
        utilities::log_warn("Engine: Malformed datagram from " +
                            datagram.sender.address().to_string() + ": " + e.what());
        return;
    }

    switch (message.kind) {
        case MessageKind::ANNOUNCE:
            send_message(datagram.sender, Message::acknowledge(self_));
            add_peer(datagram.sender, message.peer);
            break;

        case MessageKind::ACKNOWLEDGE:
            add_peer(datagram.sender, message.peer);
            break;

        case MessageKind::DISCONNECT:
            remove_peer(datagram.sender);
            break;

        case MessageKind::COPY_REQUEST:
            serve_copy_request(datagram.sender);
            break;

        case MessageKind::PAYLOAD_POST:
            utilities::log_warn("Engine: Ignoring payload post over UDP from " +
                                datagram.sender.address().to_string());
            break;

        case MessageKind::NO_MESSAGE:
            utilities::log_debug("Engine: Empty envelope from " + datagram.sender.address().to_string());
            break;
    }
}

void SessionEngine::handle_stream_payload(const std::vector<uint8_t>& bytes) {
    Message message;
    try {
        message = MessageCodec::decode(bytes);
    } catch (const CodecError& e) {
        utilities::log_warn("Engine: Malformed stream payload: " + std::string(e.what()));
        return;
    }

    if (message.kind != MessageKind::PAYLOAD_POST) {
        utilities::log_warn("Engine: Unexpected " + MessageHelpers::message_kind_to_string(message.kind) +
                            " on stream, dropping");
        return;
    }

    if (clipboard_->write(message.clipboard)) {
        payloads_received_++;
        utilities::log_info("Engine: Received " + message.clipboard.describe());
    } else {
        utilities::log_error("Engine: Failed to write received " + message.clipboard.describe());
    }
}

void SessionEngine::serve_copy_request(const asio::ip::udp::endpoint& requester) {
    auto content = clipboard_->read();
    if (!content) {
        utilities::log_warn("Engine: Nothing to send to " + requester.address().to_string());
        return;
    }

    std::vector<uint8_t> bytes;
    try {
        bytes = MessageCodec::encode(Message::payload_post(*content));
    } catch (const CodecError& e) {
        utilities::log_error("Engine: Cannot encode clipboard: " + std::string(e.what()));
        return;
    }

    asio::ip::tcp::endpoint target(requester.address(), config_.port);
    TransportStatus status = transport_->connect_and_send(target, bytes);
    if (status != TransportStatus::OK) {
        utilities::log_error("Engine: Delivery to " + requester.address().to_string() +
                             " failed: " + transport_status_to_string(status));
        return;
    }

    payloads_sent_++;
    utilities::log_info("Engine: Sent " + content->describe() + " to " + requester.address().to_string());
}

// ============================================================================
// Helpers
// ============================================================================

bool SessionEngine::send_message(const asio::ip::udp::endpoint& target, const Message& message) {
    std::vector<uint8_t> bytes;
    try {
        bytes = MessageCodec::encode(message);
    } catch (const CodecError& e) {
        utilities::log_error("Engine: Cannot encode " + MessageHelpers::message_kind_to_string(message.kind) +
                             ": " + e.what());
        return false;
    }

    if (!transport_->send_datagram(target, bytes)) {
        return false;
    }

    datagrams_sent_++;
    return true;
}

void SessionEngine::announce() {
    send_message(transport_->discovery_target(), Message::announce(self_));
}

void SessionEngine::rediscover(Clock::time_point now) {
    peers_.clear();
    menu_->remove_all_dynamic();
    last_discovery_ = now;

    if (transport_->is_open()) {
        announce();
    }
}

void SessionEngine::reset_epoch() {
    transport_->close();
    peers_.clear();
    menu_->remove_all_dynamic();
}

void SessionEngine::add_peer(const asio::ip::udp::endpoint& sender, const PeerData& peer) {
    auto it = peers_.find(sender.address());
    if (it != peers_.end()) {
        if (it->second == peer) {
            return;
        }
        // Renamed peer: relabel its entry
        remove_peer(sender);
    }

    peers_[sender.address()] = peer;

    MenuEntry entry{menu_label(peer), endpoint_attribute(sender), true};
    auto commands = commands_;
    asio::ip::udp::endpoint target = sender;
    if (!menu_->add_dynamic_entry(entry, [commands, target](const MenuEntry&) {
            commands->push(SessionCommand::send(target, MessageKind::COPY_REQUEST));
        })) {
        utilities::log_warn("Engine: Could not add menu entry for " + peer.peer_name);
    }

    utilities::log_info("Engine: Peer '" + peer.peer_name + "' at " + sender.address().to_string());
}

void SessionEngine::remove_peer(const asio::ip::udp::endpoint& sender) {
    std::string address = sender.address().to_string();

    if (peers_.erase(sender.address()) > 0) {
        utilities::log_info("Engine: Peer at " + address + " left");
    }

    menu_->remove_entry([&address](const MenuEntry& entry) {
        return entry.dynamic && attribute_address(entry.attributes) == address;
    });
}

bool SessionEngine::is_self(const asio::ip::address& address) const {
    return address.is_loopback() || address == transport_->local_address();
}

std::string SessionEngine::menu_label(const PeerData& peer) {
    return "Copy from " + peer.peer_name;
}

std::string SessionEngine::endpoint_attribute(const asio::ip::udp::endpoint& endpoint) {
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace lanclip
