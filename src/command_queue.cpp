/**
 * @file command_queue.cpp
 * @brief Implementation of the session command queue
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanclip/command_queue.hpp"
#include "lanclip/utilities.hpp"

namespace lanclip {

// ============================================================================
// SessionCommand
// ============================================================================

SessionCommand SessionCommand::stop() {
    SessionCommand cmd;
    cmd.type = Type::STOP;
    return cmd;
}

SessionCommand SessionCommand::discover() {
    SessionCommand cmd;
    cmd.type = Type::DISCOVER;
    return cmd;
}

SessionCommand SessionCommand::network_change() {
    SessionCommand cmd;
    cmd.type = Type::NETWORK_CHANGE;
    return cmd;
}

SessionCommand SessionCommand::send(const asio::ip::udp::endpoint& target, MessageKind kind) {
    SessionCommand cmd;
    cmd.type = Type::SEND;
    cmd.target = target;
    cmd.kind = kind;
    return cmd;
}

std::string SessionCommand::type_to_string(Type type) {
    switch (type) {
        case Type::STOP: return "STOP";
        case Type::DISCOVER: return "DISCOVER";
        case Type::NETWORK_CHANGE: return "NETWORK_CHANGE";
        case Type::SEND: return "SEND";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// CommandQueue
// ============================================================================

CommandQueue::CommandQueue(size_t max_attempts, std::chrono::milliseconds base_delay)
    : dropped_(0)
    , max_attempts_(max_attempts == 0 ? 1 : max_attempts)
    , base_delay_(base_delay)
{
}

bool CommandQueue::push(const SessionCommand& command) {
    bool pushed = utilities::retry_with_backoff([this, &command]() {
        std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
        if (!lock.owns_lock()) {
            return false;
        }
        queue_.push_back(command);
        return true;
    }, max_attempts_, base_delay_);

    if (!pushed) {
        dropped_++;
        utilities::log_warn("Engine: Dropped " + SessionCommand::type_to_string(command.type) +
                            " command, queue lock contended");
    }

    return pushed;
}

std::optional<SessionCommand> CommandQueue::try_pop() {
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock() || queue_.empty()) {
        return std::nullopt;
    }

    SessionCommand command = queue_.front();
    queue_.pop_front();
    return command;
}

size_t CommandQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool CommandQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

size_t CommandQueue::dropped_count() const {
    return dropped_.load();
}

} // namespace lanclip
