/**
 * @file command_queue.hpp
 * @brief Single-consumer command queue feeding the session engine
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Producers (menu clicks, network monitor callback) never block for long:
 * a contended lock is retried with exponential backoff and the command is
 * dropped once the attempts are exhausted. The engine polls with try_pop.
 */

#pragma once

#include "lanclip/message_types.hpp"
#include "lanclip/node_config.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace lanclip {

/**
 * @brief Command from another worker to the session engine
 */
struct SessionCommand {
    enum class Type {
        STOP,            ///< Leave the engine loop
        DISCOVER,        ///< Reset peers and re-announce
        NETWORK_CHANGE,  ///< Raw network change notification (debounced)
        SEND             ///< Send message kind to target
    };

    Type type = Type::STOP;
    asio::ip::udp::endpoint target;                  ///< SEND only
    MessageKind kind = MessageKind::NO_MESSAGE;      ///< SEND only

    static SessionCommand stop();
    static SessionCommand discover();
    static SessionCommand network_change();
    static SessionCommand send(const asio::ip::udp::endpoint& target, MessageKind kind);

    static std::string type_to_string(Type type);
};

/**
 * @brief Mutex-guarded FIFO of SessionCommands
 */
class CommandQueue {
public:
    /**
     * @param max_attempts Lock attempts before a push gives up
     * @param base_delay Backoff base delay between attempts
     */
    explicit CommandQueue(size_t max_attempts = config::LOCK_RETRY_ATTEMPTS,
                          std::chrono::milliseconds base_delay = config::LOCK_RETRY_BASE_DELAY);

    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;
    CommandQueue(CommandQueue&&) = delete;
    CommandQueue& operator=(CommandQueue&&) = delete;

    /**
     * @brief Enqueue a command, best effort
     * @return false if the lock stayed contended and the command was dropped
     */
    bool push(const SessionCommand& command);

    /**
     * @brief Dequeue the oldest command without blocking
     * @return Command, or std::nullopt if empty or the lock is contended
     */
    std::optional<SessionCommand> try_pop();

    size_t size() const;

    bool empty() const;

    /**
     * @brief Commands dropped because the lock could not be acquired
     */
    size_t dropped_count() const;

private:
    mutable std::mutex mutex_;
    std::deque<SessionCommand> queue_;
    std::atomic<size_t> dropped_;

    size_t max_attempts_;
    std::chrono::milliseconds base_delay_;
};

} // namespace lanclip
