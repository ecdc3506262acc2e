/**
 * @file message_types.hpp
 * @brief Message type definitions and payload serialization for LanClip
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Domain messages exchanged between nodes:
 * - Discovery messages (UDP): announce, acknowledge, disconnect
 * - Copy requests (UDP unicast)
 * - Clipboard payload posts (TCP)
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace lanclip {

/**
 * @brief Message kinds in the LanClip protocol
 */
enum class MessageKind {
    ANNOUNCE,        ///< XCON: node announces presence (PeerData)
    ACKNOWLEDGE,     ///< XACN: reply to an announce (PeerData)
    COPY_REQUEST,    ///< XCPY: ask a peer to push its clipboard to us
    PAYLOAD_POST,    ///< XPST: clipboard contents (ClipboardData)
    DISCONNECT,      ///< XDIS: node is leaving
    NO_MESSAGE       ///< Envelope decoded but carried nothing actionable
};

/**
 * @brief Identity a node announces to its peers
 *
 * Serialized as a 1-byte length followed by raw UTF-8 bytes.
 */
struct PeerData {
    std::string peer_name;          ///< Display name, at most 255 bytes of UTF-8

    /**
     * @brief Serialize to wire bytes
     * @throws CodecError SIZE_OVERFLOW if the name exceeds 255 bytes
     */
    std::vector<uint8_t> serialize() const;

    /**
     * @brief Deserialize from wire bytes
     * @throws CodecError OUT_OF_BOUNDS, INVALID_STRUCTURE
     */
    static PeerData deserialize(const std::vector<uint8_t>& bytes);

    bool operator==(const PeerData& other) const { return peer_name == other.peer_name; }
    bool operator!=(const PeerData& other) const { return !(*this == other); }
};

/**
 * @brief Clipboard content category
 */
enum class ClipboardKind {
    STRING,          ///< XSTR: textual content
    FILE             ///< XFIL: named file
};

/**
 * @brief Textual clipboard flavour (XTYP value)
 */
enum class StringType {
    PLAIN_UTF8,      ///< "UTF8P"
    HTML             ///< "HTML"
};

/**
 * @brief Clipboard contents carried by a payload post
 */
struct ClipboardData {
    ClipboardKind kind = ClipboardKind::STRING;
    StringType string_type = StringType::PLAIN_UTF8;  ///< Meaningful for STRING only
    std::string filename;                             ///< Meaningful for FILE only
    std::vector<uint8_t> data;                        ///< Raw payload bytes

    static ClipboardData text(StringType type, std::vector<uint8_t> bytes);
    static ClipboardData text(StringType type, const std::string& str);
    static ClipboardData file(const std::string& filename, std::vector<uint8_t> bytes);

    /**
     * @brief Serialize to an XSTR or XFIL chunk
     * @throws CodecError TOO_BIG
     */
    std::vector<uint8_t> serialize() const;

    /**
     * @brief Deserialize from an XSTR or XFIL chunk
     *
     * Inner chunks must appear in order: XTYP then XDAT, or XFME then XDAT.
     *
     * @throws CodecError OUT_OF_BOUNDS, UNKNOWN_HEADER, INVALID_STRUCTURE
     */
    static ClipboardData deserialize(const std::vector<uint8_t>& bytes);

    /**
     * @brief Short human-readable summary for logs
     */
    std::string describe() const;

    bool operator==(const ClipboardData& other) const;
    bool operator!=(const ClipboardData& other) const { return !(*this == other); }
};

/**
 * @brief A decoded or to-be-encoded protocol message
 *
 * Only the field matching the kind is meaningful: peer for
 * ANNOUNCE/ACKNOWLEDGE, clipboard for PAYLOAD_POST.
 */
struct Message {
    MessageKind kind = MessageKind::NO_MESSAGE;
    PeerData peer;
    ClipboardData clipboard;

    static Message announce(const PeerData& peer);
    static Message acknowledge(const PeerData& peer);
    static Message copy_request();
    static Message payload_post(const ClipboardData& clipboard);
    static Message disconnect();
    static Message no_message();

    bool operator==(const Message& other) const;
    bool operator!=(const Message& other) const { return !(*this == other); }
};

/**
 * @brief Helper functions for message kinds and wire names
 */
class MessageHelpers {
public:
    static std::string message_kind_to_string(MessageKind kind);

    /**
     * @brief Wire tag for a message kind
     * @return Tag, or std::nullopt for NO_MESSAGE
     */
    static std::optional<std::string> message_kind_to_tag(MessageKind kind);

    static std::optional<MessageKind> tag_to_message_kind(const std::string& tag);

    static std::string string_type_to_string(StringType type);

    static std::optional<StringType> string_to_string_type(const std::string& str);
};

} // namespace lanclip
