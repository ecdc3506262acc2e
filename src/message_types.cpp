/**
 * @file message_types.cpp
 * @brief Implementation of message types and payload serialization
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanclip/message_types.hpp"
#include "lanclip/wire_format.hpp"
#include "lanclip/node_config.hpp"
#include "lanclip/utilities.hpp"

namespace lanclip {

// ============================================================================
// Message Kind String Conversion
// ============================================================================

std::string MessageHelpers::message_kind_to_string(MessageKind kind) {
    switch (kind) {
        case MessageKind::ANNOUNCE: return "ANNOUNCE";
        case MessageKind::ACKNOWLEDGE: return "ACKNOWLEDGE";
        case MessageKind::COPY_REQUEST: return "COPY_REQUEST";
        case MessageKind::PAYLOAD_POST: return "PAYLOAD_POST";
        case MessageKind::DISCONNECT: return "DISCONNECT";
        case MessageKind::NO_MESSAGE: return "NO_MESSAGE";
        default: return "UNKNOWN";
    }
}

std::optional<std::string> MessageHelpers::message_kind_to_tag(MessageKind kind) {
    switch (kind) {
        case MessageKind::ANNOUNCE: return std::string(tags::ANNOUNCE);
        case MessageKind::ACKNOWLEDGE: return std::string(tags::ACKNOWLEDGE);
        case MessageKind::COPY_REQUEST: return std::string(tags::COPY_REQUEST);
        case MessageKind::PAYLOAD_POST: return std::string(tags::PAYLOAD_POST);
        case MessageKind::DISCONNECT: return std::string(tags::DISCONNECT);
        default: return std::nullopt;
    }
}

std::optional<MessageKind> MessageHelpers::tag_to_message_kind(const std::string& tag) {
    if (tag == tags::ANNOUNCE) return MessageKind::ANNOUNCE;
    if (tag == tags::ACKNOWLEDGE) return MessageKind::ACKNOWLEDGE;
    if (tag == tags::COPY_REQUEST) return MessageKind::COPY_REQUEST;
    if (tag == tags::PAYLOAD_POST) return MessageKind::PAYLOAD_POST;
    if (tag == tags::DISCONNECT) return MessageKind::DISCONNECT;
    return std::nullopt;
}

std::string MessageHelpers::string_type_to_string(StringType type) {
    switch (type) {
        case StringType::PLAIN_UTF8: return "UTF8P";
        case StringType::HTML: return "HTML";
        default: return "UNKNOWN";
    }
}

std::optional<StringType> MessageHelpers::string_to_string_type(const std::string& str) {
    if (str == "UTF8P") return StringType::PLAIN_UTF8;
    if (str == "HTML") return StringType::HTML;
    return std::nullopt;
}

// ============================================================================
// PeerData
// ============================================================================

std::vector<uint8_t> PeerData::serialize() const {
    if (peer_name.size() > config::MAX_PEER_NAME_LENGTH) {
        throw CodecError(CodecErrorKind::SIZE_OVERFLOW,
                         "peer name is " + std::to_string(peer_name.size()) + " bytes");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(1 + peer_name.size());
    bytes.push_back(static_cast<uint8_t>(peer_name.size()));
    bytes.insert(bytes.end(), peer_name.begin(), peer_name.end());
    return bytes;
}

PeerData PeerData::deserialize(const std::vector<uint8_t>& bytes) {
    ChunkReader reader(bytes);

    uint8_t length = reader.read_byte();
    std::vector<uint8_t> name = reader.read_payload(length);

    if (!utilities::is_valid_utf8(name.data(), name.size())) {
        throw CodecError(CodecErrorKind::INVALID_STRUCTURE, "peer name is not valid UTF-8");
    }

    PeerData peer;
    peer.peer_name.assign(name.begin(), name.end());
    return peer;
}

// ============================================================================
// ClipboardData
// ============================================================================

ClipboardData ClipboardData::text(StringType type, std::vector<uint8_t> bytes) {
    ClipboardData clip;
    clip.kind = ClipboardKind::STRING;
    clip.string_type = type;
    clip.data = std::move(bytes);
    return clip;
}

ClipboardData ClipboardData::text(StringType type, const std::string& str) {
    return text(type, std::vector<uint8_t>(str.begin(), str.end()));
}

ClipboardData ClipboardData::file(const std::string& filename, std::vector<uint8_t> bytes) {
    ClipboardData clip;
    clip.kind = ClipboardKind::FILE;
    clip.filename = filename;
    clip.data = std::move(bytes);
    return clip;
}

std::vector<uint8_t> ClipboardData::serialize() const {
    ChunkWriter inner;
    std::string outer_tag;

    if (kind == ClipboardKind::STRING) {
        outer_tag = tags::STRING;
        inner.write_chunk(tags::STRING_TYPE, MessageHelpers::string_type_to_string(string_type));
    } else {
        outer_tag = tags::FILE;
        inner.write_chunk(tags::FILE_NAME, filename);
    }
    inner.write_chunk(tags::DATA, data);

    ChunkWriter outer;
    outer.write_chunk(outer_tag, inner.data());
    return outer.take();
}

ClipboardData ClipboardData::deserialize(const std::vector<uint8_t>& bytes) {
    ChunkReader outer(bytes);

    std::string outer_tag = outer.read_tag();
    if (outer_tag != tags::STRING && outer_tag != tags::FILE) {
        throw CodecError(CodecErrorKind::UNKNOWN_HEADER, "unexpected clipboard tag " + outer_tag);
    }
    std::vector<uint8_t> body = outer.read_payload(outer.read_length());

    ChunkReader reader(body);
    ClipboardData clip;

    if (outer_tag == tags::STRING) {
        reader.expect_tag(tags::STRING_TYPE);
        std::vector<uint8_t> type_bytes = reader.read_payload(reader.read_length());
        auto type = MessageHelpers::string_to_string_type(std::string(type_bytes.begin(), type_bytes.end()));
        if (!type) {
            throw CodecError(CodecErrorKind::INVALID_STRUCTURE, "unknown string type");
        }
        clip.kind = ClipboardKind::STRING;
        clip.string_type = *type;
    } else {
        reader.expect_tag(tags::FILE_NAME);
        std::vector<uint8_t> name = reader.read_payload(reader.read_length());
        if (!utilities::is_valid_utf8(name.data(), name.size())) {
            throw CodecError(CodecErrorKind::INVALID_STRUCTURE, "filename is not valid UTF-8");
        }
        clip.kind = ClipboardKind::FILE;
        clip.filename.assign(name.begin(), name.end());
    }

    reader.expect_tag(tags::DATA);
    clip.data = reader.read_payload(reader.read_length());

    return clip;
}

std::string ClipboardData::describe() const {
    std::string size = utilities::format_file_size(data.size());
    if (kind == ClipboardKind::FILE) {
        return "file '" + filename + "' (" + size + ")";
    }
    return (string_type == StringType::HTML ? "html (" : "text (") + size + ")";
}

bool ClipboardData::operator==(const ClipboardData& other) const {
    if (kind != other.kind || data != other.data) {
        return false;
    }
    if (kind == ClipboardKind::STRING) {
        return string_type == other.string_type;
    }
    return filename == other.filename;
}

// ============================================================================
// Message
// ============================================================================

Message Message::announce(const PeerData& peer) {
    Message msg;
    msg.kind = MessageKind::ANNOUNCE;
    msg.peer = peer;
    return msg;
}

Message Message::acknowledge(const PeerData& peer) {
    Message msg;
    msg.kind = MessageKind::ACKNOWLEDGE;
    msg.peer = peer;
    return msg;
}

Message Message::copy_request() {
    Message msg;
    msg.kind = MessageKind::COPY_REQUEST;
    return msg;
}

Message Message::payload_post(const ClipboardData& clipboard) {
    Message msg;
    msg.kind = MessageKind::PAYLOAD_POST;
    msg.clipboard = clipboard;
    return msg;
}

Message Message::disconnect() {
    Message msg;
    msg.kind = MessageKind::DISCONNECT;
    return msg;
}

Message Message::no_message() {
    return Message();
}

bool Message::operator==(const Message& other) const {
    if (kind != other.kind) {
        return false;
    }
    switch (kind) {
        case MessageKind::ANNOUNCE:
        case MessageKind::ACKNOWLEDGE:
            return peer == other.peer;
        case MessageKind::PAYLOAD_POST:
            return clipboard == other.clipboard;
        default:
            return true;
    }
}

} // namespace lanclip
