/**
 * @file message_codec.cpp
 * @brief Implementation of envelope encoding and decoding
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanclip/message_codec.hpp"
#include "lanclip/wire_format.hpp"
#include "lanclip/utilities.hpp"

namespace lanclip {

namespace {
    std::vector<uint8_t> encode_u32(uint32_t value) {
        return {
            static_cast<uint8_t>(value >> 24),
            static_cast<uint8_t>(value >> 16),
            static_cast<uint8_t>(value >> 8),
            static_cast<uint8_t>(value)
        };
    }

    uint32_t decode_version(const std::vector<uint8_t>& payload) {
        if (payload.size() != 4) {
            throw CodecError(CodecErrorKind::INVALID_STRUCTURE,
                             "version chunk must be 4 bytes, got " + std::to_string(payload.size()));
        }
        return (static_cast<uint32_t>(payload[0]) << 24) |
               (static_cast<uint32_t>(payload[1]) << 16) |
               (static_cast<uint32_t>(payload[2]) << 8) |
               static_cast<uint32_t>(payload[3]);
    }
}

// ============================================================================
// Encoding
// ============================================================================

std::vector<uint8_t> MessageCodec::encode(const Message& message, uint32_t protocol_version) {
    auto tag = MessageHelpers::message_kind_to_tag(message.kind);
    if (!tag) {
        throw CodecError(CodecErrorKind::INVALID_STRUCTURE,
                         "cannot encode " + MessageHelpers::message_kind_to_string(message.kind));
    }

    ChunkWriter body;
    body.write_chunk(tags::VERSION, encode_u32(protocol_version));

    switch (message.kind) {
        case MessageKind::ANNOUNCE:
        case MessageKind::ACKNOWLEDGE:
            body.write_chunk(*tag, message.peer.serialize());
            break;
        case MessageKind::PAYLOAD_POST:
            body.write_chunk(*tag, message.clipboard.serialize());
            break;
        default:
            body.write_chunk(*tag, std::vector<uint8_t>());
            break;
    }

    ChunkWriter envelope;
    envelope.write_chunk(tags::ENVELOPE, body.data());
    return envelope.take();
}

// ============================================================================
// Decoding
// ============================================================================

Message MessageCodec::decode(const std::vector<uint8_t>& bytes) {
    return decode(bytes.data(), bytes.size());
}

Message MessageCodec::decode(const uint8_t* data, size_t size) {
    ChunkReader reader(data, size);

    reader.expect_tag(tags::ENVELOPE);
    uint32_t envelope_length = reader.read_length();
    size_t envelope_end = CHUNK_HEADER_SIZE + static_cast<size_t>(envelope_length);

    utilities::log_debug("Codec: Envelope of " + std::to_string(envelope_length) +
                         " bytes in buffer of " + std::to_string(size));

    while (true) {
        if (reader.at_end() && reader.offset() >= envelope_end) {
            return Message::no_message();
        }

        std::string tag = reader.read_tag();
        std::vector<uint8_t> payload = reader.read_payload(reader.read_length());

        if (tag == tags::VERSION) {
            uint32_t version = decode_version(payload);
            if (version != config::PROTOCOL_VERSION) {
                utilities::log_warn("Codec: Peer speaks protocol version " + std::to_string(version) +
                                    ", expected " + std::to_string(config::PROTOCOL_VERSION));
            }
            continue;
        }

        if (tag == tags::ENVELOPE) {
            continue;
        }

        auto kind = MessageHelpers::tag_to_message_kind(tag);
        if (!kind) {
            throw CodecError(CodecErrorKind::UNKNOWN_HEADER, "unrecognized tag " + tag);
        }

        switch (*kind) {
            case MessageKind::ANNOUNCE:
                return Message::announce(PeerData::deserialize(payload));
            case MessageKind::ACKNOWLEDGE:
                return Message::acknowledge(PeerData::deserialize(payload));
            case MessageKind::PAYLOAD_POST:
                return Message::payload_post(ClipboardData::deserialize(payload));
            case MessageKind::COPY_REQUEST:
                return Message::copy_request();
            case MessageKind::DISCONNECT:
                return Message::disconnect();
            default:
                return Message::no_message();
        }
    }
}

} // namespace lanclip
