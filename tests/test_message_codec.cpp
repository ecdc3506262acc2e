/**
 * @file test_message_codec.cpp
 * @brief Unit tests for envelope encoding and decoding
 *
 * Tests the message codec including:
 * - Bit-exact envelope layout
 * - Round trip of every message kind
 * - Determinism
 * - Structural errors for every truncated prefix
 * - Unknown tag rejection and first-payload-wins decoding
 * - Envelopes without a payload chunk
 */

#include <gtest/gtest.h>
#include "lanclip/message_codec.hpp"
#include "lanclip/wire_format.hpp"

#include <string>
#include <vector>

using namespace lanclip;

// Test fixture for codec tests
class MessageCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        messages_ = {
            Message::announce(PeerData{"alpha"}),
            Message::acknowledge(PeerData{"b\xC3\xA9ta"}),
            Message::copy_request(),
            Message::payload_post(ClipboardData::text(StringType::PLAIN_UTF8, std::string("hello"))),
            Message::payload_post(ClipboardData::text(StringType::HTML, std::string("<i>x</i>"))),
            Message::payload_post(ClipboardData::file("a.bin", std::vector<uint8_t>{0, 1, 2, 255})),
            Message::disconnect()
        };
    }

    static std::vector<uint8_t> envelope_with(const std::vector<std::vector<uint8_t>>& chunks) {
        std::vector<uint8_t> body;
        for (const auto& chunk : chunks) {
            body.insert(body.end(), chunk.begin(), chunk.end());
        }
        ChunkWriter envelope;
        envelope.write_chunk("XCOP", body);
        return envelope.take();
    }

    static std::vector<uint8_t> version_chunk(uint32_t version) {
        return encode_chunk("XVER", {
            static_cast<uint8_t>(version >> 24), static_cast<uint8_t>(version >> 16),
            static_cast<uint8_t>(version >> 8), static_cast<uint8_t>(version)
        });
    }

    static CodecErrorKind decode_error(const std::vector<uint8_t>& bytes) {
        try {
            MessageCodec::decode(bytes);
        } catch (const CodecError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected CodecError for " << bytes.size() << " bytes";
        return CodecErrorKind::INVALID_STRUCTURE;
    }

    std::vector<Message> messages_;
};

// ============================================================================
// Encoding Tests
// ============================================================================

TEST_F(MessageCodecTest, CopyRequestIsBitExact) {
    std::vector<uint8_t> expected = {
        'X', 'C', 'O', 'P', 0x00, 0x00, 0x00, 0x14,
        'X', 'V', 'E', 'R', 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00, 0x01,
        'X', 'C', 'P', 'Y', 0x00, 0x00, 0x00, 0x00
    };
    EXPECT_EQ(MessageCodec::encode(Message::copy_request(), 1), expected);
}

TEST_F(MessageCodecTest, AnnounceIsBitExact) {
    std::vector<uint8_t> expected = {
        'X', 'C', 'O', 'P', 0x00, 0x00, 0x00, 0x18,
        'X', 'V', 'E', 'R', 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00, 0x07,
        'X', 'C', 'O', 'N', 0x00, 0x00, 0x00, 0x04, 0x03, 'p', 'c', '1'
    };
    EXPECT_EQ(MessageCodec::encode(Message::announce(PeerData{"pc1"}), 7), expected);
}

TEST_F(MessageCodecTest, EnvelopeLengthCoversVersionAndPayload) {
    for (const auto& message : messages_) {
        auto bytes = MessageCodec::encode(message);
        uint32_t declared = (static_cast<uint32_t>(bytes[4]) << 24) | (bytes[5] << 16) | (bytes[6] << 8) | bytes[7];
        EXPECT_EQ(declared, bytes.size() - CHUNK_HEADER_SIZE);
    }
}

TEST_F(MessageCodecTest, EncodingIsDeterministic) {
    for (const auto& message : messages_) {
        EXPECT_EQ(MessageCodec::encode(message, 3), MessageCodec::encode(message, 3));
    }
}

TEST_F(MessageCodecTest, NoMessageCannotBeEncoded) {
    try {
        MessageCodec::encode(Message::no_message());
        FAIL() << "expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.kind(), CodecErrorKind::INVALID_STRUCTURE);
    }
}

TEST_F(MessageCodecTest, OversizedPeerNameRejected) {
    try {
        MessageCodec::encode(Message::announce(PeerData{std::string(300, 'n')}));
        FAIL() << "expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.kind(), CodecErrorKind::SIZE_OVERFLOW);
    }
}

// ============================================================================
// Decoding Tests
// ============================================================================

TEST_F(MessageCodecTest, RoundTrip) {
    for (uint32_t version : {1u, 2u, 0xFFFFFFFFu}) {
        for (const auto& message : messages_) {
            EXPECT_EQ(MessageCodec::decode(MessageCodec::encode(message, version)), message)
                << MessageHelpers::message_kind_to_string(message.kind) << " v" << version;
        }
    }
}

TEST_F(MessageCodecTest, EveryTruncatedPrefixIsStructuralError) {
    for (const auto& message : messages_) {
        auto bytes = MessageCodec::encode(message);
        for (size_t length = 0; length < bytes.size(); ++length) {
            std::vector<uint8_t> prefix(bytes.begin(), bytes.begin() + length);
            CodecErrorKind kind = decode_error(prefix);
            EXPECT_TRUE(kind == CodecErrorKind::OUT_OF_BOUNDS ||
                        kind == CodecErrorKind::INVALID_STRUCTURE ||
                        kind == CodecErrorKind::UNKNOWN_HEADER)
                << "prefix " << length << " of " << bytes.size();
        }
    }
}

TEST_F(MessageCodecTest, WrongEnvelopeTag) {
    auto bytes = MessageCodec::encode(Message::disconnect());
    bytes[3] = 'X';
    EXPECT_EQ(decode_error(bytes), CodecErrorKind::UNKNOWN_HEADER);
}

TEST_F(MessageCodecTest, UnknownPayloadTag) {
    auto bytes = envelope_with({version_chunk(1), encode_chunk("XZZZ", {})});
    EXPECT_EQ(decode_error(bytes), CodecErrorKind::UNKNOWN_HEADER);
}

TEST_F(MessageCodecTest, VersionChunkMustBeFourBytes) {
    auto bytes = envelope_with({encode_chunk("XVER", {0, 1}), encode_chunk("XCPY", {})});
    EXPECT_EQ(decode_error(bytes), CodecErrorKind::INVALID_STRUCTURE);
}

TEST_F(MessageCodecTest, FirstPayloadChunkWins) {
    auto bytes = envelope_with({
        version_chunk(1),
        encode_chunk("XCPY", {}),
        encode_chunk("XCON", PeerData{"late"}.serialize())
    });
    EXPECT_EQ(MessageCodec::decode(bytes), Message::copy_request());
}

TEST_F(MessageCodecTest, NestedEnvelopeChunkSkipped) {
    auto bytes = envelope_with({
        version_chunk(1),
        encode_chunk("XCOP", {}),
        encode_chunk("XDIS", {})
    });
    EXPECT_EQ(MessageCodec::decode(bytes), Message::disconnect());
}

TEST_F(MessageCodecTest, EnvelopeWithoutPayloadIsNoMessage) {
    auto bytes = envelope_with({version_chunk(1)});
    EXPECT_EQ(MessageCodec::decode(bytes).kind, MessageKind::NO_MESSAGE);

    auto empty_envelope = envelope_with({});
    EXPECT_EQ(MessageCodec::decode(empty_envelope).kind, MessageKind::NO_MESSAGE);
}

TEST_F(MessageCodecTest, OtherProtocolVersionStillDecodes) {
    auto bytes = MessageCodec::encode(Message::acknowledge(PeerData{"old"}), 9);
    EXPECT_EQ(MessageCodec::decode(bytes), Message::acknowledge(PeerData{"old"}));
}

TEST_F(MessageCodecTest, MalformedPayloadInsideValidEnvelope) {
    auto bytes = envelope_with({version_chunk(1), encode_chunk("XCON", {5, 'a'})});
    EXPECT_EQ(decode_error(bytes), CodecErrorKind::OUT_OF_BOUNDS);
}
