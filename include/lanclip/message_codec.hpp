/**
 * @file message_codec.hpp
 * @brief Envelope encoding and decoding for LanClip messages
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Envelope layout (big-endian):
 *
 *   "XCOP" u32(len)               len = size of everything below
 *     "XVER" u32(4) u32(version)
 *     <payload tag> u32(n) <n bytes>
 */

#pragma once

#include "lanclip/message_types.hpp"
#include "lanclip/node_config.hpp"

#include <cstdint>
#include <vector>

namespace lanclip {

/**
 * @brief Stateless message encoder/decoder
 */
class MessageCodec {
public:
    /**
     * @brief Encode a message into a complete envelope
     *
     * Deterministic: the same message and version always give the same bytes.
     *
     * @param message Message to encode (must not be NO_MESSAGE)
     * @param protocol_version Value written into the XVER chunk
     * @return Encoded envelope
     * @throws CodecError INVALID_STRUCTURE, SIZE_OVERFLOW, TOO_BIG
     */
    static std::vector<uint8_t> encode(const Message& message,
                                       uint32_t protocol_version = config::PROTOCOL_VERSION);

    /**
     * @brief Decode an envelope
     *
     * Returns on the first payload chunk. A complete envelope without a
     * payload chunk decodes to NO_MESSAGE; a buffer that ends before the
     * declared envelope length raises OUT_OF_BOUNDS.
     *
     * @throws CodecError on any structural problem
     */
    static Message decode(const std::vector<uint8_t>& bytes);

    static Message decode(const uint8_t* data, size_t size);
};

} // namespace lanclip
