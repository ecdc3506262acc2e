/**
 * @file wire_format.hpp
 * @brief Chunked binary wire format primitives
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every LanClip message is a tree of chunks, loosely modelled on IFF:
 *
 *   +--------+------------------+-------------------+
 *   | tag(4) | length(4, BE u32) | payload(length)   |
 *   +--------+------------------+-------------------+
 *
 * Tags are exactly four ASCII bytes without terminator. Reading goes
 * through a single forward-only cursor that validates every access
 * against the buffer end; writing only appends.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace lanclip {

/// Size of a chunk tag in bytes
constexpr size_t TAG_SIZE = 4;

/// Size of a chunk length field in bytes
constexpr size_t LENGTH_SIZE = 4;

/// Size of a chunk header (tag + length)
constexpr size_t CHUNK_HEADER_SIZE = TAG_SIZE + LENGTH_SIZE;

/**
 * @brief Chunk tags used on the wire
 */
namespace tags {
    // Envelope and message kinds
    constexpr const char* ENVELOPE = "XCOP";
    constexpr const char* VERSION = "XVER";
    constexpr const char* ANNOUNCE = "XCON";
    constexpr const char* ACKNOWLEDGE = "XACN";
    constexpr const char* COPY_REQUEST = "XCPY";
    constexpr const char* PAYLOAD_POST = "XPST";
    constexpr const char* DISCONNECT = "XDIS";

    // Clipboard payload
    constexpr const char* STRING = "XSTR";
    constexpr const char* STRING_TYPE = "XTYP";
    constexpr const char* DATA = "XDAT";
    constexpr const char* FILE = "XFIL";
    constexpr const char* FILE_NAME = "XFME";
}

/**
 * @brief Structural error categories for encoding and decoding
 */
enum class CodecErrorKind {
    OUT_OF_BOUNDS,       ///< Buffer shorter than a declared field demands
    UNKNOWN_HEADER,      ///< Tag not in the recognized set or not where expected
    INVALID_STRUCTURE,   ///< Field bytes cannot be interpreted
    TOO_BIG,             ///< Payload length not representable in 32 bits
    SIZE_OVERFLOW        ///< Field exceeds its own length prefix (e.g. peer name > 255)
};

std::string codec_error_kind_to_string(CodecErrorKind kind);

/**
 * @brief Error raised by the wire format and message codec
 */
class CodecError : public std::runtime_error {
public:
    CodecError(CodecErrorKind kind, const std::string& message);

    CodecErrorKind kind() const noexcept { return kind_; }

private:
    CodecErrorKind kind_;
};

/**
 * @brief Bounds-checked forward cursor over an encoded buffer
 *
 * The reader never owns the buffer; it must outlive the reader.
 */
class ChunkReader {
public:
    ChunkReader(const uint8_t* data, size_t size);
    explicit ChunkReader(const std::vector<uint8_t>& buffer);

    /**
     * @brief Read a 4-byte tag
     * @throws CodecError OUT_OF_BOUNDS, INVALID_STRUCTURE for non-ASCII bytes
     */
    std::string read_tag();

    /**
     * @brief Read a tag and require it to equal expected
     * @throws CodecError UNKNOWN_HEADER on mismatch
     */
    void expect_tag(const std::string& expected);

    /**
     * @brief Read a 4-byte big-endian length
     * @throws CodecError OUT_OF_BOUNDS
     */
    uint32_t read_length();

    /**
     * @brief Copy length bytes and advance
     * @throws CodecError OUT_OF_BOUNDS
     */
    std::vector<uint8_t> read_payload(size_t length);

    /**
     * @brief Read a single byte
     * @throws CodecError OUT_OF_BOUNDS
     */
    uint8_t read_byte();

    size_t offset() const { return offset_; }
    size_t size() const { return size_; }
    size_t remaining() const { return size_ - offset_; }
    bool at_end() const { return offset_ == size_; }

private:
    void require(size_t count) const;

    const uint8_t* data_;
    size_t size_;
    size_t offset_;
};

/**
 * @brief Append-only chunk encoder
 */
class ChunkWriter {
public:
    ChunkWriter() = default;

    /**
     * @brief Append a 4-byte tag
     * @throws CodecError INVALID_STRUCTURE if tag is not exactly 4 ASCII bytes
     */
    void write_tag(const std::string& tag);

    /**
     * @brief Append a 4-byte big-endian length
     * @throws CodecError TOO_BIG if length exceeds UINT32_MAX
     */
    void write_length(uint64_t length);

    /**
     * @brief Append tag, length and payload
     */
    void write_chunk(const std::string& tag, const std::vector<uint8_t>& payload);

    void write_chunk(const std::string& tag, const std::string& payload);

    const std::vector<uint8_t>& data() const { return buffer_; }
    std::vector<uint8_t> take() { return std::move(buffer_); }
    size_t size() const { return buffer_.size(); }

private:
    void write_chunk(const std::string& tag, const uint8_t* payload, size_t size);

    std::vector<uint8_t> buffer_;
};

/**
 * @brief Encode a single chunk
 * @return tag + length + payload
 */
std::vector<uint8_t> encode_chunk(const std::string& tag, const std::vector<uint8_t>& payload);

} // namespace lanclip
