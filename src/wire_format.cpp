/**
 * @file wire_format.cpp
 * @brief Implementation of chunked binary wire format primitives
 *
 * LanClip - LAN clipboard exchange
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanclip/wire_format.hpp"

#include <limits>

namespace lanclip {

// ============================================================================
// CodecError
// ============================================================================

std::string codec_error_kind_to_string(CodecErrorKind kind) {
    switch (kind) {
        case CodecErrorKind::OUT_OF_BOUNDS: return "OUT_OF_BOUNDS";
        case CodecErrorKind::UNKNOWN_HEADER: return "UNKNOWN_HEADER";
        case CodecErrorKind::INVALID_STRUCTURE: return "INVALID_STRUCTURE";
        case CodecErrorKind::TOO_BIG: return "TOO_BIG";
        case CodecErrorKind::SIZE_OVERFLOW: return "SIZE_OVERFLOW";
        default: return "UNKNOWN";
    }
}

CodecError::CodecError(CodecErrorKind kind, const std::string& message)
    : std::runtime_error(codec_error_kind_to_string(kind) + ": " + message)
    , kind_(kind)
{
}

// ============================================================================
// ChunkReader
// ============================================================================

ChunkReader::ChunkReader(const uint8_t* data, size_t size)
    : data_(data)
    , size_(data == nullptr ? 0 : size)
    , offset_(0)
{
}

ChunkReader::ChunkReader(const std::vector<uint8_t>& buffer)
    : ChunkReader(buffer.data(), buffer.size())
{
}

void ChunkReader::require(size_t count) const {
    // remaining() cannot underflow, so this comparison cannot overflow
    if (count > remaining()) {
        throw CodecError(
            CodecErrorKind::OUT_OF_BOUNDS,
            "need " + std::to_string(count) + " bytes at offset " +
            std::to_string(offset_) + ", " + std::to_string(remaining()) + " available"
        );
    }
}

std::string ChunkReader::read_tag() {
    require(TAG_SIZE);

    std::string tag;
    tag.reserve(TAG_SIZE);
    for (size_t i = 0; i < TAG_SIZE; ++i) {
        uint8_t byte = data_[offset_ + i];
        if (byte >= 0x80) {
            throw CodecError(CodecErrorKind::INVALID_STRUCTURE,
                             "non-ASCII tag byte at offset " + std::to_string(offset_ + i));
        }
        tag += static_cast<char>(byte);
    }

    offset_ += TAG_SIZE;
    return tag;
}

void ChunkReader::expect_tag(const std::string& expected) {
    std::string tag = read_tag();
    if (tag != expected) {
        throw CodecError(CodecErrorKind::UNKNOWN_HEADER,
                         "expected " + expected + ", received " + tag);
    }
}

uint32_t ChunkReader::read_length() {
    require(LENGTH_SIZE);

    uint32_t value = (static_cast<uint32_t>(data_[offset_]) << 24) |
                     (static_cast<uint32_t>(data_[offset_ + 1]) << 16) |
                     (static_cast<uint32_t>(data_[offset_ + 2]) << 8) |
                     static_cast<uint32_t>(data_[offset_ + 3]);

    offset_ += LENGTH_SIZE;
    return value;
}

std::vector<uint8_t> ChunkReader::read_payload(size_t length) {
    require(length);

    std::vector<uint8_t> payload(data_ + offset_, data_ + offset_ + length);
    offset_ += length;
    return payload;
}

uint8_t ChunkReader::read_byte() {
    require(1);
    return data_[offset_++];
}

// ============================================================================
// ChunkWriter
// ============================================================================

void ChunkWriter::write_tag(const std::string& tag) {
    if (tag.size() != TAG_SIZE) {
        throw CodecError(CodecErrorKind::INVALID_STRUCTURE,
                         "tag must be 4 bytes: '" + tag + "'");
    }
    for (char c : tag) {
        if (static_cast<unsigned char>(c) >= 0x80) {
            throw CodecError(CodecErrorKind::INVALID_STRUCTURE, "tag must be ASCII");
        }
    }
    buffer_.insert(buffer_.end(), tag.begin(), tag.end());
}

void ChunkWriter::write_length(uint64_t length) {
    if (length > std::numeric_limits<uint32_t>::max()) {
        throw CodecError(CodecErrorKind::TOO_BIG,
                         "length " + std::to_string(length) + " exceeds 32 bits");
    }

    uint32_t value = static_cast<uint32_t>(length);
    buffer_.push_back(static_cast<uint8_t>(value >> 24));
    buffer_.push_back(static_cast<uint8_t>(value >> 16));
    buffer_.push_back(static_cast<uint8_t>(value >> 8));
    buffer_.push_back(static_cast<uint8_t>(value));
}

void ChunkWriter::write_chunk(const std::string& tag, const uint8_t* payload, size_t size) {
    write_tag(tag);
    write_length(size);
    buffer_.insert(buffer_.end(), payload, payload + size);
}

void ChunkWriter::write_chunk(const std::string& tag, const std::vector<uint8_t>& payload) {
    write_chunk(tag, payload.data(), payload.size());
}

void ChunkWriter::write_chunk(const std::string& tag, const std::string& payload) {
    write_chunk(tag, reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
}

std::vector<uint8_t> encode_chunk(const std::string& tag, const std::vector<uint8_t>& payload) {
    ChunkWriter writer;
    writer.write_chunk(tag, payload);
    return writer.take();
}

} // namespace lanclip
