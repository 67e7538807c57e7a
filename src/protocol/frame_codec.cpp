#include "protocol/frame_codec.hpp"
#include "system/logger.hpp"

#include <zlib.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace nocturne::protocol {

namespace {

void putU16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}

void putU32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value >> 24));
    out.push_back(static_cast<uint8_t>(value >> 16));
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}

uint16_t getU16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t getU32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

void setError(FrameError* error, FrameError value) {
    if (error) {
        *error = value;
    }
}

} // namespace

const char* frameErrorName(FrameError error) {
    switch (error) {
        case FrameError::None: return "none";
        case FrameError::TruncatedHeader: return "truncated_header";
        case FrameError::UnsupportedVersion: return "unsupported_version";
        case FrameError::CrcMismatch: return "crc_mismatch";
        case FrameError::Oversized: return "oversized";
    }
    return "unknown";
}

std::vector<uint8_t> FrameCodec::encode(uint16_t type, const std::vector<uint8_t>& payload, uint16_t messageId) {
    if (type > MAX_MESSAGE_TYPE) {
        throw std::invalid_argument("message type does not fit 12 bits");
    }
    if (payload.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("payload exceeds 32-bit size field");
    }

    std::vector<uint8_t> data;
    data.reserve(HEADER_SIZE + payload.size());

    putU16(data, static_cast<uint16_t>((PROTOCOL_VERSION << 12) | (type & MAX_MESSAGE_TYPE)));
    putU16(data, messageId);
    putU32(data, static_cast<uint32_t>(payload.size()));
    putU32(data, calculateCRC32(payload));
    putU16(data, 0);  // flags
    putU16(data, 0);  // reserved

    data.insert(data.end(), payload.begin(), payload.end());
    return data;
}

std::optional<DecodedFrame> FrameCodec::decode(const std::vector<uint8_t>& data, FrameError* error) {
    return decode(data.data(), data.size(), error);
}

std::optional<DecodedFrame> FrameCodec::decode(const uint8_t* data, size_t size, FrameError* error) {
    setError(error, FrameError::None);

    auto header = parseHeader(data, size);
    if (!header) {
        setError(error, FrameError::TruncatedHeader);
        return std::nullopt;
    }

    if (header->version != PROTOCOL_VERSION) {
        Logger::debug("FrameCodec: unsupported protocol version {}", static_cast<int>(header->version));
        setError(error, FrameError::UnsupportedVersion);
        return std::nullopt;
    }

    DecodedFrame frame;
    frame.header = *header;

    if (size - HEADER_SIZE < header->payloadSize) {
        frame.isComplete = false;
        return frame;
    }

    const uint8_t* payload = data + HEADER_SIZE;
    uint32_t computed = calculateCRC32(payload, header->payloadSize);
    if (computed != header->checksum) {
        Logger::warning("FrameCodec: CRC mismatch on {} (expected {}, computed {})",
                        messageTypeName(header->type), header->checksum, computed);
        setError(error, FrameError::CrcMismatch);
        return std::nullopt;
    }

    frame.payload.assign(payload, payload + header->payloadSize);
    frame.isComplete = true;
    return frame;
}

std::optional<FrameHeader> FrameCodec::parseHeader(const uint8_t* data, size_t size) {
    if (data == nullptr || size < HEADER_SIZE) {
        return std::nullopt;
    }

    FrameHeader header;
    uint16_t versionAndType = getU16(data);
    header.version = static_cast<uint8_t>(versionAndType >> 12);
    header.type = static_cast<uint16_t>(versionAndType & MAX_MESSAGE_TYPE);
    header.messageId = getU16(data + 2);
    header.payloadSize = getU32(data + 4);
    header.checksum = getU32(data + 8);
    header.flags = getU16(data + 12);
    header.reserved = getU16(data + 14);
    return header;
}

uint32_t FrameCodec::calculateCRC32(const uint8_t* data, size_t size) {
    uLong crc = crc32(0L, Z_NULL, 0);
    // crc32() takes a uInt length; feed large buffers in slices
    while (size > 0) {
        uInt slice = static_cast<uInt>(std::min<size_t>(size, std::numeric_limits<uInt>::max()));
        crc = crc32(crc, data, slice);
        data += slice;
        size -= slice;
    }
    return static_cast<uint32_t>(crc);
}

uint32_t FrameCodec::calculateCRC32(const std::vector<uint8_t>& data) {
    return calculateCRC32(data.data(), data.size());
}

// FrameReader

FrameReader::FrameReader(size_t maxFrameSize)
    : maxFrameSize_(maxFrameSize) {
}

void FrameReader::append(const uint8_t* data, size_t size) {
    buffer_.insert(buffer_.end(), data, data + size);
}

void FrameReader::append(const std::vector<uint8_t>& data) {
    append(data.data(), data.size());
}

std::optional<DecodedFrame> FrameReader::next() {
    while (buffer_.size() >= HEADER_SIZE) {
        auto header = FrameCodec::parseHeader(buffer_.data(), buffer_.size());

        if (header->version == PROTOCOL_VERSION && header->payloadSize > maxFrameSize_) {
            Logger::warning("FrameReader: declared payload {} exceeds limit {}, dropping {} buffered bytes",
                            header->payloadSize, maxFrameSize_, buffer_.size());
            lastError_ = FrameError::Oversized;
            ++errors_;
            buffer_.clear();
            return std::nullopt;
        }

        FrameError error = FrameError::None;
        auto frame = FrameCodec::decode(buffer_.data(), buffer_.size(), &error);

        if (!frame) {
            lastError_ = error;
            ++errors_;
            if (error == FrameError::CrcMismatch) {
                buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(HEADER_SIZE + header->payloadSize));
            } else {
                buffer_.erase(buffer_.begin());
            }
            continue;
        }

        if (!frame->isComplete) {
            return std::nullopt;
        }

        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(frame->frameSize()));
        return frame;
    }
    return std::nullopt;
}

void FrameReader::reset() {
    buffer_.clear();
    lastError_ = FrameError::None;
}

} // namespace nocturne::protocol
