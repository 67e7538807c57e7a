#pragma once

#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

#include "protocol/message_types.hpp"

namespace nocturne::protocol {

/**
 * Wire header, 16 bytes, all fields big-endian:
 *   [0-1]   version (high 4 bits) | message type (low 12 bits)
 *   [2-3]   message id (correlation / chunk index)
 *   [4-7]   payload size
 *   [8-11]  CRC-32 of the payload only
 *   [12-13] flags (reserved)
 *   [14-15] reserved
 */
struct FrameHeader {
    uint8_t version = PROTOCOL_VERSION;
    uint16_t type = 0;
    uint16_t messageId = 0;
    uint32_t payloadSize = 0;
    uint32_t checksum = 0;
    uint16_t flags = 0;
    uint16_t reserved = 0;
};

struct DecodedFrame {
    FrameHeader header;
    std::vector<uint8_t> payload;
    bool isComplete = false;

    size_t frameSize() const { return HEADER_SIZE + header.payloadSize; }
};

enum class FrameError {
    None,
    TruncatedHeader,
    UnsupportedVersion,
    CrcMismatch,
    Oversized
};

const char* frameErrorName(FrameError error);

/**
 * @brief Versioned binary frame codec
 *
 * Pure transformation between (type, payload, messageId) and wire bytes.
 * decode() tolerates partial reads: a frame whose payload has not fully
 * arrived is returned with isComplete=false and an empty payload.
 */
class FrameCodec {
public:
    static std::vector<uint8_t> encode(uint16_t type,
                                       const std::vector<uint8_t>& payload,
                                       uint16_t messageId = 0);

    static std::optional<DecodedFrame> decode(const std::vector<uint8_t>& data,
                                              FrameError* error = nullptr);
    static std::optional<DecodedFrame> decode(const uint8_t* data, size_t size,
                                              FrameError* error = nullptr);

    /** Reads the header fields without validating version or CRC. */
    static std::optional<FrameHeader> parseHeader(const uint8_t* data, size_t size);

    static uint32_t calculateCRC32(const uint8_t* data, size_t size);
    static uint32_t calculateCRC32(const std::vector<uint8_t>& data);
};

/**
 * @brief Accumulates fragmented writes and yields complete frames
 *
 * Frames failing their CRC are skipped as a whole; an unsupported version
 * resynchronizes one byte at a time. A declared payload larger than
 * maxFrameSize drops the buffer.
 */
class FrameReader {
public:
    explicit FrameReader(size_t maxFrameSize = 64 * 1024);

    void append(const uint8_t* data, size_t size);
    void append(const std::vector<uint8_t>& data);

    std::optional<DecodedFrame> next();

    size_t buffered() const { return buffer_.size(); }
    uint64_t errorCount() const { return errors_; }
    FrameError lastError() const { return lastError_; }
    void reset();

private:
    std::vector<uint8_t> buffer_;
    size_t maxFrameSize_;
    uint64_t errors_ = 0;
    FrameError lastError_ = FrameError::None;
};

} // namespace nocturne::protocol
