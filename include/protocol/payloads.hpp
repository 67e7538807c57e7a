#pragma once

#include <vector>
#include <string>
#include <optional>
#include <cstdint>
#include <cstddef>
#include <utility>

#include "link_types.hpp"
#include "protocol/message_types.hpp"

namespace nocturne::protocol {

/**
 * @brief Big-endian payload writer
 */
class ByteWriter {
public:
    void writeU8(uint8_t value);
    void writeU16(uint16_t value);
    void writeU32(uint32_t value);
    void writeI64(int64_t value);
    void writeBytes(const uint8_t* data, size_t size);
    void writeBytes(const std::vector<uint8_t>& data);

    /** Raw UTF-8, no prefix */
    void writeString(const std::string& value);
    /** UTF-8 with a one-byte length prefix, truncated to 255 bytes */
    void writeShortString(const std::string& value);
    /** UTF-8 with a two-byte length prefix, truncated to 65535 bytes */
    void writeLongString(const std::string& value);
    /** Legacy NUL-terminated string */
    void writeCString(const std::string& value);

    const std::vector<uint8_t>& data() const { return buffer_; }
    std::vector<uint8_t> take() { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

/**
 * @brief Bounds-checked big-endian payload reader
 *
 * Every read returns false instead of running past the buffer.
 */
class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& data);
    ByteReader(const uint8_t* data, size_t size);

    bool readU8(uint8_t& value);
    bool readU16(uint16_t& value);
    bool readU32(uint32_t& value);
    bool readI64(int64_t& value);
    bool readBytes(size_t count, std::vector<uint8_t>& out);
    bool readDigest(Digest& out);
    bool readShortString(std::string& value);
    bool readLongString(std::string& value);
    bool readCString(std::string& value);
    std::string readRemainingString();

    size_t remaining() const { return size_ - offset_; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;
};

/** Cuts a UTF-8 string to at most maxBytes without splitting a code point. */
std::string truncateUtf8(const std::string& value, size_t maxBytes);

// Commands

constexpr uint8_t COMMAND_FLAG_VALUE_MS = 0x01;
constexpr uint8_t COMMAND_FLAG_VALUE_PERCENT = 0x02;

struct Command {
    uint16_t type = 0;
    std::optional<int64_t> valueMs;
    std::optional<uint8_t> valuePercent;
};

std::vector<uint8_t> encodeCommand(const Command& command);
std::optional<Command> parseCommand(uint16_t type, const std::vector<uint8_t>& payload);

// Media state

struct MediaState {
    bool playing = false;
    int64_t durationMs = 0;
    int64_t positionMs = 0;
    uint8_t volume = 0;
    std::string artist;
    std::string album;
    std::string track;

    bool operator==(const MediaState& other) const;
    bool operator!=(const MediaState& other) const { return !(*this == other); }
};

constexpr size_t FULL_STATE_MIN_SIZE = 20;

std::vector<uint8_t> encodeFullState(const MediaState& state);
std::optional<MediaState> parseFullState(const std::vector<uint8_t>& payload);

struct ArtistAlbum {
    std::string artist;
    std::string album;
};

std::vector<uint8_t> encodeArtistAlbum(const std::string& artist, const std::string& album);
std::optional<ArtistAlbum> parseArtistAlbum(const std::vector<uint8_t>& payload);

std::vector<uint8_t> encodeInt64Value(int64_t value);
std::optional<int64_t> parseInt64Value(const std::vector<uint8_t>& payload);
std::vector<uint8_t> encodeByteValue(uint8_t value);
std::optional<uint8_t> parseByteValue(const std::vector<uint8_t>& payload);
std::vector<uint8_t> encodeStringValue(const std::string& value);
std::string parseStringValue(const std::vector<uint8_t>& payload);

// System

struct TimeSync {
    int64_t timestampMs = 0;
    std::string timezone;
};

std::vector<uint8_t> encodeTimeSync(const TimeSync& sync);
std::optional<TimeSync> parseTimeSync(const std::vector<uint8_t>& payload);

struct Capabilities {
    std::string version;
    uint16_t mtu = 0;
    bool debug = false;
    std::vector<std::string> features;
};

std::vector<uint8_t> encodeCapabilities(const Capabilities& capabilities);
std::optional<Capabilities> parseCapabilities(const std::vector<uint8_t>& payload);

// Errors

struct ErrorReport {
    std::string code;
    std::string message;
};

std::vector<uint8_t> encodeError(const ErrorReport& report);
std::optional<ErrorReport> parseError(const std::vector<uint8_t>& payload);

// Gradient

constexpr size_t MAX_GRADIENT_COLORS = 255;

/** Colors are ARGB; alpha is not transmitted and decodes as 0xFF. */
std::vector<uint8_t> encodeGradient(const std::vector<uint32_t>& colors);
std::optional<std::vector<uint32_t>> parseGradient(const std::vector<uint8_t>& payload);

// Bulk transfer control

constexpr uint8_t TRANSFER_FLAG_COMPRESSED = 0x01;

struct TransferStart {
    Digest checksum{};
    uint32_t totalChunks = 0;
    uint32_t originalSize = 0;
    bool compressed = false;
    uint32_t compressedSize = 0;    // equals originalSize when not compressed
    std::string assetId;
};

std::vector<uint8_t> encodeTransferStart(const TransferStart& start);
std::optional<TransferStart> parseTransferStart(const std::vector<uint8_t>& payload);

struct TransferEnd {
    Digest checksum{};
    bool success = false;
};

std::vector<uint8_t> encodeTransferEnd(const TransferEnd& end);
std::optional<TransferEnd> parseTransferEnd(const std::vector<uint8_t>& payload);

/**
 * Weather start keeps the deployed layout: fixed integer block, checksum,
 * then two NUL-terminated strings.
 */
struct WeatherStart {
    uint32_t originalSize = 0;
    uint32_t compressedSize = 0;
    uint32_t totalChunks = 0;
    int64_t timestampMs = 0;
    Digest checksum{};
    std::string mode;
    std::string location;
};

std::vector<uint8_t> encodeWeatherStart(const WeatherStart& start);
std::optional<WeatherStart> parseWeatherStart(const std::vector<uint8_t>& payload);

} // namespace nocturne::protocol
