#include "protocol/payloads.hpp"
#include "system/logger.hpp"

#include <algorithm>
#include <sstream>

namespace nocturne::protocol {

// ByteWriter

void ByteWriter::writeU8(uint8_t value) {
    buffer_.push_back(value);
}

void ByteWriter::writeU16(uint16_t value) {
    buffer_.push_back(static_cast<uint8_t>(value >> 8));
    buffer_.push_back(static_cast<uint8_t>(value));
}

void ByteWriter::writeU32(uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<uint8_t>(value >> shift));
    }
}

void ByteWriter::writeI64(int64_t value) {
    uint64_t bits = static_cast<uint64_t>(value);
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<uint8_t>(bits >> shift));
    }
}

void ByteWriter::writeBytes(const uint8_t* data, size_t size) {
    buffer_.insert(buffer_.end(), data, data + size);
}

void ByteWriter::writeBytes(const std::vector<uint8_t>& data) {
    buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void ByteWriter::writeString(const std::string& value) {
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

void ByteWriter::writeShortString(const std::string& value) {
    std::string bounded = truncateUtf8(value, 0xFF);
    writeU8(static_cast<uint8_t>(bounded.size()));
    writeString(bounded);
}

void ByteWriter::writeLongString(const std::string& value) {
    std::string bounded = truncateUtf8(value, 0xFFFF);
    writeU16(static_cast<uint16_t>(bounded.size()));
    writeString(bounded);
}

void ByteWriter::writeCString(const std::string& value) {
    std::string bounded = value.substr(0, value.find('\0'));
    writeString(bounded);
    writeU8(0);
}

// ByteReader

ByteReader::ByteReader(const std::vector<uint8_t>& data)
    : data_(data.data()), size_(data.size()) {
}

ByteReader::ByteReader(const uint8_t* data, size_t size)
    : data_(data), size_(size) {
}

bool ByteReader::readU8(uint8_t& value) {
    if (remaining() < 1) {
        return false;
    }
    value = data_[offset_++];
    return true;
}

bool ByteReader::readU16(uint16_t& value) {
    if (remaining() < 2) {
        return false;
    }
    value = static_cast<uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
    offset_ += 2;
    return true;
}

bool ByteReader::readU32(uint32_t& value) {
    if (remaining() < 4) {
        return false;
    }
    value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | data_[offset_++];
    }
    return true;
}

bool ByteReader::readI64(int64_t& value) {
    if (remaining() < 8) {
        return false;
    }
    uint64_t bits = 0;
    for (int i = 0; i < 8; ++i) {
        bits = (bits << 8) | data_[offset_++];
    }
    value = static_cast<int64_t>(bits);
    return true;
}

bool ByteReader::readBytes(size_t count, std::vector<uint8_t>& out) {
    if (remaining() < count) {
        return false;
    }
    out.assign(data_ + offset_, data_ + offset_ + count);
    offset_ += count;
    return true;
}

bool ByteReader::readDigest(Digest& out) {
    if (remaining() < out.size()) {
        return false;
    }
    std::copy(data_ + offset_, data_ + offset_ + out.size(), out.begin());
    offset_ += out.size();
    return true;
}

bool ByteReader::readShortString(std::string& value) {
    uint8_t length = 0;
    if (!readU8(length) || remaining() < length) {
        return false;
    }
    value.assign(reinterpret_cast<const char*>(data_ + offset_), length);
    offset_ += length;
    return true;
}

bool ByteReader::readLongString(std::string& value) {
    uint16_t length = 0;
    if (!readU16(length) || remaining() < length) {
        return false;
    }
    value.assign(reinterpret_cast<const char*>(data_ + offset_), length);
    offset_ += length;
    return true;
}

bool ByteReader::readCString(std::string& value) {
    const uint8_t* begin = data_ + offset_;
    const uint8_t* end = data_ + size_;
    const uint8_t* terminator = std::find(begin, end, static_cast<uint8_t>(0));
    if (terminator == end) {
        return false;
    }
    value.assign(reinterpret_cast<const char*>(begin), static_cast<size_t>(terminator - begin));
    offset_ += static_cast<size_t>(terminator - begin) + 1;
    return true;
}

std::string ByteReader::readRemainingString() {
    std::string value(reinterpret_cast<const char*>(data_ + offset_), remaining());
    offset_ = size_;
    return value;
}

std::string truncateUtf8(const std::string& value, size_t maxBytes) {
    if (value.size() <= maxBytes) {
        return value;
    }
    size_t cut = maxBytes;
    // step back over continuation bytes (10xxxxxx)
    while (cut > 0 && (static_cast<uint8_t>(value[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return value.substr(0, cut);
}

// Commands

std::vector<uint8_t> encodeCommand(const Command& command) {
    ByteWriter writer;
    uint8_t flags = 0;
    if (command.valueMs) flags |= COMMAND_FLAG_VALUE_MS;
    if (command.valuePercent) flags |= COMMAND_FLAG_VALUE_PERCENT;

    writer.writeU8(flags);
    if (command.valueMs) {
        writer.writeI64(*command.valueMs);
    }
    if (command.valuePercent) {
        writer.writeU8(*command.valuePercent);
    }
    return writer.take();
}

std::optional<Command> parseCommand(uint16_t type, const std::vector<uint8_t>& payload) {
    if (!isCommandType(type)) {
        return std::nullopt;
    }

    Command command;
    command.type = type;

    // Commands without arguments may arrive with an empty payload
    if (payload.empty()) {
        return command;
    }

    ByteReader reader(payload);
    uint8_t flags = 0;
    if (!reader.readU8(flags)) {
        return std::nullopt;
    }

    if (flags & COMMAND_FLAG_VALUE_MS) {
        int64_t value = 0;
        if (!reader.readI64(value)) {
            Logger::debug("Payloads: truncated valueMs in {}", messageTypeName(type));
            return std::nullopt;
        }
        command.valueMs = value;
    }

    if (flags & COMMAND_FLAG_VALUE_PERCENT) {
        uint8_t value = 0;
        if (!reader.readU8(value)) {
            Logger::debug("Payloads: truncated valuePercent in {}", messageTypeName(type));
            return std::nullopt;
        }
        command.valuePercent = value;
    }

    return command;
}

// Media state

bool MediaState::operator==(const MediaState& other) const {
    return playing == other.playing &&
           durationMs == other.durationMs &&
           positionMs == other.positionMs &&
           volume == other.volume &&
           artist == other.artist &&
           album == other.album &&
           track == other.track;
}

std::vector<uint8_t> encodeFullState(const MediaState& state) {
    ByteWriter writer;
    writer.writeU8(state.playing ? 0x01 : 0x00);
    writer.writeI64(state.durationMs);
    writer.writeI64(state.positionMs);
    writer.writeU8(state.volume);
    writer.writeLongString(state.artist);
    writer.writeLongString(state.album);
    writer.writeLongString(state.track);
    return writer.take();
}

std::optional<MediaState> parseFullState(const std::vector<uint8_t>& payload) {
    if (payload.size() < FULL_STATE_MIN_SIZE) {
        return std::nullopt;
    }

    ByteReader reader(payload);
    MediaState state;
    uint8_t flags = 0;
    if (!reader.readU8(flags) ||
        !reader.readI64(state.durationMs) ||
        !reader.readI64(state.positionMs) ||
        !reader.readU8(state.volume) ||
        !reader.readLongString(state.artist) ||
        !reader.readLongString(state.album) ||
        !reader.readLongString(state.track)) {
        return std::nullopt;
    }
    state.playing = (flags & 0x01) != 0;
    return state;
}

std::vector<uint8_t> encodeArtistAlbum(const std::string& artist, const std::string& album) {
    ByteWriter writer;
    writer.writeLongString(artist);
    writer.writeLongString(album);
    return writer.take();
}

std::optional<ArtistAlbum> parseArtistAlbum(const std::vector<uint8_t>& payload) {
    ByteReader reader(payload);
    ArtistAlbum result;
    if (!reader.readLongString(result.artist) || !reader.readLongString(result.album)) {
        return std::nullopt;
    }
    return result;
}

std::vector<uint8_t> encodeInt64Value(int64_t value) {
    ByteWriter writer;
    writer.writeI64(value);
    return writer.take();
}

std::optional<int64_t> parseInt64Value(const std::vector<uint8_t>& payload) {
    ByteReader reader(payload);
    int64_t value = 0;
    if (!reader.readI64(value)) {
        return std::nullopt;
    }
    return value;
}

std::vector<uint8_t> encodeByteValue(uint8_t value) {
    return {value};
}

std::optional<uint8_t> parseByteValue(const std::vector<uint8_t>& payload) {
    if (payload.empty()) {
        return std::nullopt;
    }
    return payload.front();
}

std::vector<uint8_t> encodeStringValue(const std::string& value) {
    return std::vector<uint8_t>(value.begin(), value.end());
}

std::string parseStringValue(const std::vector<uint8_t>& payload) {
    return std::string(payload.begin(), payload.end());
}

// System

std::vector<uint8_t> encodeTimeSync(const TimeSync& sync) {
    ByteWriter writer;
    writer.writeI64(sync.timestampMs);
    writer.writeLongString(sync.timezone);
    return writer.take();
}

std::optional<TimeSync> parseTimeSync(const std::vector<uint8_t>& payload) {
    ByteReader reader(payload);
    TimeSync sync;
    if (!reader.readI64(sync.timestampMs) || !reader.readLongString(sync.timezone)) {
        return std::nullopt;
    }
    return sync;
}

std::vector<uint8_t> encodeCapabilities(const Capabilities& capabilities) {
    std::ostringstream joined;
    for (size_t i = 0; i < capabilities.features.size(); ++i) {
        if (i > 0) {
            joined << ',';
        }
        joined << capabilities.features[i];
    }

    ByteWriter writer;
    writer.writeU8(capabilities.debug ? 0x01 : 0x00);
    writer.writeU16(capabilities.mtu);
    writer.writeShortString(capabilities.version);
    writer.writeLongString(joined.str());
    return writer.take();
}

std::optional<Capabilities> parseCapabilities(const std::vector<uint8_t>& payload) {
    ByteReader reader(payload);
    Capabilities capabilities;
    uint8_t flags = 0;
    std::string features;
    if (!reader.readU8(flags) ||
        !reader.readU16(capabilities.mtu) ||
        !reader.readShortString(capabilities.version) ||
        !reader.readLongString(features)) {
        return std::nullopt;
    }
    capabilities.debug = (flags & 0x01) != 0;

    std::istringstream stream(features);
    std::string feature;
    while (std::getline(stream, feature, ',')) {
        if (!feature.empty()) {
            capabilities.features.push_back(feature);
        }
    }
    return capabilities;
}

// Errors

std::vector<uint8_t> encodeError(const ErrorReport& report) {
    ByteWriter writer;
    writer.writeShortString(report.code);
    writer.writeLongString(report.message);
    return writer.take();
}

std::optional<ErrorReport> parseError(const std::vector<uint8_t>& payload) {
    ByteReader reader(payload);
    ErrorReport report;
    if (!reader.readShortString(report.code) || !reader.readLongString(report.message)) {
        return std::nullopt;
    }
    return report;
}

// Gradient

std::vector<uint8_t> encodeGradient(const std::vector<uint32_t>& colors) {
    size_t count = std::min(colors.size(), MAX_GRADIENT_COLORS);

    ByteWriter writer;
    writer.writeU8(static_cast<uint8_t>(count));
    for (size_t i = 0; i < count; ++i) {
        writer.writeU8(static_cast<uint8_t>(colors[i] >> 16));
        writer.writeU8(static_cast<uint8_t>(colors[i] >> 8));
        writer.writeU8(static_cast<uint8_t>(colors[i]));
    }
    return writer.take();
}

std::optional<std::vector<uint32_t>> parseGradient(const std::vector<uint8_t>& payload) {
    ByteReader reader(payload);
    uint8_t count = 0;
    std::vector<uint8_t> rgb;
    if (!reader.readU8(count) || !reader.readBytes(static_cast<size_t>(count) * 3, rgb)) {
        return std::nullopt;
    }

    std::vector<uint32_t> colors;
    colors.reserve(count);
    for (size_t i = 0; i + 2 < rgb.size(); i += 3) {
        colors.push_back(0xFF000000u | (static_cast<uint32_t>(rgb[i]) << 16) |
                         (static_cast<uint32_t>(rgb[i + 1]) << 8) | rgb[i + 2]);
    }
    return colors;
}

// Bulk transfer control

std::vector<uint8_t> encodeTransferStart(const TransferStart& start) {
    ByteWriter writer;
    writer.writeBytes(start.checksum.data(), start.checksum.size());
    writer.writeU32(start.totalChunks);
    writer.writeU32(start.originalSize);
    writer.writeU8(start.compressed ? TRANSFER_FLAG_COMPRESSED : 0x00);
    if (start.compressed) {
        writer.writeU32(start.compressedSize);
    }
    writer.writeString(start.assetId);
    return writer.take();
}

std::optional<TransferStart> parseTransferStart(const std::vector<uint8_t>& payload) {
    ByteReader reader(payload);
    TransferStart start;
    uint8_t flags = 0;
    if (!reader.readDigest(start.checksum) ||
        !reader.readU32(start.totalChunks) ||
        !reader.readU32(start.originalSize) ||
        !reader.readU8(flags)) {
        return std::nullopt;
    }

    start.compressed = (flags & TRANSFER_FLAG_COMPRESSED) != 0;
    if (start.compressed) {
        if (!reader.readU32(start.compressedSize)) {
            return std::nullopt;
        }
    } else {
        start.compressedSize = start.originalSize;
    }

    start.assetId = reader.readRemainingString();
    return start;
}

std::vector<uint8_t> encodeTransferEnd(const TransferEnd& end) {
    ByteWriter writer;
    writer.writeBytes(end.checksum.data(), end.checksum.size());
    writer.writeU8(end.success ? 0x01 : 0x00);
    return writer.take();
}

std::optional<TransferEnd> parseTransferEnd(const std::vector<uint8_t>& payload) {
    ByteReader reader(payload);
    TransferEnd end;
    uint8_t success = 0;
    if (!reader.readDigest(end.checksum) || !reader.readU8(success)) {
        return std::nullopt;
    }
    end.success = success != 0;
    return end;
}

std::vector<uint8_t> encodeWeatherStart(const WeatherStart& start) {
    ByteWriter writer;
    writer.writeU32(start.originalSize);
    writer.writeU32(start.compressedSize);
    writer.writeU32(start.totalChunks);
    writer.writeU32(0);  // reserved
    writer.writeI64(start.timestampMs);
    writer.writeBytes(start.checksum.data(), start.checksum.size());
    writer.writeCString(start.mode);
    writer.writeCString(start.location);
    return writer.take();
}

std::optional<WeatherStart> parseWeatherStart(const std::vector<uint8_t>& payload) {
    ByteReader reader(payload);
    WeatherStart start;
    uint32_t reserved = 0;
    if (!reader.readU32(start.originalSize) ||
        !reader.readU32(start.compressedSize) ||
        !reader.readU32(start.totalChunks) ||
        !reader.readU32(reserved) ||
        !reader.readI64(start.timestampMs) ||
        !reader.readDigest(start.checksum) ||
        !reader.readCString(start.mode) ||
        !reader.readCString(start.location)) {
        return std::nullopt;
    }
    return start;
}

} // namespace nocturne::protocol
