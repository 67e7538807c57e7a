#pragma once

#include <cstdint>
#include <cstddef>

namespace nocturne::protocol {

constexpr uint8_t PROTOCOL_VERSION = 2;
constexpr size_t HEADER_SIZE = 16;
constexpr uint16_t MAX_MESSAGE_TYPE = 0x0FFF;

/**
 * Message type identifiers (12-bit), namespaced by their high nibble:
 * system 0x0xx, command 0x1xx, state 0x2xx, album art transfer 0x3xx,
 * error 0x4xx, weather transfer 0x5xx, gradient 0x6xx.
 */
namespace message_type {

// System
constexpr uint16_t CAPABILITIES = 0x001;
constexpr uint16_t TIME_SYNC = 0x002;
constexpr uint16_t PROTOCOL_ENABLE = 0x003;
constexpr uint16_t DEVICE_INFO = 0x004;
constexpr uint16_t CONNECTION_PARAMS = 0x005;
constexpr uint16_t GET_CAPABILITIES = 0x006;
constexpr uint16_t ENABLE_BINARY_INCREMENTAL = 0x007;
constexpr uint16_t REQUEST_HIGH_PRIORITY_CONNECTION = 0x008;
constexpr uint16_t OPTIMIZE_CONNECTION_PARAMS = 0x009;

// Commands
constexpr uint16_t CMD_PLAY = 0x101;
constexpr uint16_t CMD_PAUSE = 0x102;
constexpr uint16_t CMD_NEXT = 0x103;
constexpr uint16_t CMD_PREVIOUS = 0x104;
constexpr uint16_t CMD_SEEK_TO = 0x105;
constexpr uint16_t CMD_SET_VOLUME = 0x106;
constexpr uint16_t CMD_REQUEST_STATE = 0x107;
constexpr uint16_t CMD_REQUEST_TIMESTAMP = 0x108;
constexpr uint16_t CMD_ALBUM_ART_QUERY = 0x109;
constexpr uint16_t CMD_TEST_ALBUM_ART = 0x10A;

// State
constexpr uint16_t STATE_FULL = 0x201;
constexpr uint16_t STATE_ARTIST = 0x202;
constexpr uint16_t STATE_ALBUM = 0x203;
constexpr uint16_t STATE_TRACK = 0x204;
constexpr uint16_t STATE_POSITION = 0x205;
constexpr uint16_t STATE_DURATION = 0x206;
constexpr uint16_t STATE_PLAY_STATUS = 0x207;
constexpr uint16_t STATE_VOLUME = 0x208;
constexpr uint16_t STATE_ARTIST_ALBUM = 0x209;

// Album art transfer
constexpr uint16_t ALBUM_ART_START = 0x301;
constexpr uint16_t ALBUM_ART_CHUNK = 0x302;
constexpr uint16_t ALBUM_ART_END = 0x303;
constexpr uint16_t ALBUM_ART_NOT_AVAILABLE = 0x304;

// Test album art transfer (unpaced)
constexpr uint16_t TEST_ALBUM_ART_START = 0x310;
constexpr uint16_t TEST_ALBUM_ART_CHUNK = 0x311;
constexpr uint16_t TEST_ALBUM_ART_END = 0x312;

// Errors
constexpr uint16_t ERROR = 0x401;
constexpr uint16_t ERROR_COMMAND_FAILED = 0x402;
constexpr uint16_t ERROR_INVALID_MESSAGE = 0x403;

// Weather transfer
constexpr uint16_t WEATHER_START = 0x501;
constexpr uint16_t WEATHER_CHUNK = 0x502;
constexpr uint16_t WEATHER_END = 0x503;

constexpr uint16_t GRADIENT_COLORS = 0x601;

} // namespace message_type

/**
 * Message type family (high nibble of the 12-bit type)
 */
enum class MessageCategory : uint8_t {
    System = 0x0,
    Command = 0x1,
    State = 0x2,
    AlbumArt = 0x3,
    Error = 0x4,
    Weather = 0x5,
    Gradient = 0x6,
    Unknown = 0xF
};

MessageCategory messageCategory(uint16_t type);
const char* messageTypeName(uint16_t type);
bool isKnownMessageType(uint16_t type);

inline bool isCommandType(uint16_t type) {
    return type >= message_type::CMD_PLAY && type <= message_type::CMD_TEST_ALBUM_ART;
}

} // namespace nocturne::protocol
