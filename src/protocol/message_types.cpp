#include "protocol/message_types.hpp"

#include <cstring>

namespace nocturne::protocol {

MessageCategory messageCategory(uint16_t type) {
    switch ((type >> 8) & 0x0F) {
        case 0x0: return MessageCategory::System;
        case 0x1: return MessageCategory::Command;
        case 0x2: return MessageCategory::State;
        case 0x3: return MessageCategory::AlbumArt;
        case 0x4: return MessageCategory::Error;
        case 0x5: return MessageCategory::Weather;
        case 0x6: return MessageCategory::Gradient;
        default: return MessageCategory::Unknown;
    }
}

const char* messageTypeName(uint16_t type) {
    using namespace message_type;

    switch (type) {
        case CAPABILITIES: return "CAPABILITIES";
        case TIME_SYNC: return "TIME_SYNC";
        case PROTOCOL_ENABLE: return "PROTOCOL_ENABLE";
        case DEVICE_INFO: return "DEVICE_INFO";
        case CONNECTION_PARAMS: return "CONNECTION_PARAMS";
        case GET_CAPABILITIES: return "GET_CAPABILITIES";
        case ENABLE_BINARY_INCREMENTAL: return "ENABLE_BINARY_INCREMENTAL";
        case REQUEST_HIGH_PRIORITY_CONNECTION: return "REQUEST_HIGH_PRIORITY_CONNECTION";
        case OPTIMIZE_CONNECTION_PARAMS: return "OPTIMIZE_CONNECTION_PARAMS";

        case CMD_PLAY: return "CMD_PLAY";
        case CMD_PAUSE: return "CMD_PAUSE";
        case CMD_NEXT: return "CMD_NEXT";
        case CMD_PREVIOUS: return "CMD_PREVIOUS";
        case CMD_SEEK_TO: return "CMD_SEEK_TO";
        case CMD_SET_VOLUME: return "CMD_SET_VOLUME";
        case CMD_REQUEST_STATE: return "CMD_REQUEST_STATE";
        case CMD_REQUEST_TIMESTAMP: return "CMD_REQUEST_TIMESTAMP";
        case CMD_ALBUM_ART_QUERY: return "CMD_ALBUM_ART_QUERY";
        case CMD_TEST_ALBUM_ART: return "CMD_TEST_ALBUM_ART";

        case STATE_FULL: return "STATE_FULL";
        case STATE_ARTIST: return "STATE_ARTIST";
        case STATE_ALBUM: return "STATE_ALBUM";
        case STATE_TRACK: return "STATE_TRACK";
        case STATE_POSITION: return "STATE_POSITION";
        case STATE_DURATION: return "STATE_DURATION";
        case STATE_PLAY_STATUS: return "STATE_PLAY_STATUS";
        case STATE_VOLUME: return "STATE_VOLUME";
        case STATE_ARTIST_ALBUM: return "STATE_ARTIST_ALBUM";

        case ALBUM_ART_START: return "ALBUM_ART_START";
        case ALBUM_ART_CHUNK: return "ALBUM_ART_CHUNK";
        case ALBUM_ART_END: return "ALBUM_ART_END";
        case ALBUM_ART_NOT_AVAILABLE: return "ALBUM_ART_NOT_AVAILABLE";
        case TEST_ALBUM_ART_START: return "TEST_ALBUM_ART_START";
        case TEST_ALBUM_ART_CHUNK: return "TEST_ALBUM_ART_CHUNK";
        case TEST_ALBUM_ART_END: return "TEST_ALBUM_ART_END";

        case ERROR: return "ERROR";
        case ERROR_COMMAND_FAILED: return "ERROR_COMMAND_FAILED";
        case ERROR_INVALID_MESSAGE: return "ERROR_INVALID_MESSAGE";

        case WEATHER_START: return "WEATHER_START";
        case WEATHER_CHUNK: return "WEATHER_CHUNK";
        case WEATHER_END: return "WEATHER_END";

        case GRADIENT_COLORS: return "GRADIENT_COLORS";

        default: return "UNKNOWN";
    }
}

bool isKnownMessageType(uint16_t type) {
    return std::strcmp(messageTypeName(type), "UNKNOWN") != 0;
}

} // namespace nocturne::protocol
