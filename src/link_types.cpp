#include "link_types.hpp"

namespace nocturne {

const char* channelName(Channel channel) {
    switch (channel) {
        case Channel::Command: return "command";
        case Channel::State: return "state";
        case Channel::Bulk: return "bulk";
        case Channel::DebugLog: return "debug_log";
        case Channel::DeviceInfo: return "device_info";
    }
    return "unknown";
}

const char* laneName(Lane lane) {
    switch (lane) {
        case Lane::Urgent: return "urgent";
        case Lane::Normal: return "normal";
        case Lane::Bulk: return "bulk";
    }
    return "unknown";
}

const char* assetClassName(AssetClass assetClass) {
    switch (assetClass) {
        case AssetClass::AlbumArt: return "album_art";
        case AssetClass::Weather: return "weather";
    }
    return "unknown";
}

const char* connectionQualityName(ConnectionQuality quality) {
    switch (quality) {
        case ConnectionQuality::Poor: return "poor";
        case ConnectionQuality::Fair: return "fair";
        case ConnectionQuality::Good: return "good";
        case ConnectionQuality::Excellent: return "excellent";
    }
    return "unknown";
}

size_t QueueSettings::capacityFor(Lane lane) const {
    switch (lane) {
        case Lane::Urgent: return urgentCapacity;
        case Lane::Normal: return normalCapacity;
        case Lane::Bulk: return bulkCapacity;
    }
    return 0;
}

} // namespace nocturne
