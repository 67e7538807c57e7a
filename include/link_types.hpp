#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace nocturne {

using PeerId = std::string;

/** 32-byte digest carried in transfer start/end messages */
using Digest = std::array<uint8_t, 32>;

/**
 * Byte-stream channels exposed by the peripheral
 */
enum class Channel : uint8_t {
    Command = 0,      // peer -> host writes
    State = 1,        // state, control and weather notifications
    Bulk = 2,         // album art transfers
    DebugLog = 3,
    DeviceInfo = 4
};

/**
 * Scheduler priority lanes, drained in declaration order
 */
enum class Lane : uint8_t {
    Urgent = 0,
    Normal = 1,
    Bulk = 2
};

constexpr size_t LANE_COUNT = 3;

/**
 * Kinds of bulk assets; each peer holds at most one active transfer per class
 */
enum class AssetClass : uint8_t {
    AlbumArt = 0,
    Weather = 1
};

enum class DigestAlgorithm : uint8_t {
    Sha256 = 0,
    Sha3_256 = 1,
    Blake2s256 = 2
};

enum class ConnectionQuality : uint8_t {
    Poor = 0,
    Fair = 1,
    Good = 2,
    Excellent = 3
};

const char* channelName(Channel channel);
const char* laneName(Lane lane);
const char* assetClassName(AssetClass assetClass);
const char* connectionQualityName(ConnectionQuality quality);

/**
 * @brief Scheduler, pacing and backoff parameters
 */
struct QueueSettings {
    size_t urgentCapacity = 50;
    size_t normalCapacity = 100;
    size_t bulkCapacity = 200;

    uint32_t minMessageIntervalMs = 10;
    uint32_t minBulkIntervalMs = 5;     // chunk delay
    uint32_t idleWaitMs = 10;

    uint32_t baseBackoffMs = 50;
    uint32_t maxBackoffMs = 1000;
    uint32_t backoffDecayMs = 10;

    uint32_t maxUrgentRetries = 3;
    uint32_t maxCriticalRetries = 1;

    size_t capacityFor(Lane lane) const;
};

/**
 * @brief Bulk transfer encoding parameters
 */
struct TransferSettings {
    bool compressionEnabled = true;
    int compressionLevel = 6;
    DigestAlgorithm digest = DigestAlgorithm::Sha256;

    uint32_t minimumChunkSize = 16;
    uint32_t weatherMinimumChunkSize = 50;
    uint32_t linkHeaderOverhead = 3;
    uint32_t safetyMargin = 4;
    uint32_t weatherSafetyMargin = 20;

    uint32_t completionTimeoutMs = 30000;
    uint32_t endMessageTimeoutMs = 2000;
    uint32_t enqueueRetryDelayMs = 5;
    bool refuseWhenPoorQuality = true;

    size_t maxAssetSize = 4 * 1024 * 1024;
};

/**
 * @brief Link-level identity and negotiation defaults
 */
struct LinkSettings {
    uint16_t defaultMtu = 23;
    uint16_t maxMtu = 517;
    std::string version = "1.0.0";
    std::vector<std::string> features = {"binary", "album_art", "weather", "gradient", "incremental"};
    std::string timezone = "UTC";
    bool debug = false;
    size_t maxFrameSize = 64 * 1024;
};

struct LogSettings {
    std::string level = "info";
    std::string file = "nocturne_link.log";
    bool consoleOutput = true;
    bool fileOutput = false;
    size_t maxFileSize = 10 * 1024 * 1024;
    size_t maxBackupFiles = 3;
};

struct LinkConfiguration {
    QueueSettings queue;
    TransferSettings transfer;
    LinkSettings link;
    LogSettings logging;
};

} // namespace nocturne
