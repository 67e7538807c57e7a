#pragma once

#include <vector>
#include <string>
#include <optional>
#include <map>
#include <cstdint>
#include <utility>

#include "link_types.hpp"
#include "protocol/frame_codec.hpp"

namespace nocturne::transfer {

/**
 * Start / chunk / end message types used by one kind of transfer
 */
struct TransferMessageTypes {
    uint16_t start;
    uint16_t chunk;
    uint16_t end;
};

TransferMessageTypes transferMessageTypes(AssetClass assetClass, bool isTest);

/** Maps a start/chunk/end message type back to its asset class and test flag. */
struct TransferTypeInfo {
    AssetClass assetClass;
    bool isTest;
    enum class Role { Start, Chunk, End } role;
};

std::optional<TransferTypeInfo> classifyTransferType(uint16_t type);

/**
 * Extra fields needed by asset classes whose start message carries metadata
 */
struct PlanOptions {
    AssetClass assetClass = AssetClass::AlbumArt;
    int64_t timestampMs = 0;
    std::string mode;       // weather: "hourly" / "weekly"
};

/**
 * @brief In-memory plan for one bulk transfer
 *
 * Holds the digest and sizing of the compressed payload together with the
 * encoded frames. The end frame is produced on demand because its success
 * flag is only known once the chunks have been delivered.
 */
struct TransferPlan {
    Digest checksum{};
    uint32_t originalSize = 0;
    uint32_t compressedSize = 0;
    bool compressed = false;
    uint32_t chunkSize = 0;
    uint32_t totalChunks = 0;
    std::vector<std::vector<uint8_t>> chunks;
    bool isTest = false;
    AssetClass assetClass = AssetClass::AlbumArt;
    std::string assetId;

    std::vector<uint8_t> startMessage;
    std::vector<std::vector<uint8_t>> chunkMessages;

    std::vector<uint8_t> endMessage(bool success) const;
};

/**
 * @brief Compresses, digests and splits a payload into framed messages
 */
class ChunkEncoder {
public:
    static constexpr uint32_t MAX_CHUNKS = 0xFFFF;

    explicit ChunkEncoder(const TransferSettings& settings);

    /**
     * chunkSize = max(minimumChunk, (mtu - linkHeaderOverhead) - frameHeader - safetyMargin)
     */
    uint32_t chunkSizeFor(uint16_t mtu, AssetClass assetClass = AssetClass::AlbumArt) const;

    /**
     * @throws std::invalid_argument on an MTU of zero, an oversized source or
     *         a plan that needs more chunks than the 16-bit message id can index
     * @throws std::runtime_error if compression or digest computation fails
     */
    TransferPlan planTransfer(const std::vector<uint8_t>& source,
                              DigestAlgorithm algorithm,
                              uint16_t mtu,
                              const std::string& assetId,
                              bool isTest,
                              const PlanOptions& options = PlanOptions()) const;

    const TransferSettings& settings() const { return settings_; }

private:
    TransferSettings settings_;
};

enum class ReassemblyState {
    Idle,
    Receiving,
    Complete,
    Failed
};

enum class ReassemblyError {
    None,
    AbortedBySender,
    UnexpectedChunkCount,
    SizeMismatch,
    ChecksumMismatch,
    DecompressionFailed,
    OriginalSizeMismatch,
    MalformedControl
};

const char* reassemblyStateName(ReassemblyState state);
const char* reassemblyErrorName(ReassemblyError error);

struct ReassemblyResult {
    AssetClass assetClass = AssetClass::AlbumArt;
    bool isTest = false;
    ReassemblyState state = ReassemblyState::Idle;
    ReassemblyError error = ReassemblyError::None;
    std::string assetId;
    std::string mode;
    Digest checksum{};
    uint32_t chunksReceived = 0;
    uint32_t totalChunks = 0;
    std::vector<uint8_t> data;      // decompressed payload, only when Complete
};

/**
 * @brief Receive-side mirror of ChunkEncoder
 *
 * One reassembly slot per asset class. A start frame supersedes any partial
 * transfer in the same slot. Nothing is decompressed until an end frame with
 * success=true arrives and every size and digest check has passed.
 */
class ChunkDecoder {
public:
    explicit ChunkDecoder(DigestAlgorithm algorithm = DigestAlgorithm::Sha256,
                          size_t maxAssetSize = 16 * 1024 * 1024);

    /**
     * Feeds one decoded frame. Returns a result when the frame finished a
     * transfer (successfully or not); non-transfer frames are ignored.
     */
    std::optional<ReassemblyResult> handleFrame(const protocol::DecodedFrame& frame);

    /** Test transfers reassemble in their own slot beside the regular one. */
    ReassemblyState state(AssetClass assetClass, bool isTest = false) const;
    uint32_t chunksReceived(AssetClass assetClass, bool isTest = false) const;
    uint64_t rejectedChunks() const { return rejectedChunks_; }
    void reset();

private:
    struct Slot {
        ReassemblyState state = ReassemblyState::Idle;
        bool isTest = false;
        Digest checksum{};
        uint32_t totalChunks = 0;
        uint32_t originalSize = 0;
        uint32_t compressedSize = 0;
        bool compressed = false;
        std::string assetId;
        std::string mode;
        std::map<uint16_t, std::vector<uint8_t>> chunks;
        size_t bytesReceived = 0;
    };

    void handleStart(Slot& slot, const TransferTypeInfo& info, const protocol::DecodedFrame& frame);
    void handleChunk(Slot& slot, const protocol::DecodedFrame& frame);
    ReassemblyResult handleEnd(Slot& slot, const TransferTypeInfo& info, const protocol::DecodedFrame& frame);
    ReassemblyResult fail(Slot& slot, const TransferTypeInfo& info, ReassemblyError error);

    using SlotKey = std::pair<AssetClass, bool>;

    DigestAlgorithm algorithm_;
    size_t maxAssetSize_;
    std::map<SlotKey, Slot> slots_;
    uint64_t rejectedChunks_ = 0;
};

} // namespace nocturne::transfer
