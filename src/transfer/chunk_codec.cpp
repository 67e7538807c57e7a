#include "transfer/chunk_codec.hpp"
#include "transfer/compression.hpp"
#include "transfer/digest.hpp"
#include "protocol/payloads.hpp"
#include "system/logger.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace nocturne::transfer {

using namespace protocol;

TransferMessageTypes transferMessageTypes(AssetClass assetClass, bool isTest) {
    if (assetClass == AssetClass::Weather) {
        return {message_type::WEATHER_START, message_type::WEATHER_CHUNK, message_type::WEATHER_END};
    }
    if (isTest) {
        return {message_type::TEST_ALBUM_ART_START, message_type::TEST_ALBUM_ART_CHUNK,
                message_type::TEST_ALBUM_ART_END};
    }
    return {message_type::ALBUM_ART_START, message_type::ALBUM_ART_CHUNK, message_type::ALBUM_ART_END};
}

std::optional<TransferTypeInfo> classifyTransferType(uint16_t type) {
    using Role = TransferTypeInfo::Role;

    switch (type) {
        case message_type::ALBUM_ART_START: return TransferTypeInfo{AssetClass::AlbumArt, false, Role::Start};
        case message_type::ALBUM_ART_CHUNK: return TransferTypeInfo{AssetClass::AlbumArt, false, Role::Chunk};
        case message_type::ALBUM_ART_END: return TransferTypeInfo{AssetClass::AlbumArt, false, Role::End};
        case message_type::TEST_ALBUM_ART_START: return TransferTypeInfo{AssetClass::AlbumArt, true, Role::Start};
        case message_type::TEST_ALBUM_ART_CHUNK: return TransferTypeInfo{AssetClass::AlbumArt, true, Role::Chunk};
        case message_type::TEST_ALBUM_ART_END: return TransferTypeInfo{AssetClass::AlbumArt, true, Role::End};
        case message_type::WEATHER_START: return TransferTypeInfo{AssetClass::Weather, false, Role::Start};
        case message_type::WEATHER_CHUNK: return TransferTypeInfo{AssetClass::Weather, false, Role::Chunk};
        case message_type::WEATHER_END: return TransferTypeInfo{AssetClass::Weather, false, Role::End};
        default: return std::nullopt;
    }
}

std::vector<uint8_t> TransferPlan::endMessage(bool success) const {
    TransferEnd end;
    end.checksum = checksum;
    end.success = success;
    return FrameCodec::encode(transferMessageTypes(assetClass, isTest).end, encodeTransferEnd(end));
}

// ChunkEncoder

ChunkEncoder::ChunkEncoder(const TransferSettings& settings)
    : settings_(settings) {
}

uint32_t ChunkEncoder::chunkSizeFor(uint16_t mtu, AssetClass assetClass) const {
    bool weather = assetClass == AssetClass::Weather;
    uint32_t margin = weather ? settings_.weatherSafetyMargin : settings_.safetyMargin;
    uint32_t minimum = weather ? settings_.weatherMinimumChunkSize : settings_.minimumChunkSize;
    uint32_t overhead = settings_.linkHeaderOverhead + static_cast<uint32_t>(HEADER_SIZE) + margin;

    if (mtu <= overhead) {
        return minimum;
    }
    return std::max(minimum, static_cast<uint32_t>(mtu) - overhead);
}

TransferPlan ChunkEncoder::planTransfer(const std::vector<uint8_t>& source,
                                        DigestAlgorithm algorithm,
                                        uint16_t mtu,
                                        const std::string& assetId,
                                        bool isTest,
                                        const PlanOptions& options) const {
    if (mtu == 0) {
        throw std::invalid_argument("MTU must be positive");
    }
    if (source.size() > settings_.maxAssetSize || source.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("asset of " + std::to_string(source.size()) + " bytes exceeds the transfer limit");
    }

    TransferPlan plan;
    plan.assetClass = options.assetClass;
    plan.isTest = isTest && options.assetClass == AssetClass::AlbumArt;
    plan.assetId = assetId;
    plan.originalSize = static_cast<uint32_t>(source.size());

    // Deployed weather receivers always inflate, so weather ignores the compression switch
    bool compress = !source.empty() &&
                    (settings_.compressionEnabled || options.assetClass == AssetClass::Weather);

    std::vector<uint8_t> payload = compress ? gzipCompress(source, settings_.compressionLevel) : source;
    plan.compressed = compress;
    plan.compressedSize = static_cast<uint32_t>(payload.size());
    plan.checksum = computeDigest(algorithm, payload);
    plan.chunkSize = chunkSizeFor(mtu, options.assetClass);

    size_t totalChunks = (payload.size() + plan.chunkSize - 1) / plan.chunkSize;
    if (totalChunks > MAX_CHUNKS) {
        throw std::invalid_argument("transfer needs " + std::to_string(totalChunks) +
                                    " chunks, more than a 16-bit chunk index allows");
    }
    plan.totalChunks = static_cast<uint32_t>(totalChunks);

    TransferMessageTypes types = transferMessageTypes(plan.assetClass, plan.isTest);

    if (plan.assetClass == AssetClass::Weather) {
        WeatherStart start;
        start.originalSize = plan.originalSize;
        start.compressedSize = plan.compressedSize;
        start.totalChunks = plan.totalChunks;
        start.timestampMs = options.timestampMs;
        start.checksum = plan.checksum;
        start.mode = options.mode;
        start.location = assetId;
        plan.startMessage = FrameCodec::encode(types.start, encodeWeatherStart(start));
    } else {
        TransferStart start;
        start.checksum = plan.checksum;
        start.totalChunks = plan.totalChunks;
        start.originalSize = plan.originalSize;
        start.compressed = plan.compressed;
        start.compressedSize = plan.compressedSize;
        start.assetId = assetId;
        plan.startMessage = FrameCodec::encode(types.start, encodeTransferStart(start));
    }

    plan.chunks.reserve(totalChunks);
    plan.chunkMessages.reserve(totalChunks);
    for (size_t index = 0; index < totalChunks; ++index) {
        size_t offset = index * plan.chunkSize;
        size_t length = std::min<size_t>(plan.chunkSize, payload.size() - offset);
        std::vector<uint8_t> chunk(payload.begin() + static_cast<std::ptrdiff_t>(offset),
                                   payload.begin() + static_cast<std::ptrdiff_t>(offset + length));
        plan.chunkMessages.push_back(FrameCodec::encode(types.chunk, chunk, static_cast<uint16_t>(index)));
        plan.chunks.push_back(std::move(chunk));
    }

    Logger::debug("ChunkEncoder: {} '{}' {} -> {} bytes, {} chunks of {} (mtu {})",
                  assetClassName(plan.assetClass), assetId, plan.originalSize, plan.compressedSize,
                  plan.totalChunks, plan.chunkSize, mtu);
    return plan;
}

// ChunkDecoder

const char* reassemblyStateName(ReassemblyState state) {
    switch (state) {
        case ReassemblyState::Idle: return "idle";
        case ReassemblyState::Receiving: return "receiving";
        case ReassemblyState::Complete: return "complete";
        case ReassemblyState::Failed: return "failed";
    }
    return "unknown";
}

const char* reassemblyErrorName(ReassemblyError error) {
    switch (error) {
        case ReassemblyError::None: return "none";
        case ReassemblyError::AbortedBySender: return "aborted_by_sender";
        case ReassemblyError::UnexpectedChunkCount: return "unexpected_chunk_count";
        case ReassemblyError::SizeMismatch: return "size_mismatch";
        case ReassemblyError::ChecksumMismatch: return "checksum_mismatch";
        case ReassemblyError::DecompressionFailed: return "decompression_failed";
        case ReassemblyError::OriginalSizeMismatch: return "original_size_mismatch";
        case ReassemblyError::MalformedControl: return "malformed_control";
    }
    return "unknown";
}

ChunkDecoder::ChunkDecoder(DigestAlgorithm algorithm, size_t maxAssetSize)
    : algorithm_(algorithm)
    , maxAssetSize_(maxAssetSize) {
}

std::optional<ReassemblyResult> ChunkDecoder::handleFrame(const DecodedFrame& frame) {
    if (!frame.isComplete) {
        return std::nullopt;
    }

    auto info = classifyTransferType(frame.header.type);
    if (!info) {
        return std::nullopt;
    }

    Slot& slot = slots_[SlotKey(info->assetClass, info->isTest)];

    switch (info->role) {
        case TransferTypeInfo::Role::Start:
            handleStart(slot, *info, frame);
            if (slot.state == ReassemblyState::Failed) {
                return fail(slot, *info, ReassemblyError::MalformedControl);
            }
            return std::nullopt;

        case TransferTypeInfo::Role::Chunk:
            handleChunk(slot, frame);
            return std::nullopt;

        case TransferTypeInfo::Role::End:
            return handleEnd(slot, *info, frame);
    }
    return std::nullopt;
}

void ChunkDecoder::handleStart(Slot& slot, const TransferTypeInfo& info, const DecodedFrame& frame) {
    if (slot.state == ReassemblyState::Receiving) {
        Logger::info("ChunkDecoder: new {} start supersedes '{}' after {}/{} chunks",
                     assetClassName(info.assetClass), slot.assetId, slot.chunks.size(), slot.totalChunks);
    }

    slot = Slot();
    slot.isTest = info.isTest;

    if (info.assetClass == AssetClass::Weather) {
        auto start = parseWeatherStart(frame.payload);
        if (!start) {
            slot.state = ReassemblyState::Failed;
            return;
        }
        slot.checksum = start->checksum;
        slot.totalChunks = start->totalChunks;
        slot.originalSize = start->originalSize;
        slot.compressedSize = start->compressedSize;
        slot.compressed = start->compressedSize > 0;
        slot.assetId = start->location;
        slot.mode = start->mode;
    } else {
        auto start = parseTransferStart(frame.payload);
        if (!start) {
            slot.state = ReassemblyState::Failed;
            return;
        }
        slot.checksum = start->checksum;
        slot.totalChunks = start->totalChunks;
        slot.originalSize = start->originalSize;
        slot.compressedSize = start->compressedSize;
        slot.compressed = start->compressed;
        slot.assetId = start->assetId;
    }

    if (slot.compressedSize > maxAssetSize_ || slot.originalSize > maxAssetSize_) {
        Logger::warning("ChunkDecoder: announced transfer of {} bytes exceeds limit", slot.originalSize);
        slot.state = ReassemblyState::Failed;
        return;
    }

    slot.state = ReassemblyState::Receiving;
}

void ChunkDecoder::handleChunk(Slot& slot, const DecodedFrame& frame) {
    uint16_t index = frame.header.messageId;

    if (slot.state != ReassemblyState::Receiving) {
        ++rejectedChunks_;
        return;
    }
    if (index >= slot.totalChunks || slot.chunks.count(index) > 0) {
        Logger::debug("ChunkDecoder: rejecting chunk {} of '{}'", index, slot.assetId);
        ++rejectedChunks_;
        return;
    }
    if (slot.bytesReceived + frame.payload.size() > slot.compressedSize) {
        Logger::debug("ChunkDecoder: chunk {} overruns announced size of '{}'", index, slot.assetId);
        ++rejectedChunks_;
        return;
    }

    slot.bytesReceived += frame.payload.size();
    slot.chunks.emplace(index, frame.payload);
}

ReassemblyResult ChunkDecoder::handleEnd(Slot& slot, const TransferTypeInfo& info, const DecodedFrame& frame) {
    auto end = parseTransferEnd(frame.payload);
    if (!end) {
        return fail(slot, info, ReassemblyError::MalformedControl);
    }

    if (slot.state != ReassemblyState::Receiving) {
        // end without a matching start; nothing to discard
        return fail(slot, info, end->success ? ReassemblyError::MalformedControl
                                             : ReassemblyError::AbortedBySender);
    }

    if (!end->success) {
        Logger::info("ChunkDecoder: sender aborted '{}' after {}/{} chunks, discarding",
                     slot.assetId, slot.chunks.size(), slot.totalChunks);
        return fail(slot, info, ReassemblyError::AbortedBySender);
    }

    if (slot.chunks.size() != slot.totalChunks) {
        Logger::warning("ChunkDecoder: '{}' ended with {}/{} chunks",
                        slot.assetId, slot.chunks.size(), slot.totalChunks);
        return fail(slot, info, ReassemblyError::UnexpectedChunkCount);
    }

    if (slot.bytesReceived != slot.compressedSize) {
        return fail(slot, info, ReassemblyError::SizeMismatch);
    }

    if (end->checksum != slot.checksum) {
        return fail(slot, info, ReassemblyError::ChecksumMismatch);
    }

    std::vector<uint8_t> assembled;
    assembled.reserve(slot.bytesReceived);
    for (const auto& entry : slot.chunks) {
        assembled.insert(assembled.end(), entry.second.begin(), entry.second.end());
    }

    Digest computed{};
    try {
        computed = computeDigest(algorithm_, assembled);
    } catch (const std::runtime_error& e) {
        Logger::error("ChunkDecoder: digest failed: {}", e.what());
        return fail(slot, info, ReassemblyError::ChecksumMismatch);
    }
    if (computed != slot.checksum) {
        Logger::warning("ChunkDecoder: digest mismatch on '{}' (expected {}, got {})",
                        slot.assetId, toHex(slot.checksum), toHex(computed));
        return fail(slot, info, ReassemblyError::ChecksumMismatch);
    }

    std::vector<uint8_t> data;
    if (slot.compressed && !assembled.empty()) {
        auto inflated = gzipDecompress(assembled, maxAssetSize_);
        if (!inflated) {
            return fail(slot, info, ReassemblyError::DecompressionFailed);
        }
        data = std::move(*inflated);
    } else {
        data = std::move(assembled);
    }

    if (data.size() != slot.originalSize) {
        return fail(slot, info, ReassemblyError::OriginalSizeMismatch);
    }

    ReassemblyResult result;
    result.assetClass = info.assetClass;
    result.isTest = slot.isTest;
    result.state = ReassemblyState::Complete;
    result.assetId = slot.assetId;
    result.mode = slot.mode;
    result.checksum = slot.checksum;
    result.chunksReceived = static_cast<uint32_t>(slot.chunks.size());
    result.totalChunks = slot.totalChunks;
    result.data = std::move(data);

    Logger::debug("ChunkDecoder: '{}' complete, {} bytes", slot.assetId, result.data.size());

    slot.chunks.clear();
    slot.state = ReassemblyState::Complete;
    return result;
}

ReassemblyResult ChunkDecoder::fail(Slot& slot, const TransferTypeInfo& info, ReassemblyError error) {
    ReassemblyResult result;
    result.assetClass = info.assetClass;
    result.isTest = info.isTest;
    result.state = ReassemblyState::Failed;
    result.error = error;
    result.assetId = slot.assetId;
    result.mode = slot.mode;
    result.checksum = slot.checksum;
    result.chunksReceived = static_cast<uint32_t>(slot.chunks.size());
    result.totalChunks = slot.totalChunks;

    if (error != ReassemblyError::AbortedBySender) {
        Logger::warning("ChunkDecoder: {} transfer '{}' failed: {}",
                        assetClassName(info.assetClass), slot.assetId, reassemblyErrorName(error));
    }

    slot.chunks.clear();
    slot.bytesReceived = 0;
    slot.state = ReassemblyState::Failed;
    return result;
}

ReassemblyState ChunkDecoder::state(AssetClass assetClass, bool isTest) const {
    auto it = slots_.find(SlotKey(assetClass, isTest));
    return it == slots_.end() ? ReassemblyState::Idle : it->second.state;
}

uint32_t ChunkDecoder::chunksReceived(AssetClass assetClass, bool isTest) const {
    auto it = slots_.find(SlotKey(assetClass, isTest));
    return it == slots_.end() ? 0 : static_cast<uint32_t>(it->second.chunks.size());
}

void ChunkDecoder::reset() {
    slots_.clear();
    rejectedChunks_ = 0;
}

} // namespace nocturne::transfer
