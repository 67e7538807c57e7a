#include "transport/command_dispatcher.hpp"
#include "system/logger.hpp"

#include <iomanip>
#include <sstream>

namespace nocturne::transport {

using namespace nocturne::protocol;

namespace {

std::string hexType(uint16_t type) {
    std::ostringstream out;
    out << "0x" << std::hex << std::setw(3) << std::setfill('0') << type;
    return out.str();
}

} // namespace

CommandDispatcher::CommandDispatcher(transfer::TransferOrchestrator& orchestrator, size_t maxFrameSize)
    : orchestrator_(orchestrator)
    , maxFrameSize_(maxFrameSize) {
    disconnectHandle_ = orchestrator_.addDisconnectListener([this](const PeerId& peer) {
        removePeer(peer);
    });
}

CommandDispatcher::~CommandDispatcher() {
    orchestrator_.removeDisconnectListener(disconnectHandle_);
}

void CommandDispatcher::setCommandHandler(CommandHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

size_t CommandDispatcher::handleWrite(const PeerId& peer, const std::vector<uint8_t>& bytes) {
    if (!orchestrator_.sessions().contains(peer)) {
        Logger::warning("CommandDispatcher: write from unknown peer {} ignored", peer);
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.ignoredWrites++;
        return 0;
    }
    orchestrator_.onPeerActivity(peer);

    std::vector<DecodedFrame> frames;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = readers_.find(peer);
        if (it == readers_.end()) {
            it = readers_.emplace(peer, FrameReader(maxFrameSize_)).first;
        }

        FrameReader& reader = it->second;
        uint64_t errorsBefore = reader.errorCount();
        reader.append(bytes);
        while (auto frame = reader.next()) {
            frames.push_back(std::move(*frame));
        }

        uint64_t newErrors = reader.errorCount() - errorsBefore;
        if (newErrors > 0) {
            stats_.framingErrors += newErrors;
            Logger::debug("CommandDispatcher: {} framing errors from {} (last: {})",
                          newErrors, peer, frameErrorName(reader.lastError()));
        }
    }

    // dispatched outside the lock: handlers call back into the orchestrator
    for (const auto& frame : frames) {
        dispatchFrame(peer, frame);
    }
    return frames.size();
}

void CommandDispatcher::dispatchFrame(const PeerId& peer, const DecodedFrame& frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.framesHandled++;
    }

    uint16_t type = frame.header.type;
    Logger::debug("CommandDispatcher: {} from {} ({} bytes)", messageTypeName(type), peer, frame.payload.size());

    switch (messageCategory(type)) {
        case MessageCategory::System:
            handleSystem(peer, frame);
            break;
        case MessageCategory::Command:
            handleCommand(peer, frame);
            break;
        case MessageCategory::Error:
            handlePeerError(peer, frame);
            break;
        default:
            rejectInvalid(peer, type, "unsupported message type " + hexType(type));
            break;
    }
}

void CommandDispatcher::handleSystem(const PeerId& peer, const DecodedFrame& frame) {
    switch (frame.header.type) {
        case message_type::GET_CAPABILITIES:
            orchestrator_.setBinaryProtocol(peer, true);
            orchestrator_.sendCapabilities(peer);
            break;

        case message_type::PROTOCOL_ENABLE:
            orchestrator_.setBinaryProtocol(peer, flagValue(frame.payload));
            break;

        case message_type::ENABLE_BINARY_INCREMENTAL: {
            bool enabled = flagValue(frame.payload);
            orchestrator_.setBinaryProtocol(peer, true);
            orchestrator_.setIncrementalUpdates(peer, enabled);
            Logger::info("CommandDispatcher: incremental updates {} for {}", enabled ? "enabled" : "disabled", peer);
            // give the peer a baseline to apply deltas to
            orchestrator_.sendFullState(peer);
            break;
        }

        case message_type::REQUEST_HIGH_PRIORITY_CONNECTION:
        case message_type::OPTIMIZE_CONNECTION_PARAMS:
        case message_type::CONNECTION_PARAMS: {
            // connection parameters belong to the link layer
            Command command;
            command.type = frame.header.type;
            forward(peer, command);
            break;
        }

        default:
            rejectInvalid(peer, frame.header.type, "unsupported system message " + hexType(frame.header.type));
            break;
    }
}

void CommandDispatcher::handleCommand(const PeerId& peer, const DecodedFrame& frame) {
    uint16_t type = frame.header.type;

    switch (type) {
        case message_type::CMD_REQUEST_TIMESTAMP:
            orchestrator_.sendTimeSync(peer);
            return;

        case message_type::CMD_ALBUM_ART_QUERY: {
            std::string hash = parseStringValue(frame.payload);
            if (hash.empty()) {
                orchestrator_.sendCurrentAsset(peer, AssetClass::AlbumArt);
            } else {
                orchestrator_.sendAssetByChecksum(peer, hash);
            }
            return;
        }

        case message_type::CMD_TEST_ALBUM_ART:
            orchestrator_.sendCurrentAsset(peer, AssetClass::AlbumArt, true);
            return;

        case message_type::CMD_REQUEST_STATE:
            if (!orchestrator_.sendFullState(peer)) {
                orchestrator_.sendError(peer, message_type::ERROR_COMMAND_FAILED, "NO_STATE",
                                        "no media state available");
            }
            return;

        default:
            break;
    }

    if (!isCommandType(type)) {
        rejectInvalid(peer, type, "unsupported command " + hexType(type));
        return;
    }

    auto command = parseCommand(type, frame.payload);
    if (!command) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.invalidPayloads++;
        }
        orchestrator_.sendError(peer, message_type::ERROR_INVALID_MESSAGE, "INVALID_PAYLOAD",
                                std::string("malformed ") + messageTypeName(type));
        return;
    }
    forward(peer, *command);
}

void CommandDispatcher::handlePeerError(const PeerId& peer, const DecodedFrame& frame) {
    auto report = parseError(frame.payload);
    if (!report) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.invalidPayloads++;
        return;
    }

    Logger::warning("CommandDispatcher: {} reported {}: {}", peer, report->code, report->message);
    if (report->code == "CHECKSUM_MISMATCH") {
        AssetClass assetClass = report->message.find("weather") != std::string::npos
            ? AssetClass::Weather
            : AssetClass::AlbumArt;
        orchestrator_.reportPeerChecksumMismatch(peer, assetClass);
    }
}

void CommandDispatcher::forward(const PeerId& peer, const Command& command) {
    CommandHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = handler_;
        if (handler) {
            stats_.commandsForwarded++;
        }
    }

    if (!handler) {
        Logger::debug("CommandDispatcher: no handler for {}", messageTypeName(command.type));
        orchestrator_.sendError(peer, message_type::ERROR_COMMAND_FAILED, "NO_HANDLER",
                                std::string("no handler for ") + messageTypeName(command.type));
        return;
    }

    try {
        handler(peer, command);
    } catch (const std::exception& e) {
        Logger::error("CommandDispatcher: handler for {} threw: {}", messageTypeName(command.type), e.what());
        orchestrator_.sendError(peer, message_type::ERROR_COMMAND_FAILED, "COMMAND_FAILED", e.what());
    }
}

void CommandDispatcher::rejectInvalid(const PeerId& peer, uint16_t type, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.unknownTypes++;
    }
    Logger::debug("CommandDispatcher: rejecting {} from {}: {}", hexType(type), peer, reason);
    orchestrator_.sendError(peer, message_type::ERROR_INVALID_MESSAGE, "UNKNOWN_TYPE", reason);
}

void CommandDispatcher::removePeer(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = readers_.find(peer);
    if (it == readers_.end()) {
        return;
    }
    if (it->second.buffered() > 0) {
        Logger::debug("CommandDispatcher: discarding {} buffered bytes from {}", it->second.buffered(), peer);
    }
    readers_.erase(it);
}

CommandDispatcher::Statistics CommandDispatcher::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

bool CommandDispatcher::flagValue(const std::vector<uint8_t>& payload) {
    auto value = parseByteValue(payload);
    return !value || *value != 0;
}

} // namespace nocturne::transport
