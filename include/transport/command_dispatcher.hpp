#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "link_types.hpp"
#include "protocol/frame_codec.hpp"
#include "protocol/payloads.hpp"
#include "transfer/transfer_orchestrator.hpp"

namespace nocturne::transport {

/**
 * @brief Decodes peer writes on the command channel and answers them
 *
 * Each peer gets its own FrameReader, so writes split at arbitrary byte
 * boundaries reassemble independently. Protocol requests (capabilities,
 * time sync, album art queries, state resend) are answered through the
 * orchestrator; playback and volume commands go to the host handler.
 */
class CommandDispatcher {
public:
    using CommandHandler = std::function<void(const PeerId&, const protocol::Command&)>;

    struct Statistics {
        uint64_t framesHandled = 0;
        uint64_t commandsForwarded = 0;
        uint64_t invalidPayloads = 0;
        uint64_t unknownTypes = 0;
        uint64_t framingErrors = 0;
        uint64_t ignoredWrites = 0;
    };

    /** Registers for disconnects so a dropped peer's partial frame is discarded. */
    explicit CommandDispatcher(transfer::TransferOrchestrator& orchestrator,
                               size_t maxFrameSize = 64 * 1024);
    ~CommandDispatcher();

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    void setCommandHandler(CommandHandler handler);

    /** Returns the number of complete frames dispatched from this write. */
    size_t handleWrite(const PeerId& peer, const std::vector<uint8_t>& bytes);
    void dispatchFrame(const PeerId& peer, const protocol::DecodedFrame& frame);

    void removePeer(const PeerId& peer);
    Statistics getStatistics() const;

private:
    void handleSystem(const PeerId& peer, const protocol::DecodedFrame& frame);
    void handleCommand(const PeerId& peer, const protocol::DecodedFrame& frame);
    void handlePeerError(const PeerId& peer, const protocol::DecodedFrame& frame);
    void forward(const PeerId& peer, const protocol::Command& command);
    void rejectInvalid(const PeerId& peer, uint16_t type, const std::string& reason);

    static bool flagValue(const std::vector<uint8_t>& payload);

    transfer::TransferOrchestrator& orchestrator_;
    size_t maxFrameSize_;
    uint64_t disconnectHandle_ = 0;

    mutable std::mutex mutex_;
    std::unordered_map<PeerId, protocol::FrameReader> readers_;
    CommandHandler handler_;
    Statistics stats_;
};

} // namespace nocturne::transport
