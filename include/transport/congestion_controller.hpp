#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <cstdint>

#include "link_types.hpp"

namespace nocturne::transport {

struct CongestionState {
    uint32_t consecutiveFailures = 0;
    uint32_t backoffMs = 0;
    uint64_t totalFailures = 0;
    uint64_t totalSuccesses = 0;
    std::chrono::steady_clock::time_point lastFailure{};
};

/**
 * @brief Per-peer failure streak and backoff tracking
 *
 * A failure sets backoff = min(maxBackoff, baseBackoff * streak). A success
 * lowers the streak by one and the backoff by backoffDecayMs, so recovery is
 * gradual rather than a reset.
 */
class CongestionController {
public:
    explicit CongestionController(const QueueSettings& settings);

    void recordSuccess(const PeerId& peer);
    void recordFailure(const PeerId& peer);

    CongestionState stateFor(const PeerId& peer) const;
    std::chrono::milliseconds backoffFor(const PeerId& peer) const;

    /** Earliest time a non-test send to this peer may be attempted. */
    std::chrono::steady_clock::time_point readyAt(const PeerId& peer) const;

    bool isCongested(const PeerId& peer) const;
    ConnectionQuality qualityFor(const PeerId& peer, size_t queuedMessages) const;

    void removePeer(const PeerId& peer);
    void updateSettings(const QueueSettings& settings);

private:
    static ConnectionQuality classify(const CongestionState& state, size_t queuedMessages,
                                      const QueueSettings& settings);

    mutable std::mutex mutex_;
    QueueSettings settings_;
    std::unordered_map<PeerId, CongestionState> states_;
};

} // namespace nocturne::transport
