#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "link_types.hpp"
#include "transport/congestion_controller.hpp"

namespace nocturne::transport {

/** Shared flag checked right before a message is handed to the transport. */
using CancellationToken = std::shared_ptr<std::atomic<bool>>;

inline CancellationToken makeCancellationToken() {
    return std::make_shared<std::atomic<bool>>(false);
}

/**
 * Injected transport. Returns true when the link accepted the write.
 * Must not call back into the queue.
 */
using TransportSend = std::function<bool(const PeerId&, Channel, const std::vector<uint8_t>&)>;

/**
 * Completion callback, invoked exactly once: true after a successful send,
 * false after a terminal failure, a drop, a cancellation or a purge.
 */
using CompletionCallback = std::function<void(bool)>;

struct QueuedMessage {
    PeerId peer;
    Channel channel = Channel::State;
    std::vector<uint8_t> bytes;
    Lane lane = Lane::Normal;
    std::chrono::steady_clock::time_point enqueueTime{};
    uint32_t retryCount = 0;
    CompletionCallback onComplete;

    bool isTest = false;            // skips pacing and backoff
    bool protocolCritical = false;  // transfer start/end: one retry on the normal lane
    CancellationToken cancel;
    std::string label;
};

enum class EnqueueResult {
    Accepted,
    LaneFull,
    UnknownPeer,
    Stopped
};

const char* enqueueResultName(EnqueueResult result);

struct LaneDepths {
    size_t urgent = 0;
    size_t normal = 0;
    size_t bulk = 0;

    size_t total() const { return urgent + normal + bulk; }
};

struct QueueStatistics {
    uint64_t enqueued = 0;
    uint64_t sent = 0;
    uint64_t failed = 0;
    uint64_t retried = 0;
    uint64_t dropped = 0;      // terminal failures with no retries left
    uint64_t cancelled = 0;
    uint64_t purged = 0;       // removed by peer disconnect or stop
    uint64_t rejected = 0;     // LaneFull / UnknownPeer / Stopped
};

/**
 * @brief Three-lane per-peer scheduler with pacing, backoff and retry policy
 *
 * A single scheduler thread drains the lanes of every peer. Urgent messages
 * of any peer go before normal, normal before bulk; peers sharing a lane
 * are served round-robin. Each send is awaited before the next message is
 * chosen, so there is never more than one outstanding write.
 *
 * A peer in backoff is skipped (other peers keep flowing) until its backoff
 * window has passed; test messages ignore both backoff and pacing.
 */
class MessageQueue {
public:
    MessageQueue(const QueueSettings& settings,
                 TransportSend send,
                 std::shared_ptr<CongestionController> congestion);
    ~MessageQueue();

    MessageQueue(const MessageQueue&) = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;

    bool start();
    void stop();
    bool isRunning() const { return running_.load(); }

    // Peer lifecycle
    void addPeer(const PeerId& peer);
    void removePeer(const PeerId& peer);
    bool hasPeer(const PeerId& peer) const;

    EnqueueResult enqueue(QueuedMessage message);

    /** Drops queued messages whose cancellation token is set. */
    size_t purgeCancelled(const PeerId& peer);

    void pauseBulk(const PeerId& peer);
    void resumeBulk(const PeerId& peer);

    /** Runtime change of the bulk chunk delay. */
    void updatePacing(uint32_t chunkDelayMs);

    LaneDepths depths(const PeerId& peer) const;
    size_t totalDepth() const;
    QueueStatistics getStatistics() const;
    ConnectionQuality connectionQuality(const PeerId& peer) const;

    CongestionController& congestion() { return *congestion_; }

private:
    struct PeerLanes {
        std::array<std::deque<QueuedMessage>, LANE_COUNT> lanes;
        bool bulkPaused = false;
        uint64_t generation = 0;    // distinguishes a reconnect under the same id
    };

    void schedulerLoop();
    bool selectNext(QueuedMessage& out, uint64_t& generation,
                    std::chrono::steady_clock::time_point now,
                    std::chrono::steady_clock::time_point& wakeAt);
    bool isEligible(const PeerId& peer, const PeerLanes& lanes, Lane lane,
                    std::chrono::steady_clock::time_point now,
                    std::chrono::steady_clock::time_point& wakeAt) const;
    void dispatch(QueuedMessage message, uint64_t generation);
    bool retryAllowed(const QueuedMessage& message) const;
    std::chrono::milliseconds pacingFor(Lane lane) const;

    /** Sleeps until deadline or stop(); returns false when stopping. */
    bool waitUntil(std::chrono::steady_clock::time_point deadline);

    static void complete(QueuedMessage& message, bool success);

    QueueSettings settings_;
    TransportSend send_;
    std::shared_ptr<CongestionController> congestion_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<PeerId, PeerLanes> peers_;
    std::vector<PeerId> peerOrder_;
    std::array<size_t, LANE_COUNT> roundRobin_{};
    QueueStatistics stats_;
    uint64_t nextGeneration_ = 1;
    bool wake_ = false;

    // Held for the whole of each send; removePeer takes it so that a purge
    // cannot interleave with an in-flight write to the same peer.
    std::mutex dispatchMutex_;

    std::thread scheduler_;
    std::atomic<bool> running_{false};
    std::atomic<bool> accepting_{true};
    std::atomic<uint32_t> bulkIntervalMs_;
    std::chrono::steady_clock::time_point lastSend_{};
};

} // namespace nocturne::transport
