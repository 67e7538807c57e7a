#include "transport/message_queue.hpp"
#include "protocol/frame_codec.hpp"
#include "system/logger.hpp"

#include <algorithm>

namespace nocturne::transport {

using Clock = std::chrono::steady_clock;

namespace {

size_t laneIndex(Lane lane) {
    return static_cast<size_t>(lane);
}

uint16_t frameType(const std::vector<uint8_t>& bytes) {
    auto header = protocol::FrameCodec::parseHeader(bytes.data(), bytes.size());
    return header ? header->type : 0;
}

} // namespace

const char* enqueueResultName(EnqueueResult result) {
    switch (result) {
        case EnqueueResult::Accepted: return "accepted";
        case EnqueueResult::LaneFull: return "lane_full";
        case EnqueueResult::UnknownPeer: return "unknown_peer";
        case EnqueueResult::Stopped: return "stopped";
    }
    return "unknown";
}

MessageQueue::MessageQueue(const QueueSettings& settings,
                           TransportSend send,
                           std::shared_ptr<CongestionController> congestion)
    : settings_(settings)
    , send_(std::move(send))
    , congestion_(congestion ? std::move(congestion) : std::make_shared<CongestionController>(settings))
    , bulkIntervalMs_(settings.minBulkIntervalMs) {
}

MessageQueue::~MessageQueue() {
    stop();
}

bool MessageQueue::start() {
    if (running_.load()) {
        return true;
    }
    if (!send_) {
        Logger::error("MessageQueue: cannot start without a transport");
        return false;
    }

    accepting_.store(true);
    running_.store(true);
    scheduler_ = std::thread(&MessageQueue::schedulerLoop, this);
    Logger::info("MessageQueue: started (lanes {}/{}/{}, pacing {}/{} ms)",
                 settings_.urgentCapacity, settings_.normalCapacity, settings_.bulkCapacity,
                 settings_.minMessageIntervalMs, bulkIntervalMs_.load());
    return true;
}

void MessageQueue::stop() {
    accepting_.store(false);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
    }
    cv_.notify_all();

    if (scheduler_.joinable()) {
        scheduler_.join();
    }

    std::vector<QueuedMessage> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : peers_) {
            for (auto& lane : entry.second.lanes) {
                for (auto& message : lane) {
                    pending.push_back(std::move(message));
                }
                lane.clear();
            }
        }
        stats_.purged += pending.size();
    }

    if (!pending.empty()) {
        Logger::info("MessageQueue: stopped with {} pending messages", pending.size());
    }
    for (auto& message : pending) {
        complete(message, false);
    }
}

void MessageQueue::addPeer(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (peers_.count(peer) > 0) {
        return;
    }
    PeerLanes lanes;
    lanes.generation = nextGeneration_++;
    peers_.emplace(peer, std::move(lanes));
    peerOrder_.push_back(peer);
}

void MessageQueue::removePeer(const PeerId& peer) {
    std::vector<QueuedMessage> purged;
    {
        std::lock_guard<std::mutex> dispatchLock(dispatchMutex_);
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = peers_.find(peer);
        if (it == peers_.end()) {
            return;
        }

        for (auto& lane : it->second.lanes) {
            for (auto& message : lane) {
                purged.push_back(std::move(message));
            }
        }
        peers_.erase(it);
        peerOrder_.erase(std::remove(peerOrder_.begin(), peerOrder_.end(), peer), peerOrder_.end());
        stats_.purged += purged.size();
    }

    congestion_->removePeer(peer);
    Logger::info("MessageQueue: removed {} and purged {} queued messages", peer, purged.size());

    for (auto& message : purged) {
        complete(message, false);
    }
}

bool MessageQueue::hasPeer(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.count(peer) > 0;
}

EnqueueResult MessageQueue::enqueue(QueuedMessage message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!accepting_.load()) {
        stats_.rejected++;
        return EnqueueResult::Stopped;
    }

    auto it = peers_.find(message.peer);
    if (it == peers_.end()) {
        stats_.rejected++;
        return EnqueueResult::UnknownPeer;
    }

    auto& lane = it->second.lanes[laneIndex(message.lane)];
    if (lane.size() >= settings_.capacityFor(message.lane)) {
        stats_.rejected++;
        Logger::debug("MessageQueue: {} lane full for {}", laneName(message.lane), message.peer);
        return EnqueueResult::LaneFull;
    }

    message.enqueueTime = Clock::now();
    message.retryCount = 0;
    lane.push_back(std::move(message));
    stats_.enqueued++;
    wake_ = true;
    cv_.notify_one();
    return EnqueueResult::Accepted;
}

size_t MessageQueue::purgeCancelled(const PeerId& peer) {
    std::vector<QueuedMessage> cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = peers_.find(peer);
        if (it == peers_.end()) {
            return 0;
        }

        for (auto& lane : it->second.lanes) {
            auto keep = std::stable_partition(lane.begin(), lane.end(), [](const QueuedMessage& message) {
                return !(message.cancel && message.cancel->load());
            });
            for (auto moved = keep; moved != lane.end(); ++moved) {
                cancelled.push_back(std::move(*moved));
            }
            lane.erase(keep, lane.end());
        }
        stats_.cancelled += cancelled.size();
    }

    for (auto& message : cancelled) {
        complete(message, false);
    }
    return cancelled.size();
}

void MessageQueue::pauseBulk(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer);
    if (it != peers_.end()) {
        it->second.bulkPaused = true;
    }
}

void MessageQueue::resumeBulk(const PeerId& peer) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = peers_.find(peer);
        if (it == peers_.end()) {
            return;
        }
        it->second.bulkPaused = false;
        wake_ = true;
    }
    cv_.notify_one();
}

void MessageQueue::updatePacing(uint32_t chunkDelayMs) {
    bulkIntervalMs_.store(chunkDelayMs);
    Logger::info("MessageQueue: bulk pacing set to {} ms", chunkDelayMs);
}

LaneDepths MessageQueue::depths(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    LaneDepths result;
    auto it = peers_.find(peer);
    if (it != peers_.end()) {
        result.urgent = it->second.lanes[laneIndex(Lane::Urgent)].size();
        result.normal = it->second.lanes[laneIndex(Lane::Normal)].size();
        result.bulk = it->second.lanes[laneIndex(Lane::Bulk)].size();
    }
    return result;
}

size_t MessageQueue::totalDepth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& entry : peers_) {
        for (const auto& lane : entry.second.lanes) {
            total += lane.size();
        }
    }
    return total;
}

QueueStatistics MessageQueue::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

ConnectionQuality MessageQueue::connectionQuality(const PeerId& peer) const {
    return congestion_->qualityFor(peer, depths(peer).total());
}

void MessageQueue::schedulerLoop() {
    Logger::debug("MessageQueue: scheduler thread running");

    while (running_.load()) {
        QueuedMessage message;
        uint64_t generation = 0;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            auto now = Clock::now();
            auto wakeAt = now + std::chrono::milliseconds(settings_.idleWaitMs);

            if (!selectNext(message, generation, now, wakeAt)) {
                cv_.wait_until(lock, wakeAt, [this] { return !running_.load() || wake_; });
                wake_ = false;
                continue;
            }
        }

        if (!message.isTest) {
            if (!waitUntil(lastSend_ + pacingFor(message.lane))) {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    stats_.purged++;
                }
                complete(message, false);
                break;
            }
        }

        dispatch(std::move(message), generation);
    }

    Logger::debug("MessageQueue: scheduler thread exiting");
}

bool MessageQueue::selectNext(QueuedMessage& out, uint64_t& generation,
                              Clock::time_point now, Clock::time_point& wakeAt) {
    size_t peerCount = peerOrder_.size();
    if (peerCount == 0) {
        return false;
    }

    for (size_t laneSlot = 0; laneSlot < LANE_COUNT; ++laneSlot) {
        Lane lane = static_cast<Lane>(laneSlot);

        for (size_t i = 0; i < peerCount; ++i) {
            size_t index = (roundRobin_[laneSlot] + i) % peerCount;
            const PeerId& peer = peerOrder_[index];
            auto it = peers_.find(peer);
            if (it == peers_.end() || !isEligible(peer, it->second, lane, now, wakeAt)) {
                continue;
            }

            auto& queue = it->second.lanes[laneSlot];
            out = std::move(queue.front());
            queue.pop_front();
            generation = it->second.generation;
            roundRobin_[laneSlot] = (index + 1) % peerCount;
            return true;
        }
    }
    return false;
}

bool MessageQueue::isEligible(const PeerId& peer, const PeerLanes& lanes, Lane lane,
                              Clock::time_point now, Clock::time_point& wakeAt) const {
    const auto& queue = lanes.lanes[laneIndex(lane)];
    if (queue.empty()) {
        return false;
    }
    if (lane == Lane::Bulk && lanes.bulkPaused) {
        return false;
    }
    if (queue.front().isTest) {
        return true;
    }

    auto readyAt = congestion_->readyAt(peer);
    if (readyAt > now) {
        wakeAt = std::min(wakeAt, readyAt);
        return false;
    }
    return true;
}

void MessageQueue::dispatch(QueuedMessage message, uint64_t generation) {
    bool attempted = false;
    bool success = false;
    bool peerGone = false;

    {
        std::lock_guard<std::mutex> dispatchLock(dispatchMutex_);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = peers_.find(message.peer);
            peerGone = it == peers_.end() || it->second.generation != generation;
        }

        if (!peerGone && !(message.cancel && message.cancel->load())) {
            attempted = true;
            auto started = Clock::now();
            try {
                success = send_(message.peer, message.channel, message.bytes);
            } catch (const std::exception& e) {
                Logger::error("MessageQueue: transport threw for {}: {}", message.peer, e.what());
                success = false;
            }
            lastSend_ = Clock::now();

            double elapsedMs = std::chrono::duration<double, std::milli>(lastSend_ - started).count();
            Logger::updatePerformanceMetrics("link.send", elapsedMs, success);
        }
    }

    if (!attempted) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (peerGone) {
                stats_.purged++;
            } else {
                stats_.cancelled++;
            }
        }
        Logger::trace("MessageQueue: dropped {} for {} before send ({})",
                      protocol::messageTypeName(frameType(message.bytes)), message.peer,
                      peerGone ? "peer removed" : "cancelled");
        complete(message, false);
        return;
    }

    if (success) {
        congestion_->recordSuccess(message.peer);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.sent++;
        }
        Logger::trace("MessageQueue: sent {} ({} bytes, {} lane) to {}",
                      protocol::messageTypeName(frameType(message.bytes)), message.bytes.size(),
                      laneName(message.lane), message.peer);
        complete(message, true);
        return;
    }

    congestion_->recordFailure(message.peer);

    if (retryAllowed(message)) {
        bool requeued = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.failed++;
            auto it = peers_.find(message.peer);
            if (it != peers_.end() && it->second.generation == generation) {
                message.retryCount++;
                stats_.retried++;
                Logger::debug("MessageQueue: retry {} of {} to {}", message.retryCount,
                              protocol::messageTypeName(frameType(message.bytes)), message.peer);
                // front of the lane keeps per-lane order intact
                it->second.lanes[laneIndex(message.lane)].push_front(std::move(message));
                requeued = true;
            } else {
                stats_.purged++;
            }
        }
        if (!requeued) {
            complete(message, false);
        }
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.failed++;
        stats_.dropped++;
    }
    Logger::debug("MessageQueue: dropped {} to {} after {} retries ({} lane)",
                  protocol::messageTypeName(frameType(message.bytes)), message.peer,
                  message.retryCount, laneName(message.lane));
    complete(message, false);
}

bool MessageQueue::retryAllowed(const QueuedMessage& message) const {
    switch (message.lane) {
        case Lane::Urgent:
            return message.retryCount < settings_.maxUrgentRetries;
        case Lane::Normal:
            return message.protocolCritical && message.retryCount < settings_.maxCriticalRetries;
        case Lane::Bulk:
            return false;
    }
    return false;
}

std::chrono::milliseconds MessageQueue::pacingFor(Lane lane) const {
    if (lane == Lane::Bulk) {
        return std::chrono::milliseconds(bulkIntervalMs_.load());
    }
    return std::chrono::milliseconds(settings_.minMessageIntervalMs);
}

bool MessageQueue::waitUntil(Clock::time_point deadline) {
    if (deadline <= Clock::now()) {
        return running_.load();
    }
    std::unique_lock<std::mutex> lock(mutex_);
    bool stopping = cv_.wait_until(lock, deadline, [this] { return !running_.load(); });
    return !stopping;
}

void MessageQueue::complete(QueuedMessage& message, bool success) {
    if (!message.onComplete) {
        return;
    }
    try {
        message.onComplete(success);
    } catch (const std::exception& e) {
        Logger::error("MessageQueue: completion callback threw: {}", e.what());
    }
    message.onComplete = nullptr;
}

} // namespace nocturne::transport
