#include "transfer/transfer_orchestrator.hpp"
#include "protocol/frame_codec.hpp"
#include "system/config_manager.hpp"
#include "system/logger.hpp"
#include "transfer/digest.hpp"

#include <algorithm>

namespace nocturne::transfer {

using namespace nocturne::protocol;
using nocturne::transport::EnqueueResult;
using nocturne::transport::QueuedMessage;
using Clock = std::chrono::steady_clock;

const char* transferStatusName(TransferStatus status) {
    switch (status) {
        case TransferStatus::Completed: return "completed";
        case TransferStatus::AssetUnavailable: return "asset_unavailable";
        case TransferStatus::NotSubscribed: return "not_subscribed";
        case TransferStatus::UnknownPeer: return "unknown_peer";
        case TransferStatus::Congested: return "congested";
        case TransferStatus::Cancelled: return "cancelled";
        case TransferStatus::TimedOut: return "timed_out";
        case TransferStatus::ChunksDropped: return "chunks_dropped";
        case TransferStatus::QueueRejected: return "queue_rejected";
        case TransferStatus::ChecksumMismatch: return "checksum_mismatch";
        case TransferStatus::EncodingFailed: return "encoding_failed";
    }
    return "unknown";
}

// CompletionTracker

CompletionTracker::CompletionTracker(uint32_t expected)
    : expected_(expected)
    , future_(promise_.get_future().share()) {
    if (expected_ == 0) {
        signal();
    }
}

void CompletionTracker::record(bool success) {
    if (success) {
        delivered_.fetch_add(1);
    } else {
        failed_.fetch_add(1);
    }
    if (delivered_.load() + failed_.load() >= expected_) {
        signal();
    }
}

void CompletionTracker::abort() {
    signal();
}

bool CompletionTracker::waitFor(std::chrono::milliseconds timeout) const {
    if (timeout.count() < 0) {
        timeout = std::chrono::milliseconds(0);
    }
    return future_.wait_for(timeout) == std::future_status::ready;
}

uint32_t CompletionTracker::outstanding() const {
    uint32_t done = delivered_.load() + failed_.load();
    return done >= expected_ ? 0 : expected_ - done;
}

void CompletionTracker::signal() {
    std::call_once(signalled_, [this] { promise_.set_value(); });
}

// TransferOrchestrator

TransferOrchestrator::TransferOrchestrator(const LinkConfiguration& config,
                                           transport::TransportSend send,
                                           std::shared_ptr<AssetSource> assets)
    : config_(config)
    , assets_(std::move(assets))
    , congestion_(std::make_shared<transport::CongestionController>(config.queue))
    , queue_(std::make_unique<transport::MessageQueue>(config.queue, std::move(send), congestion_))
    , encoder_(config.transfer) {
}

TransferOrchestrator::~TransferOrchestrator() {
    stop();
}

bool TransferOrchestrator::start() {
    if (running_.load()) {
        return true;
    }
    if (!queue_->start()) {
        Logger::error("TransferOrchestrator: message queue failed to start");
        return false;
    }
    running_.store(true);
    Logger::info("TransferOrchestrator: started (digest {}, compression {}, chunk delay {} ms)",
                 ConfigManager::digestAlgorithmName(config_.transfer.digest),
                 config_.transfer.compressionEnabled ? "on" : "off",
                 config_.queue.minBulkIntervalMs);
    return true;
}

void TransferOrchestrator::stop() {
    std::vector<std::shared_ptr<Transfer>> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load() && workers_.empty()) {
            return;
        }
        running_.store(false);
        for (auto& entry : active_) {
            running.push_back(entry.second);
        }
    }

    for (auto& transfer : running) {
        cancel(transfer);
    }
    queue_->stop();

    std::list<std::shared_ptr<Transfer>> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }
    for (auto& transfer : workers) {
        if (transfer->worker.joinable()) {
            transfer->worker.join();
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.clear();
    }
    Logger::info("TransferOrchestrator: stopped");
}

// Peer lifecycle

void TransferOrchestrator::onPeerConnected(const PeerId& peer) {
    onPeerConnected(peer, config_.link.defaultMtu);
}

void TransferOrchestrator::onPeerConnected(const PeerId& peer, uint16_t mtu) {
    uint16_t negotiated = mtu == 0 ? config_.link.defaultMtu : std::min(mtu, config_.link.maxMtu);
    if (!sessions_.add(peer, negotiated)) {
        Logger::debug("TransferOrchestrator: {} already connected", peer);
        return;
    }
    queue_->addPeer(peer);
    Logger::info("TransferOrchestrator: {} connected (MTU {})", peer, negotiated);
}

void TransferOrchestrator::onPeerDisconnected(const PeerId& peer) {
    // removed first so that finishing workers no longer record results for it
    bool known = sessions_.remove(peer);

    std::vector<std::shared_ptr<Transfer>> transfers;
    std::vector<PeerListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : disconnectListeners_) {
            listeners.push_back(entry.second);
        }
        for (auto it = active_.begin(); it != active_.end();) {
            if (std::get<0>(it->first) == peer) {
                transfers.push_back(it->second);
                it = active_.erase(it);
            } else {
                ++it;
            }
        }
        for (auto it = lastResults_.begin(); it != lastResults_.end();) {
            it = std::get<0>(it->first) == peer ? lastResults_.erase(it) : std::next(it);
        }
    }

    for (auto& transfer : transfers) {
        cancel(transfer);
    }
    queue_->removePeer(peer);

    for (const auto& listener : listeners) {
        listener(peer);
    }

    if (known) {
        Logger::info("TransferOrchestrator: {} disconnected, {} transfers cancelled", peer, transfers.size());
    }
}

uint64_t TransferOrchestrator::addDisconnectListener(PeerListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t handle = nextListenerId_++;
    disconnectListeners_[handle] = std::move(listener);
    return handle;
}

void TransferOrchestrator::removeDisconnectListener(uint64_t handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnectListeners_.erase(handle);
}

void TransferOrchestrator::onMtuChanged(const PeerId& peer, uint16_t mtu) {
    uint16_t negotiated = mtu == 0 ? config_.link.defaultMtu : std::min(mtu, config_.link.maxMtu);
    bool known = sessions_.update(peer, [negotiated](transport::PeerSession& session) {
        session.mtu = negotiated;
    });
    if (!known) {
        Logger::warning("TransferOrchestrator: MTU change for unknown peer {}", peer);
        return;
    }
    Logger::info("TransferOrchestrator: {} MTU now {}, next chunk size {}",
                 peer, negotiated, encoder_.chunkSizeFor(negotiated));
}

void TransferOrchestrator::onSubscriptionChanged(const PeerId& peer, Channel channel, bool enabled) {
    bool known = sessions_.update(peer, [channel, enabled](transport::PeerSession& session) {
        if (enabled) {
            session.subscriptions.insert(channel);
        } else {
            session.subscriptions.erase(channel);
            if (channel == Channel::State) {
                session.lastSentState.reset();
            }
        }
    });
    if (known) {
        Logger::debug("TransferOrchestrator: {} {} {}", peer,
                      enabled ? "subscribed to" : "unsubscribed from", channelName(channel));
    }
}

void TransferOrchestrator::onPeerActivity(const PeerId& peer) {
    sessions_.touch(peer);
}

void TransferOrchestrator::setBinaryProtocol(const PeerId& peer, bool enabled) {
    sessions_.update(peer, [enabled](transport::PeerSession& session) {
        session.supportsBinaryProtocol = enabled;
    });
}

void TransferOrchestrator::setIncrementalUpdates(const PeerId& peer, bool enabled) {
    sessions_.update(peer, [enabled](transport::PeerSession& session) {
        session.incrementalUpdates = enabled;
        // the next publish must be a full state to give the peer a baseline
        session.lastSentState.reset();
    });
}

// Bulk transfers

std::shared_future<TransferResult> TransferOrchestrator::immediate(TransferResult result) {
    std::promise<TransferResult> promise;
    promise.set_value(std::move(result));
    return promise.get_future().share();
}

TransferResult TransferOrchestrator::rejection(const PeerId& peer, AssetClass assetClass, bool isTest,
                                               TransferStatus status) const {
    TransferResult result;
    result.status = status;
    result.peer = peer;
    result.assetClass = assetClass;
    result.isTest = isTest;
    return result;
}

Channel TransferOrchestrator::channelFor(AssetClass assetClass) {
    return assetClass == AssetClass::AlbumArt ? Channel::Bulk : Channel::State;
}

std::shared_future<TransferResult> TransferOrchestrator::sendAsset(const PeerId& peer,
                                                                   AssetClass assetClass,
                                                                   AssetPayload payload,
                                                                   bool isTest) {
    auto session = sessions_.get(peer);
    if (!session) {
        Logger::warning("TransferOrchestrator: {} transfer to unknown peer {}", assetClassName(assetClass), peer);
        return immediate(rejection(peer, assetClass, isTest, TransferStatus::UnknownPeer));
    }
    if (payload.bytes.empty()) {
        return immediate(rejection(peer, assetClass, isTest, TransferStatus::AssetUnavailable));
    }
    if (!session->isSubscribed(channelFor(assetClass))) {
        Logger::debug("TransferOrchestrator: {} not subscribed to {}", peer, channelName(channelFor(assetClass)));
        return immediate(rejection(peer, assetClass, isTest, TransferStatus::NotSubscribed));
    }
    if (!isTest && config_.transfer.refuseWhenPoorQuality &&
        connectionQuality(peer) == ConnectionQuality::Poor) {
        Logger::warning("TransferOrchestrator: refusing {} transfer to {}, connection quality poor",
                        assetClassName(assetClass), peer);
        return immediate(rejection(peer, assetClass, isTest, TransferStatus::Congested));
    }

    auto transfer = std::make_shared<Transfer>();
    transfer->peer = peer;
    transfer->assetClass = assetClass;
    transfer->isTest = isTest;
    transfer->payload = std::move(payload);
    transfer->cancel = transport::makeCancellationToken();
    transfer->result = transfer->promise.get_future().share();

    std::shared_ptr<Transfer> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) {
            return immediate(rejection(peer, assetClass, isTest, TransferStatus::QueueRejected));
        }
        reapWorkers();

        transfer->id = nextTransferId_++;
        TransferKey key(peer, assetClass, isTest);
        auto it = active_.find(key);
        if (it != active_.end()) {
            previous = it->second;
            transfer->previous = previous;
        }
        active_[key] = transfer;
        workers_.push_back(transfer);

        transfer->worker = std::thread([this, transfer] {
            runTransfer(transfer);
            transfer->finished.store(true);
        });
    }

    uint64_t id = transfer->id;
    if (!isTest) {
        sessions_.update(peer, [assetClass, id](transport::PeerSession& session) {
            session.activeTransfers[assetClass] = id;
        });
    }

    if (previous) {
        Logger::info("TransferOrchestrator: transfer {} supersedes {} for {} ({})",
                     id, previous->id, peer, assetClassName(assetClass));
        cancel(previous);
    }

    return transfer->result;
}

TransferResult TransferOrchestrator::sendAssetAndWait(const PeerId& peer,
                                                      AssetClass assetClass,
                                                      AssetPayload payload,
                                                      bool isTest) {
    return sendAsset(peer, assetClass, std::move(payload), isTest).get();
}

std::shared_future<TransferResult> TransferOrchestrator::sendAssetByChecksum(const PeerId& peer,
                                                                             const std::string& checksum,
                                                                             bool isTest) {
    std::optional<AssetPayload> payload;
    if (assets_) {
        payload = assets_->findByChecksum(checksum);
    }
    if (!payload || payload->bytes.empty()) {
        Logger::debug("TransferOrchestrator: no album art for hash {}", checksum);
        sendAlbumArtNotAvailable(peer, checksum);
        return immediate(rejection(peer, AssetClass::AlbumArt, isTest, TransferStatus::AssetUnavailable));
    }
    return sendAsset(peer, AssetClass::AlbumArt, std::move(*payload), isTest);
}

std::shared_future<TransferResult> TransferOrchestrator::sendCurrentAsset(const PeerId& peer,
                                                                          AssetClass assetClass,
                                                                          bool isTest) {
    std::optional<AssetPayload> payload;
    if (assets_) {
        payload = assets_->current(assetClass);
    }
    if (!payload || payload->bytes.empty()) {
        if (assetClass == AssetClass::AlbumArt) {
            sendAlbumArtNotAvailable(peer, "");
        }
        return immediate(rejection(peer, assetClass, isTest, TransferStatus::AssetUnavailable));
    }
    return sendAsset(peer, assetClass, std::move(*payload), isTest);
}

std::shared_future<TransferResult> TransferOrchestrator::sendWeather(const PeerId& peer,
                                                                     const WeatherBundle& bundle) {
    AssetPayload payload;
    payload.bytes = buildWeatherDocument(bundle);
    payload.assetId = bundle.location.name;
    payload.variant = forecastModeName(bundle.mode);
    payload.timestampMs = bundle.timestampMs;
    return sendAsset(peer, AssetClass::Weather, std::move(payload));
}

std::vector<std::shared_future<TransferResult>> TransferOrchestrator::broadcastAsset(AssetClass assetClass,
                                                                                     const AssetPayload& payload) {
    std::vector<std::shared_future<TransferResult>> results;
    for (const auto& peer : sessions_.subscribers(channelFor(assetClass))) {
        results.push_back(sendAsset(peer, assetClass, payload));
    }
    return results;
}

bool TransferOrchestrator::cancelTransfer(const PeerId& peer, AssetClass assetClass, bool isTest) {
    std::shared_ptr<Transfer> transfer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(TransferKey(peer, assetClass, isTest));
        if (it == active_.end()) {
            return false;
        }
        transfer = it->second;
    }
    cancel(transfer);
    return true;
}

bool TransferOrchestrator::hasActiveTransfer(const PeerId& peer, AssetClass assetClass, bool isTest) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(TransferKey(peer, assetClass, isTest)) > 0;
}

bool TransferOrchestrator::reportPeerChecksumMismatch(const PeerId& peer, AssetClass assetClass) {
    TransferKey key(peer, assetClass, false);
    TransferResult updated;
    TransferObserver observer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto active = active_.find(key);
        if (active != active_.end() && !active->second->finished.load()) {
            active->second->checksumMismatch.store(true);
            Logger::warning("TransferOrchestrator: {} reports checksum mismatch for running transfer {}",
                            peer, active->second->id);
            return true;
        }

        auto last = lastResults_.find(key);
        if (last == lastResults_.end()) {
            return false;
        }
        last->second.status = TransferStatus::ChecksumMismatch;
        updated = last->second;
        observer = observer_;
    }

    Logger::warning("TransferOrchestrator: {} reports checksum mismatch for transfer {} ({})",
                    peer, updated.transferId, toHex(updated.checksum));
    if (observer) {
        observer(updated);
    }
    return true;
}

void TransferOrchestrator::cancel(const std::shared_ptr<Transfer>& transfer) {
    if (transfer->cancel->exchange(true)) {
        return;
    }

    std::shared_ptr<CompletionTracker> tracker;
    {
        std::lock_guard<std::mutex> lock(transfer->trackerMutex);
        tracker = transfer->tracker;
    }
    if (tracker) {
        tracker->abort();
    }

    size_t purged = queue_->purgeCancelled(transfer->peer);
    Logger::info("TransferOrchestrator: cancelled transfer {} to {} ({} queued messages dropped)",
                 transfer->id, transfer->peer, purged);
}

void TransferOrchestrator::runTransfer(const std::shared_ptr<Transfer>& transfer) {
    auto started = Clock::now();
    TransferResult result = rejection(transfer->peer, transfer->assetClass, transfer->isTest,
                                      TransferStatus::Cancelled);
    result.transferId = transfer->id;
    result.assetId = transfer->payload.assetId;

    if (transfer->previous) {
        // the superseded transfer closes with its own end message first
        transfer->previous->result.wait();
        transfer->previous.reset();
    }

    if (transfer->cancel->load()) {
        finish(transfer, result);
        return;
    }

    auto session = sessions_.get(transfer->peer);
    if (!session) {
        result.status = TransferStatus::UnknownPeer;
        finish(transfer, result);
        return;
    }

    TransferPlan plan;
    try {
        PlanOptions options;
        options.assetClass = transfer->assetClass;
        options.timestampMs = transfer->payload.timestampMs;
        options.mode = transfer->payload.variant;
        plan = encoder_.planTransfer(transfer->payload.bytes, config_.transfer.digest, session->mtu,
                                     transfer->payload.assetId, transfer->isTest, options);
    } catch (const std::exception& e) {
        Logger::error("TransferOrchestrator: encoding transfer {} failed: {}", transfer->id, e.what());
        result.status = TransferStatus::EncodingFailed;
        finish(transfer, result);
        return;
    }

    result.checksum = plan.checksum;
    result.originalSize = plan.originalSize;
    result.compressedSize = plan.compressedSize;
    result.chunkSize = plan.chunkSize;
    result.totalChunks = plan.totalChunks;

    Logger::info("TransferOrchestrator: transfer {} to {}: {} bytes -> {} bytes, {} chunks of {} (MTU {})",
                 transfer->id, transfer->peer, plan.originalSize, plan.compressedSize,
                 plan.totalChunks, plan.chunkSize, session->mtu);

    auto tracker = std::make_shared<CompletionTracker>(plan.totalChunks + 1);
    {
        std::lock_guard<std::mutex> lock(transfer->trackerMutex);
        transfer->tracker = tracker;
    }

    auto deadline = started + std::chrono::milliseconds(config_.transfer.completionTimeoutMs);
    Channel channel = channelFor(transfer->assetClass);

    QueuedMessage start;
    start.peer = transfer->peer;
    start.channel = channel;
    start.bytes = plan.startMessage;
    start.lane = Lane::Normal;
    start.isTest = transfer->isTest;
    start.protocolCritical = true;
    start.cancel = transfer->cancel;
    start.label = "transfer-start";
    start.onComplete = [tracker](bool success) { tracker->record(success); };

    uint32_t queued = 0;
    bool enqueueFailed = false;
    EnqueueResult startResult = transfer->cancel->load()
        ? EnqueueResult::Stopped
        : enqueueWithBackpressure(start, transfer->cancel, deadline);

    if (startResult == EnqueueResult::Accepted) {
        queued++;
        for (uint32_t i = 0; i < plan.totalChunks; ++i) {
            if (transfer->cancel->load()) {
                break;
            }

            QueuedMessage chunk;
            chunk.peer = transfer->peer;
            chunk.channel = channel;
            chunk.bytes = plan.chunkMessages[i];
            chunk.lane = Lane::Bulk;
            chunk.isTest = transfer->isTest;
            chunk.cancel = transfer->cancel;
            chunk.label = "transfer-chunk";
            chunk.onComplete = [tracker, transfer](bool success) {
                if (success) {
                    transfer->chunksSent.fetch_add(1);
                }
                tracker->record(success);
            };

            EnqueueResult chunkResult = enqueueWithBackpressure(chunk, transfer->cancel, deadline);
            if (chunkResult != EnqueueResult::Accepted) {
                Logger::warning("TransferOrchestrator: chunk {}/{} of transfer {} not queued: {}",
                                i + 1, plan.totalChunks, transfer->id, transport::enqueueResultName(chunkResult));
                enqueueFailed = true;
                break;
            }
            queued++;
        }
    } else {
        enqueueFailed = true;
        Logger::warning("TransferOrchestrator: start of transfer {} not queued: {}",
                        transfer->id, transport::enqueueResultName(startResult));
    }

    for (uint32_t i = queued; i < tracker->expected(); ++i) {
        tracker->record(false);
    }

    bool settled = tracker->waitFor(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()));
    bool cancelled = transfer->cancel->load();
    bool timedOut = !cancelled && !settled;

    if (timedOut) {
        Logger::warning("TransferOrchestrator: transfer {} to {} timed out with {} messages outstanding",
                        transfer->id, transfer->peer, tracker->outstanding());
        transfer->cancel->store(true);
        queue_->purgeCancelled(transfer->peer);
    }

    if (cancelled) {
        result.status = TransferStatus::Cancelled;
    } else if (timedOut) {
        result.status = TransferStatus::TimedOut;
    } else if (startResult != EnqueueResult::Accepted) {
        result.status = startResult == EnqueueResult::UnknownPeer ? TransferStatus::UnknownPeer
                                                                  : TransferStatus::QueueRejected;
    } else if (enqueueFailed || tracker->failed() > 0) {
        result.status = TransferStatus::ChunksDropped;
    } else {
        result.status = TransferStatus::Completed;
    }

    bool success = result.status == TransferStatus::Completed;
    result.chunksSent = transfer->chunksSent.load();
    result.endDelivered = sendEnd(transfer, plan, success);

    if (success && !result.endDelivered) {
        result.status = TransferStatus::ChunksDropped;
    }
    if (transfer->checksumMismatch.load()) {
        result.status = TransferStatus::ChecksumMismatch;
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    std::string operation = "transfer." + std::string(assetClassName(transfer->assetClass));
    if (result.ok() && result.elapsed.count() > 0) {
        Logger::logThroughput(operation,
                              plan.compressedSize * 1000.0 / static_cast<double>(result.elapsed.count()));
    }
    if (!transfer->isTest) {
        Logger::updatePerformanceMetrics(operation, static_cast<double>(result.elapsed.count()), result.ok());
    }

    finish(transfer, result);
}

bool TransferOrchestrator::sendEnd(const std::shared_ptr<Transfer>& transfer, const TransferPlan& plan,
                                   bool success) {
    auto delivered = std::make_shared<std::promise<bool>>();
    auto outcome = delivered->get_future();

    QueuedMessage end;
    end.peer = transfer->peer;
    end.channel = channelFor(transfer->assetClass);
    end.bytes = plan.endMessage(success);
    end.lane = Lane::Normal;
    end.isTest = transfer->isTest;
    end.protocolCritical = true;
    end.label = "transfer-end";
    end.onComplete = [delivered](bool sent) { delivered->set_value(sent); };

    auto timeout = std::chrono::milliseconds(config_.transfer.endMessageTimeoutMs);
    auto queuedAt = Clock::now();
    EnqueueResult result = enqueueWithBackpressure(end, nullptr, queuedAt + timeout);
    if (result != EnqueueResult::Accepted) {
        Logger::debug("TransferOrchestrator: end of transfer {} not queued: {}",
                      transfer->id, transport::enqueueResultName(result));
        return false;
    }

    if (outcome.wait_for(timeout) != std::future_status::ready) {
        Logger::warning("TransferOrchestrator: end of transfer {} not delivered within {} ms",
                        transfer->id, config_.transfer.endMessageTimeoutMs);
        return false;
    }
    Logger::logLatency("transfer-end",
                       std::chrono::duration<double, std::milli>(Clock::now() - queuedAt).count());
    return outcome.get();
}

EnqueueResult TransferOrchestrator::enqueueWithBackpressure(const QueuedMessage& message,
                                                            const transport::CancellationToken& cancel,
                                                            Clock::time_point deadline) {
    auto retryDelay = std::chrono::milliseconds(std::max<uint32_t>(1, config_.transfer.enqueueRetryDelayMs));
    while (true) {
        EnqueueResult result = queue_->enqueue(message);
        if (result != EnqueueResult::LaneFull) {
            return result;
        }
        if ((cancel && cancel->load()) || Clock::now() >= deadline) {
            return result;
        }
        std::this_thread::sleep_for(retryDelay);
    }
}

void TransferOrchestrator::finish(const std::shared_ptr<Transfer>& transfer, TransferResult result) {
    TransferKey key(transfer->peer, transfer->assetClass, transfer->isTest);
    TransferObserver observer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(key);
        if (it != active_.end() && it->second == transfer) {
            active_.erase(it);
        }
        if (sessions_.contains(transfer->peer)) {
            lastResults_[key] = result;
        }
        observer = observer_;
    }

    uint64_t id = transfer->id;
    AssetClass assetClass = transfer->assetClass;
    if (!transfer->isTest) {
        sessions_.update(transfer->peer, [assetClass, id](transport::PeerSession& session) {
            auto it = session.activeTransfers.find(assetClass);
            if (it != session.activeTransfers.end() && it->second == id) {
                session.activeTransfers.erase(it);
            }
        });
    }

    if (result.ok()) {
        Logger::info("TransferOrchestrator: transfer {} to {} completed ({} chunks in {} ms)",
                     id, transfer->peer, result.chunksSent, result.elapsed.count());
    } else {
        Logger::warning("TransferOrchestrator: transfer {} to {} failed: {} ({}/{} chunks sent)",
                        id, transfer->peer, transferStatusName(result.status),
                        result.chunksSent, result.totalChunks);
    }

    if (observer) {
        try {
            observer(result);
        } catch (const std::exception& e) {
            Logger::error("TransferOrchestrator: transfer observer threw: {}", e.what());
        }
    }
    transfer->promise.set_value(result);
}

void TransferOrchestrator::reapWorkers() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if ((*it)->finished.load()) {
            if ((*it)->worker.joinable()) {
                (*it)->worker.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

// State and control messages

bool TransferOrchestrator::enqueueControl(const PeerId& peer, Channel channel, Lane lane, uint16_t type,
                                          std::vector<uint8_t> payload, const std::string& label) {
    QueuedMessage message;
    message.peer = peer;
    message.channel = channel;
    message.lane = lane;
    message.bytes = FrameCodec::encode(type, payload);
    message.label = label;

    EnqueueResult result = queue_->enqueue(std::move(message));
    if (result != EnqueueResult::Accepted) {
        Logger::debug("TransferOrchestrator: {} to {} not queued: {}",
                      messageTypeName(type), peer, transport::enqueueResultName(result));
        return false;
    }
    return true;
}

std::vector<std::pair<uint16_t, std::vector<uint8_t>>> TransferOrchestrator::stateMessagesFor(
    const transport::PeerSession& session, const MediaState& state) const {
    std::vector<std::pair<uint16_t, std::vector<uint8_t>>> messages;

    if (session.lastSentState && *session.lastSentState == state) {
        return messages;
    }
    if (!session.incrementalUpdates || !session.lastSentState) {
        messages.emplace_back(message_type::STATE_FULL, encodeFullState(state));
        return messages;
    }

    const MediaState& last = *session.lastSentState;
    bool artistChanged = last.artist != state.artist;
    bool albumChanged = last.album != state.album;

    if (artistChanged && albumChanged) {
        messages.emplace_back(message_type::STATE_ARTIST_ALBUM, encodeArtistAlbum(state.artist, state.album));
    } else if (artistChanged) {
        messages.emplace_back(message_type::STATE_ARTIST, encodeStringValue(state.artist));
    } else if (albumChanged) {
        messages.emplace_back(message_type::STATE_ALBUM, encodeStringValue(state.album));
    }
    if (last.track != state.track) {
        messages.emplace_back(message_type::STATE_TRACK, encodeStringValue(state.track));
    }
    if (last.positionMs != state.positionMs) {
        messages.emplace_back(message_type::STATE_POSITION, encodeInt64Value(state.positionMs));
    }
    if (last.durationMs != state.durationMs) {
        messages.emplace_back(message_type::STATE_DURATION, encodeInt64Value(state.durationMs));
    }
    if (last.playing != state.playing) {
        messages.emplace_back(message_type::STATE_PLAY_STATUS, encodeByteValue(state.playing ? 1 : 0));
    }
    if (last.volume != state.volume) {
        messages.emplace_back(message_type::STATE_VOLUME, encodeByteValue(state.volume));
    }

    if (messages.empty()) {
        messages.emplace_back(message_type::STATE_FULL, encodeFullState(state));
    }
    return messages;
}

size_t TransferOrchestrator::publishState(const MediaState& state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        currentState_ = state;
    }

    size_t updated = 0;
    for (const auto& session : sessions_.snapshot()) {
        if (!session.isSubscribed(Channel::State)) {
            continue;
        }

        auto messages = stateMessagesFor(session, state);
        if (messages.empty()) {
            continue;
        }

        bool allQueued = true;
        for (auto& message : messages) {
            allQueued = enqueueControl(session.id, Channel::State, Lane::Normal, message.first,
                                       std::move(message.second), "state") && allQueued;
        }

        if (allQueued) {
            sessions_.update(session.id, [&state](transport::PeerSession& peer) {
                peer.lastSentState = state;
            });
            updated++;
        } else {
            // force a full resend next time
            sessions_.update(session.id, [](transport::PeerSession& peer) {
                peer.lastSentState.reset();
            });
        }
    }

    Logger::trace("TransferOrchestrator: state published to {} peers", updated);
    return updated;
}

bool TransferOrchestrator::sendFullState(const PeerId& peer) {
    auto state = currentState();
    if (!state) {
        return false;
    }
    if (!enqueueControl(peer, Channel::State, Lane::Normal, message_type::STATE_FULL,
                        encodeFullState(*state), "state")) {
        return false;
    }
    sessions_.update(peer, [&state](transport::PeerSession& session) {
        session.lastSentState = *state;
    });
    return true;
}

std::optional<MediaState> TransferOrchestrator::currentState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentState_;
}

size_t TransferOrchestrator::publishTimeSync() {
    size_t sent = 0;
    for (const auto& peer : sessions_.subscribers(Channel::State)) {
        if (sendTimeSync(peer)) {
            sent++;
        }
    }
    return sent;
}

bool TransferOrchestrator::sendTimeSync(const PeerId& peer) {
    TimeSync sync;
    sync.timestampMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    sync.timezone = config_.link.timezone;
    return enqueueControl(peer, Channel::State, Lane::Urgent, message_type::TIME_SYNC,
                          encodeTimeSync(sync), "time-sync");
}

size_t TransferOrchestrator::publishGradient(const std::vector<uint32_t>& colors) {
    auto payload = encodeGradient(colors);
    size_t sent = 0;
    for (const auto& peer : sessions_.subscribers(Channel::State)) {
        if (enqueueControl(peer, Channel::State, Lane::Normal, message_type::GRADIENT_COLORS, payload, "gradient")) {
            sent++;
        }
    }
    return sent;
}

bool TransferOrchestrator::sendAlbumArtNotAvailable(const PeerId& peer, const std::string& assetId) {
    return enqueueControl(peer, Channel::Bulk, Lane::Normal, message_type::ALBUM_ART_NOT_AVAILABLE,
                          encodeStringValue(assetId), "art-not-available");
}

bool TransferOrchestrator::sendCapabilities(const PeerId& peer) {
    auto session = sessions_.get(peer);
    if (!session) {
        return false;
    }

    Capabilities capabilities;
    capabilities.version = config_.link.version;
    capabilities.mtu = session->mtu;
    capabilities.debug = config_.link.debug;
    capabilities.features = config_.link.features;
    return enqueueControl(peer, Channel::State, Lane::Normal, message_type::CAPABILITIES,
                          encodeCapabilities(capabilities), "capabilities");
}

bool TransferOrchestrator::sendError(const PeerId& peer, uint16_t type, const std::string& code,
                                     const std::string& message) {
    ErrorReport report;
    report.code = code;
    report.message = message;
    return enqueueControl(peer, Channel::State, Lane::Normal, type, encodeError(report), "error");
}

void TransferOrchestrator::setChunkDelay(uint32_t chunkDelayMs) {
    queue_->updatePacing(chunkDelayMs);
}

void TransferOrchestrator::setTransferObserver(TransferObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

ConnectionQuality TransferOrchestrator::connectionQuality(const PeerId& peer) const {
    return queue_->connectionQuality(peer);
}

uint32_t TransferOrchestrator::chunkSizeFor(const PeerId& peer, AssetClass assetClass) const {
    auto session = sessions_.get(peer);
    return encoder_.chunkSizeFor(session ? session->mtu : config_.link.defaultMtu, assetClass);
}

std::optional<TransferResult> TransferOrchestrator::lastResult(const PeerId& peer, AssetClass assetClass,
                                                              bool isTest) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lastResults_.find(TransferKey(peer, assetClass, isTest));
    if (it == lastResults_.end()) {
        return std::nullopt;
    }
    return it->second;
}

nlohmann::json TransferOrchestrator::diagnosticsJson() const {
    using json = nlohmann::json;

    auto stats = queue_->getStatistics();
    json document;
    document["running"] = running_.load();
    document["queue"] = {
        {"enqueued", stats.enqueued},
        {"sent", stats.sent},
        {"failed", stats.failed},
        {"retried", stats.retried},
        {"dropped", stats.dropped},
        {"cancelled", stats.cancelled},
        {"purged", stats.purged},
        {"rejected", stats.rejected},
        {"depth", queue_->totalDepth()}
    };

    auto now = Clock::now();
    json peers = json::array();
    for (const auto& session : sessions_.snapshot()) {
        json subscriptions = json::array();
        for (Channel channel : session.subscriptions) {
            subscriptions.push_back(channelName(channel));
        }
        json transfers = json::array();
        for (const auto& entry : session.activeTransfers) {
            transfers.push_back({{"class", assetClassName(entry.first)}, {"id", entry.second}});
        }

        auto congestion = congestion_->stateFor(session.id);
        auto depths = queue_->depths(session.id);
        peers.push_back({
            {"id", session.id},
            {"mtu", session.mtu},
            {"chunk_size", encoder_.chunkSizeFor(session.mtu)},
            {"binary_protocol", session.supportsBinaryProtocol},
            {"incremental_updates", session.incrementalUpdates},
            {"subscriptions", subscriptions},
            {"quality", connectionQualityName(queue_->connectionQuality(session.id))},
            {"congestion", {
                {"consecutive_failures", congestion.consecutiveFailures},
                {"backoff_ms", congestion.backoffMs},
                {"total_failures", congestion.totalFailures},
                {"total_successes", congestion.totalSuccesses}
            }},
            {"lanes", {{"urgent", depths.urgent}, {"normal", depths.normal}, {"bulk", depths.bulk}}},
            {"active_transfers", transfers},
            {"connected_ms", std::chrono::duration_cast<std::chrono::milliseconds>(now - session.connectedAt).count()}
        });
    }
    document["peers"] = std::move(peers);
    return document;
}

} // namespace nocturne::transfer
