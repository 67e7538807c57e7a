#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "link_types.hpp"
#include "protocol/payloads.hpp"
#include "transfer/chunk_codec.hpp"
#include "transfer/weather_bundle.hpp"
#include "transport/congestion_controller.hpp"
#include "transport/message_queue.hpp"
#include "transport/session_registry.hpp"

namespace nocturne::transfer {

/**
 * Asset bytes as handed over by the host's asset cache
 */
struct AssetPayload {
    std::vector<uint8_t> bytes;
    std::string checksum;       // cache identity used by album art queries
    std::string assetId;        // track id, or location name for weather
    std::string variant;        // weather mode ("hourly" / "weekly")
    int64_t timestampMs = 0;
};

/**
 * @brief Host-side provider of transferable assets
 */
class AssetSource {
public:
    virtual ~AssetSource() = default;

    virtual std::optional<AssetPayload> findByChecksum(const std::string& checksum) = 0;
    virtual std::optional<AssetPayload> current(AssetClass assetClass) = 0;
};

enum class TransferStatus {
    Completed,
    AssetUnavailable,
    NotSubscribed,
    UnknownPeer,
    Congested,
    Cancelled,
    TimedOut,
    ChunksDropped,
    QueueRejected,
    ChecksumMismatch,
    EncodingFailed
};

const char* transferStatusName(TransferStatus status);

struct TransferResult {
    TransferStatus status = TransferStatus::AssetUnavailable;
    uint64_t transferId = 0;
    PeerId peer;
    AssetClass assetClass = AssetClass::AlbumArt;
    bool isTest = false;
    std::string assetId;
    Digest checksum{};
    uint32_t originalSize = 0;
    uint32_t compressedSize = 0;
    uint32_t chunkSize = 0;
    uint32_t totalChunks = 0;
    uint32_t chunksSent = 0;
    bool endDelivered = false;
    std::chrono::milliseconds elapsed{0};

    bool ok() const { return status == TransferStatus::Completed; }
};

/**
 * @brief Countdown of expected send outcomes, signalled through a future
 *
 * Every expected message reports exactly once through record(). The future
 * becomes ready when the last outcome arrives or when abort() is called.
 */
class CompletionTracker {
public:
    explicit CompletionTracker(uint32_t expected);

    void record(bool success);
    void abort();

    /** True if every outcome arrived (or abort() ran) before the timeout. */
    bool waitFor(std::chrono::milliseconds timeout) const;

    uint32_t expected() const { return expected_; }
    uint32_t delivered() const { return delivered_.load(); }
    uint32_t failed() const { return failed_.load(); }
    uint32_t outstanding() const;

private:
    void signal();

    const uint32_t expected_;
    std::atomic<uint32_t> delivered_{0};
    std::atomic<uint32_t> failed_{0};
    std::promise<void> promise_;
    std::shared_future<void> future_;
    std::once_flag signalled_;
};

/**
 * @brief Per-peer transfer driver
 *
 * Owns the session registry, the message queue and one active transfer per
 * peer and asset class. Each transfer runs on its own worker thread:
 *
 *   start (normal lane) -> chunks (bulk lane) -> wait for outcomes -> end
 *
 * A newer request for the same peer and class cancels the older transfer and
 * waits until its failure end message has been handed to the queue before
 * enqueuing the new start, so the peer always sees the old transfer close
 * first. Transfers to other peers are never touched.
 */
class TransferOrchestrator {
public:
    using TransferObserver = std::function<void(const TransferResult&)>;
    using PeerListener = std::function<void(const PeerId&)>;

    TransferOrchestrator(const LinkConfiguration& config,
                         transport::TransportSend send,
                         std::shared_ptr<AssetSource> assets = nullptr);
    ~TransferOrchestrator();

    TransferOrchestrator(const TransferOrchestrator&) = delete;
    TransferOrchestrator& operator=(const TransferOrchestrator&) = delete;

    bool start();
    void stop();
    bool isRunning() const { return running_.load(); }

    // Peer lifecycle events from the link layer
    void onPeerConnected(const PeerId& peer);
    void onPeerConnected(const PeerId& peer, uint16_t mtu);
    void onPeerDisconnected(const PeerId& peer);
    void onMtuChanged(const PeerId& peer, uint16_t mtu);
    void onSubscriptionChanged(const PeerId& peer, Channel channel, bool enabled);

    void onPeerActivity(const PeerId& peer);

    /**
     * Called after a peer's session, transfers and queued messages are gone,
     * outside the orchestrator's locks. Returns a handle for removal.
     */
    uint64_t addDisconnectListener(PeerListener listener);
    void removeDisconnectListener(uint64_t handle);

    void setBinaryProtocol(const PeerId& peer, bool enabled);
    void setIncrementalUpdates(const PeerId& peer, bool enabled);

    // Bulk transfers
    std::shared_future<TransferResult> sendAsset(const PeerId& peer,
                                                 AssetClass assetClass,
                                                 AssetPayload payload,
                                                 bool isTest = false);
    TransferResult sendAssetAndWait(const PeerId& peer,
                                    AssetClass assetClass,
                                    AssetPayload payload,
                                    bool isTest = false);

    std::shared_future<TransferResult> sendAssetByChecksum(const PeerId& peer,
                                                           const std::string& checksum,
                                                           bool isTest = false);
    std::shared_future<TransferResult> sendCurrentAsset(const PeerId& peer,
                                                        AssetClass assetClass,
                                                        bool isTest = false);
    std::shared_future<TransferResult> sendWeather(const PeerId& peer, const WeatherBundle& bundle);

    /** Sends to every peer subscribed to the asset class channel. */
    std::vector<std::shared_future<TransferResult>> broadcastAsset(AssetClass assetClass,
                                                                   const AssetPayload& payload);

    /**
     * Idempotent; returns false if nothing was running. Test transfers run
     * beside regular ones and are addressed separately.
     */
    bool cancelTransfer(const PeerId& peer, AssetClass assetClass, bool isTest = false);
    bool hasActiveTransfer(const PeerId& peer, AssetClass assetClass, bool isTest = false) const;

    /**
     * Peer feedback that the reassembled digest did not match. Marks the
     * active or most recent transfer for that peer and class as failed.
     */
    bool reportPeerChecksumMismatch(const PeerId& peer, AssetClass assetClass);

    // State and control messages
    size_t publishState(const protocol::MediaState& state);
    bool sendFullState(const PeerId& peer);
    std::optional<protocol::MediaState> currentState() const;

    size_t publishTimeSync();
    bool sendTimeSync(const PeerId& peer);
    size_t publishGradient(const std::vector<uint32_t>& colors);
    bool sendAlbumArtNotAvailable(const PeerId& peer, const std::string& assetId);
    bool sendCapabilities(const PeerId& peer);
    bool sendError(const PeerId& peer, uint16_t type, const std::string& code, const std::string& message);

    void setChunkDelay(uint32_t chunkDelayMs);
    /** Called on the worker thread before the transfer future becomes ready. */
    void setTransferObserver(TransferObserver observer);

    ConnectionQuality connectionQuality(const PeerId& peer) const;
    uint32_t chunkSizeFor(const PeerId& peer, AssetClass assetClass) const;
    std::optional<TransferResult> lastResult(const PeerId& peer, AssetClass assetClass,
                                             bool isTest = false) const;

    nlohmann::json diagnosticsJson() const;

    const transport::SessionRegistry& sessions() const { return sessions_; }
    transport::MessageQueue& queue() { return *queue_; }
    AssetSource* assetSource() const { return assets_.get(); }
    const LinkSettings& linkSettings() const { return config_.link; }

private:
    struct Transfer {
        uint64_t id = 0;
        PeerId peer;
        AssetClass assetClass = AssetClass::AlbumArt;
        bool isTest = false;
        AssetPayload payload;
        transport::CancellationToken cancel;
        std::shared_ptr<Transfer> previous;

        std::mutex trackerMutex;
        std::shared_ptr<CompletionTracker> tracker;
        std::atomic<uint32_t> chunksSent{0};
        std::atomic<bool> checksumMismatch{false};

        std::promise<TransferResult> promise;
        std::shared_future<TransferResult> result;
        std::atomic<bool> finished{false};
        std::thread worker;
    };

    // peer, asset class, test flag
    using TransferKey = std::tuple<PeerId, AssetClass, bool>;

    static std::shared_future<TransferResult> immediate(TransferResult result);
    TransferResult rejection(const PeerId& peer, AssetClass assetClass, bool isTest,
                             TransferStatus status) const;

    void runTransfer(const std::shared_ptr<Transfer>& transfer);
    void cancel(const std::shared_ptr<Transfer>& transfer);
    void finish(const std::shared_ptr<Transfer>& transfer, TransferResult result);
    bool sendEnd(const std::shared_ptr<Transfer>& transfer, const TransferPlan& plan, bool success);
    transport::EnqueueResult enqueueWithBackpressure(const transport::QueuedMessage& message,
                                                     const transport::CancellationToken& cancel,
                                                     std::chrono::steady_clock::time_point deadline);
    void reapWorkers();

    bool enqueueControl(const PeerId& peer, Channel channel, Lane lane, uint16_t type,
                        std::vector<uint8_t> payload, const std::string& label);
    std::vector<std::pair<uint16_t, std::vector<uint8_t>>> stateMessagesFor(
        const transport::PeerSession& session, const protocol::MediaState& state) const;

    static Channel channelFor(AssetClass assetClass);

    LinkConfiguration config_;
    std::shared_ptr<AssetSource> assets_;
    std::shared_ptr<transport::CongestionController> congestion_;
    std::unique_ptr<transport::MessageQueue> queue_;
    transport::SessionRegistry sessions_;
    ChunkEncoder encoder_;

    mutable std::mutex mutex_;
    std::map<TransferKey, std::shared_ptr<Transfer>> active_;
    std::map<TransferKey, TransferResult> lastResults_;
    std::list<std::shared_ptr<Transfer>> workers_;
    std::optional<protocol::MediaState> currentState_;
    TransferObserver observer_;
    std::map<uint64_t, PeerListener> disconnectListeners_;
    uint64_t nextListenerId_ = 1;
    uint64_t nextTransferId_ = 1;

    std::atomic<bool> running_{false};
};

} // namespace nocturne::transfer
