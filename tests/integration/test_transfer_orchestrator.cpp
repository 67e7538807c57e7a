#include <gtest/gtest.h>
#include "link_test_harness.hpp"
#include "protocol/payloads.hpp"
#include "system/logger.hpp"
#include "transfer/digest.hpp"
#include "transfer/transfer_orchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

using namespace nocturne;
using namespace nocturne::transfer;
using namespace nocturne::protocol;
using nocturne::testing::LinkTestHarness;
using nocturne::testing::InMemoryAssetSource;
using namespace std::chrono_literals;

class TransferOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::initialize("test_transfer_orchestrator.log", Logger::Level::Debug, false);
        config_ = LinkTestHarness::fastConfiguration();
        assets_ = std::make_shared<InMemoryAssetSource>();
    }

    void TearDown() override {
        if (orchestrator_) {
            orchestrator_->stop();
            orchestrator_.reset();
        }
        Logger::shutdown();
    }

    TransferOrchestrator& start() {
        orchestrator_ = std::make_unique<TransferOrchestrator>(config_, harness_.transport(), assets_);
        EXPECT_TRUE(orchestrator_->start());
        return *orchestrator_;
    }

    void connect(const PeerId& peer, uint16_t mtu) {
        orchestrator_->onPeerConnected(peer, mtu);
        orchestrator_->onSubscriptionChanged(peer, Channel::State, true);
        orchestrator_->onSubscriptionChanged(peer, Channel::Bulk, true);
    }

    static AssetPayload art(std::vector<uint8_t> bytes, const std::string& id) {
        AssetPayload payload;
        payload.bytes = std::move(bytes);
        payload.assetId = id;
        payload.checksum = "hash-" + id;
        return payload;
    }

    LinkConfiguration config_;
    LinkTestHarness harness_;
    std::shared_ptr<InMemoryAssetSource> assets_;
    std::unique_ptr<TransferOrchestrator> orchestrator_;
};

TEST_F(TransferOrchestratorTest, FiftyKilobyteArtArrivesIntact) {
    auto& orchestrator = start();
    connect("peer", 185);

    auto source = LinkTestHarness::randomBytes(50000);
    auto result = orchestrator.sendAssetAndWait("peer", AssetClass::AlbumArt, art(source, "track-1"));

    ASSERT_EQ(result.status, TransferStatus::Completed) << transferStatusName(result.status);
    EXPECT_TRUE(result.endDelivered);
    EXPECT_EQ(result.originalSize, 50000u);
    EXPECT_EQ(result.chunkSize, 162u);
    EXPECT_EQ(result.totalChunks, (result.compressedSize + 161) / 162);
    EXPECT_EQ(result.chunksSent, result.totalChunks);

    ASSERT_TRUE(harness_.waitForResults("peer", 1));
    auto received = harness_.results("peer").front();
    EXPECT_EQ(received.state, ReassemblyState::Complete);
    EXPECT_EQ(received.assetId, "track-1");
    EXPECT_EQ(received.data, source);
    EXPECT_EQ(received.checksum, result.checksum);
    EXPECT_EQ(harness_.rejectedChunks("peer"), 0u);

    auto last = orchestrator.lastResult("peer", AssetClass::AlbumArt);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->transferId, result.transferId);
    EXPECT_FALSE(orchestrator.hasActiveTransfer("peer", AssetClass::AlbumArt));
}

TEST_F(TransferOrchestratorTest, FramesRespectPeerMtu) {
    auto& orchestrator = start();
    connect("small", 23);

    auto result = orchestrator.sendAssetAndWait("small", AssetClass::AlbumArt,
                                                art(LinkTestHarness::randomBytes(2000), "tiny"));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.chunkSize, 16u);

    for (const auto& frame : harness_.frames("small")) {
        if (frame.type == message_type::ALBUM_ART_CHUNK) {
            EXPECT_LE(frame.payload.size(), 16u);
        }
    }
}

TEST_F(TransferOrchestratorTest, SupersedingTransferClosesPreviousFirst) {
    config_.queue.minBulkIntervalMs = 2;
    auto& orchestrator = start();
    connect("a", 23);
    connect("b", 23);

    auto firstSource = LinkTestHarness::randomBytes(20000, 1);
    auto otherSource = LinkTestHarness::randomBytes(3000, 2);
    auto secondSource = LinkTestHarness::randomBytes(3000, 3);

    auto first = orchestrator.sendAsset("a", AssetClass::AlbumArt, art(firstSource, "first"));
    auto other = orchestrator.sendAsset("b", AssetClass::AlbumArt, art(otherSource, "other"));

    ASSERT_TRUE(harness_.waitForFrames("a", message_type::ALBUM_ART_CHUNK, 5));
    auto second = orchestrator.sendAsset("a", AssetClass::AlbumArt, art(secondSource, "second"));

    EXPECT_EQ(first.get().status, TransferStatus::Cancelled);
    EXPECT_EQ(second.get().status, TransferStatus::Completed);
    EXPECT_EQ(other.get().status, TransferStatus::Completed);
    EXPECT_GT(second.get().transferId, first.get().transferId);

    ASSERT_TRUE(harness_.waitForResults("a", 2));
    auto results = harness_.results("a");
    EXPECT_EQ(results[0].state, ReassemblyState::Failed);
    EXPECT_EQ(results[0].error, ReassemblyError::AbortedBySender);
    EXPECT_EQ(results[1].state, ReassemblyState::Complete);
    EXPECT_EQ(results[1].assetId, "second");
    EXPECT_EQ(results[1].data, secondSource);

    // the peer saw start(first) ... end(first, failed) before start(second)
    auto types = harness_.frameTypes("a");
    auto firstEnd = std::find(types.begin(), types.end(), message_type::ALBUM_ART_END);
    auto starts = std::count(types.begin(), firstEnd, message_type::ALBUM_ART_START);
    EXPECT_EQ(starts, 1);

    ASSERT_TRUE(harness_.waitForResults("b", 1));
    EXPECT_EQ(harness_.results("b")[0].data, otherSource);
}

TEST_F(TransferOrchestratorTest, TestTransferRunsBesideRegularArt) {
    config_.queue.minBulkIntervalMs = 2;
    auto& orchestrator = start();
    connect("peer", 23);

    auto realSource = LinkTestHarness::randomBytes(8000, 4);
    auto testSource = LinkTestHarness::randomBytes(500, 5);

    auto real = orchestrator.sendAsset("peer", AssetClass::AlbumArt, art(realSource, "real"));
    ASSERT_TRUE(harness_.waitForFrames("peer", message_type::ALBUM_ART_CHUNK, 3));

    auto test = orchestrator.sendAsset("peer", AssetClass::AlbumArt, art(testSource, "test"), true);
    EXPECT_TRUE(orchestrator.hasActiveTransfer("peer", AssetClass::AlbumArt));

    EXPECT_EQ(test.get().status, TransferStatus::Completed);
    EXPECT_EQ(real.get().status, TransferStatus::Completed) << transferStatusName(real.get().status);

    ASSERT_TRUE(harness_.waitForResults("peer", 2));
    auto results = harness_.results("peer");
    auto byId = [&results](const std::string& id) {
        return std::find_if(results.begin(), results.end(),
                            [&id](const ReassemblyResult& r) { return r.assetId == id; });
    };
    ASSERT_NE(byId("test"), results.end());
    ASSERT_NE(byId("real"), results.end());
    EXPECT_TRUE(byId("test")->isTest);
    EXPECT_EQ(byId("test")->data, testSource);
    EXPECT_EQ(byId("real")->state, ReassemblyState::Complete);
    EXPECT_EQ(byId("real")->data, realSource);
    EXPECT_EQ(harness_.rejectedChunks("peer"), 0u);

    auto lastReal = orchestrator.lastResult("peer", AssetClass::AlbumArt);
    auto lastTest = orchestrator.lastResult("peer", AssetClass::AlbumArt, true);
    ASSERT_TRUE(lastReal.has_value());
    ASSERT_TRUE(lastTest.has_value());
    EXPECT_EQ(lastReal->assetId, "real");
    EXPECT_EQ(lastTest->assetId, "test");
}

TEST_F(TransferOrchestratorTest, CancelTransfer) {
    config_.queue.minBulkIntervalMs = 5;
    auto& orchestrator = start();
    connect("peer", 23);

    EXPECT_FALSE(orchestrator.cancelTransfer("peer", AssetClass::AlbumArt));

    auto future = orchestrator.sendAsset("peer", AssetClass::AlbumArt,
                                         art(LinkTestHarness::randomBytes(10000), "doomed"));
    EXPECT_TRUE(orchestrator.hasActiveTransfer("peer", AssetClass::AlbumArt));
    ASSERT_TRUE(harness_.waitForFrames("peer", message_type::ALBUM_ART_CHUNK, 2));

    EXPECT_TRUE(orchestrator.cancelTransfer("peer", AssetClass::AlbumArt));
    auto result = future.get();
    EXPECT_EQ(result.status, TransferStatus::Cancelled);
    EXPECT_LT(result.chunksSent, result.totalChunks);
    EXPECT_FALSE(orchestrator.hasActiveTransfer("peer", AssetClass::AlbumArt));

    ASSERT_TRUE(harness_.waitForResults("peer", 1));
    EXPECT_EQ(harness_.results("peer")[0].error, ReassemblyError::AbortedBySender);
}

TEST_F(TransferOrchestratorTest, MtuChangeAppliesToNextTransferOnly) {
    config_.queue.minBulkIntervalMs = 2;
    auto& orchestrator = start();
    connect("peer", 23);

    auto running = orchestrator.sendAsset("peer", AssetClass::AlbumArt,
                                          art(LinkTestHarness::randomBytes(3000), "before"));
    ASSERT_TRUE(harness_.waitForFrames("peer", message_type::ALBUM_ART_CHUNK, 3));
    orchestrator.onMtuChanged("peer", 185);
    EXPECT_EQ(orchestrator.chunkSizeFor("peer", AssetClass::AlbumArt), 162u);

    auto before = running.get();
    ASSERT_TRUE(before.ok());
    EXPECT_EQ(before.chunkSize, 16u);

    auto after = orchestrator.sendAssetAndWait("peer", AssetClass::AlbumArt,
                                               art(LinkTestHarness::randomBytes(3000, 8), "after"));
    ASSERT_TRUE(after.ok());
    EXPECT_EQ(after.chunkSize, 162u);

    ASSERT_TRUE(harness_.waitForResults("peer", 2));
    EXPECT_EQ(harness_.results("peer")[0].state, ReassemblyState::Complete);
    EXPECT_EQ(harness_.results("peer")[1].state, ReassemblyState::Complete);
}

TEST_F(TransferOrchestratorTest, StalledChunksTimeOut) {
    config_.transfer.completionTimeoutMs = 200;
    auto& orchestrator = start();
    connect("peer", 185);
    orchestrator.queue().pauseBulk("peer");

    auto result = orchestrator.sendAssetAndWait("peer", AssetClass::AlbumArt,
                                                art(LinkTestHarness::randomBytes(2000), "stalled"));
    EXPECT_EQ(result.status, TransferStatus::TimedOut);
    EXPECT_EQ(result.chunksSent, 0u);
    EXPECT_TRUE(result.endDelivered);
    EXPECT_EQ(orchestrator.queue().depths("peer").bulk, 0u);

    ASSERT_TRUE(harness_.waitForResults("peer", 1));
    EXPECT_EQ(harness_.results("peer")[0].error, ReassemblyError::AbortedBySender);
}

TEST_F(TransferOrchestratorTest, ChunksSettlingLateStillComplete) {
    config_.transfer.completionTimeoutMs = 600;
    auto& orchestrator = start();
    connect("peer", 185);
    orchestrator.queue().pauseBulk("peer");

    auto pending = orchestrator.sendAsset("peer", AssetClass::AlbumArt,
                                          art(LinkTestHarness::randomBytes(2000), "late"));
    std::this_thread::sleep_for(450ms);
    orchestrator.queue().resumeBulk("peer");

    auto result = pending.get();
    EXPECT_EQ(result.status, TransferStatus::Completed) << transferStatusName(result.status);
    EXPECT_EQ(result.chunksSent, result.totalChunks);
    EXPECT_TRUE(result.endDelivered);

    ASSERT_TRUE(harness_.waitForResults("peer", 1));
    EXPECT_EQ(harness_.results("peer")[0].state, ReassemblyState::Complete);
}

TEST_F(TransferOrchestratorTest, TransferTimingsFeedPerformanceMetrics) {
    Logger::resetPerformanceMetrics();
    auto& orchestrator = start();
    connect("peer", 185);

    auto first = orchestrator.sendAssetAndWait("peer", AssetClass::AlbumArt,
                                               art(LinkTestHarness::randomBytes(3000), "one"));
    auto second = orchestrator.sendAssetAndWait("peer", AssetClass::AlbumArt,
                                                art(LinkTestHarness::randomBytes(3000), "two"));
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());

    auto transfers = Logger::getPerformanceMetrics("transfer.album_art");
    EXPECT_EQ(transfers.totalOperations, 2u);
    EXPECT_DOUBLE_EQ(transfers.errorRate, 0.0);
    EXPECT_GE(transfers.maxLatency, transfers.minLatency);

    auto ends = Logger::getPerformanceMetrics("transfer-end");
    EXPECT_EQ(ends.totalOperations, 2u);
    EXPECT_EQ(Logger::getPerformanceMetrics("transfer.weather").totalOperations, 0u);
}

TEST_F(TransferOrchestratorTest, RefusedChunksReportDropped) {
    auto& orchestrator = start();
    connect("peer", 185);
    harness_.setFailurePredicate([](const PeerId&, Channel, uint16_t type) {
        return type == message_type::ALBUM_ART_CHUNK;
    });

    auto result = orchestrator.sendAssetAndWait("peer", AssetClass::AlbumArt,
                                                art(LinkTestHarness::randomBytes(1000), "lossy"));
    EXPECT_EQ(result.status, TransferStatus::ChunksDropped);
    EXPECT_EQ(result.chunksSent, 0u);
    EXPECT_GT(harness_.refusedWrites(), 0u);

    // bulk chunks are never retried
    EXPECT_EQ(harness_.refusedWrites(), result.totalChunks);

    ASSERT_TRUE(harness_.waitForResults("peer", 1));
    EXPECT_EQ(harness_.results("peer")[0].error, ReassemblyError::AbortedBySender);
}

TEST_F(TransferOrchestratorTest, DisconnectPurgesQueuedChunks) {
    auto& orchestrator = start();
    connect("peer", 23);
    orchestrator.queue().pauseBulk("peer");

    auto future = orchestrator.sendAsset("peer", AssetClass::AlbumArt,
                                         art(LinkTestHarness::randomBytes(3000), "orphan"));
    ASSERT_TRUE(harness_.waitForFrames("peer", message_type::ALBUM_ART_START, 1));
    std::this_thread::sleep_for(20ms);

    orchestrator.onPeerDisconnected("peer");
    auto result = future.get();
    EXPECT_EQ(result.status, TransferStatus::Cancelled);
    EXPECT_FALSE(orchestrator.sessions().contains("peer"));
    EXPECT_FALSE(orchestrator.queue().hasPeer("peer"));
    EXPECT_EQ(harness_.countFrames("peer", message_type::ALBUM_ART_CHUNK), 0u);

    auto stats = orchestrator.queue().getStatistics();
    EXPECT_GT(stats.cancelled + stats.purged, 0u);
    EXPECT_FALSE(orchestrator.lastResult("peer", AssetClass::AlbumArt).has_value());
}

TEST_F(TransferOrchestratorTest, RejectionsResolveImmediately) {
    auto& orchestrator = start();
    orchestrator.onPeerConnected("bare", 185);

    auto unknown = orchestrator.sendAssetAndWait("ghost", AssetClass::AlbumArt, art({1, 2, 3}, "x"));
    EXPECT_EQ(unknown.status, TransferStatus::UnknownPeer);

    auto empty = orchestrator.sendAssetAndWait("bare", AssetClass::AlbumArt, art({}, "x"));
    EXPECT_EQ(empty.status, TransferStatus::AssetUnavailable);

    auto unsubscribed = orchestrator.sendAssetAndWait("bare", AssetClass::AlbumArt, art({1, 2, 3}, "x"));
    EXPECT_EQ(unsubscribed.status, TransferStatus::NotSubscribed);

    // weather rides the state channel
    orchestrator.onSubscriptionChanged("bare", Channel::Bulk, true);
    WeatherBundle bundle;
    bundle.location.name = "Nowhere";
    EXPECT_EQ(orchestrator.sendWeather("bare", bundle).get().status, TransferStatus::NotSubscribed);
}

TEST_F(TransferOrchestratorTest, PoorQualityRefusesAllButTests) {
    auto& orchestrator = start();
    connect("peer", 185);
    for (int i = 0; i < 6; ++i) {
        orchestrator.queue().congestion().recordFailure("peer");
    }
    ASSERT_EQ(orchestrator.connectionQuality("peer"), ConnectionQuality::Poor);

    auto refused = orchestrator.sendAssetAndWait("peer", AssetClass::AlbumArt, art({1, 2, 3}, "x"));
    EXPECT_EQ(refused.status, TransferStatus::Congested);

    auto diagnostic = orchestrator.sendAssetAndWait("peer", AssetClass::AlbumArt,
                                                    art(LinkTestHarness::randomBytes(500), "diagnostic"), true);
    EXPECT_EQ(diagnostic.status, TransferStatus::Completed);
    EXPECT_TRUE(diagnostic.isTest);
    EXPECT_EQ(harness_.countFrames("peer", message_type::TEST_ALBUM_ART_START), 1u);
    EXPECT_EQ(harness_.countFrames("peer", message_type::ALBUM_ART_START), 0u);
}

TEST_F(TransferOrchestratorTest, WeatherTransfer) {
    auto& orchestrator = start();
    connect("peer", 185);

    WeatherBundle bundle;
    bundle.mode = ForecastMode::Weekly;
    bundle.location = {"Reykjavik", 64.14, -21.94};
    bundle.timestampMs = 1700000000000;
    for (int i = 0; i < 7; ++i) {
        DailyForecast day;
        day.date = "2024-01-0" + std::to_string(i + 1);
        day.dayName = "Day " + std::to_string(i);
        day.highF = 35;
        day.lowF = 20;
        day.weatherCode = 71;
        bundle.days.push_back(day);
    }

    auto result = orchestrator.sendWeather("peer", bundle).get();
    ASSERT_EQ(result.status, TransferStatus::Completed) << transferStatusName(result.status);
    EXPECT_EQ(result.chunkSize, 146u);

    ASSERT_TRUE(harness_.waitForResults("peer", 1));
    auto received = harness_.results("peer")[0];
    EXPECT_EQ(received.assetClass, AssetClass::Weather);
    EXPECT_EQ(received.mode, "weekly");
    EXPECT_EQ(received.assetId, "Reykjavik");

    auto parsed = parseWeatherDocument(received.data);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->days.size(), 7u);
    EXPECT_EQ(parsed->location.name, "Reykjavik");

    for (const auto& frame : harness_.frames("peer")) {
        if (frame.type == message_type::WEATHER_CHUNK) {
            EXPECT_EQ(frame.channel, Channel::State);
        }
    }
}

TEST_F(TransferOrchestratorTest, ArtAndWeatherRunSideBySide) {
    auto& orchestrator = start();
    connect("peer", 185);

    auto artFuture = orchestrator.sendAsset("peer", AssetClass::AlbumArt,
                                            art(LinkTestHarness::randomBytes(8000), "art"));
    WeatherBundle bundle;
    bundle.location.name = "Lima";
    auto weatherFuture = orchestrator.sendWeather("peer", bundle);

    EXPECT_EQ(artFuture.get().status, TransferStatus::Completed);
    EXPECT_EQ(weatherFuture.get().status, TransferStatus::Completed);
    ASSERT_TRUE(harness_.waitForResults("peer", 2));
}

TEST_F(TransferOrchestratorTest, MissingChecksumSendsNotAvailable) {
    auto& orchestrator = start();
    connect("peer", 185);

    auto result = orchestrator.sendAssetByChecksum("peer", "unknown-hash").get();
    EXPECT_EQ(result.status, TransferStatus::AssetUnavailable);

    ASSERT_TRUE(harness_.waitForFrames("peer", message_type::ALBUM_ART_NOT_AVAILABLE, 1));
    auto frames = harness_.frames("peer");
    EXPECT_EQ(parseStringValue(frames.back().payload), "unknown-hash");
    EXPECT_EQ(frames.back().channel, Channel::Bulk);
}

TEST_F(TransferOrchestratorTest, ChecksumLookupFindsCachedArt) {
    auto& orchestrator = start();
    connect("peer", 185);
    auto payload = art(LinkTestHarness::randomBytes(700), "cached");
    assets_->add(payload);

    auto result = orchestrator.sendAssetByChecksum("peer", payload.checksum).get();
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.assetId, "cached");
}

TEST_F(TransferOrchestratorTest, BroadcastReachesSubscribersOnly) {
    auto& orchestrator = start();
    connect("a", 185);
    connect("b", 23);
    orchestrator.onPeerConnected("c", 185);

    auto futures = orchestrator.broadcastAsset(AssetClass::AlbumArt, art(LinkTestHarness::randomBytes(900), "all"));
    ASSERT_EQ(futures.size(), 2u);
    for (auto& future : futures) {
        EXPECT_TRUE(future.get().ok());
    }
    EXPECT_EQ(harness_.countFrames("c", message_type::ALBUM_ART_START), 0u);
}

TEST_F(TransferOrchestratorTest, PeerChecksumMismatchRewritesResult) {
    auto& orchestrator = start();
    connect("peer", 185);

    std::vector<TransferResult> observed;
    std::mutex observedMutex;
    orchestrator.setTransferObserver([&](const TransferResult& result) {
        std::lock_guard<std::mutex> lock(observedMutex);
        observed.push_back(result);
    });

    EXPECT_FALSE(orchestrator.reportPeerChecksumMismatch("peer", AssetClass::AlbumArt));

    auto result = orchestrator.sendAssetAndWait("peer", AssetClass::AlbumArt,
                                                art(LinkTestHarness::randomBytes(400), "bad"));
    ASSERT_TRUE(result.ok());

    EXPECT_TRUE(orchestrator.reportPeerChecksumMismatch("peer", AssetClass::AlbumArt));
    EXPECT_EQ(orchestrator.lastResult("peer", AssetClass::AlbumArt)->status, TransferStatus::ChecksumMismatch);

    std::lock_guard<std::mutex> lock(observedMutex);
    ASSERT_EQ(observed.size(), 2u);
    EXPECT_EQ(observed[0].status, TransferStatus::Completed);
    EXPECT_EQ(observed[1].status, TransferStatus::ChecksumMismatch);
}

TEST_F(TransferOrchestratorTest, IncrementalStateUpdates) {
    auto& orchestrator = start();
    connect("inc", 185);
    connect("full", 185);
    orchestrator.setIncrementalUpdates("inc", true);

    MediaState state;
    state.artist = "Artist";
    state.album = "Album";
    state.track = "One";
    state.durationMs = 180000;
    state.volume = 50;

    EXPECT_EQ(orchestrator.publishState(state), 2u);
    EXPECT_EQ(orchestrator.publishState(state), 0u);

    state.positionMs = 5000;
    EXPECT_EQ(orchestrator.publishState(state), 2u);

    state.artist = "Other";
    state.album = "Record";
    state.track = "Two";
    EXPECT_EQ(orchestrator.publishState(state), 2u);

    ASSERT_TRUE(harness_.waitForFrames("inc", message_type::STATE_TRACK, 1));
    EXPECT_EQ(harness_.frameTypes("inc"),
              (std::vector<uint16_t>{message_type::STATE_FULL, message_type::STATE_POSITION,
                                     message_type::STATE_ARTIST_ALBUM, message_type::STATE_TRACK}));

    ASSERT_TRUE(harness_.waitForFrames("full", message_type::STATE_FULL, 3));
    auto last = parseFullState(harness_.frames("full").back().payload);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(*last, state);
}

TEST_F(TransferOrchestratorTest, StateRequiresSubscription) {
    auto& orchestrator = start();
    orchestrator.onPeerConnected("quiet", 185);

    MediaState state;
    state.track = "Silence";
    EXPECT_EQ(orchestrator.publishState(state), 0u);
    ASSERT_TRUE(orchestrator.currentState().has_value());

    // unsubscribing drops the baseline so the next publish is a full state
    orchestrator.onSubscriptionChanged("quiet", Channel::State, true);
    EXPECT_EQ(orchestrator.publishState(state), 1u);
    orchestrator.onSubscriptionChanged("quiet", Channel::State, false);
    orchestrator.onSubscriptionChanged("quiet", Channel::State, true);
    EXPECT_EQ(orchestrator.publishState(state), 1u);
}

TEST_F(TransferOrchestratorTest, ControlMessages) {
    config_.link.timezone = "Asia/Tokyo";
    auto& orchestrator = start();
    connect("peer", 247);

    EXPECT_EQ(orchestrator.publishTimeSync(), 1u);
    EXPECT_EQ(orchestrator.publishGradient({0xFF102030, 0xFF405060}), 1u);
    EXPECT_TRUE(orchestrator.sendCapabilities("peer"));
    EXPECT_FALSE(orchestrator.sendCapabilities("ghost"));
    EXPECT_TRUE(orchestrator.sendError("peer", message_type::ERROR, "OOPS", "broken"));

    ASSERT_TRUE(harness_.waitForFrames("peer", message_type::ERROR, 1));

    auto frames = harness_.frames("peer");
    ASSERT_EQ(frames.size(), 4u);
    // time sync rides the urgent lane
    EXPECT_EQ(frames[0].type, message_type::TIME_SYNC);
    auto sync = parseTimeSync(frames[0].payload);
    ASSERT_TRUE(sync.has_value());
    EXPECT_EQ(sync->timezone, "Asia/Tokyo");
    EXPECT_GT(sync->timestampMs, 1600000000000);

    auto gradient = parseGradient(frames[1].payload);
    ASSERT_TRUE(gradient.has_value());
    EXPECT_EQ(gradient->size(), 2u);

    auto caps = parseCapabilities(frames[2].payload);
    ASSERT_TRUE(caps.has_value());
    EXPECT_EQ(caps->mtu, 247);
    EXPECT_EQ(caps->features, config_.link.features);
}

TEST_F(TransferOrchestratorTest, DiagnosticsDescribePeers) {
    auto& orchestrator = start();
    connect("peer", 185);
    orchestrator.sendAssetAndWait("peer", AssetClass::AlbumArt, art(LinkTestHarness::randomBytes(300), "d"));

    auto diagnostics = orchestrator.diagnosticsJson();
    EXPECT_TRUE(diagnostics["running"].get<bool>());
    ASSERT_EQ(diagnostics["peers"].size(), 1u);
    EXPECT_EQ(diagnostics["peers"][0]["id"], "peer");
    EXPECT_EQ(diagnostics["peers"][0]["chunk_size"], 162);
    EXPECT_EQ(diagnostics["peers"][0]["quality"], "excellent");
    EXPECT_GT(diagnostics["queue"]["sent"].get<uint64_t>(), 0u);
}

TEST_F(TransferOrchestratorTest, StoppedOrchestratorRejects) {
    auto& orchestrator = start();
    connect("peer", 185);
    orchestrator.stop();
    EXPECT_FALSE(orchestrator.isRunning());

    auto result = orchestrator.sendAssetAndWait("peer", AssetClass::AlbumArt, art({1, 2, 3}, "late"));
    EXPECT_EQ(result.status, TransferStatus::QueueRejected);
}

TEST_F(TransferOrchestratorTest, CompletionTrackerCountsOutcomes) {
    CompletionTracker empty(0);
    EXPECT_TRUE(empty.waitFor(0ms));

    CompletionTracker tracker(3);
    tracker.record(true);
    tracker.record(false);
    EXPECT_FALSE(tracker.waitFor(1ms));
    EXPECT_EQ(tracker.outstanding(), 1u);
    tracker.record(true);
    EXPECT_TRUE(tracker.waitFor(0ms));
    EXPECT_EQ(tracker.delivered(), 2u);
    EXPECT_EQ(tracker.failed(), 1u);

    // settled trackers report ready even once the deadline has passed
    EXPECT_TRUE(tracker.waitFor(-5ms));

    CompletionTracker aborted(10);
    aborted.abort();
    EXPECT_TRUE(aborted.waitFor(0ms));
    EXPECT_EQ(aborted.outstanding(), 10u);
}
