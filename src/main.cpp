#include <iostream>
#include <memory>
#include <csignal>
#include <thread>
#include <atomic>
#include <map>
#include <mutex>

#include "link_types.hpp"
#include "protocol/frame_codec.hpp"
#include "protocol/payloads.hpp"
#include "system/logger.hpp"
#include "system/config_manager.hpp"
#include "transfer/chunk_codec.hpp"
#include "transfer/digest.hpp"
#include "transfer/transfer_orchestrator.hpp"
#include "transfer/weather_bundle.hpp"
#include "transport/command_dispatcher.hpp"

using namespace nocturne;

// Global flag for graceful shutdown
std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int signal) {
    g_shutdown_requested = true;
    Logger::info("Received signal {}, initiating graceful shutdown", signal);
}

namespace {

/**
 * Peer-side mirror: reassembles whatever the host sends to one peer.
 */
class LoopbackPeer {
public:
    LoopbackPeer(DigestAlgorithm algorithm, size_t maxFrameSize)
        : reader_(maxFrameSize)
        , decoder_(algorithm) {
    }

    bool receive(const std::vector<uint8_t>& bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        reader_.append(bytes);
        while (auto frame = reader_.next()) {
            frames_++;
            if (auto result = decoder_.handleFrame(*frame)) {
                results_.push_back(std::move(*result));
            }
        }
        return true;
    }

    nlohmann::json summary() const {
        std::lock_guard<std::mutex> lock(mutex_);
        nlohmann::json transfers = nlohmann::json::array();
        for (const auto& result : results_) {
            transfers.push_back({
                {"class", assetClassName(result.assetClass)},
                {"asset", result.assetId},
                {"state", transfer::reassemblyStateName(result.state)},
                {"error", transfer::reassemblyErrorName(result.error)},
                {"chunks", result.chunksReceived},
                {"bytes", result.data.size()},
                {"digest", transfer::toHex(result.checksum)}
            });
        }
        return {{"frames", frames_}, {"framing_errors", reader_.errorCount()}, {"transfers", transfers}};
    }

private:
    mutable std::mutex mutex_;
    protocol::FrameReader reader_;
    transfer::ChunkDecoder decoder_;
    uint64_t frames_ = 0;
    std::vector<transfer::ReassemblyResult> results_;
};

class DemoAssets : public transfer::AssetSource {
public:
    explicit DemoAssets(std::vector<uint8_t> art) : art_(std::move(art)) {}

    std::optional<transfer::AssetPayload> findByChecksum(const std::string& checksum) override {
        if (checksum != "demo-art") {
            return std::nullopt;
        }
        return current(AssetClass::AlbumArt);
    }

    std::optional<transfer::AssetPayload> current(AssetClass assetClass) override {
        if (assetClass != AssetClass::AlbumArt) {
            return std::nullopt;
        }
        transfer::AssetPayload payload;
        payload.bytes = art_;
        payload.checksum = "demo-art";
        payload.assetId = "track-0001";
        return payload;
    }

private:
    std::vector<uint8_t> art_;
};

std::vector<uint8_t> syntheticImage(size_t size, uint8_t seed) {
    std::vector<uint8_t> image(size);
    for (size_t i = 0; i < size; ++i) {
        image[i] = static_cast<uint8_t>(((i / 64) ^ (i % 7)) + seed);
    }
    return image;
}

transfer::WeatherBundle demoWeather() {
    transfer::WeatherBundle bundle;
    bundle.mode = transfer::ForecastMode::Hourly;
    bundle.location = {"Loopback City", 52.52, 13.40};
    bundle.timestampMs = 1700000000000;
    for (int hour = 0; hour < 24; ++hour) {
        transfer::HourlyForecast forecast;
        forecast.time = "2024-01-01T" + std::string(hour < 10 ? "0" : "") + std::to_string(hour) + ":00";
        forecast.temperatureF = 40.0 + hour;
        forecast.weatherCode = hour % 4;
        forecast.precipitation = hour * 2;
        forecast.humidity = 60;
        forecast.windSpeed = 7.5;
        bundle.hours.push_back(forecast);
    }
    return bundle;
}

} // namespace

int main(int argc, char* argv[]) {
    // Setup signal handlers for graceful shutdown
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        // Load configuration
        ConfigManager configManager;
        if (argc > 1 && !configManager.loadFromFile(argv[1])) {
            std::cerr << "Failed to load configuration from " << argv[1] << std::endl;
            return 1;
        }
        if (!configManager.loadFromEnvironment()) {
            std::cerr << "Ignoring invalid NOCTURNE_* environment overrides" << std::endl;
        }
        LinkConfiguration config = configManager.getConfiguration();

        // Initialize logger
        if (!Logger::initialize(config.logging.file,
                                Logger::parseLevel(config.logging.level),
                                config.logging.consoleOutput,
                                config.logging.fileOutput)) {
            std::cerr << "Failed to initialize logging" << std::endl;
            return 1;
        }
        Logger::setMaxFileSize(config.logging.maxFileSize);
        Logger::setMaxBackupFiles(config.logging.maxBackupFiles);
        Logger::info("Nocturne link loopback simulator starting...");
        Logger::info("Protocol version: {}", static_cast<int>(protocol::PROTOCOL_VERSION));
        Logger::info("Build Date: {}", __DATE__);

        std::map<PeerId, std::unique_ptr<LoopbackPeer>> mirrors;
        mirrors["peer-a"] = std::make_unique<LoopbackPeer>(config.transfer.digest, config.link.maxFrameSize);
        mirrors["peer-b"] = std::make_unique<LoopbackPeer>(config.transfer.digest, config.link.maxFrameSize);

        auto transport = [&mirrors](const PeerId& peer, Channel, const std::vector<uint8_t>& bytes) {
            auto it = mirrors.find(peer);
            return it != mirrors.end() && it->second->receive(bytes);
        };

        auto art = syntheticImage(50000, 0);
        auto assets = std::make_shared<DemoAssets>(art);
        transfer::TransferOrchestrator orchestrator(config, transport, assets);
        transport::CommandDispatcher dispatcher(orchestrator, config.link.maxFrameSize);
        dispatcher.setCommandHandler([](const PeerId& peer, const protocol::Command& command) {
            Logger::info("Host command {} from {}", protocol::messageTypeName(command.type), peer);
        });

        if (!orchestrator.start()) {
            Logger::error("Failed to start transfer orchestrator");
            return 1;
        }

        orchestrator.onPeerConnected("peer-a", 23);
        orchestrator.onPeerConnected("peer-b", 185);
        for (const auto& peer : {"peer-a", "peer-b"}) {
            orchestrator.onSubscriptionChanged(peer, Channel::State, true);
            orchestrator.onSubscriptionChanged(peer, Channel::Bulk, true);
        }

        // Peer requests as they would arrive on the command channel
        dispatcher.handleWrite("peer-a", protocol::FrameCodec::encode(protocol::message_type::GET_CAPABILITIES, {}));
        dispatcher.handleWrite("peer-b", protocol::FrameCodec::encode(protocol::message_type::ENABLE_BINARY_INCREMENTAL,
                                                                      protocol::encodeByteValue(1)));
        dispatcher.handleWrite("peer-b", protocol::FrameCodec::encode(protocol::message_type::CMD_REQUEST_TIMESTAMP, {}));

        protocol::MediaState state;
        state.playing = true;
        state.durationMs = 215000;
        state.artist = "Loopback";
        state.album = "Simulated Sessions";
        state.track = "Chunk Boundary";
        state.volume = 60;
        orchestrator.publishState(state);
        state.positionMs = 1000;
        orchestrator.publishState(state);

        // One transfer per peer, then a superseding transfer on peer-a
        auto first = orchestrator.sendAssetByChecksum("peer-a", "demo-art");
        auto other = orchestrator.sendAssetByChecksum("peer-b", "demo-art");

        transfer::AssetPayload replacement;
        replacement.bytes = syntheticImage(30000, 17);
        replacement.assetId = "track-0002";
        auto second = orchestrator.sendAsset("peer-a", AssetClass::AlbumArt, replacement);

        orchestrator.onMtuChanged("peer-a", 185);
        auto weather = orchestrator.sendWeather("peer-b", demoWeather());

        nlohmann::json results = nlohmann::json::array();
        for (auto* future : {&first, &other, &second, &weather}) {
            if (g_shutdown_requested) {
                break;
            }
            auto result = future->get();
            results.push_back({
                {"id", result.transferId},
                {"peer", result.peer},
                {"class", assetClassName(result.assetClass)},
                {"status", transfer::transferStatusName(result.status)},
                {"chunks", result.chunksSent},
                {"total_chunks", result.totalChunks},
                {"chunk_size", result.chunkSize},
                {"elapsed_ms", result.elapsed.count()}
            });
        }

        nlohmann::json summary;
        summary["transfers"] = results;
        summary["host"] = orchestrator.diagnosticsJson();
        for (const auto& mirror : mirrors) {
            summary["peers"][mirror.first] = mirror.second->summary();
        }
        for (const char* operation : {"transfer.album_art", "transfer.weather", "transfer-end"}) {
            auto metrics = Logger::getPerformanceMetrics(operation);
            summary["latency"][operation] = {
                {"count", metrics.totalOperations},
                {"avg_ms", metrics.avgLatency},
                {"max_ms", metrics.maxLatency},
                {"error_rate", metrics.errorRate}
            };
        }

        // Graceful shutdown
        Logger::info("Shutting down gracefully...");
        orchestrator.stop();

        std::cout << summary.dump(2) << std::endl;
        Logger::info("Nocturne link loopback simulator stopped");
        Logger::flush();
        Logger::shutdown();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
