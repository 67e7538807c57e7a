#include <gtest/gtest.h>
#include "system/config_manager.hpp"
#include "system/logger.hpp"

#include <cstdlib>
#include <cstdio>
#include <string>

using namespace nocturne;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::initialize("test_config_manager.log", Logger::Level::Debug, false);
        clearEnvironment();
    }

    void TearDown() override {
        clearEnvironment();
        Logger::shutdown();
    }

    static void clearEnvironment() {
        unsetenv("NOCTURNE_LOG_LEVEL");
        unsetenv("NOCTURNE_CHUNK_DELAY_MS");
        unsetenv("NOCTURNE_COMPRESSION");
        unsetenv("NOCTURNE_DIGEST");
    }
};

TEST_F(ConfigManagerTest, Defaults) {
    ConfigManager manager;
    auto config = manager.getConfiguration();

    EXPECT_EQ(config.queue.urgentCapacity, 50u);
    EXPECT_EQ(config.queue.normalCapacity, 100u);
    EXPECT_EQ(config.queue.bulkCapacity, 200u);
    EXPECT_EQ(config.queue.minMessageIntervalMs, 10u);
    EXPECT_EQ(config.queue.minBulkIntervalMs, 5u);
    EXPECT_EQ(config.queue.baseBackoffMs, 50u);
    EXPECT_EQ(config.queue.maxBackoffMs, 1000u);
    EXPECT_EQ(config.transfer.digest, DigestAlgorithm::Sha256);
    EXPECT_TRUE(config.transfer.compressionEnabled);
    EXPECT_EQ(config.transfer.minimumChunkSize, 16u);
    EXPECT_EQ(config.transfer.weatherMinimumChunkSize, 50u);
    EXPECT_EQ(config.logging.maxFileSize, 10u * 1024 * 1024);
    EXPECT_EQ(config.logging.maxBackupFiles, 3u);
    EXPECT_EQ(config.link.defaultMtu, 23);
    EXPECT_EQ(config.link.maxMtu, 517);
    EXPECT_TRUE(manager.validateConfiguration(config));
}

TEST_F(ConfigManagerTest, PartialDocumentMergesOverDefaults) {
    ConfigManager manager;
    ASSERT_TRUE(manager.loadFromString(R"({
        "queue": { "bulkCapacity": 64, "minBulkIntervalMs": 12 },
        "transfer": { "digest": "sha3-256", "compressionLevel": 9 },
        "link": { "timezone": "Europe/Berlin", "features": ["binary"] }
    })"));

    auto config = manager.getConfiguration();
    EXPECT_EQ(config.queue.bulkCapacity, 64u);
    EXPECT_EQ(config.queue.minBulkIntervalMs, 12u);
    EXPECT_EQ(config.queue.urgentCapacity, 50u);
    EXPECT_EQ(config.transfer.digest, DigestAlgorithm::Sha3_256);
    EXPECT_EQ(config.transfer.compressionLevel, 9);
    EXPECT_EQ(config.link.timezone, "Europe/Berlin");
    EXPECT_EQ(config.link.features, std::vector<std::string>{"binary"});
}

TEST_F(ConfigManagerTest, RejectsInvalidDocuments) {
    ConfigManager manager;

    EXPECT_FALSE(manager.loadFromString("{ not json"));
    EXPECT_FALSE(manager.loadFromString("[1, 2, 3]"));
    EXPECT_FALSE(manager.loadFromString(R"({"transfer": {"digest": "md5"}})"));
    EXPECT_FALSE(manager.loadFromString(R"({"queue": {"urgentCapacity": 0}})"));
    EXPECT_FALSE(manager.loadFromString(R"({"link": {"defaultMtu": 20}})"));
    EXPECT_FALSE(manager.loadFromString(R"({"queue": {"baseBackoffMs": 500, "maxBackoffMs": 100}})"));

    // failed loads leave the configuration untouched
    EXPECT_EQ(manager.getConfiguration().queue.urgentCapacity, 50u);
    EXPECT_EQ(manager.getConfiguration().transfer.digest, DigestAlgorithm::Sha256);
}

TEST_F(ConfigManagerTest, JsonRoundTrip) {
    LinkConfiguration config;
    config.queue.maxUrgentRetries = 5;
    config.transfer.digest = DigestAlgorithm::Blake2s256;
    config.transfer.weatherSafetyMargin = 24;
    config.transfer.weatherMinimumChunkSize = 60;
    config.link.debug = true;
    config.logging.level = "trace";

    ConfigManager source;
    ASSERT_TRUE(source.updateConfiguration(config));

    ConfigManager copy;
    ASSERT_TRUE(copy.loadFromString(source.saveToString()));
    auto loaded = copy.getConfiguration();

    EXPECT_EQ(loaded.queue.maxUrgentRetries, 5u);
    EXPECT_EQ(loaded.transfer.digest, DigestAlgorithm::Blake2s256);
    EXPECT_EQ(loaded.transfer.weatherSafetyMargin, 24u);
    EXPECT_EQ(loaded.transfer.weatherMinimumChunkSize, 60u);
    EXPECT_TRUE(loaded.link.debug);
    EXPECT_EQ(loaded.logging.level, "trace");
}

TEST_F(ConfigManagerTest, FileRoundTrip) {
    const std::string path = "test_config_manager_roundtrip.json";

    ConfigManager source;
    ASSERT_TRUE(source.loadFromString(R"({"transfer": {"completionTimeoutMs": 1234}})"));
    ASSERT_TRUE(source.saveToFile(path));

    ConfigManager loaded;
    ASSERT_TRUE(loaded.loadFromFile(path));
    EXPECT_EQ(loaded.getTransferSettings().completionTimeoutMs, 1234u);

    std::remove(path.c_str());
    EXPECT_FALSE(loaded.loadFromFile("does_not_exist.json"));
}

TEST_F(ConfigManagerTest, EnvironmentOverrides) {
    setenv("NOCTURNE_CHUNK_DELAY_MS", "20", 1);
    setenv("NOCTURNE_COMPRESSION", "off", 1);
    setenv("NOCTURNE_DIGEST", "blake2s-256", 1);
    setenv("NOCTURNE_LOG_LEVEL", "debug", 1);

    ConfigManager manager;
    ASSERT_TRUE(manager.loadFromEnvironment());
    auto config = manager.getConfiguration();

    EXPECT_EQ(config.queue.minBulkIntervalMs, 20u);
    EXPECT_FALSE(config.transfer.compressionEnabled);
    EXPECT_EQ(config.transfer.digest, DigestAlgorithm::Blake2s256);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigManagerTest, MalformedEnvironmentValuesAreIgnored) {
    setenv("NOCTURNE_CHUNK_DELAY_MS", "soon", 1);
    setenv("NOCTURNE_DIGEST", "crc32", 1);

    ConfigManager manager;
    EXPECT_TRUE(manager.loadFromEnvironment());
    EXPECT_EQ(manager.getQueueSettings().minBulkIntervalMs, 5u);
    EXPECT_EQ(manager.getTransferSettings().digest, DigestAlgorithm::Sha256);
}

TEST_F(ConfigManagerTest, DigestNames) {
    EXPECT_EQ(ConfigManager::parseDigestAlgorithm("sha-256"), DigestAlgorithm::Sha256);
    EXPECT_EQ(ConfigManager::parseDigestAlgorithm("sha3_256"), DigestAlgorithm::Sha3_256);
    EXPECT_EQ(ConfigManager::parseDigestAlgorithm("blake2s256"), DigestAlgorithm::Blake2s256);
    EXPECT_FALSE(ConfigManager::parseDigestAlgorithm("SHA1").has_value());
    EXPECT_EQ(ConfigManager::digestAlgorithmName(DigestAlgorithm::Sha3_256), "sha3-256");
}

TEST_F(ConfigManagerTest, ValidatorWarnsWithoutFailing) {
    QueueSettings settings;
    settings.idleWaitMs = 0;
    auto result = ConfigValidator::validateQueueSettings(settings);
    EXPECT_TRUE(result.isValid);
    EXPECT_FALSE(result.warnings.empty());

    TransferSettings transfer;
    transfer.compressionLevel = 12;
    EXPECT_FALSE(ConfigValidator::validateTransferSettings(transfer).isValid);

    TransferSettings noWeatherFloor;
    noWeatherFloor.weatherMinimumChunkSize = 0;
    EXPECT_FALSE(ConfigValidator::validateTransferSettings(noWeatherFloor).isValid);
}
