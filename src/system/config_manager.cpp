#include "system/config_manager.hpp"
#include "system/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace nocturne {

namespace {

template<typename T>
void readValue(const json& object, const char* key, T& target) {
    auto it = object.find(key);
    if (it != object.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

void appendResult(ConfigValidator::ValidationResult& into, const ConfigValidator::ValidationResult& from) {
    into.isValid = into.isValid && from.isValid;
    into.errors.insert(into.errors.end(), from.errors.begin(), from.errors.end());
    into.warnings.insert(into.warnings.end(), from.warnings.begin(), from.warnings.end());
}

} // namespace

ConfigManager::ConfigManager()
    : m_configuration(createDefaultConfiguration()) {
}

bool ConfigManager::loadFromFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        Logger::error("ConfigManager: cannot open {}", filePath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (!loadFromString(buffer.str())) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_configFilePath = filePath;
    Logger::info("ConfigManager: loaded configuration from {}", filePath);
    return true;
}

bool ConfigManager::loadFromString(const std::string& text) {
    LinkConfiguration candidate = getConfiguration();

    try {
        json document = json::parse(text);
        if (!document.is_object()) {
            Logger::error("ConfigManager: configuration root must be an object");
            return false;
        }
        mergeJson(document, candidate);
    } catch (const json::exception& e) {
        Logger::error("ConfigManager: invalid configuration JSON: {}", e.what());
        return false;
    } catch (const std::invalid_argument& e) {
        Logger::error("ConfigManager: invalid configuration value: {}", e.what());
        return false;
    }

    return updateConfiguration(candidate);
}

bool ConfigManager::loadFromEnvironment() {
    LinkConfiguration candidate = getConfiguration();
    bool changed = false;

    if (const char* level = std::getenv("NOCTURNE_LOG_LEVEL")) {
        candidate.logging.level = level;
        changed = true;
    }

    if (const char* delay = std::getenv("NOCTURNE_CHUNK_DELAY_MS")) {
        try {
            candidate.queue.minBulkIntervalMs = static_cast<uint32_t>(std::stoul(delay));
            changed = true;
        } catch (const std::exception& e) {
            Logger::warning("ConfigManager: ignoring NOCTURNE_CHUNK_DELAY_MS={} ({})", delay, e.what());
        }
    }

    if (const char* compression = std::getenv("NOCTURNE_COMPRESSION")) {
        std::string value = compression;
        candidate.transfer.compressionEnabled = !(value == "0" || value == "false" || value == "off");
        changed = true;
    }

    if (const char* digest = std::getenv("NOCTURNE_DIGEST")) {
        auto algorithm = parseDigestAlgorithm(digest);
        if (algorithm) {
            candidate.transfer.digest = *algorithm;
            changed = true;
        } else {
            Logger::warning("ConfigManager: ignoring unknown NOCTURNE_DIGEST={}", digest);
        }
    }

    if (!changed) {
        return true;
    }
    return updateConfiguration(candidate);
}

bool ConfigManager::saveToFile(const std::string& filePath) const {
    std::ofstream file(filePath, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        Logger::error("ConfigManager: cannot write {}", filePath);
        return false;
    }
    file << saveToString();
    return file.good();
}

std::string ConfigManager::saveToString() const {
    return toJson(getConfiguration()).dump(2);
}

LinkConfiguration ConfigManager::getConfiguration() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_configuration;
}

bool ConfigManager::updateConfiguration(const LinkConfiguration& config) {
    if (!validateConfiguration(config)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_configuration = config;
    return true;
}

QueueSettings ConfigManager::getQueueSettings() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_configuration.queue;
}

TransferSettings ConfigManager::getTransferSettings() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_configuration.transfer;
}

LinkSettings ConfigManager::getLinkSettings() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_configuration.link;
}

LogSettings ConfigManager::getLogSettings() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_configuration.logging;
}

bool ConfigManager::validateConfiguration(const LinkConfiguration& config) const {
    auto result = ConfigValidator::validateConfiguration(config);
    for (const auto& warning : result.warnings) {
        Logger::warning("ConfigManager: {}", warning);
    }
    for (const auto& error : result.errors) {
        Logger::error("ConfigManager: {}", error);
    }
    return result.isValid;
}

LinkConfiguration ConfigManager::createDefaultConfiguration() {
    return LinkConfiguration{};
}

json ConfigManager::toJson(const LinkConfiguration& config) {
    json document;

    const auto& q = config.queue;
    document["queue"] = {
        {"urgentCapacity", q.urgentCapacity},
        {"normalCapacity", q.normalCapacity},
        {"bulkCapacity", q.bulkCapacity},
        {"minMessageIntervalMs", q.minMessageIntervalMs},
        {"minBulkIntervalMs", q.minBulkIntervalMs},
        {"idleWaitMs", q.idleWaitMs},
        {"baseBackoffMs", q.baseBackoffMs},
        {"maxBackoffMs", q.maxBackoffMs},
        {"backoffDecayMs", q.backoffDecayMs},
        {"maxUrgentRetries", q.maxUrgentRetries},
        {"maxCriticalRetries", q.maxCriticalRetries}
    };

    const auto& t = config.transfer;
    document["transfer"] = {
        {"compressionEnabled", t.compressionEnabled},
        {"compressionLevel", t.compressionLevel},
        {"digest", digestAlgorithmName(t.digest)},
        {"minimumChunkSize", t.minimumChunkSize},
        {"weatherMinimumChunkSize", t.weatherMinimumChunkSize},
        {"linkHeaderOverhead", t.linkHeaderOverhead},
        {"safetyMargin", t.safetyMargin},
        {"weatherSafetyMargin", t.weatherSafetyMargin},
        {"completionTimeoutMs", t.completionTimeoutMs},
        {"endMessageTimeoutMs", t.endMessageTimeoutMs},
        {"enqueueRetryDelayMs", t.enqueueRetryDelayMs},
        {"refuseWhenPoorQuality", t.refuseWhenPoorQuality},
        {"maxAssetSize", t.maxAssetSize}
    };

    const auto& l = config.link;
    document["link"] = {
        {"defaultMtu", l.defaultMtu},
        {"maxMtu", l.maxMtu},
        {"version", l.version},
        {"features", l.features},
        {"timezone", l.timezone},
        {"debug", l.debug},
        {"maxFrameSize", l.maxFrameSize}
    };

    const auto& g = config.logging;
    document["logging"] = {
        {"level", g.level},
        {"file", g.file},
        {"consoleOutput", g.consoleOutput},
        {"fileOutput", g.fileOutput},
        {"maxFileSize", g.maxFileSize},
        {"maxBackupFiles", g.maxBackupFiles}
    };

    return document;
}

void ConfigManager::mergeJson(const json& document, LinkConfiguration& config) {
    if (auto it = document.find("queue"); it != document.end() && it->is_object()) {
        auto& q = config.queue;
        readValue(*it, "urgentCapacity", q.urgentCapacity);
        readValue(*it, "normalCapacity", q.normalCapacity);
        readValue(*it, "bulkCapacity", q.bulkCapacity);
        readValue(*it, "minMessageIntervalMs", q.minMessageIntervalMs);
        readValue(*it, "minBulkIntervalMs", q.minBulkIntervalMs);
        readValue(*it, "idleWaitMs", q.idleWaitMs);
        readValue(*it, "baseBackoffMs", q.baseBackoffMs);
        readValue(*it, "maxBackoffMs", q.maxBackoffMs);
        readValue(*it, "backoffDecayMs", q.backoffDecayMs);
        readValue(*it, "maxUrgentRetries", q.maxUrgentRetries);
        readValue(*it, "maxCriticalRetries", q.maxCriticalRetries);
    }

    if (auto it = document.find("transfer"); it != document.end() && it->is_object()) {
        auto& t = config.transfer;
        readValue(*it, "compressionEnabled", t.compressionEnabled);
        readValue(*it, "compressionLevel", t.compressionLevel);
        std::string digest;
        readValue(*it, "digest", digest);
        if (!digest.empty()) {
            auto algorithm = parseDigestAlgorithm(digest);
            if (!algorithm) {
                throw std::invalid_argument("unknown digest algorithm: " + digest);
            }
            t.digest = *algorithm;
        }
        readValue(*it, "minimumChunkSize", t.minimumChunkSize);
        readValue(*it, "weatherMinimumChunkSize", t.weatherMinimumChunkSize);
        readValue(*it, "linkHeaderOverhead", t.linkHeaderOverhead);
        readValue(*it, "safetyMargin", t.safetyMargin);
        readValue(*it, "weatherSafetyMargin", t.weatherSafetyMargin);
        readValue(*it, "completionTimeoutMs", t.completionTimeoutMs);
        readValue(*it, "endMessageTimeoutMs", t.endMessageTimeoutMs);
        readValue(*it, "enqueueRetryDelayMs", t.enqueueRetryDelayMs);
        readValue(*it, "refuseWhenPoorQuality", t.refuseWhenPoorQuality);
        readValue(*it, "maxAssetSize", t.maxAssetSize);
    }

    if (auto it = document.find("link"); it != document.end() && it->is_object()) {
        auto& l = config.link;
        readValue(*it, "defaultMtu", l.defaultMtu);
        readValue(*it, "maxMtu", l.maxMtu);
        readValue(*it, "version", l.version);
        readValue(*it, "features", l.features);
        readValue(*it, "timezone", l.timezone);
        readValue(*it, "debug", l.debug);
        readValue(*it, "maxFrameSize", l.maxFrameSize);
    }

    if (auto it = document.find("logging"); it != document.end() && it->is_object()) {
        auto& g = config.logging;
        readValue(*it, "level", g.level);
        readValue(*it, "file", g.file);
        readValue(*it, "consoleOutput", g.consoleOutput);
        readValue(*it, "fileOutput", g.fileOutput);
        readValue(*it, "maxFileSize", g.maxFileSize);
        readValue(*it, "maxBackupFiles", g.maxBackupFiles);
    }
}

std::optional<DigestAlgorithm> ConfigManager::parseDigestAlgorithm(const std::string& name) {
    if (name == "sha256" || name == "sha-256") return DigestAlgorithm::Sha256;
    if (name == "sha3-256" || name == "sha3_256") return DigestAlgorithm::Sha3_256;
    if (name == "blake2s256" || name == "blake2s-256") return DigestAlgorithm::Blake2s256;
    return std::nullopt;
}

std::string ConfigManager::digestAlgorithmName(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::Sha256: return "sha256";
        case DigestAlgorithm::Sha3_256: return "sha3-256";
        case DigestAlgorithm::Blake2s256: return "blake2s256";
    }
    return "sha256";
}

// ConfigValidator

ConfigValidator::ValidationResult ConfigValidator::validateQueueSettings(const QueueSettings& settings) {
    ValidationResult result;

    if (settings.urgentCapacity == 0 || settings.normalCapacity == 0 || settings.bulkCapacity == 0) {
        result.isValid = false;
        result.errors.push_back("queue lane capacities must be positive");
    }
    if (settings.maxBackoffMs < settings.baseBackoffMs) {
        result.isValid = false;
        result.errors.push_back("queue.maxBackoffMs must not be below queue.baseBackoffMs");
    }
    if (settings.idleWaitMs == 0) {
        result.warnings.push_back("queue.idleWaitMs of 0 makes the scheduler spin when idle");
    }
    if (settings.backoffDecayMs == 0) {
        result.warnings.push_back("queue.backoffDecayMs of 0 keeps backoff until failures stop entirely");
    }
    return result;
}

ConfigValidator::ValidationResult ConfigValidator::validateTransferSettings(const TransferSettings& settings) {
    ValidationResult result;

    if (settings.compressionLevel < -1 || settings.compressionLevel > 9) {
        result.isValid = false;
        result.errors.push_back("transfer.compressionLevel must be within -1..9");
    }
    if (settings.minimumChunkSize == 0) {
        result.isValid = false;
        result.errors.push_back("transfer.minimumChunkSize must be positive");
    }
    if (settings.weatherMinimumChunkSize == 0) {
        result.isValid = false;
        result.errors.push_back("transfer.weatherMinimumChunkSize must be positive");
    }
    if (settings.completionTimeoutMs == 0) {
        result.isValid = false;
        result.errors.push_back("transfer.completionTimeoutMs must be positive");
    }
    if (settings.maxAssetSize == 0) {
        result.isValid = false;
        result.errors.push_back("transfer.maxAssetSize must be positive");
    }
    return result;
}

ConfigValidator::ValidationResult ConfigValidator::validateLinkSettings(const LinkSettings& settings) {
    ValidationResult result;

    if (settings.defaultMtu < 23) {
        result.isValid = false;
        result.errors.push_back("link.defaultMtu must be at least 23");
    }
    if (settings.maxMtu < settings.defaultMtu) {
        result.isValid = false;
        result.errors.push_back("link.maxMtu must not be below link.defaultMtu");
    }
    if (settings.version.size() > 255) {
        result.isValid = false;
        result.errors.push_back("link.version must fit a one-byte length prefix");
    }
    if (settings.maxFrameSize < 16) {
        result.isValid = false;
        result.errors.push_back("link.maxFrameSize must hold at least a frame header");
    }
    return result;
}

ConfigValidator::ValidationResult ConfigValidator::validateConfiguration(const LinkConfiguration& config) {
    ValidationResult result;
    appendResult(result, validateQueueSettings(config.queue));
    appendResult(result, validateTransferSettings(config.transfer));
    appendResult(result, validateLinkSettings(config.link));
    return result;
}

} // namespace nocturne
