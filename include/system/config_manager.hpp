#pragma once

#include "link_types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>
#include <mutex>
#include <optional>

namespace nocturne {

/**
 * @brief Configuration manager for link settings
 *
 * Loads a LinkConfiguration from JSON (file or string), overlays
 * NOCTURNE_* environment variables and validates the result. Keys that are
 * missing from a document keep their current values, so partial documents
 * can be merged on top of the defaults.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager() = default;

    // Configuration loading
    bool loadFromFile(const std::string& filePath);
    bool loadFromString(const std::string& json);
    bool loadFromEnvironment();

    // Configuration saving
    bool saveToFile(const std::string& filePath) const;
    std::string saveToString() const;

    // Configuration access
    LinkConfiguration getConfiguration() const;
    bool updateConfiguration(const LinkConfiguration& config);

    QueueSettings getQueueSettings() const;
    TransferSettings getTransferSettings() const;
    LinkSettings getLinkSettings() const;
    LogSettings getLogSettings() const;

    bool validateConfiguration(const LinkConfiguration& config) const;

    static LinkConfiguration createDefaultConfiguration();

    static nlohmann::json toJson(const LinkConfiguration& config);
    static void mergeJson(const nlohmann::json& document, LinkConfiguration& config);

    static std::optional<DigestAlgorithm> parseDigestAlgorithm(const std::string& name);
    static std::string digestAlgorithmName(DigestAlgorithm algorithm);

private:
    mutable std::mutex m_mutex;
    LinkConfiguration m_configuration;
    std::string m_configFilePath;
};

/**
 * @brief Configuration validator
 */
class ConfigValidator {
public:
    struct ValidationResult {
        bool isValid = true;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    static ValidationResult validateQueueSettings(const QueueSettings& settings);
    static ValidationResult validateTransferSettings(const TransferSettings& settings);
    static ValidationResult validateLinkSettings(const LinkSettings& settings);
    static ValidationResult validateConfiguration(const LinkConfiguration& config);
};

} // namespace nocturne
