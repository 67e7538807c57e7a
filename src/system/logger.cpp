#include "system/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace nocturne {

std::unique_ptr<Logger> Logger::s_instance;
std::mutex Logger::s_lifecycleMutex;
std::atomic<Logger::Level> Logger::s_currentLevel{Logger::Level::Info};
std::atomic<bool> Logger::s_consoleEnabled{true};
std::atomic<bool> Logger::s_fileEnabled{false};
std::atomic<bool> Logger::s_initialized{false};

Logger::Logger() = default;

Logger::~Logger() {
    if (m_logFile.is_open()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

bool Logger::initialize(const std::string& logFile, Level minLevel, bool enableConsole, bool enableFile) {
    std::lock_guard<std::mutex> lock(s_lifecycleMutex);

    if (!s_instance) {
        s_instance = std::make_unique<Logger>();
    }

    s_currentLevel.store(minLevel);
    s_consoleEnabled.store(enableConsole);
    s_fileEnabled.store(enableFile);

    if (enableFile && !logFile.empty()) {
        if (s_instance->m_logFile.is_open()) {
            s_instance->m_logFile.close();
        }
        s_instance->m_logFilePath = logFile;
        s_instance->m_logFile.open(logFile, std::ios::out | std::ios::app);
        if (!s_instance->m_logFile.is_open()) {
            std::cerr << "Logger: cannot open log file " << logFile << std::endl;
            s_fileEnabled.store(false);
        } else {
            s_instance->m_logFile.seekp(0, std::ios::end);
            s_instance->m_currentFileSize = static_cast<size_t>(s_instance->m_logFile.tellp());
        }
    }

    s_initialized.store(true);
    return true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(s_lifecycleMutex);
    s_initialized.store(false);
    s_instance.reset();
}

bool Logger::isInitialized() {
    return s_initialized.load();
}

void Logger::setLevel(Level level) {
    s_currentLevel.store(level);
}

Logger::Level Logger::getLevel() {
    return s_currentLevel.load();
}

void Logger::setConsoleOutput(bool enable) {
    s_consoleEnabled.store(enable);
}

void Logger::setFileOutput(bool enable) {
    s_fileEnabled.store(enable);
}

void Logger::setMaxFileSize(size_t maxSize) {
    std::lock_guard<std::mutex> lock(s_lifecycleMutex);
    if (s_instance) {
        s_instance->m_maxFileSize = maxSize;
    }
}

void Logger::setMaxBackupFiles(size_t maxBackups) {
    std::lock_guard<std::mutex> lock(s_lifecycleMutex);
    if (s_instance) {
        s_instance->m_maxBackupFiles = maxBackups;
    }
}

Logger::Level Logger::parseLevel(const std::string& name, Level fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return Level::Trace;
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warning" || lower == "warn") return Level::Warning;
    if (lower == "error") return Level::Error;
    if (lower == "critical") return Level::Critical;
    if (lower == "off") return Level::Off;
    return fallback;
}

std::string Logger::levelToString(Level level) {
    switch (level) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warning: return "WARN";
        case Level::Error: return "ERROR";
        case Level::Critical: return "CRITICAL";
        case Level::Off: return "OFF";
    }
    return "UNKNOWN";
}

void Logger::logLatency(const std::string& operation, double latencyMs) {
    debug("Latency [{}]: {} ms", operation, latencyMs);
    updatePerformanceMetrics(operation, latencyMs, true);
}

void Logger::logThroughput(const std::string& operation, double bytesPerSecond) {
    info("Throughput [{}]: {} B/s", operation, bytesPerSecond);
}

void Logger::updatePerformanceMetrics(const std::string& operation, double latencyMs, bool success) {
    std::lock_guard<std::mutex> lock(s_lifecycleMutex);
    if (!s_instance) {
        return;
    }

    std::lock_guard<std::mutex> metricsLock(s_instance->m_metricsMutex);
    auto& metrics = s_instance->m_metrics[operation];
    if (metrics.operationCount == 0) {
        metrics.minLatency = latencyMs;
    }
    metrics.totalLatency += latencyMs;
    metrics.maxLatency = std::max(metrics.maxLatency, latencyMs);
    metrics.minLatency = std::min(metrics.minLatency, latencyMs);
    metrics.operationCount++;
    if (!success) {
        metrics.errorCount++;
    }
}

Logger::PerformanceMetrics Logger::getPerformanceMetrics(const std::string& operation) {
    PerformanceMetrics result;
    std::lock_guard<std::mutex> lock(s_lifecycleMutex);
    if (!s_instance) {
        return result;
    }

    std::lock_guard<std::mutex> metricsLock(s_instance->m_metricsMutex);
    auto it = s_instance->m_metrics.find(operation);
    if (it == s_instance->m_metrics.end() || it->second.operationCount == 0) {
        return result;
    }

    const auto& metrics = it->second;
    result.totalOperations = metrics.operationCount;
    result.avgLatency = metrics.totalLatency / static_cast<double>(metrics.operationCount);
    result.maxLatency = metrics.maxLatency;
    result.minLatency = metrics.minLatency;
    result.errorRate = static_cast<double>(metrics.errorCount) / static_cast<double>(metrics.operationCount);
    return result;
}

void Logger::resetPerformanceMetrics() {
    std::lock_guard<std::mutex> lock(s_lifecycleMutex);
    if (s_instance) {
        std::lock_guard<std::mutex> metricsLock(s_instance->m_metricsMutex);
        s_instance->m_metrics.clear();
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(s_lifecycleMutex);
    if (s_instance && s_instance->m_logFile.is_open()) {
        s_instance->m_logFile.flush();
    }
    std::cerr.flush();
}

void Logger::write(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(s_lifecycleMutex);
    if (!s_instance) {
        return;
    }

    if (s_consoleEnabled.load()) {
        writeToConsole(level, message);
    }

    if (s_fileEnabled.load() && s_instance->m_logFile.is_open()) {
        s_instance->writeToFile(message);
    }
}

void Logger::writeToConsole(Level level, const std::string& message) {
    // stdout stays free for the simulator's report
    (void)level;
    std::cerr << message << '\n';
}

void Logger::writeToFile(const std::string& message) {
    m_logFile << message << '\n';
    m_currentFileSize += message.size() + 1;

    if (m_maxFileSize > 0 && m_currentFileSize >= m_maxFileSize) {
        rotateLogFile();
    }
}

void Logger::rotateLogFile() {
    m_logFile.close();

    for (size_t i = m_maxBackupFiles; i > 0; --i) {
        std::string from = i == 1 ? m_logFilePath : m_logFilePath + "." + std::to_string(i - 1);
        std::string to = m_logFilePath + "." + std::to_string(i);
        std::rename(from.c_str(), to.c_str());
    }
    if (m_maxBackupFiles == 0) {
        std::remove(m_logFilePath.c_str());
    }

    m_logFile.open(m_logFilePath, std::ios::out | std::ios::trunc);
    m_currentFileSize = 0;
}

} // namespace nocturne
