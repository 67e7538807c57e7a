#pragma once

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <atomic>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <unordered_map>
#include <utility>
#include <ctime>
#include <cstdint>

namespace nocturne {

/**
 * @brief Thread-safe logging system for the link layer
 *
 * Static facade shared by the scheduler thread, transfer workers and
 * callers. Messages use "{}" placeholders which are substituted in order;
 * surplus arguments are appended, missing ones leave the placeholder as is.
 */
class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warning = 3,
        Error = 4,
        Critical = 5,
        Off = 6
    };

    Logger();
    ~Logger();

    // Initialization
    static bool initialize(const std::string& logFile = "nocturne_link.log",
                          Level minLevel = Level::Info,
                          bool enableConsole = true,
                          bool enableFile = false);
    static void shutdown();
    static bool isInitialized();

    // Configuration
    static void setLevel(Level level);
    static Level getLevel();
    static void setConsoleOutput(bool enable);
    static void setFileOutput(bool enable);
    static void setMaxFileSize(size_t maxSize);
    static void setMaxBackupFiles(size_t maxBackups);

    static Level parseLevel(const std::string& name, Level fallback = Level::Info);
    static std::string levelToString(Level level);

    // Logging methods
    template<typename... Args>
    static void trace(const std::string& format, Args&&... args) {
        log(Level::Trace, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(const std::string& format, Args&&... args) {
        log(Level::Debug, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(const std::string& format, Args&&... args) {
        log(Level::Info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warning(const std::string& format, Args&&... args) {
        log(Level::Warning, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(const std::string& format, Args&&... args) {
        log(Level::Error, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(const std::string& format, Args&&... args) {
        log(Level::Critical, format, std::forward<Args>(args)...);
    }

    // Performance logging
    static void logLatency(const std::string& operation, double latencyMs);
    static void logThroughput(const std::string& operation, double bytesPerSecond);

    struct PerformanceMetrics {
        double avgLatency = 0.0;
        double maxLatency = 0.0;
        double minLatency = 0.0;
        uint64_t totalOperations = 0;
        double errorRate = 0.0;
    };

    static void updatePerformanceMetrics(const std::string& operation, double latencyMs, bool success);
    static PerformanceMetrics getPerformanceMetrics(const std::string& operation);
    static void resetPerformanceMetrics();

    static void flush();

    template<typename... Args>
    static std::string formatMessage(const std::string& format, Args&&... args) {
        std::ostringstream out;
        size_t position = 0;
        (appendArgument(out, format, position, std::forward<Args>(args)), ...);
        if (position < format.size()) {
            out << format.substr(position);
        }
        return out.str();
    }

private:
    template<typename... Args>
    static void log(Level level, const std::string& format, Args&&... args) {
        if (!s_initialized.load() || level < s_currentLevel.load()) {
            return;
        }

        try {
            std::string body = formatMessage(format, std::forward<Args>(args)...);

            auto now = std::chrono::system_clock::now();
            auto time_t = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;

            std::tm localTime{};
            localtime_r(&time_t, &localTime);

            std::ostringstream ss;
            ss << "[" << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
            ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
            ss << "[" << levelToString(level) << "] " << body;

            write(level, ss.str());
        } catch (const std::exception& e) {
            std::cerr << "Logger error: " << e.what() << std::endl;
        }
    }

    template<typename T>
    static void appendArgument(std::ostringstream& out, const std::string& format,
                               size_t& position, T&& value) {
        size_t placeholder = format.find("{}", position);
        if (placeholder == std::string::npos) {
            out << format.substr(position) << ' ' << value;
            position = format.size();
            return;
        }
        out << format.substr(position, placeholder - position) << value;
        position = placeholder + 2;
    }

    static void write(Level level, const std::string& message);
    static void writeToConsole(Level level, const std::string& message);
    void writeToFile(const std::string& message);
    void rotateLogFile();

    // Instance data, guarded by s_lifecycleMutex
    std::ofstream m_logFile;
    std::string m_logFilePath;
    size_t m_currentFileSize = 0;
    size_t m_maxFileSize = 10 * 1024 * 1024;
    size_t m_maxBackupFiles = 3;

    struct OperationMetrics {
        double totalLatency = 0.0;
        double maxLatency = 0.0;
        double minLatency = 0.0;
        uint64_t operationCount = 0;
        uint64_t errorCount = 0;
    };

    std::unordered_map<std::string, OperationMetrics> m_metrics;
    std::mutex m_metricsMutex;

    static std::unique_ptr<Logger> s_instance;
    static std::mutex s_lifecycleMutex;
    static std::atomic<Level> s_currentLevel;
    static std::atomic<bool> s_consoleEnabled;
    static std::atomic<bool> s_fileEnabled;
    static std::atomic<bool> s_initialized;
};

} // namespace nocturne
