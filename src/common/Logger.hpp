#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <chrono>
#include <atomic>
#include <unordered_map>

namespace datachat {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Process-wide logger.
 *
 * Every line carries a timestamp, the level and the emitting component
 * ("cache", "executor", "http", ...). HTTP traffic is logged through
 * logRequest/logResponse, which correlate both halves by request id.
 */
class Logger {
public:
    static Logger& instance();

    // Configuration
    void setLevel(LogLevel level) { m_level = level; }
    LogLevel level() const { return m_level; }
    void setOutputStream(std::ostream* os);
    void enableFileLogging(const std::string& filepath);
    void setLogRequests(bool enabled) { m_logRequests = enabled; }

    // Logging methods
    void debug(const std::string& component, const std::string& message);
    void info(const std::string& component, const std::string& message);
    void warn(const std::string& component, const std::string& message);
    void error(const std::string& component, const std::string& message);

    // Request/response logging with request id correlation
    uint64_t logRequest(const std::string& method, const std::string& target, const std::string& body = "");
    void logResponse(uint64_t requestId, int statusCode, size_t bodySize);

    // Helpers
    static std::string levelToString(LogLevel level);
    // Accepts debug|info|warn|error, throws std::invalid_argument otherwise
    static LogLevel parseLevel(const std::string& name);

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& component, const std::string& message);
    std::string timestamp();
    std::string truncate(const std::string& str, size_t maxLen = 500);

    std::atomic<LogLevel> m_level{LogLevel::INFO};
    std::ostream* m_output = &std::cout;
    std::ofstream m_fileStream;
    std::mutex m_mutex;
    std::atomic<bool> m_logRequests{true};

    std::atomic<uint64_t> m_requestIdCounter{0};
    std::unordered_map<uint64_t, std::chrono::steady_clock::time_point> m_requestStartTimes;
};

// Convenience macros, component first
#define LOG_DEBUG(component, msg) datachat::Logger::instance().debug(component, msg)
#define LOG_INFO(component, msg) datachat::Logger::instance().info(component, msg)
#define LOG_WARN(component, msg) datachat::Logger::instance().warn(component, msg)
#define LOG_ERROR(component, msg) datachat::Logger::instance().error(component, msg)

} // namespace datachat
