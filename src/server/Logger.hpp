#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>

namespace slugline {
namespace server {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Parse "debug", "info", "warn"/"warning" or "error" (any case)
 * @throws std::invalid_argument for anything else
 */
LogLevel parseLogLevel(const std::string& name);

/**
 * Logger singleton - centralized, thread-safe log output
 */
class Logger {
public:
    static Logger& instance();

    // Configuration
    void setLevel(LogLevel level) { m_level = level; }
    LogLevel level() const { return m_level; }
    void setOutputStream(std::ostream* os);

    /**
     * Append to a file instead of the output stream
     * @throws std::runtime_error if the file cannot be opened
     */
    void enableFileLogging(const std::string& filepath);
    void setLogRequests(bool enabled) { m_logRequests = enabled; }

    // Logging methods
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    // Request/Response logging with request ID correlation
    uint64_t logRequest(const std::string& method, const std::string& target, const std::string& remote = "");
    void logResponse(uint64_t requestId, int statusCode, size_t bodySize = 0);

    // Helpers
    static std::string levelToString(LogLevel level);

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    static std::string timestamp();

    std::atomic<LogLevel> m_level{LogLevel::INFO};
    std::ostream* m_output = &std::cout;
    std::ofstream m_fileStream;
    std::mutex m_mutex;
    std::atomic<bool> m_logRequests{true};

    // Request ID generation and timing
    std::atomic<uint64_t> m_requestIdCounter{0};
    std::unordered_map<uint64_t, std::chrono::steady_clock::time_point> m_requestStartTimes;
};

// Convenience macros
#define LOG_DEBUG(msg) slugline::server::Logger::instance().debug(msg)
#define LOG_INFO(msg) slugline::server::Logger::instance().info(msg)
#define LOG_WARN(msg) slugline::server::Logger::instance().warn(msg)
#define LOG_ERROR(msg) slugline::server::Logger::instance().error(msg)

} // namespace server
} // namespace slugline
