#include "server/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace slugline {
namespace server {

LogLevel parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    throw std::invalid_argument("unknown log level: " + name);
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (m_fileStream.is_open()) {
        m_fileStream.close();
    }
}

void Logger::setOutputStream(std::ostream* os) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_output = os;
}

void Logger::enableFileLogging(const std::string& filepath) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_fileStream.is_open()) {
        m_fileStream.close();
    }
    m_fileStream.open(filepath, std::ios::app);
    if (!m_fileStream.is_open()) {
        throw std::runtime_error("Cannot open log file: " + filepath);
    }
    m_output = &m_fileStream;
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "?????";
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < m_level) return;

    std::string line = "[" + timestamp() + "] [" + levelToString(level) + "] " + message;

    std::lock_guard<std::mutex> lock(m_mutex);
    *m_output << line << std::endl;
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

uint64_t Logger::logRequest(const std::string& method, const std::string& target, const std::string& remote) {
    uint64_t requestId = ++m_requestIdCounter;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_requestStartTimes[requestId] = std::chrono::steady_clock::now();
    }

    if (!m_logRequests) return requestId;

    std::ostringstream oss;
    oss << "[REQ-" << requestId << "] " << method << " " << target;
    if (!remote.empty()) {
        oss << " from " << remote;
    }
    log(LogLevel::DEBUG, oss.str());

    return requestId;
}

void Logger::logResponse(uint64_t requestId, int statusCode, size_t bodySize) {
    double durationMs = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_requestStartTimes.find(requestId);
        if (it != m_requestStartTimes.end()) {
            auto now = std::chrono::steady_clock::now();
            durationMs = std::chrono::duration<double, std::milli>(now - it->second).count();
            m_requestStartTimes.erase(it);
        }
    }

    if (!m_logRequests) return;

    std::ostringstream oss;
    oss << "[REQ-" << requestId << "] RESPONSE " << statusCode;
    if (bodySize > 0) {
        oss << " | Size: " << bodySize << " B";
    }
    oss << " | Time: " << std::fixed << std::setprecision(1) << durationMs << "ms";
    log(statusCode >= 500 ? LogLevel::ERROR : LogLevel::INFO, oss.str());
}

} // namespace server
} // namespace slugline
