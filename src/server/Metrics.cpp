#include "server/Metrics.hpp"
#include <iomanip>
#include <sstream>

namespace slugline {
namespace server {

Metrics& Metrics::instance() {
    static Metrics instance;
    return instance;
}

void Metrics::increment(const std::string& name, int64_t delta) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_values[name] += delta;
}

void Metrics::setGauge(const std::string& name, int64_t value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_values[name] = value;
}

int64_t Metrics::value(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_values.find(name);
    return it != m_values.end() ? it->second : 0;
}

void Metrics::recordDuration(const std::string& name, double durationMs) {
    std::lock_guard<std::mutex> lock(m_mutex);
    TimerStats& stats = m_timers[name];
    stats.count++;
    stats.totalMs += durationMs;
    if (durationMs < stats.minMs) stats.minMs = durationMs;
    if (durationMs > stats.maxMs) stats.maxMs = durationMs;
}

Metrics::TimerStats Metrics::timerStats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_timers.find(name);
    if (it != m_timers.end()) {
        return it->second;
    }
    return TimerStats{};
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_values.clear();
    m_timers.clear();
}

std::string Metrics::formatText() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::map<std::string, std::string> lines;
    for (const auto& [name, value] : m_values) {
        lines[name] = std::to_string(value);
    }
    for (const auto& [name, stats] : m_timers) {
        std::ostringstream avg;
        std::ostringstream max;
        avg << std::fixed << std::setprecision(3) << stats.avgMs();
        max << std::fixed << std::setprecision(3) << stats.maxMs;
        lines[name + "_count"] = std::to_string(stats.count);
        lines[name + "_avg"] = avg.str();
        lines[name + "_max"] = max.str();
    }

    std::ostringstream oss;
    for (const auto& [name, value] : lines) {
        oss << name << ' ' << value << '\n';
    }
    return oss.str();
}

} // namespace server
} // namespace slugline
