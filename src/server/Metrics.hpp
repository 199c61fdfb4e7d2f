#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <map>
#include <mutex>
#include <string>

namespace slugline {
namespace server {

// Metric names
namespace metric {
constexpr const char* kRedirectsTotal = "redirects_total";
constexpr const char* kRedirectsNotFoundTotal = "redirects_not_found_total";
constexpr const char* kClicksRecordedTotal = "clicks_recorded_total";
constexpr const char* kClickRecordErrorsTotal = "clicks_record_errors_total";
constexpr const char* kClicksDroppedTotal = "clicks_dropped_total";
constexpr const char* kLinksTotal = "links_total";
constexpr const char* kUsersTotal = "users_total";
constexpr const char* kRedirectDurationMs = "redirect_duration_ms";
} // namespace metric

/**
 * Metrics - process-wide counters, gauges and timing stats
 */
class Metrics {
public:
    struct TimerStats {
        size_t count = 0;
        double totalMs = 0.0;
        double minMs = std::numeric_limits<double>::max();
        double maxMs = 0.0;

        double avgMs() const { return count > 0 ? totalMs / count : 0.0; }
    };

    static Metrics& instance();

    void increment(const std::string& name, int64_t delta = 1);
    void setGauge(const std::string& name, int64_t value);

    /**
     * Current value of a counter or gauge, 0 if never touched
     */
    int64_t value(const std::string& name) const;

    void recordDuration(const std::string& name, double durationMs);
    TimerStats timerStats(const std::string& name) const;

    void reset();

    /**
     * One "name value" line per metric, sorted by name. Timers expand to
     * name_count, name_avg and name_max.
     */
    std::string formatText() const;

private:
    Metrics() = default;
    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

    mutable std::mutex m_mutex;
    std::map<std::string, int64_t> m_values;
    std::map<std::string, TimerStats> m_timers;
};

/**
 * RAII Scoped timer - records its lifetime into Metrics when destroyed
 */
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name)
        : m_name(name)
        , m_start(std::chrono::steady_clock::now())
    {}

    ~ScopedTimer() {
        stop();
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    double stop() {
        if (!m_stopped) {
            m_stopped = true;
            m_duration = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - m_start).count();
            Metrics::instance().recordDuration(m_name, m_duration);
        }
        return m_duration;
    }

    double duration() const { return m_duration; }

private:
    std::string m_name;
    std::chrono::steady_clock::time_point m_start;
    bool m_stopped = false;
    double m_duration = 0.0;
};

} // namespace server
} // namespace slugline
