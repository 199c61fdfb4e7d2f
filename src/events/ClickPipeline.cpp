#include "events/ClickPipeline.hpp"
#include "server/Logger.hpp"
#include "server/Metrics.hpp"
#include <stdexcept>

namespace slugline {
namespace events {

using server::Metrics;
namespace metric = server::metric;

ClickPipeline::ClickPipeline(ClickRecorder& recorder, size_t capacity)
    : m_recorder(recorder)
    , m_capacity(capacity)
    , m_state(std::make_shared<State>())
{
    if (m_capacity == 0) {
        throw std::invalid_argument("Click queue capacity must be positive");
    }
}

ClickPipeline::~ClickPipeline() {
    shutdown();
}

void ClickPipeline::start() {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (m_consumer.joinable() || m_state->closed) {
            return;
        }
    }
    m_consumer = std::thread(&ClickPipeline::run, m_state, std::ref(m_recorder));
    LOG_INFO("ClickPipeline: started (capacity " + std::to_string(m_capacity) + ")");
}

bool ClickPipeline::tryEnqueue(store::ClickEvent event) {
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (m_state->closed) {
            m_state->stats.rejected++;
        } else if (m_state->queue.size() >= m_capacity) {
            m_state->stats.dropped++;
        } else {
            m_state->queue.push_back(std::move(event));
            m_state->stats.enqueued++;
            m_state->available.notify_one();
            return true;
        }
    }

    Metrics::instance().increment(metric::kClicksDroppedTotal);
    return false;
}

void ClickPipeline::run(std::shared_ptr<State> state, ClickRecorder& recorder) {
    while (true) {
        store::ClickEvent event;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->available.wait(lock, [&state]() {
                return !state->queue.empty() || state->closed;
            });

            if (state->abandon || state->queue.empty()) {
                break;
            }
            event = std::move(state->queue.front());
            state->queue.pop_front();
        }

        bool ok = false;
        try {
            recorder.recordClick(event);
            ok = true;
        } catch (const std::exception& e) {
            LOG_ERROR("ClickPipeline: failed to record click for link " + event.linkId +
                      ": " + e.what());
        }

        Metrics::instance().increment(ok ? metric::kClicksRecordedTotal
                                         : metric::kClickRecordErrorsTotal);
        uint64_t newDrops = 0;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (ok) {
                state->stats.persisted++;
            } else {
                state->stats.failed++;
            }
            newDrops = state->stats.dropped - state->dropsReported;
            state->dropsReported = state->stats.dropped;
        }
        if (newDrops > 0) {
            LOG_WARN("ClickPipeline: queue full, dropped " + std::to_string(newDrops) +
                     " click(s)");
        }
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    state->consumerDone = true;
    state->drained.notify_all();
}

bool ClickPipeline::shutdown(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    if (m_shutdownDone) {
        return m_drainComplete;
    }
    m_shutdownDone = true;

    std::unique_lock<std::mutex> lock(m_state->mutex);
    m_state->closed = true;
    m_state->available.notify_all();

    bool drained = true;
    if (m_consumer.joinable()) {
        drained = m_state->drained.wait_for(lock, timeout,
                                            [this]() { return m_state->consumerDone; });
    } else {
        drained = m_state->queue.empty();
    }

    if (!drained) {
        m_state->abandon = true;
        m_state->stats.abandoned += m_state->queue.size();
        LOG_WARN("ClickPipeline: drain timed out, abandoning " +
                 std::to_string(m_state->queue.size()) + " queued click(s)");
        m_state->queue.clear();
        m_state->available.notify_all();
    }
    m_drainComplete = drained;
    Stats stats = m_state->stats;
    lock.unlock();

    if (m_consumer.joinable()) {
        if (drained) {
            m_consumer.join();
        } else {
            // Still inside recordClick; it exits on its own once that returns
            m_consumer.detach();
        }
    }

    LOG_INFO("ClickPipeline: stopped (enqueued " + std::to_string(stats.enqueued) +
             ", persisted " + std::to_string(stats.persisted) +
             ", failed " + std::to_string(stats.failed) +
             ", dropped " + std::to_string(stats.dropped) +
             ", rejected " + std::to_string(stats.rejected) +
             ", abandoned " + std::to_string(stats.abandoned) + ")");
    return drained;
}

ClickPipeline::Stats ClickPipeline::stats() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->stats;
}

size_t ClickPipeline::queued() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->queue.size();
}

bool ClickPipeline::isClosed() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->closed;
}

} // namespace events
} // namespace slugline
