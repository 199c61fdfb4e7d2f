#pragma once

#include "events/ClickRecorder.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

namespace slugline {
namespace events {

/**
 * @brief Bounded queue plus one consumer thread that persists click events
 *
 * Producers call tryEnqueue() from request threads; it never waits on I/O
 * and never logs. Drops are counted and reported in batches by the consumer.
 * Events are handed to the recorder one at a time in enqueue order. A
 * recorder failure is logged and counted, and the event is discarded.
 *
 * The recorder must outlive the pipeline. If a drain times out while a
 * record call is in flight, the consumer thread is detached and finishes
 * that call on its own; it only touches the recorder and state it shares.
 *
 * Usage:
 *   ClickPipeline pipeline(clickStore, 256);
 *   pipeline.start();
 *   pipeline.tryEnqueue(event);
 *   pipeline.shutdown(std::chrono::seconds(30));
 */
class ClickPipeline {
public:
    static constexpr size_t kDefaultCapacity = 256;

    struct Stats {
        uint64_t enqueued = 0;   // accepted into the queue
        uint64_t persisted = 0;  // recorded successfully
        uint64_t failed = 0;     // recorder threw
        uint64_t dropped = 0;    // queue full
        uint64_t rejected = 0;   // offered after shutdown began
        uint64_t abandoned = 0;  // still queued when the drain timed out
    };

    explicit ClickPipeline(ClickRecorder& recorder, size_t capacity = kDefaultCapacity);

    /**
     * Shuts down with the default drain timeout if still running
     */
    ~ClickPipeline();

    ClickPipeline(const ClickPipeline&) = delete;
    ClickPipeline& operator=(const ClickPipeline&) = delete;

    /**
     * @brief Start the consumer thread. Events enqueued earlier are kept.
     */
    void start();

    /**
     * @brief Offer an event without blocking
     * @return false if the event was dropped (queue full) or rejected (closed)
     */
    bool tryEnqueue(store::ClickEvent event);

    /**
     * @brief Close the producer side and drain accepted events
     *
     * Waits up to timeout for the consumer to persist every accepted event.
     * On timeout the events still queued are discarded and counted as
     * abandoned, and the consumer is detached instead of joined, so the
     * call returns without waiting for a stuck recorder. Calling it again
     * is a no-op.
     *
     * @return true if every accepted event reached the recorder
     */
    bool shutdown(std::chrono::milliseconds timeout = std::chrono::seconds(30));

    Stats stats() const;
    size_t capacity() const { return m_capacity; }
    size_t queued() const;
    bool isClosed() const;

private:
    // Shared with the consumer so a detached consumer never touches *this
    struct State {
        std::mutex mutex;
        std::condition_variable available;   // consumer waits for events
        std::condition_variable drained;     // shutdown waits for the consumer
        std::deque<store::ClickEvent> queue;
        bool closed = false;
        bool abandon = false;
        bool consumerDone = false;
        uint64_t dropsReported = 0;
        Stats stats;
    };

    static void run(std::shared_ptr<State> state, ClickRecorder& recorder);

    ClickRecorder& m_recorder;
    const size_t m_capacity;
    std::shared_ptr<State> m_state;

    std::mutex m_lifecycleMutex;
    bool m_shutdownDone = false;
    bool m_drainComplete = true;
    std::thread m_consumer;
};

} // namespace events
} // namespace slugline
