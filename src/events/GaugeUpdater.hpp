#pragma once

#include "store/LinkStore.hpp"
#include "store/UserStore.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <thread>

namespace slugline {
namespace events {

namespace net = boost::asio;

/**
 * @brief Periodically publishes the links_total and users_total gauges
 *
 * Runs its own io_context on a dedicated thread. A failed refresh is logged
 * and retried at the next tick.
 */
class GaugeUpdater {
public:
    GaugeUpdater(store::LinkStore& links, store::UserStore& users,
                 std::chrono::seconds interval = std::chrono::seconds(60));
    ~GaugeUpdater();

    GaugeUpdater(const GaugeUpdater&) = delete;
    GaugeUpdater& operator=(const GaugeUpdater&) = delete;

    /**
     * Refresh now, then every interval until stop()
     */
    void start();
    void stop();

    /**
     * @brief One synchronous refresh
     * @return false if a count query failed
     */
    bool refresh();

private:
    void schedule();

    store::LinkStore& m_links;
    store::UserStore& m_users;
    std::chrono::seconds m_interval;

    net::io_context m_io;
    net::steady_timer m_timer;
    std::thread m_thread;
};

} // namespace events
} // namespace slugline
