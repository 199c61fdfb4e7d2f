#include "events/GaugeUpdater.hpp"
#include "server/Logger.hpp"
#include "server/Metrics.hpp"

namespace slugline {
namespace events {

GaugeUpdater::GaugeUpdater(store::LinkStore& links, store::UserStore& users,
                           std::chrono::seconds interval)
    : m_links(links)
    , m_users(users)
    , m_interval(interval)
    , m_timer(m_io)
{
}

GaugeUpdater::~GaugeUpdater() {
    stop();
}

bool GaugeUpdater::refresh() {
    try {
        auto& metrics = server::Metrics::instance();
        metrics.setGauge(server::metric::kLinksTotal, m_links.countAll());
        metrics.setGauge(server::metric::kUsersTotal, m_users.countAll());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("GaugeUpdater: refresh failed: " + std::string(e.what()));
        return false;
    }
}

void GaugeUpdater::schedule() {
    m_timer.expires_after(m_interval);
    m_timer.async_wait([this](const boost::system::error_code& ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        refresh();
        schedule();
    });
}

void GaugeUpdater::start() {
    if (m_thread.joinable()) {
        return;
    }

    net::post(m_io, [this]() {
        refresh();
        schedule();
    });
    m_thread = std::thread([this]() { m_io.run(); });

    LOG_INFO("GaugeUpdater: refreshing every " + std::to_string(m_interval.count()) + "s");
}

void GaugeUpdater::stop() {
    if (!m_thread.joinable()) {
        return;
    }
    m_io.stop();
    m_thread.join();
    LOG_INFO("GaugeUpdater: stopped");
}

} // namespace events
} // namespace slugline
