#include "db/ConnectionPool.hpp"
#include "db/ConnectionFactory.hpp"
#include "server/Logger.hpp"

namespace slugline {
namespace db {

ConnectionPool::Handle::~Handle() {
    if (m_pool && m_conn) {
        m_pool->release(std::move(m_conn));
    }
}

ConnectionPool::ConnectionPool(Dialect dialect, const std::string& dsn, size_t maxSize,
                               std::chrono::milliseconds acquireTimeout)
    : ConnectionPool(dialect, [dialect, dsn]() { return openConnection(dialect, dsn); },
                     maxSize, acquireTimeout)
{
}

ConnectionPool::ConnectionPool(Dialect dialect, Factory factory, size_t maxSize,
                               std::chrono::milliseconds acquireTimeout)
    : m_dialect(dialect)
    , m_factory(std::move(factory))
    , m_maxSize(maxSize)
    , m_acquireTimeout(acquireTimeout)
{
    if (m_maxSize == 0) {
        throw std::invalid_argument("Connection pool size must be positive");
    }
}

ConnectionPool::Handle ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(m_mutex);

    bool ready = m_available.wait_for(lock, m_acquireTimeout, [this]() {
        return !m_idle.empty() || m_open < m_maxSize;
    });
    if (!ready) {
        throw DatabaseError(ErrorKind::Transient,
            "Database pool timeout: no connection available after " +
            std::to_string(m_acquireTimeout.count()) + "ms");
    }

    if (!m_idle.empty()) {
        std::unique_ptr<Connection> conn = std::move(m_idle.back());
        m_idle.pop_back();
        return Handle(this, std::move(conn));
    }

    // Reserve the slot, then connect without holding the lock
    ++m_open;
    lock.unlock();

    try {
        std::unique_ptr<Connection> conn = m_factory();
        LOG_DEBUG("ConnectionPool: opened " + dialectName(m_dialect) + " connection");
        return Handle(this, std::move(conn));
    } catch (const std::exception&) {
        lock.lock();
        --m_open;
        lock.unlock();
        m_available.notify_one();
        throw;
    }
}

void ConnectionPool::release(std::unique_ptr<Connection> conn) {
    if (conn->inTransaction()) {
        try {
            conn->rollback();
        } catch (const std::exception& e) {
            LOG_WARN("ConnectionPool: rollback on release failed: " + std::string(e.what()));
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (conn->isOpen() && !conn->inTransaction()) {
            m_idle.push_back(std::move(conn));
        } else {
            LOG_WARN("ConnectionPool: discarding broken connection");
            --m_open;
        }
    }
    m_available.notify_one();
}

size_t ConnectionPool::openCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_open;
}

size_t ConnectionPool::idleCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_idle.size();
}

} // namespace db
} // namespace slugline
