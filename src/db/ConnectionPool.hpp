#pragma once

#include "db/Connection.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace slugline {
namespace db {

/**
 * @brief Bounded pool of database connections
 *
 * Connections are opened lazily up to maxSize. When every connection is in
 * use, acquire() waits up to the acquire timeout and then throws a Transient
 * DatabaseError. Connections that come back broken are discarded.
 */
class ConnectionPool {
public:
    using Factory = std::function<std::unique_ptr<Connection>()>;

    /**
     * @brief RAII lease of one pooled connection
     */
    class Handle {
    public:
        Handle(ConnectionPool* pool, std::unique_ptr<Connection> conn)
            : m_pool(pool), m_conn(std::move(conn)) {}
        ~Handle();

        Handle(Handle&& other) noexcept = default;
        Handle& operator=(Handle&& other) = delete;
        Handle(const Handle&) = delete;
        Handle& operator=(const Handle&) = delete;

        Connection& operator*() const { return *m_conn; }
        Connection* operator->() const { return m_conn.get(); }

    private:
        ConnectionPool* m_pool;
        std::unique_ptr<Connection> m_conn;
    };

    ConnectionPool(Dialect dialect, const std::string& dsn, size_t maxSize = 4,
                   std::chrono::milliseconds acquireTimeout = std::chrono::milliseconds(5000));

    ConnectionPool(Dialect dialect, Factory factory, size_t maxSize = 4,
                   std::chrono::milliseconds acquireTimeout = std::chrono::milliseconds(5000));

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    Dialect dialect() const { return m_dialect; }

    /**
     * @brief Lease a connection
     * @throws DatabaseError (Transient) when the pool stays exhausted past the timeout
     */
    Handle acquire();

    size_t maxSize() const { return m_maxSize; }

    /**
     * @brief Number of connections currently open (idle or leased)
     */
    size_t openCount() const;

    size_t idleCount() const;

private:
    void release(std::unique_ptr<Connection> conn);

    Dialect m_dialect;
    Factory m_factory;
    size_t m_maxSize;
    std::chrono::milliseconds m_acquireTimeout;

    mutable std::mutex m_mutex;
    std::condition_variable m_available;
    std::vector<std::unique_ptr<Connection>> m_idle;
    size_t m_open = 0;
};

} // namespace db
} // namespace slugline
