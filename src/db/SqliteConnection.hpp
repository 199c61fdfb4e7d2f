#pragma once

#include "db/Connection.hpp"
#include <chrono>
#include <string>

struct sqlite3;

namespace slugline {
namespace db {

/**
 * SQLite connection.
 *
 * Opening a connection enables foreign-key enforcement (off by default in
 * SQLite, which would turn every ON DELETE CASCADE into a silent no-op),
 * switches file databases to WAL journaling and installs a busy timeout.
 */
class SqliteConnection : public Connection {
public:
    /**
     * @param path Database file path or SQLite URI filename
     */
    explicit SqliteConnection(const std::string& path,
                              std::chrono::milliseconds busyTimeout = std::chrono::milliseconds(5000));
    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    Dialect dialect() const override { return Dialect::SQLite; }
    bool isOpen() const override { return m_db != nullptr; }

    ResultSet query(const std::string& sql, const Params& params = {}) override;
    size_t execute(const std::string& sql, const Params& params = {}) override;

    void begin() override;
    void commit() override;
    void rollback() override;
    bool inTransaction() const override { return m_inTransaction; }

    const std::string& getPath() const { return m_path; }

private:
    void exec(const std::string& sql);

    std::string m_path;
    sqlite3* m_db = nullptr;
    bool m_inTransaction = false;
};

} // namespace db
} // namespace slugline
