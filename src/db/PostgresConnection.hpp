#pragma once

#include "db/Connection.hpp"
#include <memory>
#include <string>
#include <pqxx/pqxx>

namespace slugline {
namespace db {

/**
 * PostgreSQL connection backed by libpqxx.
 *
 * Statements written with '?' placeholders are rebound to $1..$n. Outside an
 * explicit transaction each statement runs in its own pqxx::nontransaction.
 */
class PostgresConnection : public Connection {
public:
    /**
     * @param connectionString Format: "host=localhost port=5432 dbname=mydb user=user password=pass"
     */
    explicit PostgresConnection(const std::string& connectionString);
    ~PostgresConnection() override;

    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    Dialect dialect() const override { return Dialect::Postgres; }
    bool isOpen() const override;

    ResultSet query(const std::string& sql, const Params& params = {}) override;
    size_t execute(const std::string& sql, const Params& params = {}) override;

    void begin() override;
    void commit() override;
    void rollback() override;
    bool inTransaction() const override { return m_work != nullptr; }

private:
    /**
     * Run a statement on the active transaction, or an autocommit one
     */
    pqxx::result run(const std::string& sql, const Params& params);

    /**
     * Convertit un résultat pqxx en ResultSet
     */
    static ResultSet toResultSet(const pqxx::result& result);

    std::unique_ptr<pqxx::connection> m_connection;
    std::unique_ptr<pqxx::work> m_work;
    bool m_broken = false;
};

} // namespace db
} // namespace slugline
