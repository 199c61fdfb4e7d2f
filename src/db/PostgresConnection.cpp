#include "db/PostgresConnection.hpp"
#include "server/Logger.hpp"
#include <type_traits>

namespace slugline {
namespace db {

namespace {

/**
 * Map the in-flight pqxx exception to a DatabaseError.
 * Must be called from inside a catch block.
 */
[[noreturn]] void rethrowAsDatabaseError(bool& broken) {
    try {
        throw;
    }
    catch (const pqxx::unique_violation& e) {
        throw DatabaseError(ErrorKind::UniqueViolation, std::string("SQL error: ") + e.what());
    }
    catch (const pqxx::foreign_key_violation& e) {
        throw DatabaseError(ErrorKind::ForeignKeyViolation, std::string("SQL error: ") + e.what());
    }
    catch (const pqxx::transaction_rollback& e) {
        // serialization_failure, deadlock_detected...
        throw DatabaseError(ErrorKind::Transient, std::string("Transaction rolled back: ") + e.what());
    }
    catch (const pqxx::broken_connection& e) {
        broken = true;
        throw DatabaseError(ErrorKind::Transient, std::string("Connection lost: ") + e.what());
    }
    catch (const pqxx::in_doubt_error& e) {
        broken = true;
        throw DatabaseError(ErrorKind::Transient, std::string("Commit outcome unknown: ") + e.what());
    }
    catch (const pqxx::sql_error& e) {
        throw DatabaseError(ErrorKind::Other, std::string("SQL error: ") + e.what());
    }
    catch (const DatabaseError&) {
        throw;
    }
    catch (const std::exception& e) {
        throw DatabaseError(ErrorKind::Other, e.what());
    }
}

pqxx::params toPqxxParams(const Params& params) {
    pqxx::params out;
    for (const auto& param : params) {
        std::visit([&](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                out.append(std::optional<std::string>{});
            } else {
                out.append(value);
            }
        }, param);
    }
    return out;
}

} // anonymous namespace

PostgresConnection::PostgresConnection(const std::string& connectionString) {
    try {
        m_connection = std::make_unique<pqxx::connection>(connectionString);
    } catch (...) {
        rethrowAsDatabaseError(m_broken);
    }

    if (!m_connection->is_open()) {
        throw DatabaseError(ErrorKind::Transient, "Failed to open PostgreSQL connection");
    }

    LOG_DEBUG("PostgreSQL connection established");
}

PostgresConnection::~PostgresConnection() {
    // Any open transaction aborts in pqxx::work's destructor
    m_work.reset();
}

bool PostgresConnection::isOpen() const {
    return !m_broken && m_connection && m_connection->is_open();
}

pqxx::result PostgresConnection::run(const std::string& sql, const Params& params) {
    std::string rebound = rebindPlaceholders(sql);
    try {
        if (m_work) {
            return m_work->exec_params(rebound, toPqxxParams(params));
        }
        pqxx::nontransaction txn(*m_connection);
        pqxx::result result = txn.exec_params(rebound, toPqxxParams(params));
        txn.commit();
        return result;
    } catch (...) {
        rethrowAsDatabaseError(m_broken);
    }
}

ResultSet PostgresConnection::query(const std::string& sql, const Params& params) {
    return toResultSet(run(sql, params));
}

size_t PostgresConnection::execute(const std::string& sql, const Params& params) {
    return static_cast<size_t>(run(sql, params).affected_rows());
}

void PostgresConnection::begin() {
    if (m_work) {
        throw DatabaseError(ErrorKind::Other, "Transaction already active");
    }
    try {
        m_work = std::make_unique<pqxx::work>(*m_connection);
    } catch (...) {
        rethrowAsDatabaseError(m_broken);
    }
}

void PostgresConnection::commit() {
    if (!m_work) {
        throw DatabaseError(ErrorKind::Other, "No active transaction");
    }
    // A pqxx::work is unusable after commit, whether or not it succeeded
    std::unique_ptr<pqxx::work> work = std::move(m_work);
    try {
        work->commit();
    } catch (...) {
        rethrowAsDatabaseError(m_broken);
    }
}

void PostgresConnection::rollback() {
    if (!m_work) return;
    std::unique_ptr<pqxx::work> work = std::move(m_work);
    try {
        work->abort();
    } catch (...) {
        rethrowAsDatabaseError(m_broken);
    }
}

ResultSet PostgresConnection::toResultSet(const pqxx::result& result) {
    ResultSet out;

    auto numCols = result.columns();
    for (pqxx::row::size_type i = 0; i < numCols; ++i) {
        out.columns.push_back(result.column_name(i));
    }

    out.rows.reserve(static_cast<size_t>(result.size()));
    for (const auto& row : result) {
        std::vector<std::optional<std::string>> values;
        values.reserve(static_cast<size_t>(row.size()));

        for (pqxx::row::size_type i = 0; i < row.size(); ++i) {
            if (row[i].is_null()) {
                values.push_back(std::nullopt);
            } else {
                values.push_back(std::string(row[i].c_str()));
            }
        }

        out.rows.emplace_back(std::move(values));
    }

    return out;
}

} // namespace db
} // namespace slugline
