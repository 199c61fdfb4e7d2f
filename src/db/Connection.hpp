#pragma once

#include "db/Dialect.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace slugline {
namespace db {

/**
 * Bound statement parameter. Statements use '?' placeholders in every
 * dialect; backends rebind as needed.
 */
using Param = std::variant<std::nullptr_t, int64_t, std::string>;
using Params = std::vector<Param>;

/**
 * Parameter from an optional string (nullopt binds NULL)
 */
Param optionalParam(const std::optional<std::string>& value);

/**
 * Driver-independent classification of a database failure
 */
enum class ErrorKind {
    UniqueViolation,
    ForeignKeyViolation,
    Transient,   // connection loss, timeout, lock contention
    Other
};

/**
 * Error raised by every Connection implementation
 */
class DatabaseError : public std::runtime_error {
public:
    DatabaseError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

/**
 * One result row. Values are kept in their text form, NULL as nullopt.
 */
class Row {
public:
    Row() = default;
    explicit Row(std::vector<std::optional<std::string>> values)
        : m_values(std::move(values)) {}

    size_t size() const { return m_values.size(); }
    bool isNull(size_t col) const;
    std::string getText(size_t col) const;
    int64_t getInt64(size_t col) const;
    bool getBool(size_t col) const;
    std::optional<std::string> getOptionalText(size_t col) const;

private:
    const std::optional<std::string>& at(size_t col) const;

    std::vector<std::optional<std::string>> m_values;
};

/**
 * Fully materialized result of a query
 */
struct ResultSet {
    std::vector<std::string> columns;
    std::vector<Row> rows;

    bool empty() const { return rows.empty(); }
    size_t size() const { return rows.size(); }
    const Row& front() const { return rows.front(); }
};

/**
 * Uniform statement interface over the supported engines.
 *
 * A Connection is not thread-safe; the pool hands each one to a single
 * thread at a time.
 */
class Connection {
public:
    virtual ~Connection() = default;

    virtual Dialect dialect() const = 0;

    /**
     * False once the underlying session is known to be broken
     */
    virtual bool isOpen() const = 0;

    /**
     * Run a statement that returns rows
     * @throws DatabaseError
     */
    virtual ResultSet query(const std::string& sql, const Params& params = {}) = 0;

    /**
     * Run a statement that returns no rows
     * @return Number of affected rows
     * @throws DatabaseError
     */
    virtual size_t execute(const std::string& sql, const Params& params = {}) = 0;

    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
    virtual bool inTransaction() const = 0;
};

/**
 * RAII transaction scope. Rolls back on destruction unless commit() ran.
 */
class Transaction {
public:
    explicit Transaction(Connection& conn);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Connection& m_conn;
    bool m_done = false;
};

} // namespace db
} // namespace slugline
