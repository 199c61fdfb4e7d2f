#pragma once

#include <string>
#include <vector>

namespace slugline {
namespace db {

/**
 * SQL engine a deployment targets.
 *
 * This is the only decision point for dialect-specific SQL. It is parsed once
 * from configuration and handed explicitly to the connection factory, the
 * pool and the migrator.
 */
enum class Dialect {
    SQLite,
    Postgres,
    MySQL
};

/**
 * Parse a driver name ("sqlite3", "postgres", "mysql")
 * @throws std::invalid_argument for any other name
 */
Dialect parseDialect(const std::string& name);

/**
 * Driver name as accepted by parseDialect()
 */
std::string dialectName(Dialect dialect);

/**
 * Rewrite '?' placeholders to PostgreSQL's $1..$n form.
 * Question marks inside single-quoted literals or double-quoted identifiers
 * are left untouched.
 */
std::string rebindPlaceholders(const std::string& sql);

/**
 * Statement that opens a read-write transaction.
 * SQLite takes the write lock up front so concurrent writers wait on the busy
 * timeout instead of failing on lock upgrade.
 */
std::string beginStatement(Dialect dialect);

/**
 * "INSERT ... if absent" for a table with a unique key.
 * Produces INSERT ... ON CONFLICT (conflictColumn) DO NOTHING on SQLite and
 * PostgreSQL, and INSERT IGNORE on MySQL.
 */
std::string insertIfAbsent(Dialect dialect,
                           const std::string& table,
                           const std::vector<std::string>& columns,
                           const std::string& conflictColumn);

/**
 * String concatenation expression of the given SQL operands
 */
std::string concat(Dialect dialect, const std::vector<std::string>& operands);

/**
 * Expression stripping leading and trailing occurrences of a single
 * character from a column
 */
std::string trimChar(Dialect dialect, const std::string& expr, char ch);

/**
 * Column type for short indexed text (ids, slugs, tokens).
 * MySQL cannot index unbounded TEXT, so it gets VARCHAR(length).
 */
std::string keyType(Dialect dialect, int length);

/**
 * Suffix for a SELECT that must see rows committed after the transaction's
 * snapshot. MySQL's REPEATABLE READ serves plain reads from the snapshot
 * taken by the first read; a locking read returns the latest committed row.
 * SQLite (serialized writers) and PostgreSQL (READ COMMITTED) need nothing.
 */
std::string lockingReadSuffix(Dialect dialect);

} // namespace db
} // namespace slugline
