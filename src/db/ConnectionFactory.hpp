#pragma once

#include "db/Connection.hpp"
#include <memory>
#include <string>

namespace slugline {
namespace db {

/**
 * @brief Open a connection for the given dialect
 * @param dsn SQLite file path, libpq connection string or mysqlx URI
 * @throws DatabaseError if the connection cannot be established
 */
std::unique_ptr<Connection> openConnection(Dialect dialect, const std::string& dsn);

} // namespace db
} // namespace slugline
