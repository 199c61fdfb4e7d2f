#include "db/ConnectionFactory.hpp"
#include "db/MysqlConnection.hpp"
#include "db/PostgresConnection.hpp"
#include "db/SqliteConnection.hpp"

namespace slugline {
namespace db {

std::unique_ptr<Connection> openConnection(Dialect dialect, const std::string& dsn) {
    switch (dialect) {
        case Dialect::SQLite:
            return std::make_unique<SqliteConnection>(dsn);
        case Dialect::Postgres:
            return std::make_unique<PostgresConnection>(dsn);
        case Dialect::MySQL:
            return std::make_unique<MysqlConnection>(dsn);
    }
    throw DatabaseError(ErrorKind::Other, "Unknown dialect");
}

} // namespace db
} // namespace slugline
