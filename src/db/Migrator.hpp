#pragma once

#include "db/Connection.hpp"
#include <functional>
#include <string>
#include <vector>

namespace slugline {
namespace db {

/**
 * One forward-only schema step. Statements are produced per dialect.
 */
struct Migration {
    int version;
    std::string name;
    std::function<std::vector<std::string>(Dialect)> statements;
};

/**
 * @brief All schema migrations in version order
 */
const std::vector<Migration>& allMigrations();

/**
 * @brief Applies pending migrations and records them in schema_migrations
 *
 * Each migration runs inside its own transaction together with its ledger
 * row. MySQL commits implicitly around DDL, so there a failed migration can
 * leave partial schema behind and must be repaired by hand.
 */
class Migrator {
public:
    explicit Migrator(Connection& conn);

    /**
     * @brief Versions already recorded, ascending
     */
    std::vector<int> appliedVersions();

    /**
     * @brief Highest applied version, 0 on an empty database
     */
    int currentVersion();

    /**
     * @brief Apply every pending migration in order
     * @return Number of migrations applied
     * @throws DatabaseError on the first failing statement
     */
    int migrate();

private:
    void ensureLedger();
    void apply(const Migration& migration);

    Connection& m_conn;
};

} // namespace db
} // namespace slugline
