#include "db/Migrator.hpp"
#include "db/Keys.hpp"
#include "server/Logger.hpp"
#include <algorithm>

namespace slugline {
namespace db {

Migrator::Migrator(Connection& conn) : m_conn(conn) {}

void Migrator::ensureLedger() {
    Dialect d = m_conn.dialect();
    m_conn.execute(
        "CREATE TABLE IF NOT EXISTS schema_migrations ("
        "  version INTEGER NOT NULL PRIMARY KEY,"
        "  name " + keyType(d, 255) + " NOT NULL,"
        "  applied_at " + keyType(d, 32) + " NOT NULL"
        ")");
}

std::vector<int> Migrator::appliedVersions() {
    ensureLedger();

    std::vector<int> versions;
    ResultSet result = m_conn.query("SELECT version FROM schema_migrations ORDER BY version");
    for (const auto& row : result.rows) {
        versions.push_back(static_cast<int>(row.getInt64(0)));
    }
    return versions;
}

int Migrator::currentVersion() {
    std::vector<int> versions = appliedVersions();
    return versions.empty() ? 0 : versions.back();
}

int Migrator::migrate() {
    std::vector<int> applied = appliedVersions();

    int count = 0;
    for (const auto& migration : allMigrations()) {
        if (std::find(applied.begin(), applied.end(), migration.version) != applied.end()) {
            continue;
        }
        apply(migration);
        ++count;
    }

    if (count == 0) {
        LOG_INFO("Migrator: schema up to date at version " + std::to_string(currentVersion()));
    } else {
        LOG_INFO("Migrator: applied " + std::to_string(count) + " migration(s)");
    }
    return count;
}

void Migrator::apply(const Migration& migration) {
    LOG_INFO("Migrator: applying " + std::to_string(migration.version) + " " + migration.name);

    Transaction txn(m_conn);
    for (const auto& sql : migration.statements(m_conn.dialect())) {
        try {
            m_conn.execute(sql);
        } catch (const DatabaseError& e) {
            LOG_ERROR("Migrator: migration " + std::to_string(migration.version) +
                      " failed: " + e.what());
            throw;
        }
    }
    m_conn.execute(
        "INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?)",
        {static_cast<int64_t>(migration.version), migration.name, currentTimestamp()});
    txn.commit();
}

} // namespace db
} // namespace slugline
