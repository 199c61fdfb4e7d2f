#include "db/Migrator.hpp"

namespace slugline {
namespace db {

namespace {

std::string castToText(Dialect d, const std::string& expr) {
    return "CAST(" + expr + (d == Dialect::MySQL ? " AS CHAR)" : " AS TEXT)");
}

std::string quoteLiteral(Dialect d, char c) {
    if (c == '\'') return "''''";
    // MySQL treats backslash as an escape inside string literals
    if (c == '\\' && d == Dialect::MySQL) return "'\\\\'";
    return "'" + std::string(1, c) + "'";
}

/**
 * Best-effort slug of display_name in SQL: lowercase, spaces to hyphens,
 * common punctuation removed, doubled hyphens collapsed. Later logins
 * re-derive the exact slug in application code.
 */
std::string slugifyExpr(Dialect d, const std::string& column) {
    static const std::string stripped = "'\".,!?()@#&+/\\";

    std::string expr = "REPLACE(LOWER(TRIM(" + column + ")), ' ', '-')";
    for (char c : stripped) {
        expr = "REPLACE(" + expr + ", " + quoteLiteral(d, c) + ", '')";
    }
    return "REPLACE(" + expr + ", '--', '-')";
}

std::vector<std::string> createUsers(Dialect d) {
    return {
        "CREATE TABLE IF NOT EXISTS users ("
        "  id " + keyType(d, 36) + " NOT NULL PRIMARY KEY,"
        "  provider " + keyType(d, 191) + " NOT NULL,"
        "  subject " + keyType(d, 191) + " NOT NULL,"
        "  email TEXT NOT NULL,"
        "  display_name TEXT NOT NULL,"
        "  role " + keyType(d, 16) + " NOT NULL DEFAULT 'user',"
        "  created_at " + keyType(d, 32) + " NOT NULL,"
        "  updated_at " + keyType(d, 32) + " NOT NULL,"
        "  UNIQUE (provider, subject)"
        ")"
    };
}

std::vector<std::string> createSessions(Dialect d) {
    std::string ddl;
    switch (d) {
        case Dialect::Postgres:
            ddl = "CREATE TABLE IF NOT EXISTS sessions ("
                  "  token TEXT PRIMARY KEY,"
                  "  data BYTEA NOT NULL,"
                  "  expiry TIMESTAMPTZ NOT NULL"
                  ")";
            break;
        case Dialect::MySQL:
            ddl = "CREATE TABLE IF NOT EXISTS sessions ("
                  "  token VARCHAR(43) PRIMARY KEY,"
                  "  data BLOB NOT NULL,"
                  "  expiry TIMESTAMP(6) NOT NULL"
                  ")";
            break;
        case Dialect::SQLite:
            ddl = "CREATE TABLE IF NOT EXISTS sessions ("
                  "  token TEXT PRIMARY KEY,"
                  "  data BLOB NOT NULL,"
                  "  expiry REAL NOT NULL"
                  ")";
            break;
    }
    return {ddl, "CREATE INDEX sessions_expiry_idx ON sessions (expiry)"};
}

std::vector<std::string> createLinks(Dialect d) {
    std::string slugColumn;
    switch (d) {
        case Dialect::SQLite:   slugColumn = "slug TEXT NOT NULL COLLATE NOCASE UNIQUE"; break;
        case Dialect::Postgres: slugColumn = "slug TEXT NOT NULL"; break;
        // Default collation of a VARCHAR key is case-insensitive
        case Dialect::MySQL:    slugColumn = "slug VARCHAR(255) NOT NULL UNIQUE"; break;
    }

    std::vector<std::string> stmts = {
        "CREATE TABLE IF NOT EXISTS links ("
        "  id " + keyType(d, 36) + " NOT NULL PRIMARY KEY,"
        "  " + slugColumn + ","
        "  url TEXT NOT NULL,"
        "  title TEXT NOT NULL,"
        "  description TEXT NOT NULL,"
        "  created_at " + keyType(d, 32) + " NOT NULL,"
        "  updated_at " + keyType(d, 32) + " NOT NULL"
        ")",
        "CREATE INDEX links_updated_idx ON links (updated_at)"
    };
    if (d == Dialect::Postgres) {
        stmts.push_back("CREATE UNIQUE INDEX links_slug_lower_idx ON links (LOWER(slug))");
    }
    return stmts;
}

std::vector<std::string> createTags(Dialect d) {
    return {
        "CREATE TABLE IF NOT EXISTS tags ("
        "  id " + keyType(d, 36) + " NOT NULL PRIMARY KEY,"
        "  name " + keyType(d, 255) + " NOT NULL,"
        "  slug " + keyType(d, 255) + " NOT NULL,"
        "  created_at " + keyType(d, 32) + " NOT NULL"
        ")",
        "CREATE UNIQUE INDEX idx_tags_slug ON tags (slug)"
    };
}

std::vector<std::string> createLinkTags(Dialect d) {
    return {
        "CREATE TABLE IF NOT EXISTS link_tags ("
        "  link_id " + keyType(d, 36) + " NOT NULL,"
        "  tag_id " + keyType(d, 36) + " NOT NULL,"
        "  PRIMARY KEY (link_id, tag_id),"
        "  FOREIGN KEY (link_id) REFERENCES links (id) ON DELETE CASCADE,"
        "  FOREIGN KEY (tag_id) REFERENCES tags (id) ON DELETE CASCADE"
        ")",
        "CREATE INDEX link_tags_tag_idx ON link_tags (tag_id)"
    };
}

std::vector<std::string> createLinkOwners(Dialect d) {
    return {
        "CREATE TABLE IF NOT EXISTS link_owners ("
        "  link_id " + keyType(d, 36) + " NOT NULL,"
        "  user_id " + keyType(d, 36) + " NOT NULL,"
        "  is_primary INTEGER NOT NULL DEFAULT 0,"
        "  PRIMARY KEY (link_id, user_id),"
        "  FOREIGN KEY (link_id) REFERENCES links (id) ON DELETE CASCADE,"
        "  FOREIGN KEY (user_id) REFERENCES users (id) ON DELETE CASCADE"
        ")",
        "CREATE INDEX link_owners_user_idx ON link_owners (user_id)"
    };
}

std::vector<std::string> addDisplayNameSlug(Dialect d) {
    std::vector<std::string> stmts;

    switch (d) {
        case Dialect::Postgres:
            stmts.push_back("ALTER TABLE users ADD COLUMN IF NOT EXISTS display_name_slug TEXT NOT NULL DEFAULT ''");
            break;
        case Dialect::MySQL:
            stmts.push_back("ALTER TABLE users ADD COLUMN display_name_slug VARCHAR(255) NOT NULL DEFAULT ''");
            break;
        case Dialect::SQLite:
            stmts.push_back("ALTER TABLE users ADD COLUMN display_name_slug TEXT NOT NULL DEFAULT ''");
            break;
    }

    stmts.push_back(
        "UPDATE users SET display_name_slug = " + slugifyExpr(d, "display_name") +
        " WHERE display_name_slug = ''");

    stmts.push_back(
        "UPDATE users SET display_name_slug = " + trimChar(d, "display_name_slug", '-') +
        " WHERE display_name_slug LIKE '-%' OR display_name_slug LIKE '%-'");

    // Display names made only of punctuation
    stmts.push_back(
        "UPDATE users SET display_name_slug = " + concat(d, {"'user-'", "SUBSTR(id, 1, 8)"}) +
        " WHERE display_name_slug = ''");

    // Users sharing a slug: the oldest keeps it, the others get -2, -3...
    std::string ranked =
        "(SELECT id AS dup_id, ROW_NUMBER() OVER ("
        "PARTITION BY display_name_slug ORDER BY created_at, id"
        ") AS dup_rank FROM users) ranked";

    if (d == Dialect::MySQL) {
        stmts.push_back(
            "UPDATE users u JOIN " + ranked +
            " ON u.id = ranked.dup_id AND ranked.dup_rank > 1"
            " SET u.display_name_slug = " +
            concat(d, {"u.display_name_slug", "'-'", castToText(d, "ranked.dup_rank")}));
    } else {
        stmts.push_back(
            "UPDATE users SET display_name_slug = " +
            concat(d, {"display_name_slug", "'-'", castToText(d, "dup_rank")}) +
            " FROM " + ranked +
            " WHERE users.id = ranked.dup_id AND ranked.dup_rank > 1");
    }

    stmts.push_back("CREATE UNIQUE INDEX idx_users_display_name_slug ON users (display_name_slug)");
    return stmts;
}

std::vector<std::string> createLinkClicks(Dialect d) {
    return {
        "CREATE TABLE IF NOT EXISTS link_clicks ("
        "  id " + keyType(d, 36) + " NOT NULL PRIMARY KEY,"
        "  link_id " + keyType(d, 36) + " NOT NULL,"
        "  user_id " + keyType(d, 36) + ","
        "  ip_hash " + keyType(d, 64) + " NOT NULL,"
        "  user_agent TEXT,"
        "  referrer TEXT,"
        "  clicked_at " + keyType(d, 32) + " NOT NULL,"
        "  FOREIGN KEY (link_id) REFERENCES links (id) ON DELETE CASCADE,"
        "  FOREIGN KEY (user_id) REFERENCES users (id) ON DELETE SET NULL"
        ")",
        "CREATE INDEX idx_link_clicks_link_id_clicked_at ON link_clicks (link_id, clicked_at DESC)"
    };
}

std::vector<std::string> createKeywords(Dialect d) {
    return {
        "CREATE TABLE IF NOT EXISTS keywords ("
        "  id " + keyType(d, 36) + " NOT NULL PRIMARY KEY,"
        "  keyword " + keyType(d, 255) + " NOT NULL UNIQUE,"
        "  url_template TEXT NOT NULL,"
        "  description TEXT NOT NULL,"
        "  created_at " + keyType(d, 32) + " NOT NULL"
        ")"
    };
}

std::vector<std::string> addLinkVisibility(Dialect d) {
    // Existing links stay reachable
    return {
        "ALTER TABLE links ADD COLUMN visibility " + keyType(d, 16) + " NOT NULL DEFAULT 'public'"
    };
}

std::vector<std::string> createLinkShares(Dialect d) {
    return {
        "CREATE TABLE IF NOT EXISTS link_shares ("
        "  link_id " + keyType(d, 36) + " NOT NULL,"
        "  user_id " + keyType(d, 36) + " NOT NULL,"
        "  shared_by " + keyType(d, 36) + " NOT NULL,"
        "  created_at " + keyType(d, 32) + " NOT NULL,"
        "  PRIMARY KEY (link_id, user_id),"
        "  FOREIGN KEY (link_id) REFERENCES links (id) ON DELETE CASCADE,"
        "  FOREIGN KEY (user_id) REFERENCES users (id) ON DELETE CASCADE,"
        "  FOREIGN KEY (shared_by) REFERENCES users (id)"
        ")",
        "CREATE INDEX link_shares_user_idx ON link_shares (user_id)"
    };
}

} // anonymous namespace

const std::vector<Migration>& allMigrations() {
    static const std::vector<Migration> migrations = {
        {1, "create_users", createUsers},
        {2, "create_sessions", createSessions},
        {3, "create_links", createLinks},
        {4, "create_tags", createTags},
        {5, "create_link_tags", createLinkTags},
        {6, "create_link_owners", createLinkOwners},
        {7, "add_display_name_slug", addDisplayNameSlug},
        {8, "create_link_clicks", createLinkClicks},
        {9, "create_keywords", createKeywords},
        {10, "add_link_visibility", addLinkVisibility},
        {11, "create_link_shares", createLinkShares},
    };
    return migrations;
}

} // namespace db
} // namespace slugline
