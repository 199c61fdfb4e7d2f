#include <catch2/catch_test_macros.hpp>
#include "db/Dialect.hpp"
#include <stdexcept>

using namespace slugline::db;

TEST_CASE("parseDialect accepts known driver names", "[Dialect]") {
    REQUIRE(parseDialect("sqlite3") == Dialect::SQLite);
    REQUIRE(parseDialect("sqlite") == Dialect::SQLite);
    REQUIRE(parseDialect("postgres") == Dialect::Postgres);
    REQUIRE(parseDialect("postgresql") == Dialect::Postgres);
    REQUIRE(parseDialect("mysql") == Dialect::MySQL);
}

TEST_CASE("parseDialect rejects unknown drivers", "[Dialect]") {
    REQUIRE_THROWS_AS(parseDialect("oracle"), std::invalid_argument);
    REQUIRE_THROWS_AS(parseDialect(""), std::invalid_argument);
}

TEST_CASE("dialectName round-trips through parseDialect", "[Dialect]") {
    for (Dialect d : {Dialect::SQLite, Dialect::Postgres, Dialect::MySQL}) {
        REQUIRE(parseDialect(dialectName(d)) == d);
    }
}

TEST_CASE("rebindPlaceholders numbers question marks", "[Dialect][Rebind]") {
    REQUIRE(rebindPlaceholders("SELECT * FROM links WHERE id = ? AND slug = ?") ==
            "SELECT * FROM links WHERE id = $1 AND slug = $2");
    REQUIRE(rebindPlaceholders("SELECT 1") == "SELECT 1");
}

TEST_CASE("rebindPlaceholders skips quoted literals", "[Dialect][Rebind]") {
    REQUIRE(rebindPlaceholders("SELECT '?' , ? FROM t") == "SELECT '?' , $1 FROM t");
    REQUIRE(rebindPlaceholders("SELECT \"a?\" FROM t WHERE x = ?") ==
            "SELECT \"a?\" FROM t WHERE x = $1");
    REQUIRE(rebindPlaceholders("SELECT 'it''s ?' WHERE a = ? AND b = ?") ==
            "SELECT 'it''s ?' WHERE a = $1 AND b = $2");
}

TEST_CASE("beginStatement takes the SQLite write lock up front", "[Dialect]") {
    REQUIRE(beginStatement(Dialect::SQLite) == "BEGIN IMMEDIATE");
    REQUIRE(beginStatement(Dialect::Postgres) == "BEGIN");
    REQUIRE(beginStatement(Dialect::MySQL) == "START TRANSACTION");
}

TEST_CASE("insertIfAbsent per dialect", "[Dialect]") {
    std::vector<std::string> cols = {"id", "slug"};

    REQUIRE(insertIfAbsent(Dialect::SQLite, "tags", cols, "slug") ==
            "INSERT INTO tags (id, slug) VALUES (?, ?) ON CONFLICT (slug) DO NOTHING");
    REQUIRE(insertIfAbsent(Dialect::Postgres, "tags", cols, "slug") ==
            "INSERT INTO tags (id, slug) VALUES (?, ?) ON CONFLICT (slug) DO NOTHING");
    REQUIRE(insertIfAbsent(Dialect::MySQL, "tags", cols, "slug") ==
            "INSERT IGNORE INTO tags (id, slug) VALUES (?, ?)");
}

TEST_CASE("concat and trimChar per dialect", "[Dialect]") {
    REQUIRE(concat(Dialect::SQLite, {"a", "'-'", "b"}) == "a || '-' || b");
    REQUIRE(concat(Dialect::MySQL, {"a", "'-'", "b"}) == "CONCAT(a, '-', b)");

    REQUIRE(trimChar(Dialect::SQLite, "slug", '-') == "TRIM(slug, '-')");
    REQUIRE(trimChar(Dialect::Postgres, "slug", '-') == "TRIM(BOTH '-' FROM slug)");
}

TEST_CASE("keyType bounds MySQL key columns", "[Dialect]") {
    REQUIRE(keyType(Dialect::MySQL, 36) == "VARCHAR(36)");
    REQUIRE(keyType(Dialect::SQLite, 36) == "TEXT");
    REQUIRE(keyType(Dialect::Postgres, 255) == "TEXT");
}
