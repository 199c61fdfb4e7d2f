#include <catch2/catch_test_macros.hpp>
#include "db/SqliteConnection.hpp"
#include "TestSupport.hpp"

using namespace slugline::db;

namespace {

void createItems(Connection& conn) {
    conn.execute("CREATE TABLE items (id INTEGER PRIMARY KEY, name TEXT NOT NULL UNIQUE, note TEXT)");
}

} // anonymous namespace

TEST_CASE("Execute and query with bound parameters", "[SqliteConnection]") {
    TempDatabase tempDb;
    SqliteConnection conn(tempDb.path());
    createItems(conn);

    REQUIRE(conn.execute("INSERT INTO items (id, name, note) VALUES (?, ?, ?)",
                         {int64_t(1), std::string("first"), nullptr}) == 1);
    REQUIRE(conn.execute("INSERT INTO items (id, name, note) VALUES (?, ?, ?)",
                         {int64_t(2), std::string("second"), std::string("n")}) == 1);

    ResultSet result = conn.query("SELECT id, name, note FROM items ORDER BY id");
    REQUIRE(result.size() == 2);
    REQUIRE(result.columns == std::vector<std::string>{"id", "name", "note"});
    REQUIRE(result.rows[0].getInt64(0) == 1);
    REQUIRE(result.rows[0].getText(1) == "first");
    REQUIRE(result.rows[0].isNull(2));
    REQUIRE_FALSE(result.rows[0].getOptionalText(2).has_value());
    REQUIRE(result.rows[1].getOptionalText(2) == std::optional<std::string>("n"));
}

TEST_CASE("Unique violations are classified", "[SqliteConnection][Errors]") {
    TempDatabase tempDb;
    SqliteConnection conn(tempDb.path());
    createItems(conn);
    conn.execute("INSERT INTO items (id, name) VALUES (1, 'dup')");

    try {
        conn.execute("INSERT INTO items (id, name) VALUES (2, 'dup')");
        FAIL("expected a unique violation");
    } catch (const DatabaseError& e) {
        REQUIRE(e.kind() == ErrorKind::UniqueViolation);
    }
}

TEST_CASE("Foreign keys are enforced on every connection", "[SqliteConnection][Errors]") {
    TempDatabase tempDb;
    SqliteConnection conn(tempDb.path());
    conn.execute("CREATE TABLE parent (id INTEGER PRIMARY KEY)");
    conn.execute("CREATE TABLE child (id INTEGER PRIMARY KEY, parent_id INTEGER NOT NULL,"
                 " FOREIGN KEY (parent_id) REFERENCES parent (id) ON DELETE CASCADE)");

    try {
        conn.execute("INSERT INTO child (id, parent_id) VALUES (1, 42)");
        FAIL("expected a foreign key violation");
    } catch (const DatabaseError& e) {
        REQUIRE(e.kind() == ErrorKind::ForeignKeyViolation);
    }

    conn.execute("INSERT INTO parent (id) VALUES (1)");
    conn.execute("INSERT INTO child (id, parent_id) VALUES (1, 1)");
    conn.execute("DELETE FROM parent WHERE id = 1");
    REQUIRE(conn.query("SELECT COUNT(*) FROM child").front().getInt64(0) == 0);
}

TEST_CASE("Syntax errors are not transient", "[SqliteConnection][Errors]") {
    TempDatabase tempDb;
    SqliteConnection conn(tempDb.path());

    try {
        conn.query("SELEC nonsense");
        FAIL("expected a syntax error");
    } catch (const DatabaseError& e) {
        REQUIRE(e.kind() == ErrorKind::Other);
    }
}

TEST_CASE("Transaction rolls back unless committed", "[SqliteConnection][Transaction]") {
    TempDatabase tempDb;
    SqliteConnection conn(tempDb.path());
    createItems(conn);

    {
        Transaction txn(conn);
        REQUIRE(conn.inTransaction());
        conn.execute("INSERT INTO items (id, name) VALUES (1, 'dropped')");
    }
    REQUIRE_FALSE(conn.inTransaction());
    REQUIRE(conn.query("SELECT COUNT(*) FROM items").front().getInt64(0) == 0);

    {
        Transaction txn(conn);
        conn.execute("INSERT INTO items (id, name) VALUES (1, 'kept')");
        txn.commit();
    }
    REQUIRE(conn.query("SELECT name FROM items").front().getText(0) == "kept");
}

TEST_CASE("Committed writes are visible to another connection", "[SqliteConnection][Transaction]") {
    TempDatabase tempDb;
    SqliteConnection writer(tempDb.path());
    SqliteConnection reader(tempDb.path());
    createItems(writer);

    writer.execute("INSERT INTO items (id, name) VALUES (1, 'shared')");
    REQUIRE(reader.query("SELECT name FROM items WHERE id = ?", {int64_t(1)}).front().getText(0) == "shared");
}
