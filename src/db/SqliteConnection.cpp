#include "db/SqliteConnection.hpp"
#include "server/Logger.hpp"
#include <sqlite3.h>
#include <type_traits>

namespace slugline {
namespace db {

namespace {

ErrorKind classify(int code) {
    switch (code) {
        case SQLITE_CONSTRAINT_UNIQUE:
        case SQLITE_CONSTRAINT_PRIMARYKEY:
            return ErrorKind::UniqueViolation;
        case SQLITE_CONSTRAINT_FOREIGNKEY:
            return ErrorKind::ForeignKeyViolation;
        default:
            break;
    }

    switch (code & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_IOERR:
        case SQLITE_CANTOPEN:
            return ErrorKind::Transient;
        default:
            return ErrorKind::Other;
    }
}

[[noreturn]] void fail(sqlite3* db, int code, const std::string& context) {
    std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(code);
    throw DatabaseError(classify(code), context + ": " + message);
}

/**
 * RAII wrapper for SQLite prepared statements
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : m_db(db), m_stmt(nullptr) {
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr);
        if (rc != SQLITE_OK) {
            fail(db, rc, "Failed to prepare statement");
        }
    }

    ~Statement() {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(const Params& params) {
        for (size_t i = 0; i < params.size(); ++i) {
            int index = static_cast<int>(i) + 1;
            int rc = std::visit([&](const auto& value) -> int {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, std::nullptr_t>) {
                    return sqlite3_bind_null(m_stmt, index);
                } else if constexpr (std::is_same_v<T, int64_t>) {
                    return sqlite3_bind_int64(m_stmt, index, value);
                } else {
                    return sqlite3_bind_text(m_stmt, index, value.c_str(),
                                             static_cast<int>(value.size()), SQLITE_TRANSIENT);
                }
            }, params[i]);

            if (rc != SQLITE_OK) {
                fail(m_db, rc, "Failed to bind parameter " + std::to_string(index));
            }
        }
    }

    bool step() {
        int result = sqlite3_step(m_stmt);
        if (result == SQLITE_ROW) return true;
        if (result == SQLITE_DONE) return false;
        fail(m_db, sqlite3_extended_errcode(m_db), "Step failed");
    }

    int columnCount() const {
        return sqlite3_column_count(m_stmt);
    }

    std::string columnName(int col) const {
        const char* name = sqlite3_column_name(m_stmt, col);
        return name ? name : "";
    }

    std::optional<std::string> getValue(int col) {
        if (sqlite3_column_type(m_stmt, col) == SQLITE_NULL) {
            return std::nullopt;
        }
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, col));
        int bytes = sqlite3_column_bytes(m_stmt, col);
        return text ? std::string(text, static_cast<size_t>(bytes)) : std::string();
    }

private:
    sqlite3* m_db;
    sqlite3_stmt* m_stmt;
};

} // anonymous namespace

SqliteConnection::SqliteConnection(const std::string& path, std::chrono::milliseconds busyTimeout)
    : m_path(path)
{
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI;
    int rc = sqlite3_open_v2(path.c_str(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
        sqlite3_close(m_db);
        m_db = nullptr;
        throw DatabaseError(ErrorKind::Transient, "Failed to open database: " + message);
    }

    sqlite3_extended_result_codes(m_db, 1);
    sqlite3_busy_timeout(m_db, static_cast<int>(busyTimeout.count()));

    try {
        // Cascades are silently ignored unless enabled on every connection
        exec("PRAGMA foreign_keys = ON");
        exec("PRAGMA journal_mode = WAL");
    } catch (const DatabaseError&) {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw;
    }

    LOG_DEBUG("SQLite connection opened: " + path);
}

SqliteConnection::~SqliteConnection() {
    if (m_db) {
        sqlite3_close(m_db);
    }
}

void SqliteConnection::exec(const std::string& sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        throw DatabaseError(classify(sqlite3_extended_errcode(m_db)), "SQL error: " + error);
    }
}

ResultSet SqliteConnection::query(const std::string& sql, const Params& params) {
    Statement stmt(m_db, sql);
    stmt.bind(params);

    ResultSet result;
    int columns = stmt.columnCount();
    for (int i = 0; i < columns; ++i) {
        result.columns.push_back(stmt.columnName(i));
    }

    while (stmt.step()) {
        std::vector<std::optional<std::string>> values;
        values.reserve(static_cast<size_t>(columns));
        for (int i = 0; i < columns; ++i) {
            values.push_back(stmt.getValue(i));
        }
        result.rows.emplace_back(std::move(values));
    }
    return result;
}

size_t SqliteConnection::execute(const std::string& sql, const Params& params) {
    Statement stmt(m_db, sql);
    stmt.bind(params);
    while (stmt.step()) {
        // Drain rows of statements such as PRAGMA
    }
    return static_cast<size_t>(sqlite3_changes(m_db));
}

void SqliteConnection::begin() {
    exec(beginStatement(Dialect::SQLite));
    m_inTransaction = true;
}

void SqliteConnection::commit() {
    exec("COMMIT");
    m_inTransaction = false;
}

void SqliteConnection::rollback() {
    if (!m_inTransaction) return;
    m_inTransaction = false;

    // Some errors (SQLITE_FULL, SQLITE_IOERR...) already rolled back
    if (sqlite3_get_autocommit(m_db)) return;
    exec("ROLLBACK");
}

} // namespace db
} // namespace slugline
