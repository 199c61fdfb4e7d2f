#include "db/MysqlConnection.hpp"
#include "server/Logger.hpp"
#include <type_traits>

namespace slugline {
namespace db {

namespace {

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

mysqlx::Value toValue(const Param& param) {
    return std::visit([](const auto& value) -> mysqlx::Value {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return mysqlx::Value();
        } else {
            return mysqlx::Value(value);
        }
    }, param);
}

std::optional<std::string> toText(const mysqlx::Value& value) {
    switch (value.getType()) {
        case mysqlx::Value::VNULL:
            return std::nullopt;
        case mysqlx::Value::UINT64:
            return std::to_string(value.get<uint64_t>());
        case mysqlx::Value::INT64:
            return std::to_string(value.get<int64_t>());
        case mysqlx::Value::FLOAT:
            return std::to_string(value.get<float>());
        case mysqlx::Value::DOUBLE:
            return std::to_string(value.get<double>());
        case mysqlx::Value::BOOL:
            return std::string(value.get<bool>() ? "1" : "0");
        case mysqlx::Value::STRING:
            return value.get<std::string>();
        case mysqlx::Value::RAW: {
            auto bytes = value.getRawBytes();
            return std::string(reinterpret_cast<const char*>(bytes.first), bytes.second);
        }
        default:
            throw DatabaseError(ErrorKind::Other, "Unsupported MySQL column type");
    }
}

} // anonymous namespace

ErrorKind MysqlConnection::classifyError(const std::string& message) {
    if (contains(message, "Duplicate entry")) {
        return ErrorKind::UniqueViolation;
    }
    if (contains(message, "foreign key constraint fails")) {
        return ErrorKind::ForeignKeyViolation;
    }
    if (contains(message, "Lock wait timeout exceeded") ||
        contains(message, "Deadlock found when trying to get lock") ||
        contains(message, "server has gone away") ||
        contains(message, "Lost connection to MySQL server") ||
        contains(message, "Can't connect to MySQL server") ||
        contains(message, "Connection refused")) {
        return ErrorKind::Transient;
    }
    return ErrorKind::Other;
}

MysqlConnection::MysqlConnection(const std::string& uri) {
    try {
        m_session = std::make_unique<mysqlx::Session>(uri);
    } catch (const mysqlx::Error& e) {
        throw DatabaseError(ErrorKind::Transient,
            std::string("MySQL X DevAPI connection failed: ") + e.what());
    }

    LOG_DEBUG("MySQL connection established");
}

MysqlConnection::~MysqlConnection() {
    if (!m_session) return;
    try {
        if (m_inTransaction) {
            m_session->rollback();
        }
        m_session->close();
    } catch (const mysqlx::Error& e) {
        LOG_WARN(std::string("MySQL session close failed: ") + e.what());
    }
}

void MysqlConnection::fail(const mysqlx::Error& e, const std::string& context) {
    std::string message = e.what();
    ErrorKind kind = classifyError(message);
    if (kind == ErrorKind::Transient && !contains(message, "Deadlock") &&
        !contains(message, "Lock wait timeout")) {
        m_broken = true;
    }
    throw DatabaseError(kind, context + ": " + message);
}

mysqlx::SqlResult MysqlConnection::run(const std::string& sql, const Params& params) {
    try {
        mysqlx::SqlStatement stmt = m_session->sql(sql);
        for (const auto& param : params) {
            stmt.bind(toValue(param));
        }
        return stmt.execute();
    } catch (const mysqlx::Error& e) {
        fail(e, "SQL error");
    }
}

ResultSet MysqlConnection::query(const std::string& sql, const Params& params) {
    ResultSet out;
    try {
        mysqlx::SqlResult result = run(sql, params);
        if (!result.hasData()) {
            return out;
        }

        auto numCols = result.getColumnCount();
        for (mysqlx::col_count_t i = 0; i < numCols; ++i) {
            out.columns.push_back(result.getColumn(i).getColumnLabel());
        }

        for (mysqlx::Row row : result.fetchAll()) {
            std::vector<std::optional<std::string>> values;
            values.reserve(numCols);
            for (mysqlx::col_count_t i = 0; i < numCols; ++i) {
                values.push_back(toText(row[i]));
            }
            out.rows.emplace_back(std::move(values));
        }
    } catch (const mysqlx::Error& e) {
        fail(e, "Failed to read result");
    }
    return out;
}

size_t MysqlConnection::execute(const std::string& sql, const Params& params) {
    try {
        mysqlx::SqlResult result = run(sql, params);
        return static_cast<size_t>(result.getAffectedItemsCount());
    } catch (const mysqlx::Error& e) {
        fail(e, "SQL error");
    }
}

void MysqlConnection::begin() {
    if (m_inTransaction) {
        throw DatabaseError(ErrorKind::Other, "Transaction already active");
    }
    try {
        m_session->startTransaction();
        m_inTransaction = true;
    } catch (const mysqlx::Error& e) {
        fail(e, "Failed to begin transaction");
    }
}

void MysqlConnection::commit() {
    if (!m_inTransaction) {
        throw DatabaseError(ErrorKind::Other, "No active transaction");
    }
    m_inTransaction = false;
    try {
        m_session->commit();
    } catch (const mysqlx::Error& e) {
        fail(e, "Commit failed");
    }
}

void MysqlConnection::rollback() {
    if (!m_inTransaction) return;
    m_inTransaction = false;
    try {
        m_session->rollback();
    } catch (const mysqlx::Error& e) {
        fail(e, "Rollback failed");
    }
}

} // namespace db
} // namespace slugline
