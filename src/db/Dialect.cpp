#include "db/Dialect.hpp"
#include <sstream>
#include <stdexcept>

namespace slugline {
namespace db {

Dialect parseDialect(const std::string& name) {
    if (name == "sqlite3" || name == "sqlite") return Dialect::SQLite;
    if (name == "postgres" || name == "postgresql") return Dialect::Postgres;
    if (name == "mysql") return Dialect::MySQL;
    throw std::invalid_argument(
        "unsupported DB driver \"" + name + "\": must be sqlite3, mysql, or postgres");
}

std::string dialectName(Dialect dialect) {
    switch (dialect) {
        case Dialect::SQLite:   return "sqlite3";
        case Dialect::Postgres: return "postgres";
        case Dialect::MySQL:    return "mysql";
    }
    return "unknown";
}

std::string rebindPlaceholders(const std::string& sql) {
    std::string out;
    out.reserve(sql.size() + 16);

    int index = 0;
    char quote = 0;
    for (char c : sql) {
        if (quote) {
            // Doubled quotes ('') toggle twice and land back inside the literal
            if (c == quote) quote = 0;
            out += c;
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            out += c;
        } else if (c == '?') {
            out += '$';
            out += std::to_string(++index);
        } else {
            out += c;
        }
    }
    return out;
}

std::string beginStatement(Dialect dialect) {
    switch (dialect) {
        case Dialect::SQLite:   return "BEGIN IMMEDIATE";
        case Dialect::Postgres: return "BEGIN";
        case Dialect::MySQL:    return "START TRANSACTION";
    }
    return "BEGIN";
}

std::string insertIfAbsent(Dialect dialect,
                           const std::string& table,
                           const std::vector<std::string>& columns,
                           const std::string& conflictColumn) {
    std::ostringstream cols;
    std::ostringstream marks;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) {
            cols << ", ";
            marks << ", ";
        }
        cols << columns[i];
        marks << "?";
    }

    std::ostringstream sql;
    if (dialect == Dialect::MySQL) {
        sql << "INSERT IGNORE INTO " << table << " (" << cols.str() << ") "
            << "VALUES (" << marks.str() << ")";
    } else {
        sql << "INSERT INTO " << table << " (" << cols.str() << ") "
            << "VALUES (" << marks.str() << ") "
            << "ON CONFLICT (" << conflictColumn << ") DO NOTHING";
    }
    return sql.str();
}

std::string concat(Dialect dialect, const std::vector<std::string>& operands) {
    std::ostringstream oss;
    if (dialect == Dialect::MySQL) {
        oss << "CONCAT(";
        for (size_t i = 0; i < operands.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << operands[i];
        }
        oss << ")";
        return oss.str();
    }

    for (size_t i = 0; i < operands.size(); ++i) {
        if (i > 0) oss << " || ";
        oss << operands[i];
    }
    return oss.str();
}

std::string trimChar(Dialect dialect, const std::string& expr, char ch) {
    std::string literal = "'" + std::string(1, ch) + "'";
    if (dialect == Dialect::SQLite) {
        // TRIM(X, Y) form; SQLite has no TRIM(BOTH ... FROM ...)
        return "TRIM(" + expr + ", " + literal + ")";
    }
    return "TRIM(BOTH " + literal + " FROM " + expr + ")";
}

std::string keyType(Dialect dialect, int length) {
    if (dialect == Dialect::MySQL) {
        return "VARCHAR(" + std::to_string(length) + ")";
    }
    return "TEXT";
}

std::string lockingReadSuffix(Dialect dialect) {
    return dialect == Dialect::MySQL ? " FOR SHARE" : "";
}

} // namespace db
} // namespace slugline
