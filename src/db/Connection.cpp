#include "db/Connection.hpp"
#include "server/Logger.hpp"

namespace slugline {
namespace db {

Param optionalParam(const std::optional<std::string>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

// =============================================================================
// Row
// =============================================================================

const std::optional<std::string>& Row::at(size_t col) const {
    if (col >= m_values.size()) {
        throw DatabaseError(ErrorKind::Other,
            "Column index out of range: " + std::to_string(col));
    }
    return m_values[col];
}

bool Row::isNull(size_t col) const {
    return !at(col).has_value();
}

std::string Row::getText(size_t col) const {
    const auto& value = at(col);
    return value ? *value : "";
}

int64_t Row::getInt64(size_t col) const {
    const auto& value = at(col);
    if (!value || value->empty()) {
        return 0;
    }
    try {
        return std::stoll(*value);
    } catch (const std::exception&) {
        throw DatabaseError(ErrorKind::Other,
            "Column " + std::to_string(col) + " is not an integer: " + *value);
    }
}

bool Row::getBool(size_t col) const {
    const auto& value = at(col);
    if (!value) return false;
    // PostgreSQL renders booleans as t/f, the others as 1/0
    return *value == "1" || *value == "t" || *value == "true";
}

std::optional<std::string> Row::getOptionalText(size_t col) const {
    return at(col);
}

// =============================================================================
// Transaction
// =============================================================================

Transaction::Transaction(Connection& conn) : m_conn(conn) {
    m_conn.begin();
}

Transaction::~Transaction() {
    if (m_done) return;
    try {
        m_conn.rollback();
    } catch (const std::exception& e) {
        LOG_ERROR("Transaction rollback failed: " + std::string(e.what()));
    }
}

void Transaction::commit() {
    m_conn.commit();
    m_done = true;
}

} // namespace db
} // namespace slugline
