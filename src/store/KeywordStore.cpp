#include "store/KeywordStore.hpp"
#include "db/Keys.hpp"
#include "server/Logger.hpp"
#include "store/Rows.hpp"
#include "store/SlugValidator.hpp"
#include "store/StoreError.hpp"

namespace slugline {
namespace store {

namespace {

std::optional<Keyword> findOne(db::Connection& conn, const std::string& column, const std::string& value) {
    db::ResultSet result = conn.query(
        std::string("SELECT ") + kKeywordColumns + " FROM keywords WHERE " + column + " = ?", {value});
    if (result.empty()) {
        return std::nullopt;
    }
    return readKeyword(result.front());
}

StoreError keywordTaken(const std::string& keyword) {
    return StoreError(ErrorKind::KeywordTaken, "keyword is already taken: " + keyword);
}

} // anonymous namespace

KeywordStore::KeywordStore(db::ConnectionPool& pool) : m_pool(pool) {}

std::vector<Keyword> KeywordStore::list() {
    try {
        auto conn = m_pool.acquire();
        db::ResultSet result = conn->query(
            std::string("SELECT ") + kKeywordColumns + " FROM keywords ORDER BY keyword ASC");

        std::vector<Keyword> keywords;
        keywords.reserve(result.size());
        for (const auto& row : result.rows) {
            keywords.push_back(readKeyword(row));
        }
        return keywords;
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "list keywords");
    }
}

std::optional<Keyword> KeywordStore::getById(const std::string& id) {
    try {
        auto conn = m_pool.acquire();
        return findOne(*conn, "id", id);
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "get keyword");
    }
}

std::optional<Keyword> KeywordStore::getByKeyword(const std::string& keyword) {
    try {
        auto conn = m_pool.acquire();
        return findOne(*conn, "keyword", keyword);
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "get keyword");
    }
}

Keyword KeywordStore::create(const std::string& keyword,
                             const std::string& urlTemplate,
                             const std::string& description) {
    validateKeyword(keyword, urlTemplate);

    Keyword created;
    created.id = db::newId();
    created.keyword = keyword;
    created.urlTemplate = urlTemplate;
    created.description = description;
    created.createdAt = db::currentTimestamp();

    try {
        auto conn = m_pool.acquire();
        conn->execute(
            "INSERT INTO keywords (id, keyword, url_template, description, created_at) "
            "VALUES (?, ?, ?, ?, ?)",
            {created.id, created.keyword, created.urlTemplate, created.description, created.createdAt});
    } catch (const db::DatabaseError& e) {
        if (e.kind() == db::ErrorKind::UniqueViolation) {
            throw keywordTaken(keyword);
        }
        throw fromDatabaseError(e, "create keyword");
    }

    LOG_DEBUG("KeywordStore: created keyword " + keyword);
    return created;
}

Keyword KeywordStore::update(const std::string& id,
                             const std::string& keyword,
                             const std::string& urlTemplate,
                             const std::string& description) {
    validateKeyword(keyword, urlTemplate);

    try {
        auto conn = m_pool.acquire();
        db::Transaction txn(*conn);

        try {
            conn->execute(
                "UPDATE keywords SET keyword = ?, url_template = ?, description = ? WHERE id = ?",
                {keyword, urlTemplate, description, id});
        } catch (const db::DatabaseError& e) {
            if (e.kind() == db::ErrorKind::UniqueViolation) {
                throw keywordTaken(keyword);
            }
            throw;
        }

        // MySQL counts changed rows only, so the row count cannot tell a miss
        auto stored = findOne(*conn, "id", id);
        if (!stored) {
            throw StoreError(ErrorKind::NotFound, "keyword not found: " + id);
        }
        txn.commit();

        LOG_DEBUG("KeywordStore: updated keyword " + id);
        return *stored;
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "update keyword");
    }
}

void KeywordStore::remove(const std::string& id) {
    try {
        auto conn = m_pool.acquire();
        size_t deleted = conn->execute("DELETE FROM keywords WHERE id = ?", {id});
        if (deleted == 0) {
            throw StoreError(ErrorKind::NotFound, "keyword not found: " + id);
        }
        LOG_DEBUG("KeywordStore: deleted keyword " + id);
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "delete keyword");
    }
}

} // namespace store
} // namespace slugline
