#include "store/TagStore.hpp"
#include "db/Keys.hpp"
#include "server/Logger.hpp"
#include "store/Rows.hpp"
#include "store/SlugValidator.hpp"
#include "store/StoreError.hpp"

namespace slugline {
namespace store {

namespace {

std::string trimmed(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::optional<Tag> findBySlug(db::Connection& conn, const std::string& slug,
                              const std::string& suffix = "") {
    db::ResultSet result = conn.query(
        std::string("SELECT ") + kTagColumns + " FROM tags WHERE slug = ?" + suffix, {slug});
    if (result.empty()) {
        return std::nullopt;
    }
    return readTag(result.front());
}

std::string requireTagSlug(const std::string& name) {
    std::string slug = deriveTagSlug(name);
    if (slug.empty()) {
        throw StoreError(ErrorKind::InvalidTag, "tag name has no usable characters: \"" + name + "\"");
    }
    if (trimmed(name).size() > kMaxSlugLength) {
        throw StoreError(ErrorKind::InvalidTag,
            "tag name is longer than " + std::to_string(kMaxSlugLength) + " characters");
    }
    return slug;
}

} // anonymous namespace

TagStore::TagStore(db::ConnectionPool& pool) : m_pool(pool) {}

Tag TagStore::upsert(const std::string& name) {
    requireTagSlug(name);
    try {
        auto conn = m_pool.acquire();
        return upsert(*conn, name);
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "upsert tag");
    }
}

Tag TagStore::upsert(db::Connection& conn, const std::string& name) {
    std::string slug = requireTagSlug(name);

    try {
        std::string sql = db::insertIfAbsent(conn.dialect(), "tags",
                                             {"id", "name", "slug", "created_at"}, "slug");
        size_t inserted = conn.execute(sql, {db::newId(), trimmed(name), slug, db::currentTimestamp()});
        if (inserted > 0) {
            LOG_DEBUG("TagStore: created tag " + slug);
        }

        // The row may come from a transaction committed after our snapshot
        auto tag = findBySlug(conn, slug, db::lockingReadSuffix(conn.dialect()));
        if (!tag) {
            throw StoreError(ErrorKind::Storage, "tag vanished after upsert: " + slug);
        }
        return *tag;
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "upsert tag");
    }
}

std::optional<Tag> TagStore::getBySlug(const std::string& slug) {
    try {
        auto conn = m_pool.acquire();
        return findBySlug(*conn, slug);
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "get tag");
    }
}

std::vector<Tag> TagStore::list() {
    try {
        auto conn = m_pool.acquire();
        db::ResultSet result = conn->query(
            std::string("SELECT ") + kTagColumns + " FROM tags ORDER BY name ASC, slug ASC");

        std::vector<Tag> tags;
        tags.reserve(result.size());
        for (const auto& row : result.rows) {
            tags.push_back(readTag(row));
        }
        return tags;
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "list tags");
    }
}

std::vector<TagCount> TagStore::listWithCounts() {
    try {
        auto conn = m_pool.acquire();
        db::ResultSet result = conn->query(
            "SELECT " + qualify("t", kTagColumns) + ", COUNT(lt.link_id) AS link_count "
            "FROM tags t "
            "INNER JOIN link_tags lt ON lt.tag_id = t.id "
            "GROUP BY t.id, t.name, t.slug, t.created_at "
            "ORDER BY t.name ASC, t.slug ASC");

        std::vector<TagCount> counts;
        counts.reserve(result.size());
        for (const auto& row : result.rows) {
            counts.push_back({readTag(row), row.getInt64(4)});
        }
        return counts;
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "list tag counts");
    }
}

std::vector<Tag> TagStore::suggest(const std::string& prefix, size_t limit) {
    // Derived slugs only contain [a-z0-9-], so no LIKE wildcard needs escaping
    std::string pattern = deriveTagSlug(prefix) + "%";

    try {
        auto conn = m_pool.acquire();
        db::ResultSet result = conn->query(
            std::string("SELECT ") + kTagColumns + " FROM tags WHERE slug LIKE ? "
            "ORDER BY slug ASC LIMIT " + std::to_string(limit),
            {pattern});

        std::vector<Tag> tags;
        tags.reserve(result.size());
        for (const auto& row : result.rows) {
            tags.push_back(readTag(row));
        }
        return tags;
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "suggest tags");
    }
}

} // namespace store
} // namespace slugline
