#include "store/LinkStore.hpp"
#include "db/Keys.hpp"
#include "server/Logger.hpp"
#include "store/OwnershipStore.hpp"
#include "store/Rows.hpp"
#include "store/SlugValidator.hpp"
#include "store/StoreError.hpp"
#include "store/TagStore.hpp"
#include <set>

namespace slugline {
namespace store {

namespace {

/**
 * PostgreSQL only indexes LOWER(slug); the others compare case-insensitively
 * on the column itself
 */
std::string slugPredicate(db::Dialect dialect, const std::string& column) {
    if (dialect == db::Dialect::Postgres) {
        return "LOWER(" + column + ") = ?";
    }
    return column + " = ?";
}

} // anonymous namespace

LinkStore::LinkStore(db::ConnectionPool& pool) : m_pool(pool) {}

// =============================================================================
// Helpers
// =============================================================================

std::optional<Link> LinkStore::findOne(db::Connection& conn, const std::string& where,
                                       const std::string& value) {
    db::ResultSet result = conn.query(
        std::string("SELECT ") + kLinkColumns + " FROM links WHERE " + where, {value});
    if (result.empty()) {
        return std::nullopt;
    }

    Link link = readLink(result.front());
    hydrate(conn, link);
    return link;
}

std::vector<Link> LinkStore::findMany(db::Connection& conn, const std::string& sql,
                                      const db::Params& params) {
    db::ResultSet result = conn.query(sql, params);

    std::vector<Link> links;
    links.reserve(result.size());
    for (const auto& row : result.rows) {
        Link link = readLink(row);
        hydrate(conn, link);
        links.push_back(std::move(link));
    }
    return links;
}

void LinkStore::hydrate(db::Connection& conn, Link& link) {
    link.owners = OwnershipStore::listOwners(conn, link.id);
    link.tags = loadTags(conn, link.id);
}

std::vector<Tag> LinkStore::loadTags(db::Connection& conn, const std::string& linkId) {
    db::ResultSet result = conn.query(
        "SELECT " + qualify("t", kTagColumns) + " FROM tags t "
        "INNER JOIN link_tags lt ON lt.tag_id = t.id "
        "WHERE lt.link_id = ? "
        "ORDER BY t.name ASC, t.slug ASC",
        {linkId});

    std::vector<Tag> tags;
    tags.reserve(result.size());
    for (const auto& row : result.rows) {
        tags.push_back(readTag(row));
    }
    return tags;
}

void LinkStore::requireLink(db::Connection& conn, const std::string& linkId) {
    if (conn.query("SELECT 1 FROM links WHERE id = ?", {linkId}).empty()) {
        throw StoreError(ErrorKind::NotFound, "link not found: " + linkId);
    }
}

// =============================================================================
// Link CRUD
// =============================================================================

Link LinkStore::create(const std::string& slug,
                       const std::string& url,
                       const std::string& title,
                       const std::string& description,
                       const std::string& ownerId,
                       Visibility visibility) {
    std::string normalized = normalizeSlug(slug);
    validateSlug(normalized);

    try {
        auto conn = m_pool.acquire();
        db::Transaction txn(*conn);

        db::ResultSet taken = conn->query(
            "SELECT 1 FROM links WHERE " + slugPredicate(conn->dialect(), "slug"), {normalized});
        if (!taken.empty()) {
            throw StoreError(ErrorKind::SlugTaken, "slug is already taken: " + normalized);
        }

        Link link;
        link.id = db::newId();
        link.slug = normalized;
        link.url = url;
        link.title = title;
        link.description = description;
        link.visibility = visibility;
        link.createdAt = db::currentTimestamp();
        link.updatedAt = link.createdAt;

        try {
            conn->execute(
                "INSERT INTO links (id, slug, url, title, description, visibility, created_at, updated_at) "
                "VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
                {link.id, link.slug, link.url, link.title, link.description,
                 visibilityToString(link.visibility), link.createdAt, link.updatedAt});
        } catch (const db::DatabaseError& e) {
            // Another creator committed the same slug since the check above
            if (e.kind() == db::ErrorKind::UniqueViolation) {
                throw StoreError(ErrorKind::SlugTaken, "slug is already taken: " + normalized);
            }
            throw;
        }

        OwnershipStore::addPrimaryOwner(*conn, link.id, ownerId);
        txn.commit();

        link.owners = {{ownerId, true}};
        LOG_DEBUG("LinkStore: created link " + link.slug + " (" + link.id + ")");
        return link;
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "create link");
    }
}

std::optional<Link> LinkStore::getBySlug(const std::string& slug) {
    try {
        auto conn = m_pool.acquire();
        return findOne(*conn, slugPredicate(conn->dialect(), "slug"), normalizeSlug(slug));
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "get link by slug");
    }
}

std::optional<Link> LinkStore::getById(const std::string& id) {
    try {
        auto conn = m_pool.acquire();
        return findOne(*conn, "id = ?", id);
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "get link");
    }
}

std::vector<Link> LinkStore::listByOwner(const std::string& userId) {
    try {
        auto conn = m_pool.acquire();
        return findMany(*conn,
            "SELECT " + qualify("l", kLinkColumns) + " FROM links l "
            "INNER JOIN link_owners lo ON lo.link_id = l.id "
            "WHERE lo.user_id = ? "
            "ORDER BY l.updated_at DESC, l.slug ASC",
            {userId});
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "list links by owner");
    }
}

std::vector<Link> LinkStore::listAll() {
    try {
        auto conn = m_pool.acquire();
        return findMany(*conn,
            std::string("SELECT ") + kLinkColumns + " FROM links ORDER BY slug ASC", {});
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "list links");
    }
}

std::vector<Link> LinkStore::listByOwnerOrShared(const std::string& userId) {
    try {
        auto conn = m_pool.acquire();
        return findMany(*conn,
            "SELECT " + qualify("l", kLinkColumns) + " FROM links l "
            "WHERE EXISTS (SELECT 1 FROM link_owners lo WHERE lo.link_id = l.id AND lo.user_id = ?) "
            "OR EXISTS (SELECT 1 FROM link_shares ls WHERE ls.link_id = l.id AND ls.user_id = ?) "
            "ORDER BY l.slug ASC",
            {userId, userId});
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "list owned or shared links");
    }
}

std::vector<Link> LinkStore::listSharedWithUser(const std::string& userId) {
    try {
        auto conn = m_pool.acquire();
        return findMany(*conn,
            "SELECT " + qualify("l", kLinkColumns) + " FROM links l "
            "INNER JOIN link_shares ls ON ls.link_id = l.id "
            "WHERE ls.user_id = ? "
            "ORDER BY l.slug ASC",
            {userId});
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "list shared links");
    }
}

std::vector<Link> LinkStore::listByTag(const std::string& tagSlug) {
    try {
        auto conn = m_pool.acquire();
        return findMany(*conn,
            "SELECT " + qualify("l", kLinkColumns) + " FROM links l "
            "INNER JOIN link_tags lt ON lt.link_id = l.id "
            "INNER JOIN tags t ON t.id = lt.tag_id "
            "WHERE t.slug = ? "
            "ORDER BY l.slug ASC",
            {tagSlug});
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "list links by tag");
    }
}

std::vector<Tag> LinkStore::listTags(const std::string& linkId) {
    try {
        auto conn = m_pool.acquire();
        return loadTags(*conn, linkId);
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "list link tags");
    }
}

Link LinkStore::update(const std::string& id,
                       const std::string& url,
                       const std::string& title,
                       const std::string& description,
                       std::optional<Visibility> visibility) {
    try {
        auto conn = m_pool.acquire();
        db::Transaction txn(*conn);

        requireLink(*conn, id);
        if (visibility) {
            conn->execute(
                "UPDATE links SET url = ?, title = ?, description = ?, visibility = ?, updated_at = ? "
                "WHERE id = ?",
                {url, title, description, visibilityToString(*visibility), db::currentTimestamp(), id});
        } else {
            conn->execute(
                "UPDATE links SET url = ?, title = ?, description = ?, updated_at = ? WHERE id = ?",
                {url, title, description, db::currentTimestamp(), id});
        }

        auto link = findOne(*conn, "id = ?", id);
        txn.commit();

        LOG_DEBUG("LinkStore: updated link " + id);
        return *link;
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "update link");
    }
}

void LinkStore::updateVisibility(const std::string& id, Visibility visibility) {
    try {
        auto conn = m_pool.acquire();
        db::Transaction txn(*conn);

        requireLink(*conn, id);
        conn->execute("UPDATE links SET visibility = ?, updated_at = ? WHERE id = ?",
                      {visibilityToString(visibility), db::currentTimestamp(), id});
        txn.commit();

        LOG_DEBUG("LinkStore: link " + id + " is now " + visibilityToString(visibility));
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "update visibility");
    }
}

void LinkStore::remove(const std::string& id) {
    try {
        auto conn = m_pool.acquire();
        db::Transaction txn(*conn);

        // link_owners, link_tags, link_shares and link_clicks go with it (ON DELETE CASCADE)
        size_t deleted = conn->execute("DELETE FROM links WHERE id = ?", {id});
        if (deleted == 0) {
            throw StoreError(ErrorKind::NotFound, "link not found: " + id);
        }
        txn.commit();

        LOG_DEBUG("LinkStore: deleted link " + id);
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "delete link");
    }
}

// =============================================================================
// Owners
// =============================================================================

void LinkStore::addOwner(const std::string& linkId, const std::string& userId) {
    try {
        auto conn = m_pool.acquire();
        db::Transaction txn(*conn);
        OwnershipStore::addOwner(*conn, linkId, userId);
        txn.commit();
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "add owner");
    }
}

void LinkStore::removeOwner(const std::string& linkId, const std::string& userId) {
    try {
        auto conn = m_pool.acquire();
        db::Transaction txn(*conn);
        OwnershipStore::removeOwner(*conn, linkId, userId);
        txn.commit();
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "remove owner");
    }
}

// =============================================================================
// Shares
// =============================================================================

void LinkStore::addShare(const std::string& linkId, const std::string& userId,
                         const std::string& sharedBy) {
    try {
        auto conn = m_pool.acquire();
        db::Transaction txn(*conn);
        OwnershipStore::addShare(*conn, linkId, userId, sharedBy);
        txn.commit();
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "add share");
    }
}

void LinkStore::removeShare(const std::string& linkId, const std::string& userId) {
    try {
        auto conn = m_pool.acquire();
        OwnershipStore::removeShare(*conn, linkId, userId);
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "remove share");
    }
}

std::vector<Share> LinkStore::listShares(const std::string& linkId) {
    try {
        auto conn = m_pool.acquire();
        return OwnershipStore::listShares(*conn, linkId);
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "list shares");
    }
}

bool LinkStore::hasShare(const std::string& linkId, const std::string& userId) {
    try {
        auto conn = m_pool.acquire();
        return OwnershipStore::hasShare(*conn, linkId, userId);
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "check share");
    }
}

// =============================================================================
// Tags
// =============================================================================

void LinkStore::setTags(const std::string& linkId, const std::vector<std::string>& tagNames) {
    try {
        auto conn = m_pool.acquire();
        db::Transaction txn(*conn);

        requireLink(*conn, linkId);

        std::set<std::string> desired;
        for (const auto& name : tagNames) {
            if (deriveTagSlug(name).empty()) {
                continue;
            }
            desired.insert(TagStore::upsert(*conn, name).id);
        }

        std::set<std::string> current;
        db::ResultSet rows = conn->query("SELECT tag_id FROM link_tags WHERE link_id = ?", {linkId});
        for (const auto& row : rows.rows) {
            current.insert(row.getText(0));
        }

        size_t added = 0;
        for (const auto& tagId : desired) {
            if (current.count(tagId)) continue;
            conn->execute("INSERT INTO link_tags (link_id, tag_id) VALUES (?, ?)", {linkId, tagId});
            ++added;
        }

        size_t removed = 0;
        for (const auto& tagId : current) {
            if (desired.count(tagId)) continue;
            conn->execute("DELETE FROM link_tags WHERE link_id = ? AND tag_id = ?", {linkId, tagId});
            ++removed;
        }

        txn.commit();
        LOG_DEBUG("LinkStore: tags of " + linkId + ": +" + std::to_string(added) +
                  " -" + std::to_string(removed));
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "set tags");
    }
}

int64_t LinkStore::countAll() {
    try {
        auto conn = m_pool.acquire();
        return conn->query("SELECT COUNT(*) FROM links").front().getInt64(0);
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "count links");
    }
}

} // namespace store
} // namespace slugline
