#include "store/OwnershipStore.hpp"
#include "db/Keys.hpp"
#include "server/Logger.hpp"
#include "store/Rows.hpp"
#include "store/StoreError.hpp"

namespace slugline {
namespace store {

namespace {

bool exists(db::Connection& conn, const std::string& table, const std::string& id) {
    return !conn.query("SELECT 1 FROM " + table + " WHERE id = ?", {id}).empty();
}

void insertOwner(db::Connection& conn, const std::string& linkId,
                 const std::string& userId, bool isPrimary) {
    if (!exists(conn, "links", linkId)) {
        throw StoreError(ErrorKind::NotFound, "link not found: " + linkId);
    }
    if (!exists(conn, "users", userId)) {
        throw StoreError(ErrorKind::NotFound, "user not found: " + userId);
    }

    try {
        conn.execute("INSERT INTO link_owners (link_id, user_id, is_primary) VALUES (?, ?, ?)",
                     {linkId, userId, static_cast<int64_t>(isPrimary ? 1 : 0)});
    } catch (const db::DatabaseError& e) {
        // Concurrent writers can slip between the checks and the insert
        if (e.kind() == db::ErrorKind::UniqueViolation) {
            throw StoreError(ErrorKind::DuplicateOwner,
                "user " + userId + " already owns link " + linkId);
        }
        if (e.kind() == db::ErrorKind::ForeignKeyViolation) {
            throw StoreError(ErrorKind::NotFound, "link or user not found");
        }
        throw;
    }
}

} // anonymous namespace

OwnershipStore::OwnershipStore(db::ConnectionPool& pool) : m_pool(pool) {}

bool OwnershipStore::isOwnerOrAdmin(const std::string& userId, const std::string& linkId, Role role) {
    if (role == Role::Admin) {
        return true;
    }
    return isOwner(linkId, userId);
}

bool OwnershipStore::isOwner(const std::string& linkId, const std::string& userId) {
    try {
        auto conn = m_pool.acquire();
        return isOwner(*conn, linkId, userId);
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "check ownership");
    }
}

bool OwnershipStore::canView(const std::string& userId, const std::string& linkId, Role role) {
    try {
        auto conn = m_pool.acquire();
        db::ResultSet result = conn->query("SELECT visibility FROM links WHERE id = ?", {linkId});
        if (result.empty()) {
            return false;
        }
        Visibility visibility = visibilityFromString(result.front().getText(0));
        if (role == Role::Admin || visibility == Visibility::Public) {
            return true;
        }
        if (userId.empty()) {
            return false;
        }
        if (isOwner(*conn, linkId, userId)) {
            return true;
        }
        return visibility == Visibility::Secure && hasShare(*conn, linkId, userId);
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "check access");
    }
}

std::vector<LinkOwner> OwnershipStore::listOwners(const std::string& linkId) {
    try {
        auto conn = m_pool.acquire();
        return listOwners(*conn, linkId);
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "list owners");
    }
}

bool OwnershipStore::isOwner(db::Connection& conn, const std::string& linkId, const std::string& userId) {
    db::ResultSet result = conn.query(
        "SELECT COUNT(*) FROM link_owners WHERE link_id = ? AND user_id = ?", {linkId, userId});
    return result.front().getInt64(0) > 0;
}

std::vector<LinkOwner> OwnershipStore::listOwners(db::Connection& conn, const std::string& linkId) {
    db::ResultSet result = conn.query(
        "SELECT user_id, is_primary FROM link_owners WHERE link_id = ? "
        "ORDER BY is_primary DESC, user_id ASC",
        {linkId});

    std::vector<LinkOwner> owners;
    owners.reserve(result.size());
    for (const auto& row : result.rows) {
        owners.push_back({row.getText(0), row.getBool(1)});
    }
    return owners;
}

void OwnershipStore::addPrimaryOwner(db::Connection& conn, const std::string& linkId, const std::string& userId) {
    insertOwner(conn, linkId, userId, true);
    LOG_DEBUG("OwnershipStore: primary owner " + userId + " set on link " + linkId);
}

void OwnershipStore::addOwner(db::Connection& conn, const std::string& linkId, const std::string& userId) {
    if (isOwner(conn, linkId, userId)) {
        throw StoreError(ErrorKind::DuplicateOwner,
            "user " + userId + " already owns link " + linkId);
    }
    insertOwner(conn, linkId, userId, false);
    LOG_DEBUG("OwnershipStore: co-owner " + userId + " added to link " + linkId);
}

void OwnershipStore::removeOwner(db::Connection& conn, const std::string& linkId, const std::string& userId) {
    db::ResultSet result = conn.query(
        "SELECT is_primary FROM link_owners WHERE link_id = ? AND user_id = ?", {linkId, userId});
    if (result.empty()) {
        throw StoreError(ErrorKind::NotFound,
            "user " + userId + " is not an owner of link " + linkId);
    }
    if (result.front().getBool(0)) {
        throw StoreError(ErrorKind::PrimaryOwnerImmutable, "primary owner cannot be removed");
    }

    conn.execute("DELETE FROM link_owners WHERE link_id = ? AND user_id = ?", {linkId, userId});
    LOG_DEBUG("OwnershipStore: co-owner " + userId + " removed from link " + linkId);
}

// =============================================================================
// Shares
// =============================================================================

bool OwnershipStore::hasShare(db::Connection& conn, const std::string& linkId, const std::string& userId) {
    db::ResultSet result = conn.query(
        "SELECT COUNT(*) FROM link_shares WHERE link_id = ? AND user_id = ?", {linkId, userId});
    return result.front().getInt64(0) > 0;
}

std::vector<Share> OwnershipStore::listShares(db::Connection& conn, const std::string& linkId) {
    db::ResultSet result = conn.query(
        std::string("SELECT ") + kShareColumns + " FROM link_shares WHERE link_id = ? "
        "ORDER BY created_at ASC, user_id ASC",
        {linkId});

    std::vector<Share> shares;
    shares.reserve(result.size());
    for (const auto& row : result.rows) {
        shares.push_back(readShare(row));
    }
    return shares;
}

void OwnershipStore::addShare(db::Connection& conn, const std::string& linkId,
                              const std::string& userId, const std::string& sharedBy) {
    if (!exists(conn, "links", linkId)) {
        throw StoreError(ErrorKind::NotFound, "link not found: " + linkId);
    }
    for (const auto& id : {userId, sharedBy}) {
        if (!exists(conn, "users", id)) {
            throw StoreError(ErrorKind::NotFound, "user not found: " + id);
        }
    }
    if (hasShare(conn, linkId, userId)) {
        throw StoreError(ErrorKind::DuplicateShare,
            "link " + linkId + " is already shared with user " + userId);
    }

    try {
        conn.execute("INSERT INTO link_shares (link_id, user_id, shared_by, created_at) VALUES (?, ?, ?, ?)",
                     {linkId, userId, sharedBy, db::currentTimestamp()});
    } catch (const db::DatabaseError& e) {
        if (e.kind() == db::ErrorKind::UniqueViolation) {
            throw StoreError(ErrorKind::DuplicateShare,
                "link " + linkId + " is already shared with user " + userId);
        }
        if (e.kind() == db::ErrorKind::ForeignKeyViolation) {
            throw StoreError(ErrorKind::NotFound, "link or user not found");
        }
        throw;
    }
    LOG_DEBUG("OwnershipStore: link " + linkId + " shared with " + userId + " by " + sharedBy);
}

void OwnershipStore::removeShare(db::Connection& conn, const std::string& linkId, const std::string& userId) {
    size_t deleted = conn.execute("DELETE FROM link_shares WHERE link_id = ? AND user_id = ?", {linkId, userId});
    if (deleted == 0) {
        throw StoreError(ErrorKind::NotFound,
            "link " + linkId + " is not shared with user " + userId);
    }
    LOG_DEBUG("OwnershipStore: share of link " + linkId + " with " + userId + " removed");
}

} // namespace store
} // namespace slugline
