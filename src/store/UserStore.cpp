#include "store/UserStore.hpp"
#include "db/Keys.hpp"
#include "server/Logger.hpp"
#include "store/Rows.hpp"
#include "store/SlugValidator.hpp"
#include "store/StoreError.hpp"

namespace slugline {
namespace store {

namespace {

std::optional<User> findUser(db::Connection& conn, const std::string& where, const db::Params& params) {
    db::ResultSet result = conn.query(
        std::string("SELECT ") + kUserColumns + " FROM users WHERE " + where, params);
    if (result.empty()) {
        return std::nullopt;
    }
    return readUser(result.front());
}

} // anonymous namespace

UserStore::UserStore(db::ConnectionPool& pool) : m_pool(pool) {}

std::string UserStore::resolveUniqueSlug(db::Connection& conn,
                                         const std::string& displayName,
                                         const std::string& excludeUserId) {
    std::string base = deriveDisplayNameSlug(displayName);
    if (base.empty()) {
        base = "user";
    }

    std::string candidate = base;
    for (int suffix = 2; ; ++suffix) {
        db::ResultSet result = conn.query(
            "SELECT COUNT(*) FROM users WHERE display_name_slug = ? AND id <> ?",
            {candidate, excludeUserId});
        if (result.front().getInt64(0) == 0) {
            return candidate;
        }
        candidate = base + "-" + std::to_string(suffix);
    }
}

User UserStore::upsert(const std::string& provider,
                       const std::string& subject,
                       const std::string& email,
                       const std::string& displayName,
                       Role role) {
    try {
        auto conn = m_pool.acquire();
        db::Transaction txn(*conn);

        auto existing = findUser(*conn, "provider = ? AND subject = ?", {provider, subject});
        std::string slug = resolveUniqueSlug(*conn, displayName, existing ? existing->id : "");
        std::string now = db::currentTimestamp();

        if (conn->dialect() == db::Dialect::MySQL) {
            // No ON CONFLICT ... DO UPDATE on MySQL
            if (existing) {
                conn->execute(
                    "UPDATE users SET email = ?, display_name = ?, display_name_slug = ?, "
                    "role = ?, updated_at = ? WHERE provider = ? AND subject = ?",
                    {email, displayName, slug, roleToString(role), now, provider, subject});
            } else {
                conn->execute(
                    "INSERT INTO users (id, provider, subject, email, display_name, "
                    "display_name_slug, role, created_at, updated_at) "
                    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)",
                    {db::newId(), provider, subject, email, displayName, slug,
                     roleToString(role), now, now});
            }
        } else {
            conn->execute(
                "INSERT INTO users (id, provider, subject, email, display_name, "
                "display_name_slug, role, created_at, updated_at) "
                "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
                "ON CONFLICT (provider, subject) DO UPDATE SET "
                "email = excluded.email, "
                "display_name = excluded.display_name, "
                "display_name_slug = excluded.display_name_slug, "
                "role = excluded.role, "
                "updated_at = excluded.updated_at",
                {db::newId(), provider, subject, email, displayName, slug,
                 roleToString(role), now, now});
        }

        auto user = findUser(*conn, "provider = ? AND subject = ?", {provider, subject});
        if (!user) {
            throw StoreError(ErrorKind::Storage, "user vanished after upsert: " + provider + "/" + subject);
        }
        txn.commit();

        LOG_DEBUG("UserStore: upserted user " + user->id + " (" + user->displayNameSlug + ")");
        return *user;
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "upsert user");
    }
}

std::optional<User> UserStore::getById(const std::string& id) {
    try {
        auto conn = m_pool.acquire();
        return findUser(*conn, "id = ?", {id});
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "get user");
    }
}

std::optional<User> UserStore::getByDisplayNameSlug(const std::string& slug) {
    try {
        auto conn = m_pool.acquire();
        return findUser(*conn, "display_name_slug = ?", {slug});
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "get user by slug");
    }
}

std::vector<User> UserStore::listAll() {
    try {
        auto conn = m_pool.acquire();
        db::ResultSet result = conn->query(
            std::string("SELECT ") + kUserColumns + " FROM users ORDER BY display_name ASC, id ASC");

        std::vector<User> users;
        users.reserve(result.size());
        for (const auto& row : result.rows) {
            users.push_back(readUser(row));
        }
        return users;
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "list users");
    }
}

User UserStore::updateRole(const std::string& id, Role role) {
    try {
        auto conn = m_pool.acquire();
        db::Transaction txn(*conn);

        if (!findUser(*conn, "id = ?", {id})) {
            throw StoreError(ErrorKind::NotFound, "user not found: " + id);
        }
        conn->execute("UPDATE users SET role = ?, updated_at = ? WHERE id = ?",
                      {roleToString(role), db::currentTimestamp(), id});

        auto user = findUser(*conn, "id = ?", {id});
        txn.commit();

        LOG_DEBUG("UserStore: role of " + id + " set to " + roleToString(role));
        return *user;
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "update role");
    }
}

int64_t UserStore::countAll() {
    try {
        auto conn = m_pool.acquire();
        return conn->query("SELECT COUNT(*) FROM users").front().getInt64(0);
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "count users");
    }
}

} // namespace store
} // namespace slugline
