#pragma once

#include "db/ConnectionPool.hpp"
#include "store/Types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace slugline {
namespace store {

/**
 * @brief Local user records, created or refreshed on every login
 */
class UserStore {
public:
    explicit UserStore(db::ConnectionPool& pool);

    /**
     * @brief Create the user identified by (provider, subject) or refresh it
     *
     * Email, display name, display name slug and role are overwritten on
     * every call. The slug is derived from the display name and suffixed
     * with -2, -3... when another user already holds it.
     */
    User upsert(const std::string& provider,
                const std::string& subject,
                const std::string& email,
                const std::string& displayName,
                Role role);

    std::optional<User> getById(const std::string& id);
    std::optional<User> getByDisplayNameSlug(const std::string& slug);

    /**
     * All users ordered by display name
     */
    std::vector<User> listAll();

    /**
     * @throws StoreError NotFound
     */
    User updateRole(const std::string& id, Role role);

    int64_t countAll();

private:
    static std::string resolveUniqueSlug(db::Connection& conn,
                                         const std::string& displayName,
                                         const std::string& excludeUserId);

    db::ConnectionPool& m_pool;
};

} // namespace store
} // namespace slugline
