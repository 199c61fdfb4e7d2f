#pragma once

#include "db/ConnectionPool.hpp"
#include "store/Types.hpp"
#include <string>
#include <vector>

namespace slugline {
namespace store {

/**
 * @brief Ownership and access checks, and the link_owners/link_shares write surface
 *
 * Every link has exactly one primary owner, set at creation and never
 * transferred, plus any number of co-owners. A link can also be shared with
 * users who do not own it; a share only grants access to a secure link. The
 * static members work on a caller-provided connection so LinkStore can run
 * them inside its transactions.
 */
class OwnershipStore {
public:
    explicit OwnershipStore(db::ConnectionPool& pool);

    /**
     * @brief True for admins (no query) or when the user owns the link
     */
    bool isOwnerOrAdmin(const std::string& userId, const std::string& linkId, Role role);

    bool isOwner(const std::string& linkId, const std::string& userId);

    /**
     * @brief Whether the user may see the link through the API
     *
     * Admins and owners always can, anyone can see a public link, and a
     * secure link is also visible to users it is shared with. An empty
     * userId is an anonymous caller. False for a missing link.
     */
    bool canView(const std::string& userId, const std::string& linkId, Role role);

    /**
     * Owners of a link, primary first
     */
    std::vector<LinkOwner> listOwners(const std::string& linkId);

    static bool isOwner(db::Connection& conn, const std::string& linkId, const std::string& userId);
    static std::vector<LinkOwner> listOwners(db::Connection& conn, const std::string& linkId);

    /**
     * @throws StoreError NotFound if the link or user does not exist
     */
    static void addPrimaryOwner(db::Connection& conn, const std::string& linkId, const std::string& userId);

    /**
     * @throws StoreError DuplicateOwner, NotFound
     */
    static void addOwner(db::Connection& conn, const std::string& linkId, const std::string& userId);

    /**
     * @throws StoreError PrimaryOwnerImmutable, NotFound
     */
    static void removeOwner(db::Connection& conn, const std::string& linkId, const std::string& userId);

    static bool hasShare(db::Connection& conn, const std::string& linkId, const std::string& userId);

    /**
     * Shares of a link, oldest first
     */
    static std::vector<Share> listShares(db::Connection& conn, const std::string& linkId);

    /**
     * @throws StoreError DuplicateShare, NotFound (link, user or sharer)
     */
    static void addShare(db::Connection& conn, const std::string& linkId,
                         const std::string& userId, const std::string& sharedBy);

    /**
     * @throws StoreError NotFound if the link is not shared with the user
     */
    static void removeShare(db::Connection& conn, const std::string& linkId, const std::string& userId);

private:
    db::ConnectionPool& m_pool;
};

} // namespace store
} // namespace slugline
