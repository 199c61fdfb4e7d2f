#pragma once

#include "db/ConnectionPool.hpp"
#include "store/Types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace slugline {
namespace store {

/**
 * @brief Transactional store for links, their owners and their tags
 *
 * Every mutation runs in a single transaction on one pooled connection and
 * is committed before the call returns. Lookups that may miss return an
 * empty optional; mutations on a missing link throw StoreError (NotFound).
 *
 * Usage:
 *   LinkStore links(pool);
 *   auto link = links.create("docs", "https://example.com/docs", "Docs", "", userId);
 *   links.setTags(link.id, {"Engineering Tools", "wiki"});
 *   links.addOwner(link.id, otherUserId);
 */
class LinkStore {
public:
    explicit LinkStore(db::ConnectionPool& pool);

    /**
     * @brief Create a link owned by ownerId (as primary owner)
     *
     * The slug is lowercased and validated before any query runs.
     *
     * @throws StoreError InvalidSlug, ReservedSlug, SlugTaken, NotFound (owner)
     */
    Link create(const std::string& slug,
                const std::string& url,
                const std::string& title,
                const std::string& description,
                const std::string& ownerId,
                Visibility visibility = Visibility::Public);

    /**
     * Case-insensitive lookup, with owners and tags
     */
    std::optional<Link> getBySlug(const std::string& slug);

    std::optional<Link> getById(const std::string& id);

    /**
     * Links the user owns or co-owns, most recently updated first
     */
    std::vector<Link> listByOwner(const std::string& userId);

    /**
     * All links ordered by slug
     */
    std::vector<Link> listAll();

    /**
     * Links the user owns or has been given a share of, ordered by slug
     */
    std::vector<Link> listByOwnerOrShared(const std::string& userId);

    /**
     * Links shared with the user, ordered by slug
     */
    std::vector<Link> listSharedWithUser(const std::string& userId);

    /**
     * Links carrying the tag with the given slug, ordered by slug
     */
    std::vector<Link> listByTag(const std::string& tagSlug);

    /**
     * Tags of a link ordered by name
     */
    std::vector<Tag> listTags(const std::string& linkId);

    /**
     * @brief Replace url, title and description; the slug never changes
     * @param visibility New visibility, or nullopt to keep the current one
     * @throws StoreError NotFound
     */
    Link update(const std::string& id,
                const std::string& url,
                const std::string& title,
                const std::string& description,
                std::optional<Visibility> visibility = std::nullopt);

    /**
     * @throws StoreError NotFound
     */
    void updateVisibility(const std::string& id, Visibility visibility);

    /**
     * @brief Delete a link together with its owners, tag links and clicks
     * @throws StoreError NotFound
     */
    void remove(const std::string& id);

    /**
     * @throws StoreError DuplicateOwner, NotFound
     */
    void addOwner(const std::string& linkId, const std::string& userId);

    /**
     * @throws StoreError PrimaryOwnerImmutable, NotFound
     */
    void removeOwner(const std::string& linkId, const std::string& userId);

    /**
     * @brief Share a link with a user who does not need to own it
     * @param sharedBy User granting the share
     * @throws StoreError DuplicateShare, NotFound
     */
    void addShare(const std::string& linkId, const std::string& userId, const std::string& sharedBy);

    /**
     * @throws StoreError NotFound if the link is not shared with the user
     */
    void removeShare(const std::string& linkId, const std::string& userId);

    /**
     * Shares of a link, oldest first
     */
    std::vector<Share> listShares(const std::string& linkId);

    bool hasShare(const std::string& linkId, const std::string& userId);

    /**
     * @brief Make the link's tag set exactly the given names
     *
     * Names that derive to an empty slug are ignored and names deriving to the
     * same slug collapse. Calling it twice with the same names is a no-op.
     *
     * @throws StoreError NotFound
     */
    void setTags(const std::string& linkId, const std::vector<std::string>& tagNames);

    int64_t countAll();

private:
    std::optional<Link> findOne(db::Connection& conn, const std::string& where, const std::string& value);
    std::vector<Link> findMany(db::Connection& conn, const std::string& sql, const db::Params& params);
    void hydrate(db::Connection& conn, Link& link);

    static std::vector<Tag> loadTags(db::Connection& conn, const std::string& linkId);
    static void requireLink(db::Connection& conn, const std::string& linkId);

    db::ConnectionPool& m_pool;
};

} // namespace store
} // namespace slugline
