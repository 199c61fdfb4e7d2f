#pragma once

#include "db/ConnectionPool.hpp"
#include "store/Types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace slugline {
namespace store {

/**
 * @brief Tag taxonomy, keyed by derived slug
 *
 * Tags are never deleted here, even when no link carries them anymore.
 */
class TagStore {
public:
    explicit TagStore(db::ConnectionPool& pool);

    /**
     * @brief Create the tag if its slug is new, then return the stored row
     *
     * The first creator's display name wins; later upserts with a different
     * spelling of the same slug return the existing tag unchanged.
     *
     * @throws StoreError InvalidTag if the derived slug is empty
     */
    Tag upsert(const std::string& name);

    /**
     * @brief Same as upsert() on a caller-provided connection, so it can
     * take part in the caller's transaction
     */
    static Tag upsert(db::Connection& conn, const std::string& name);

    std::optional<Tag> getBySlug(const std::string& slug);

    /**
     * All tags ordered by name
     */
    std::vector<Tag> list();

    /**
     * Tags carried by at least one link, with their link count, ordered by name
     */
    std::vector<TagCount> listWithCounts();

    /**
     * Tags whose slug starts with the derived slug of prefix, ordered by slug
     */
    std::vector<Tag> suggest(const std::string& prefix, size_t limit = 10);

private:
    db::ConnectionPool& m_pool;
};

} // namespace store
} // namespace slugline
