#pragma once

#include "db/ConnectionPool.hpp"
#include "store/Types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace slugline {
namespace store {

/**
 * @brief Keyword hosts, e.g. "jira" expanding jira/ABC-1 through a URL template
 *
 * Keywords are matched exactly; callers lowercase them first.
 */
class KeywordStore {
public:
    explicit KeywordStore(db::ConnectionPool& pool);

    /**
     * All keywords ordered by keyword
     */
    std::vector<Keyword> list();

    std::optional<Keyword> getById(const std::string& id);
    std::optional<Keyword> getByKeyword(const std::string& keyword);

    /**
     * @throws StoreError InvalidKeyword, KeywordTaken
     */
    Keyword create(const std::string& keyword,
                   const std::string& urlTemplate,
                   const std::string& description);

    /**
     * @throws StoreError InvalidKeyword, KeywordTaken, NotFound
     */
    Keyword update(const std::string& id,
                   const std::string& keyword,
                   const std::string& urlTemplate,
                   const std::string& description);

    /**
     * @throws StoreError NotFound
     */
    void remove(const std::string& id);

private:
    db::ConnectionPool& m_pool;
};

} // namespace store
} // namespace slugline
