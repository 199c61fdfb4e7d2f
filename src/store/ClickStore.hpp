#pragma once

#include "db/ConnectionPool.hpp"
#include "events/ClickRecorder.hpp"
#include "store/Types.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace slugline {
namespace store {

/**
 * @brief Append-only storage of link visits
 */
class ClickStore : public events::ClickRecorder {
public:
    static constexpr size_t kMaxUserAgentBytes = 512;
    static constexpr size_t kMaxReferrerBytes = 2048;

    explicit ClickStore(db::ConnectionPool& pool);

    /**
     * @brief Insert one click row with a fresh id and the current time
     *
     * User agent and referrer are truncated to their byte limits without
     * splitting a UTF-8 sequence.
     *
     * @throws StoreError Transient or Storage
     */
    void recordClick(const ClickEvent& event) override;

    /**
     * Raw number of recorded clicks for a link
     */
    int64_t countForLink(const std::string& linkId);

    /**
     * @brief Newest clicks of a link first, with the visitor's display name
     *
     * Anonymous visits and visits by deleted users have an empty userId and
     * displayName. A non-positive limit returns nothing.
     */
    std::vector<RecentClick> listRecent(const std::string& linkId, int64_t limit);

    /**
     * @brief Hex SHA-256 of ip + ":" + YYYYMMDD (UTC day of now)
     *
     * The daily salt makes hashes unlinkable across days.
     */
    static std::string hashIp(const std::string& ip);
    static std::string hashIp(const std::string& ip, std::chrono::system_clock::time_point now);

    /**
     * Longest prefix of value within maxBytes that ends on a UTF-8 boundary
     */
    static std::string truncateUtf8(const std::string& value, size_t maxBytes);

private:
    db::ConnectionPool& m_pool;
};

} // namespace store
} // namespace slugline
