#include "store/ClickStore.hpp"
#include "db/Keys.hpp"
#include "store/StoreError.hpp"
#include <openssl/sha.h>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace slugline {
namespace store {

ClickStore::ClickStore(db::ConnectionPool& pool) : m_pool(pool) {}

std::string ClickStore::truncateUtf8(const std::string& value, size_t maxBytes) {
    if (value.size() <= maxBytes) {
        return value;
    }
    size_t end = maxBytes;
    // Back off continuation bytes (10xxxxxx) so a code point is never split
    while (end > 0 && (static_cast<unsigned char>(value[end]) & 0xC0) == 0x80) {
        --end;
    }
    return value.substr(0, end);
}

void ClickStore::recordClick(const ClickEvent& event) {
    try {
        auto conn = m_pool.acquire();
        conn->execute(
            "INSERT INTO link_clicks (id, link_id, user_id, ip_hash, user_agent, referrer, clicked_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?)",
            {db::newId(),
             event.linkId,
             db::optionalParam(event.userId),
             event.ipHash,
             truncateUtf8(event.userAgent, kMaxUserAgentBytes),
             truncateUtf8(event.referrer, kMaxReferrerBytes),
             db::currentTimestamp()});
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "record click");
    }
}

int64_t ClickStore::countForLink(const std::string& linkId) {
    try {
        auto conn = m_pool.acquire();
        return conn->query("SELECT COUNT(*) FROM link_clicks WHERE link_id = ?", {linkId})
            .front().getInt64(0);
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "count clicks");
    }
}

std::vector<RecentClick> ClickStore::listRecent(const std::string& linkId, int64_t limit) {
    if (limit <= 0) {
        return {};
    }
    try {
        auto conn = m_pool.acquire();
        db::ResultSet result = conn->query(
            "SELECT c.clicked_at, COALESCE(c.referrer, ''), COALESCE(c.user_id, ''), "
            "COALESCE(u.display_name, '') "
            "FROM link_clicks c "
            "LEFT JOIN users u ON u.id = c.user_id "
            "WHERE c.link_id = ? "
            "ORDER BY c.clicked_at DESC, c.id DESC "
            "LIMIT ?",
            {linkId, limit});

        std::vector<RecentClick> clicks;
        clicks.reserve(result.size());
        for (const auto& row : result.rows) {
            clicks.push_back({row.getText(0), row.getText(1), row.getText(2), row.getText(3)});
        }
        return clicks;
    } catch (const db::DatabaseError& e) {
        throw fromDatabaseError(e, "list recent clicks");
    }
}

std::string ClickStore::hashIp(const std::string& ip) {
    return hashIp(ip, std::chrono::system_clock::now());
}

std::string ClickStore::hashIp(const std::string& ip, std::chrono::system_clock::time_point now) {
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream salted;
    salted << ip << ':' << std::put_time(&utc, "%Y%m%d");
    std::string input = salted.str();

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash);

    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned char byte : hash) {
        hex << std::setw(2) << static_cast<int>(byte);
    }
    return hex.str();
}

} // namespace store
} // namespace slugline
