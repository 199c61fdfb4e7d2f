#include <catch2/catch_test_macros.hpp>
#include "store/ClickStore.hpp"
#include "store/LinkStore.hpp"
#include "store/StoreError.hpp"
#include "TestSupport.hpp"

using namespace slugline::store;

TEST_CASE("recordClick stores one row per event", "[ClickStore]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    ClickStore clicks(fixture.pool());
    std::string owner = fixture.createUser("alice");
    Link link = links.create("docs", "https://example.com", "", "", owner);

    ClickEvent anonymous{link.id, std::nullopt, ClickStore::hashIp("203.0.113.7"), "curl/8", ""};
    ClickEvent known{link.id, owner, ClickStore::hashIp("203.0.113.8"), "Firefox", "https://ref"};
    clicks.recordClick(anonymous);
    clicks.recordClick(known);

    REQUIRE(clicks.countForLink(link.id) == 2);

    auto conn = fixture.pool().acquire();
    auto rows = conn->query("SELECT user_id, ip_hash, user_agent, referrer FROM link_clicks "
                            "WHERE link_id = ? ORDER BY user_agent", {link.id});
    REQUIRE(rows.size() == 2);
    REQUIRE(rows.rows[0].getText(2) == "Firefox");
    REQUIRE(rows.rows[0].getText(0) == owner);
    REQUIRE(rows.rows[0].getText(3) == "https://ref");
    REQUIRE(rows.rows[1].isNull(0));
    REQUIRE(rows.rows[1].getText(1).size() == 64);
}

TEST_CASE("recordClick for an unknown link fails as storage error", "[ClickStore]") {
    StoreFixture fixture;
    ClickStore clicks(fixture.pool());

    ClickEvent event{"missing", std::nullopt, "h", "", ""};
    try {
        clicks.recordClick(event);
        FAIL("expected a StoreError");
    } catch (const StoreError& e) {
        REQUIRE(e.kind() == ErrorKind::Storage);
    }
}

TEST_CASE("hashIp is a daily salted SHA-256", "[ClickStore]") {
    using namespace std::chrono;
    auto day1 = system_clock::time_point(seconds(1700000000));   // 2023-11-14
    auto sameDay = day1 + hours(1);
    auto day2 = day1 + hours(24);

    std::string hash = ClickStore::hashIp("198.51.100.1", day1);
    REQUIRE(hash.size() == 64);
    REQUIRE(hash.find_first_not_of("0123456789abcdef") == std::string::npos);
    REQUIRE(ClickStore::hashIp("198.51.100.1", sameDay) == hash);
    REQUIRE(ClickStore::hashIp("198.51.100.1", day2) != hash);
    REQUIRE(ClickStore::hashIp("198.51.100.2", day1) != hash);
}

TEST_CASE("truncateUtf8 never splits a code point", "[ClickStore]") {
    REQUIRE(ClickStore::truncateUtf8("short", 10) == "short");
    REQUIRE(ClickStore::truncateUtf8("abcdef", 3) == "abc");

    // "é" is two bytes (C3 A9)
    std::string accented = "ab\xC3\xA9";
    REQUIRE(ClickStore::truncateUtf8(accented, 3) == "ab");
    REQUIRE(ClickStore::truncateUtf8(accented, 4) == accented);

    // U+1F600 is four bytes
    std::string emoji = "\xF0\x9F\x98\x80x";
    REQUIRE(ClickStore::truncateUtf8(emoji, 2).empty());
    REQUIRE(ClickStore::truncateUtf8(emoji, 4) == "\xF0\x9F\x98\x80");
}

TEST_CASE("Long user agents are truncated on insert", "[ClickStore]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    ClickStore clicks(fixture.pool());
    std::string owner = fixture.createUser("alice");
    Link link = links.create("docs", "https://example.com", "", "", owner);

    ClickEvent event{link.id, std::nullopt, "h", std::string(2000, 'a'), std::string(5000, 'r')};
    clicks.recordClick(event);

    auto conn = fixture.pool().acquire();
    auto row = conn->query("SELECT user_agent, referrer FROM link_clicks").front();
    REQUIRE(row.getText(0).size() == ClickStore::kMaxUserAgentBytes);
    REQUIRE(row.getText(1).size() == ClickStore::kMaxReferrerBytes);
}

TEST_CASE("listRecent returns the newest clicks with display names", "[ClickStore]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    ClickStore clicks(fixture.pool());
    std::string alice = fixture.createUser("Alice Smith");
    std::string bob = fixture.createUser("bob");
    Link link = links.create("docs", "https://example.com", "", "", alice);
    Link other = links.create("other", "https://example.com/other", "", "", alice);

    {
        auto conn = fixture.pool().acquire();
        const char* insert =
            "INSERT INTO link_clicks (id, link_id, user_id, ip_hash, user_agent, referrer, clicked_at) "
            "VALUES (?, ?, ?, 'h', 'ua', ?, ?)";
        conn->execute(insert, {std::string("c1"), link.id, alice, std::string("https://a"),
                               std::string("2024-05-01T10:00:00.000Z")});
        conn->execute(insert, {std::string("c2"), link.id, nullptr, nullptr,
                               std::string("2024-05-01T11:00:00.000Z")});
        conn->execute(insert, {std::string("c3"), link.id, bob, std::string(""),
                               std::string("2024-05-01T12:00:00.000Z")});
        conn->execute(insert, {std::string("c4"), other.id, bob, nullptr,
                               std::string("2024-05-01T13:00:00.000Z")});
        conn->execute("DELETE FROM users WHERE id = ?", {bob});
    }

    auto recent = clicks.listRecent(link.id, 10);
    REQUIRE(recent.size() == 3);

    // Deleting bob nulled his clicks
    REQUIRE(recent[0].clickedAt == "2024-05-01T12:00:00.000Z");
    REQUIRE(recent[0].userId.empty());
    REQUIRE(recent[0].displayName.empty());

    REQUIRE(recent[1].clickedAt == "2024-05-01T11:00:00.000Z");
    REQUIRE(recent[1].referrer.empty());
    REQUIRE(recent[1].userId.empty());

    REQUIRE(recent[2].userId == alice);
    REQUIRE(recent[2].displayName == "Alice Smith");
    REQUIRE(recent[2].referrer == "https://a");

    auto newest = clicks.listRecent(link.id, 1);
    REQUIRE(newest.size() == 1);
    REQUIRE(newest[0].clickedAt == "2024-05-01T12:00:00.000Z");

    REQUIRE(clicks.listRecent(link.id, 0).empty());
    REQUIRE(clicks.listRecent("missing", 5).empty());
}
