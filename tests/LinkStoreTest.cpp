#include <catch2/catch_test_macros.hpp>
#include "store/LinkStore.hpp"
#include "store/StoreError.hpp"
#include "TestSupport.hpp"
#include <algorithm>
#include <atomic>
#include <functional>
#include <thread>

using namespace slugline;
using namespace slugline::store;

namespace {

ErrorKind errorOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const StoreError& e) {
        return e.kind();
    }
    FAIL("no StoreError thrown");
    return ErrorKind::Storage;
}

int64_t countRows(db::ConnectionPool& pool, const std::string& sql, const std::string& param) {
    auto conn = pool.acquire();
    return conn->query(sql, {param}).front().getInt64(0);
}

std::vector<std::string> tagSlugs(const Link& link) {
    std::vector<std::string> slugs;
    for (const auto& tag : link.tags) slugs.push_back(tag.slug);
    std::sort(slugs.begin(), slugs.end());
    return slugs;
}

} // anonymous namespace

// =============================================================================
// Create / read
// =============================================================================

TEST_CASE("Create and retrieve link", "[LinkStore][CRUD]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    std::string owner = fixture.createUser("alice");

    Link created = links.create("Docs", "https://example.com/docs", "Docs", "Team docs", owner);
    REQUIRE(created.slug == "docs");
    REQUIRE(created.id.size() == 36);
    REQUIRE_FALSE(created.createdAt.empty());
    REQUIRE(created.createdAt == created.updatedAt);
    REQUIRE(created.primaryOwnerId() == owner);

    auto bySlug = links.getBySlug("DOCS");
    REQUIRE(bySlug.has_value());
    REQUIRE(bySlug->id == created.id);
    REQUIRE(bySlug->url == "https://example.com/docs");
    REQUIRE(bySlug->title == "Docs");
    REQUIRE(bySlug->description == "Team docs");
    REQUIRE(bySlug->owners.size() == 1);
    REQUIRE(bySlug->owners[0].isPrimary);

    auto byId = links.getById(created.id);
    REQUIRE(byId.has_value());
    REQUIRE(byId->slug == "docs");
}

TEST_CASE("Missing links read as empty", "[LinkStore][CRUD]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());

    REQUIRE_FALSE(links.getBySlug("nope").has_value());
    REQUIRE_FALSE(links.getById("00000000-0000-0000-0000-000000000000").has_value());
}

TEST_CASE("Create rejects invalid and reserved slugs before touching the database", "[LinkStore][Validation]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    std::string owner = fixture.createUser("alice");

    REQUIRE(errorOf([&] { links.create("-bad", "https://x", "", "", owner); }) == ErrorKind::InvalidSlug);
    REQUIRE(errorOf([&] { links.create("Admin", "https://x", "", "", owner); }) == ErrorKind::ReservedSlug);
    REQUIRE(errorOf([&] { links.create(std::string(300, 'a'), "https://x", "", "", owner); }) == ErrorKind::InvalidSlug);
    REQUIRE(links.countAll() == 0);
}

TEST_CASE("Duplicate slug in any case is taken", "[LinkStore][Validation]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    std::string owner = fixture.createUser("alice");

    links.create("docs", "https://example.com/1", "", "", owner);
    REQUIRE(errorOf([&] { links.create("DOCS", "https://example.com/2", "", "", owner); }) == ErrorKind::SlugTaken);
    REQUIRE(links.countAll() == 1);
}

TEST_CASE("Create with an unknown owner leaves no link behind", "[LinkStore][Validation]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());

    REQUIRE(errorOf([&] { links.create("docs", "https://x", "", "", "no-such-user"); }) == ErrorKind::NotFound);
    REQUIRE_FALSE(links.getBySlug("docs").has_value());
}

TEST_CASE("Concurrent creates of one slug succeed exactly once", "[LinkStore][Concurrency]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    std::string owner = fixture.createUser("alice");

    std::atomic<int> created{0};
    std::atomic<int> taken{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&]() {
            try {
                links.create("race", "https://example.com", "", "", owner);
                ++created;
            } catch (const StoreError& e) {
                if (e.kind() == ErrorKind::SlugTaken) ++taken;
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(created == 1);
    REQUIRE(taken == 3);
}

// =============================================================================
// Update / delete
// =============================================================================

TEST_CASE("Update changes fields and bumps updated_at", "[LinkStore][CRUD]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    std::string owner = fixture.createUser("alice");

    Link link = links.create("docs", "https://example.com/old", "Old", "", owner);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    Link updated = links.update(link.id, "https://example.com/new", "New", "desc");
    REQUIRE(updated.slug == "docs");
    REQUIRE(updated.url == "https://example.com/new");
    REQUIRE(updated.title == "New");
    REQUIRE(updated.description == "desc");
    REQUIRE(updated.createdAt == link.createdAt);
    REQUIRE(updated.updatedAt > link.updatedAt);
}

TEST_CASE("Update of a missing link is NotFound", "[LinkStore][CRUD]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());

    REQUIRE(errorOf([&] { links.update("missing", "https://x", "", ""); }) == ErrorKind::NotFound);
}

TEST_CASE("Remove cascades to owners and tags", "[LinkStore][CRUD]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    std::string owner = fixture.createUser("alice");
    std::string other = fixture.createUser("bob");

    Link link = links.create("docs", "https://example.com", "", "", owner);
    links.addOwner(link.id, other);
    links.setTags(link.id, {"wiki", "docs"});

    links.remove(link.id);

    REQUIRE_FALSE(links.getById(link.id).has_value());
    REQUIRE(countRows(fixture.pool(), "SELECT COUNT(*) FROM link_owners WHERE link_id = ?", link.id) == 0);
    REQUIRE(countRows(fixture.pool(), "SELECT COUNT(*) FROM link_tags WHERE link_id = ?", link.id) == 0);
    REQUIRE(errorOf([&] { links.remove(link.id); }) == ErrorKind::NotFound);
}

// =============================================================================
// Visibility
// =============================================================================

TEST_CASE("Links are public unless created otherwise", "[LinkStore][Visibility]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    std::string owner = fixture.createUser("alice");

    REQUIRE(links.create("docs", "https://example.com", "", "", owner).visibility == Visibility::Public);
    Link secret = links.create("secret", "https://example.com/s", "", "", owner, Visibility::Secure);
    REQUIRE(secret.visibility == Visibility::Secure);
    REQUIRE(links.getBySlug("docs")->visibility == Visibility::Public);
    REQUIRE(links.getById(secret.id)->visibility == Visibility::Secure);
}

TEST_CASE("Update keeps or replaces the visibility", "[LinkStore][Visibility]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    std::string owner = fixture.createUser("alice");
    Link link = links.create("docs", "https://example.com", "", "", owner, Visibility::Private);

    REQUIRE(links.update(link.id, "https://example.com/1", "", "").visibility == Visibility::Private);
    REQUIRE(links.update(link.id, "https://example.com/2", "", "", Visibility::Secure).visibility ==
            Visibility::Secure);

    links.updateVisibility(link.id, Visibility::Public);
    REQUIRE(links.getById(link.id)->visibility == Visibility::Public);
    REQUIRE(errorOf([&] { links.updateVisibility("missing", Visibility::Private); }) == ErrorKind::NotFound);
}

TEST_CASE("Visibility names round through their strings", "[LinkStore][Visibility]") {
    for (Visibility v : {Visibility::Public, Visibility::Private, Visibility::Secure}) {
        REQUIRE(visibilityFromString(visibilityToString(v)) == v);
    }
    REQUIRE(visibilityToString(Visibility::Secure) == "secure");
    REQUIRE(errorOf([] { visibilityFromString("Public"); }) == ErrorKind::InvalidVisibility);
    REQUIRE(errorOf([] { visibilityFromString("hidden"); }) == ErrorKind::InvalidVisibility);
    REQUIRE(StoreError(ErrorKind::InvalidVisibility, "").isValidation());
}

// =============================================================================
// Shares
// =============================================================================

TEST_CASE("Shares can be added, listed and removed", "[LinkStore][Shares]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    std::string owner = fixture.createUser("alice");
    std::string bob = fixture.createUser("bob");
    std::string carol = fixture.createUser("carol");
    Link link = links.create("docs", "https://example.com", "", "", owner, Visibility::Secure);

    REQUIRE_FALSE(links.hasShare(link.id, bob));
    links.addShare(link.id, bob, owner);
    links.addShare(link.id, carol, owner);
    REQUIRE(links.hasShare(link.id, bob));

    auto shares = links.listShares(link.id);
    REQUIRE(shares.size() == 2);
    for (const auto& share : shares) {
        REQUIRE(share.linkId == link.id);
        REQUIRE(share.sharedBy == owner);
        REQUIRE_FALSE(share.createdAt.empty());
    }

    REQUIRE(errorOf([&] { links.addShare(link.id, bob, owner); }) == ErrorKind::DuplicateShare);

    links.removeShare(link.id, bob);
    REQUIRE_FALSE(links.hasShare(link.id, bob));
    REQUIRE(links.listShares(link.id).size() == 1);
    REQUIRE(errorOf([&] { links.removeShare(link.id, bob); }) == ErrorKind::NotFound);

    // Sharing grants access, not ownership
    REQUIRE(links.getById(link.id)->owners.size() == 1);
}

TEST_CASE("Share changes on missing entities are NotFound", "[LinkStore][Shares]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    std::string owner = fixture.createUser("alice");
    Link link = links.create("docs", "https://example.com", "", "", owner);

    REQUIRE(errorOf([&] { links.addShare("missing", owner, owner); }) == ErrorKind::NotFound);
    REQUIRE(errorOf([&] { links.addShare(link.id, "nobody", owner); }) == ErrorKind::NotFound);
    REQUIRE(errorOf([&] { links.addShare(link.id, owner, "nobody"); }) == ErrorKind::NotFound);
    REQUIRE(links.listShares(link.id).empty());
}

TEST_CASE("Removing a link removes its shares", "[LinkStore][Shares]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    std::string owner = fixture.createUser("alice");
    std::string bob = fixture.createUser("bob");
    Link link = links.create("docs", "https://example.com", "", "", owner);
    links.addShare(link.id, bob, owner);

    links.remove(link.id);
    REQUIRE(countRows(fixture.pool(), "SELECT COUNT(*) FROM link_shares WHERE link_id = ?", link.id) == 0);
}

TEST_CASE("listByOwnerOrShared and listSharedWithUser", "[LinkStore][Shares]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    std::string alice = fixture.createUser("alice");
    std::string bob = fixture.createUser("bob");

    Link owned = links.create("zeta", "https://example.com/z", "", "", bob);
    Link both = links.create("beta", "https://example.com/b", "", "", alice);
    Link shared = links.create("alpha", "https://example.com/a", "", "", alice, Visibility::Secure);
    links.create("gamma", "https://example.com/g", "", "", alice);

    links.addOwner(both.id, bob);
    links.addShare(both.id, bob, alice);
    links.addShare(shared.id, bob, alice);

    // Owned and shared at once is listed once
    auto visible = links.listByOwnerOrShared(bob);
    REQUIRE(visible.size() == 3);
    REQUIRE(visible[0].slug == "alpha");
    REQUIRE(visible[1].slug == "beta");
    REQUIRE(visible[2].slug == "zeta");
    REQUIRE(visible[0].visibility == Visibility::Secure);

    auto sharedWithBob = links.listSharedWithUser(bob);
    REQUIRE(sharedWithBob.size() == 2);
    REQUIRE(sharedWithBob[0].slug == "alpha");
    REQUIRE(sharedWithBob[1].slug == "beta");

    REQUIRE(links.listSharedWithUser(alice).empty());
    REQUIRE(links.listByOwnerOrShared("nobody").empty());
}

// =============================================================================
// Owners
// =============================================================================

TEST_CASE("Co-owners can be added and removed", "[LinkStore][Owners]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    std::string owner = fixture.createUser("alice");
    std::string other = fixture.createUser("bob");

    Link link = links.create("docs", "https://example.com", "", "", owner);
    links.addOwner(link.id, other);

    auto withCoOwner = links.getById(link.id);
    REQUIRE(withCoOwner->owners.size() == 2);
    REQUIRE(withCoOwner->owners[0].userId == owner);
    REQUIRE(withCoOwner->owners[0].isPrimary);
    REQUIRE(withCoOwner->owners[1].userId == other);
    REQUIRE_FALSE(withCoOwner->owners[1].isPrimary);

    REQUIRE(errorOf([&] { links.addOwner(link.id, other); }) == ErrorKind::DuplicateOwner);

    links.removeOwner(link.id, other);
    REQUIRE(links.getById(link.id)->owners.size() == 1);
    REQUIRE(errorOf([&] { links.removeOwner(link.id, other); }) == ErrorKind::NotFound);
}

TEST_CASE("Primary owner cannot be removed", "[LinkStore][Owners]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    std::string owner = fixture.createUser("alice");

    Link link = links.create("docs", "https://example.com", "", "", owner);
    REQUIRE(errorOf([&] { links.removeOwner(link.id, owner); }) == ErrorKind::PrimaryOwnerImmutable);
    REQUIRE(links.getById(link.id)->primaryOwnerId() == owner);
}

TEST_CASE("Owner changes on missing entities are NotFound", "[LinkStore][Owners]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    std::string owner = fixture.createUser("alice");
    Link link = links.create("docs", "https://example.com", "", "", owner);

    REQUIRE(errorOf([&] { links.addOwner("missing", owner); }) == ErrorKind::NotFound);
    REQUIRE(errorOf([&] { links.addOwner(link.id, "missing"); }) == ErrorKind::NotFound);
}

TEST_CASE("listByOwner includes primary and co-owned links", "[LinkStore][Owners]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    std::string alice = fixture.createUser("alice");
    std::string bob = fixture.createUser("bob");

    links.create("mine", "https://example.com/1", "", "", alice);
    Link shared = links.create("shared", "https://example.com/2", "", "", bob);
    links.create("theirs", "https://example.com/3", "", "", bob);
    links.addOwner(shared.id, alice);

    auto owned = links.listByOwner(alice);
    REQUIRE(owned.size() == 2);
    std::vector<std::string> slugs = {owned[0].slug, owned[1].slug};
    std::sort(slugs.begin(), slugs.end());
    REQUIRE(slugs == std::vector<std::string>{"mine", "shared"});
    REQUIRE(links.listByOwner(fixture.createUser("carol")).empty());
}

// =============================================================================
// Tags
// =============================================================================

TEST_CASE("setTags replaces the tag set", "[LinkStore][Tags]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    std::string owner = fixture.createUser("alice");
    Link link = links.create("docs", "https://example.com", "", "", owner);

    links.setTags(link.id, {"a", "b"});
    links.setTags(link.id, {"a", "b"});
    REQUIRE(tagSlugs(*links.getById(link.id)) == std::vector<std::string>{"a", "b"});
    REQUIRE(countRows(fixture.pool(), "SELECT COUNT(*) FROM link_tags WHERE link_id = ?", link.id) == 2);

    links.setTags(link.id, {"B", "c", "  "});
    REQUIRE(tagSlugs(*links.getById(link.id)) == std::vector<std::string>{"b", "c"});

    links.setTags(link.id, {});
    REQUIRE(links.listTags(link.id).empty());
}

TEST_CASE("setTags on a missing link is NotFound", "[LinkStore][Tags]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());

    REQUIRE(errorOf([&] { links.setTags("missing", {"a"}); }) == ErrorKind::NotFound);
}

TEST_CASE("listByTag and listAll", "[LinkStore][Tags]") {
    StoreFixture fixture;
    LinkStore links(fixture.pool());
    std::string owner = fixture.createUser("alice");

    Link b = links.create("b-link", "https://example.com/b", "", "", owner);
    Link a = links.create("a-link", "https://example.com/a", "", "", owner);
    links.setTags(a.id, {"Wiki"});
    links.setTags(b.id, {"wiki", "other"});

    auto tagged = links.listByTag("wiki");
    REQUIRE(tagged.size() == 2);
    REQUIRE(tagged[0].slug == "a-link");
    REQUIRE(tagged[1].slug == "b-link");

    auto all = links.listAll();
    REQUIRE(all.size() == 2);
    REQUIRE(all[0].slug == "a-link");
    REQUIRE(links.countAll() == 2);
}
