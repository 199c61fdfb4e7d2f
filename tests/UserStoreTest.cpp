#include <catch2/catch_test_macros.hpp>
#include "store/StoreError.hpp"
#include "store/UserStore.hpp"
#include "TestSupport.hpp"
#include <thread>

using namespace slugline::store;

TEST_CASE("Upsert creates a user on first login", "[UserStore]") {
    StoreFixture fixture;
    UserStore users(fixture.pool());

    User user = users.upsert("https://idp", "sub-1", "jane@example.com", "Jane Doe", Role::User);
    REQUIRE(user.id.size() == 36);
    REQUIRE(user.provider == "https://idp");
    REQUIRE(user.subject == "sub-1");
    REQUIRE(user.email == "jane@example.com");
    REQUIRE(user.displayName == "Jane Doe");
    REQUIRE(user.displayNameSlug == "jane-doe");
    REQUIRE(user.role == Role::User);
    REQUIRE_FALSE(user.isAdmin());
    REQUIRE(users.countAll() == 1);
}

TEST_CASE("Upsert refreshes an existing user", "[UserStore]") {
    StoreFixture fixture;
    UserStore users(fixture.pool());

    User first = users.upsert("https://idp", "sub-1", "old@example.com", "Old Name", Role::User);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    User second = users.upsert("https://idp", "sub-1", "new@example.com", "New Name", Role::Admin);

    REQUIRE(second.id == first.id);
    REQUIRE(second.email == "new@example.com");
    REQUIRE(second.displayNameSlug == "new-name");
    REQUIRE(second.isAdmin());
    REQUIRE(second.createdAt == first.createdAt);
    REQUIRE(second.updatedAt > first.updatedAt);
    REQUIRE(users.countAll() == 1);
}

TEST_CASE("Display name slugs get numeric suffixes", "[UserStore]") {
    StoreFixture fixture;
    UserStore users(fixture.pool());

    User a = users.upsert("idp", "a", "a@example.com", "Pat Lee", Role::User);
    User b = users.upsert("idp", "b", "b@example.com", "pat lee", Role::User);
    User c = users.upsert("idp", "c", "c@example.com", "Pat  Lee!", Role::User);

    REQUIRE(a.displayNameSlug == "pat-lee");
    REQUIRE(b.displayNameSlug == "pat-lee-2");
    REQUIRE(c.displayNameSlug == "pat-lee-3");

    // Re-login keeps the slug the user already holds
    REQUIRE(users.upsert("idp", "b", "b@example.com", "pat lee", Role::User).displayNameSlug == "pat-lee-2");
}

TEST_CASE("Display names without slug characters fall back to user", "[UserStore]") {
    StoreFixture fixture;
    UserStore users(fixture.pool());

    REQUIRE(users.upsert("idp", "a", "", "???", Role::User).displayNameSlug == "user");
    REQUIRE(users.upsert("idp", "b", "", "", Role::User).displayNameSlug == "user-2");
}

TEST_CASE("Lookups by id and display name slug", "[UserStore]") {
    StoreFixture fixture;
    UserStore users(fixture.pool());
    User user = users.upsert("idp", "a", "a@example.com", "Jane", Role::User);

    REQUIRE(users.getById(user.id)->displayName == "Jane");
    REQUIRE(users.getByDisplayNameSlug("jane")->id == user.id);
    REQUIRE_FALSE(users.getById("missing").has_value());
    REQUIRE_FALSE(users.getByDisplayNameSlug("missing").has_value());
}

TEST_CASE("listAll is ordered by display name", "[UserStore]") {
    StoreFixture fixture;
    UserStore users(fixture.pool());
    users.upsert("idp", "1", "", "Zoe", Role::User);
    users.upsert("idp", "2", "", "Adam", Role::User);

    auto all = users.listAll();
    REQUIRE(all.size() == 2);
    REQUIRE(all[0].displayName == "Adam");
    REQUIRE(all[1].displayName == "Zoe");
}

TEST_CASE("updateRole", "[UserStore]") {
    StoreFixture fixture;
    UserStore users(fixture.pool());
    User user = users.upsert("idp", "a", "", "Jane", Role::User);

    REQUIRE(users.updateRole(user.id, Role::Admin).isAdmin());
    REQUIRE(users.getById(user.id)->role == Role::Admin);

    try {
        users.updateRole("missing", Role::Admin);
        FAIL("expected NotFound");
    } catch (const StoreError& e) {
        REQUIRE(e.kind() == ErrorKind::NotFound);
    }
}

TEST_CASE("Role names", "[UserStore]") {
    REQUIRE(roleToString(Role::User) == "user");
    REQUIRE(roleToString(Role::Admin) == "admin");
    REQUIRE(roleFromString("admin") == Role::Admin);
    REQUIRE_THROWS_AS(roleFromString("root"), StoreError);
}
