#include <catch2/catch_test_macros.hpp>
#include "store/SlugValidator.hpp"
#include "store/StoreError.hpp"

using namespace slugline::store;

namespace {

ErrorKind validationKind(const std::string& slug) {
    try {
        validateSlug(slug);
    } catch (const StoreError& e) {
        return e.kind();
    }
    FAIL("slug \"" << slug << "\" was accepted");
    return ErrorKind::Storage;
}

} // anonymous namespace

TEST_CASE("Valid slugs pass", "[SlugValidator]") {
    for (const char* slug : {"docs", "a", "7", "go-links", "x1-y2-z3", "a-b", "0day"}) {
        REQUIRE_NOTHROW(validateSlug(slug));
    }
}

TEST_CASE("Malformed slugs are rejected", "[SlugValidator]") {
    for (const char* slug : {"", "-docs", "docs-", "-", "has space", "under_score",
                             "Docs", "emoji\xF0\x9F\x98\x80", "dot.ted", "a/b"}) {
        REQUIRE(validationKind(slug) == ErrorKind::InvalidSlug);
    }
}

TEST_CASE("Slug length is capped", "[SlugValidator]") {
    std::string longest(kMaxSlugLength, 'a');
    REQUIRE_NOTHROW(validateSlug(longest));
    REQUIRE(validationKind(longest + "a") == ErrorKind::InvalidSlug);
    REQUIRE(validationKind(std::string(300, 'x')) == ErrorKind::InvalidSlug);
}

TEST_CASE("Reserved slugs are rejected", "[SlugValidator]") {
    for (const char* slug : {"auth", "static", "dashboard", "admin"}) {
        REQUIRE(isReservedSlug(slug));
        REQUIRE(validationKind(slug) == ErrorKind::ReservedSlug);
    }
    REQUIRE_FALSE(isReservedSlug("administrator"));
}

TEST_CASE("normalizeSlug lowercases before validation", "[SlugValidator]") {
    REQUIRE(normalizeSlug("Go-Links") == "go-links");
    REQUIRE(validationKind(normalizeSlug("ADMIN")) == ErrorKind::ReservedSlug);
    REQUIRE_NOTHROW(validateSlug(normalizeSlug("DOCS")));
}

TEST_CASE("deriveTagSlug", "[SlugValidator][Tags]") {
    REQUIRE(deriveTagSlug("Engineering Tools") == "engineering-tools");
    REQUIRE(deriveTagSlug("  engineering   tools  ") == "engineering-tools");
    REQUIRE(deriveTagSlug("snake_case_tag") == "snake-case-tag");
    REQUIRE(deriveTagSlug("C++ & Rust!") == "c-rust");
    REQUIRE(deriveTagSlug("--a--b--") == "a-b");
    REQUIRE(deriveTagSlug("!!!").empty());
    REQUIRE(deriveTagSlug("").empty());
}

TEST_CASE("deriveDisplayNameSlug drops underscores", "[SlugValidator][Users]") {
    REQUIRE(deriveDisplayNameSlug("Jane Doe") == "jane-doe");
    REQUIRE(deriveDisplayNameSlug("jane_doe") == "janedoe");
    REQUIRE(deriveDisplayNameSlug("O'Brien, Pat") == "obrien-pat");
    REQUIRE(deriveDisplayNameSlug("***").empty());
}
