#include <catch2/catch_test_macros.hpp>
#include "store/KeywordStore.hpp"
#include "store/StoreError.hpp"
#include "TestSupport.hpp"
#include <functional>

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

} // anonymous namespace

TEST_CASE("Create and look up keywords", "[KeywordStore]") {
    StoreFixture fixture;
    KeywordStore keywords(fixture.pool());

    Keyword jira = keywords.create("jira", "https://jira.example.com/browse/{slug}", "Issue tracker");
    REQUIRE_FALSE(jira.id.empty());
    REQUIRE_FALSE(jira.createdAt.empty());

    auto byId = keywords.getById(jira.id);
    REQUIRE(byId.has_value());
    REQUIRE(byId->keyword == "jira");
    REQUIRE(byId->urlTemplate == "https://jira.example.com/browse/{slug}");
    REQUIRE(byId->description == "Issue tracker");

    REQUIRE(keywords.getByKeyword("jira")->id == jira.id);
    REQUIRE_FALSE(keywords.getByKeyword("wiki").has_value());
    REQUIRE_FALSE(keywords.getById("missing").has_value());
}

TEST_CASE("Keywords are listed alphabetically", "[KeywordStore]") {
    StoreFixture fixture;
    KeywordStore keywords(fixture.pool());

    keywords.create("wiki", "https://wiki.example.com/{slug}", "");
    keywords.create("gh", "https://github.com/{slug}", "");
    keywords.create("jira", "https://jira.example.com/browse/{slug}", "");

    auto all = keywords.list();
    REQUIRE(all.size() == 3);
    REQUIRE(all[0].keyword == "gh");
    REQUIRE(all[1].keyword == "jira");
    REQUIRE(all[2].keyword == "wiki");
}

TEST_CASE("Invalid keywords and templates are rejected", "[KeywordStore][Validation]") {
    StoreFixture fixture;
    KeywordStore keywords(fixture.pool());
    const std::string url = "https://example.com/{slug}";

    REQUIRE(errorOf([&] { keywords.create("", url, ""); }) == ErrorKind::InvalidKeyword);
    REQUIRE(errorOf([&] { keywords.create("Jira", url, ""); }) == ErrorKind::InvalidKeyword);
    REQUIRE(errorOf([&] { keywords.create("1st", url, ""); }) == ErrorKind::InvalidKeyword);
    REQUIRE(errorOf([&] { keywords.create("a b", url, ""); }) == ErrorKind::InvalidKeyword);
    REQUIRE(errorOf([&] { keywords.create("jira", "https://example.com/", ""); }) == ErrorKind::InvalidKeyword);
    REQUIRE(errorOf([&] { keywords.create(std::string(256, 'k'), url, ""); }) == ErrorKind::InvalidKeyword);
    REQUIRE(keywords.list().empty());
}

TEST_CASE("Duplicate keywords are taken", "[KeywordStore][Validation]") {
    StoreFixture fixture;
    KeywordStore keywords(fixture.pool());

    keywords.create("jira", "https://jira.example.com/browse/{slug}", "");
    Keyword wiki = keywords.create("wiki", "https://wiki.example.com/{slug}", "");

    REQUIRE(errorOf([&] { keywords.create("jira", "https://other/{slug}", ""); }) == ErrorKind::KeywordTaken);
    REQUIRE(errorOf([&] { keywords.update(wiki.id, "jira", "https://other/{slug}", ""); }) ==
            ErrorKind::KeywordTaken);
    REQUIRE(keywords.getById(wiki.id)->keyword == "wiki");
}

TEST_CASE("Update replaces every field but the id and created_at", "[KeywordStore]") {
    StoreFixture fixture;
    KeywordStore keywords(fixture.pool());
    Keyword created = keywords.create("wiki", "https://wiki.example.com/{slug}", "");

    Keyword updated = keywords.update(created.id, "docs", "https://docs.example.com/{slug}", "Docs");
    REQUIRE(updated.id == created.id);
    REQUIRE(updated.keyword == "docs");
    REQUIRE(updated.urlTemplate == "https://docs.example.com/{slug}");
    REQUIRE(updated.description == "Docs");
    REQUIRE(updated.createdAt == created.createdAt);

    // Same values again
    REQUIRE(keywords.update(created.id, "docs", "https://docs.example.com/{slug}", "Docs").id == created.id);

    REQUIRE(errorOf([&] { keywords.update("missing", "x", "https://x/{slug}", ""); }) == ErrorKind::NotFound);
}

TEST_CASE("Remove deletes a keyword once", "[KeywordStore]") {
    StoreFixture fixture;
    KeywordStore keywords(fixture.pool());
    Keyword created = keywords.create("wiki", "https://wiki.example.com/{slug}", "");

    keywords.remove(created.id);
    REQUIRE_FALSE(keywords.getById(created.id).has_value());
    REQUIRE(errorOf([&] { keywords.remove(created.id); }) == ErrorKind::NotFound);
}

TEST_CASE("expand substitutes every {slug}", "[KeywordStore]") {
    Keyword keyword;
    keyword.urlTemplate = "https://jira.example.com/browse/{slug}?ref={slug}";
    REQUIRE(keyword.expand("ABC-12") == "https://jira.example.com/browse/ABC-12?ref=ABC-12");

    // A slug containing the placeholder is not expanded again
    REQUIRE(keyword.expand("{slug}") == "https://jira.example.com/browse/{slug}?ref={slug}");
}
