#include "store/SlugValidator.hpp"
#include "store/StoreError.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace slugline {
namespace store {

namespace {

const std::array<const char*, 4> kReservedSlugs = {"auth", "static", "dashboard", "admin"};

bool isSlugChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

std::string slugify(const std::string& input, bool underscoreIsSeparator) {
    std::string out;
    out.reserve(input.size());

    bool pendingHyphen = false;
    for (char raw : input) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
        bool separator = std::isspace(static_cast<unsigned char>(c)) || c == '-' ||
                         (underscoreIsSeparator && c == '_');
        if (separator) {
            pendingHyphen = true;
            continue;
        }
        if (!isSlugChar(c)) {
            continue;
        }
        // Hyphens are only emitted between two kept characters
        if (pendingHyphen && !out.empty()) {
            out += '-';
        }
        pendingHyphen = false;
        out += c;
    }
    return out;
}

} // anonymous namespace

std::string normalizeSlug(const std::string& slug) {
    std::string out = slug;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool isReservedSlug(const std::string& slug) {
    return std::find(kReservedSlugs.begin(), kReservedSlugs.end(), slug) != kReservedSlugs.end();
}

void validateSlug(const std::string& slug) {
    bool valid = !slug.empty() && isSlugChar(slug.front()) && isSlugChar(slug.back()) &&
                 std::all_of(slug.begin(), slug.end(),
                             [](char c) { return isSlugChar(c) || c == '-'; });
    if (!valid) {
        throw StoreError(ErrorKind::InvalidSlug,
            "slug must match [a-z0-9][a-z0-9-]*[a-z0-9]: \"" + slug + "\"");
    }
    if (slug.size() > kMaxSlugLength) {
        throw StoreError(ErrorKind::InvalidSlug,
            "slug is longer than " + std::to_string(kMaxSlugLength) + " characters");
    }
    if (isReservedSlug(slug)) {
        throw StoreError(ErrorKind::ReservedSlug,
            "slug is reserved and cannot be used: \"" + slug + "\"");
    }
}

void validateKeyword(const std::string& keyword, const std::string& urlTemplate) {
    bool valid = !keyword.empty() && keyword.front() >= 'a' && keyword.front() <= 'z' &&
                 std::all_of(keyword.begin(), keyword.end(),
                             [](char c) { return isSlugChar(c) || c == '-'; });
    if (!valid) {
        throw StoreError(ErrorKind::InvalidKeyword,
            "keyword must match [a-z][a-z0-9-]*: \"" + keyword + "\"");
    }
    if (keyword.size() > kMaxSlugLength) {
        throw StoreError(ErrorKind::InvalidKeyword,
            "keyword is longer than " + std::to_string(kMaxSlugLength) + " characters");
    }
    if (urlTemplate.find("{slug}") == std::string::npos) {
        throw StoreError(ErrorKind::InvalidKeyword,
            "URL template must contain {slug}: \"" + urlTemplate + "\"");
    }
}

std::string deriveTagSlug(const std::string& name) {
    return slugify(name, true);
}

std::string deriveDisplayNameSlug(const std::string& displayName) {
    return slugify(displayName, false);
}

} // namespace store
} // namespace slugline
