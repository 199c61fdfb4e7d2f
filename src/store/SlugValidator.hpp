#pragma once

#include <cstddef>
#include <string>

namespace slugline {
namespace store {

// Longest link or tag slug, and longest tag name, in bytes. Matches the
// VARCHAR(255) key columns MySQL needs.
constexpr size_t kMaxSlugLength = 255;

/**
 * Lowercase copy of a user-supplied slug (ASCII only)
 */
std::string normalizeSlug(const std::string& slug);

/**
 * @brief Check slug format and the reserved list, without any I/O
 *
 * A valid slug is a single [a-z0-9] character, or starts and ends with
 * [a-z0-9] with only [a-z0-9-] in between, at most kMaxSlugLength long.
 *
 * @throws StoreError InvalidSlug or ReservedSlug
 */
void validateSlug(const std::string& slug);

bool isReservedSlug(const std::string& slug);

/**
 * @brief Check a keyword host and its URL template, without any I/O
 *
 * The keyword must match [a-z][a-z0-9-]* and be at most kMaxSlugLength
 * long; the template must contain "{slug}".
 *
 * @throws StoreError InvalidKeyword
 */
void validateKeyword(const std::string& keyword, const std::string& urlTemplate);

/**
 * Tag slug: lowercase, whitespace runs and underscores become one hyphen,
 * anything outside [a-z0-9-] is dropped, hyphen runs collapse, and
 * leading/trailing hyphens are trimmed. May return an empty string.
 */
std::string deriveTagSlug(const std::string& name);

/**
 * Same as deriveTagSlug except underscores are dropped rather than turned
 * into hyphens
 */
std::string deriveDisplayNameSlug(const std::string& displayName);

} // namespace store
} // namespace slugline
