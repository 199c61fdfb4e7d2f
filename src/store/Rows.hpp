#pragma once

#include "db/Connection.hpp"
#include "store/Types.hpp"

namespace slugline {
namespace store {

// Column lists matching the readers below
extern const char* const kTagColumns;     // id, name, slug, created_at
extern const char* const kLinkColumns;    // id, slug, url, title, description, visibility, created_at, updated_at
extern const char* const kUserColumns;    // id, provider, subject, email, display_name, display_name_slug, role, created_at, updated_at
extern const char* const kShareColumns;   // link_id, user_id, shared_by, created_at
extern const char* const kKeywordColumns; // id, keyword, url_template, description, created_at

Tag readTag(const db::Row& row, size_t first = 0);

/**
 * Link columns only; owners and tags are loaded separately
 */
Link readLink(const db::Row& row, size_t first = 0);

User readUser(const db::Row& row, size_t first = 0);
Share readShare(const db::Row& row, size_t first = 0);
Keyword readKeyword(const db::Row& row, size_t first = 0);

/**
 * Prefix every column of a list with a table alias ("l." ...)
 */
std::string qualify(const std::string& alias, const char* columns);

} // namespace store
} // namespace slugline
