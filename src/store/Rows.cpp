#include "store/Rows.hpp"
#include "store/StoreError.hpp"
#include <sstream>

namespace slugline {
namespace store {

const char* const kTagColumns = "id, name, slug, created_at";
const char* const kLinkColumns = "id, slug, url, title, description, visibility, created_at, updated_at";
const char* const kUserColumns =
    "id, provider, subject, email, display_name, display_name_slug, role, created_at, updated_at";
const char* const kShareColumns = "link_id, user_id, shared_by, created_at";
const char* const kKeywordColumns = "id, keyword, url_template, description, created_at";

Tag readTag(const db::Row& row, size_t first) {
    Tag tag;
    tag.id = row.getText(first);
    tag.name = row.getText(first + 1);
    tag.slug = row.getText(first + 2);
    tag.createdAt = row.getText(first + 3);
    return tag;
}

Link readLink(const db::Row& row, size_t first) {
    Link link;
    link.id = row.getText(first);
    link.slug = row.getText(first + 1);
    link.url = row.getText(first + 2);
    link.title = row.getText(first + 3);
    link.description = row.getText(first + 4);
    // The column is constrained by the stores, so a bad value is corruption
    try {
        link.visibility = visibilityFromString(row.getText(first + 5));
    } catch (const StoreError& e) {
        throw StoreError(ErrorKind::Storage, e.what());
    }
    link.createdAt = row.getText(first + 6);
    link.updatedAt = row.getText(first + 7);
    return link;
}

User readUser(const db::Row& row, size_t first) {
    User user;
    user.id = row.getText(first);
    user.provider = row.getText(first + 1);
    user.subject = row.getText(first + 2);
    user.email = row.getText(first + 3);
    user.displayName = row.getText(first + 4);
    user.displayNameSlug = row.getText(first + 5);
    user.role = roleFromString(row.getText(first + 6));
    user.createdAt = row.getText(first + 7);
    user.updatedAt = row.getText(first + 8);
    return user;
}

Share readShare(const db::Row& row, size_t first) {
    Share share;
    share.linkId = row.getText(first);
    share.userId = row.getText(first + 1);
    share.sharedBy = row.getText(first + 2);
    share.createdAt = row.getText(first + 3);
    return share;
}

Keyword readKeyword(const db::Row& row, size_t first) {
    Keyword keyword;
    keyword.id = row.getText(first);
    keyword.keyword = row.getText(first + 1);
    keyword.urlTemplate = row.getText(first + 2);
    keyword.description = row.getText(first + 3);
    keyword.createdAt = row.getText(first + 4);
    return keyword;
}

std::string qualify(const std::string& alias, const char* columns) {
    std::istringstream in(columns);
    std::ostringstream out;
    std::string column;
    bool first = true;
    while (std::getline(in, column, ',')) {
        size_t start = column.find_first_not_of(' ');
        if (!first) out << ", ";
        out << alias << "." << column.substr(start);
        first = false;
    }
    return out.str();
}

} // namespace store
} // namespace slugline
