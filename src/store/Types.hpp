#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace slugline {
namespace store {

enum class Role {
    User,
    Admin
};

std::string roleToString(Role role);

/**
 * @throws StoreError (Storage) for a value other than "user" or "admin"
 */
Role roleFromString(const std::string& value);

/**
 * Who may see a link through the API. Redirects ignore it.
 */
enum class Visibility {
    Public,                              // anyone
    Private,                             // owners and admins
    Secure                               // owners, admins and users it is shared with
};

std::string visibilityToString(Visibility visibility);

/**
 * @throws StoreError (InvalidVisibility) for anything but public, private or secure
 */
Visibility visibilityFromString(const std::string& value);

/**
 * A user known to the system, created on first login
 */
struct User {
    std::string id;                      // UUID
    std::string provider;                // Identity provider issuer
    std::string subject;                 // Subject at the provider
    std::string email;
    std::string displayName;
    std::string displayNameSlug;         // Unique, derived from displayName
    Role role = Role::User;
    std::string createdAt;               // ISO 8601 timestamp
    std::string updatedAt;               // ISO 8601 timestamp

    bool isAdmin() const { return role == Role::Admin; }
};

/**
 * A tag, identified by its derived slug
 */
struct Tag {
    std::string id;
    std::string name;                    // Display name of the first creator
    std::string slug;                    // Upsert key
    std::string createdAt;
};

/**
 * Tag with the number of links carrying it
 */
struct TagCount {
    Tag tag;
    int64_t linkCount = 0;
};

/**
 * One row of a link's owner set
 */
struct LinkOwner {
    std::string userId;
    bool isPrimary = false;
};

/**
 * A short link with its owner set (primary first) and tags
 */
struct Link {
    std::string id;
    std::string slug;                    // Lowercase, immutable
    std::string url;
    std::string title;
    std::string description;
    Visibility visibility = Visibility::Public;
    std::string createdAt;
    std::string updatedAt;
    std::vector<LinkOwner> owners;
    std::vector<Tag> tags;               // Ordered by name

    /**
     * Primary owner id, empty if the owner set is empty
     */
    std::string primaryOwnerId() const;
};

/**
 * A user a link was shared with, and who shared it
 */
struct Share {
    std::string linkId;
    std::string userId;
    std::string sharedBy;
    std::string createdAt;
};

/**
 * A keyword host: "keyword/slug" expands through urlTemplate's {slug}
 */
struct Keyword {
    std::string id;
    std::string keyword;                 // Unique, [a-z][a-z0-9-]*
    std::string urlTemplate;             // Contains "{slug}"
    std::string description;
    std::string createdAt;

    std::string expand(const std::string& slug) const;
};

/**
 * One row of a link's click history
 */
struct RecentClick {
    std::string clickedAt;
    std::string referrer;                // Empty if none was sent
    std::string userId;                  // Empty for anonymous visits
    std::string displayName;             // Empty for anonymous or deleted users
};

/**
 * A visit to be recorded by the click pipeline
 */
struct ClickEvent {
    std::string linkId;
    std::optional<std::string> userId;   // nullopt for anonymous visits
    std::string ipHash;                  // Never the raw address
    std::string userAgent;
    std::string referrer;
};

} // namespace store
} // namespace slugline
