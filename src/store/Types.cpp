#include "store/Types.hpp"
#include "store/StoreError.hpp"

namespace slugline {
namespace store {

std::string roleToString(Role role) {
    return role == Role::Admin ? "admin" : "user";
}

Role roleFromString(const std::string& value) {
    if (value == "admin") return Role::Admin;
    if (value == "user") return Role::User;
    throw StoreError(ErrorKind::Storage, "Unknown role: " + value);
}

std::string visibilityToString(Visibility visibility) {
    switch (visibility) {
        case Visibility::Public:  return "public";
        case Visibility::Private: return "private";
        case Visibility::Secure:  return "secure";
    }
    return "public";
}

Visibility visibilityFromString(const std::string& value) {
    if (value == "public") return Visibility::Public;
    if (value == "private") return Visibility::Private;
    if (value == "secure") return Visibility::Secure;
    throw StoreError(ErrorKind::InvalidVisibility,
        "visibility must be one of public, private, secure: \"" + value + "\"");
}

std::string Link::primaryOwnerId() const {
    for (const auto& owner : owners) {
        if (owner.isPrimary) return owner.userId;
    }
    return "";
}

std::string Keyword::expand(const std::string& slug) const {
    static const std::string placeholder = "{slug}";
    std::string url = urlTemplate;
    for (size_t pos = url.find(placeholder); pos != std::string::npos;
         pos = url.find(placeholder, pos + slug.size())) {
        url.replace(pos, placeholder.size(), slug);
    }
    return url;
}

} // namespace store
} // namespace slugline
