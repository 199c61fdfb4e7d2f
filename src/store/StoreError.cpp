#include "store/StoreError.hpp"

namespace slugline {
namespace store {

std::string errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidSlug:           return "invalid_slug";
        case ErrorKind::ReservedSlug:          return "reserved_slug";
        case ErrorKind::InvalidTag:            return "invalid_tag";
        case ErrorKind::InvalidVisibility:     return "invalid_visibility";
        case ErrorKind::InvalidKeyword:        return "invalid_keyword";
        case ErrorKind::NotFound:              return "not_found";
        case ErrorKind::SlugTaken:             return "slug_taken";
        case ErrorKind::KeywordTaken:          return "keyword_taken";
        case ErrorKind::DuplicateOwner:        return "duplicate_owner";
        case ErrorKind::DuplicateShare:        return "duplicate_share";
        case ErrorKind::PrimaryOwnerImmutable: return "primary_owner_immutable";
        case ErrorKind::Transient:             return "transient";
        case ErrorKind::Storage:               return "storage";
    }
    return "unknown";
}

StoreError fromDatabaseError(const db::DatabaseError& e, const std::string& context) {
    ErrorKind kind = e.kind() == db::ErrorKind::Transient ? ErrorKind::Transient : ErrorKind::Storage;
    return StoreError(kind, context + ": " + e.what());
}

} // namespace store
} // namespace slugline
