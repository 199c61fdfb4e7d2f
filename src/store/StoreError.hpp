#pragma once

#include "db/Connection.hpp"
#include <stdexcept>
#include <string>

namespace slugline {
namespace store {

/**
 * Closed set of failures reported by the stores
 */
enum class ErrorKind {
    InvalidSlug,
    ReservedSlug,
    InvalidTag,
    InvalidVisibility,
    InvalidKeyword,
    NotFound,
    SlugTaken,
    KeywordTaken,
    DuplicateOwner,
    DuplicateShare,
    PrimaryOwnerImmutable,
    Transient,               // retryable by the caller
    Storage                  // any other database failure
};

std::string errorKindName(ErrorKind kind);

class StoreError : public std::runtime_error {
public:
    StoreError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

    bool isValidation() const {
        return m_kind == ErrorKind::InvalidSlug || m_kind == ErrorKind::ReservedSlug ||
               m_kind == ErrorKind::InvalidTag || m_kind == ErrorKind::InvalidVisibility ||
               m_kind == ErrorKind::InvalidKeyword;
    }

    bool isConflict() const {
        return m_kind == ErrorKind::SlugTaken || m_kind == ErrorKind::KeywordTaken ||
               m_kind == ErrorKind::DuplicateOwner || m_kind == ErrorKind::DuplicateShare ||
               m_kind == ErrorKind::PrimaryOwnerImmutable;
    }

private:
    ErrorKind m_kind;
};

/**
 * Translate a database failure that has no more specific meaning
 * into Transient or Storage
 */
StoreError fromDatabaseError(const db::DatabaseError& e, const std::string& context);

} // namespace store
} // namespace slugline
