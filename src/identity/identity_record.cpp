#include "identity/identity_record.hpp"
#include "utils/error_handler.hpp"
#include <cmath>

namespace voiceguard {
namespace identity {

namespace {

bool isBlank(const std::string& value) {
    return value.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

IdentityRecord::IdentityRecord(std::string firstName, std::string lastName,
                               CalendarDate dateOfBirth, EmbeddingVector embedding,
                               std::optional<int64_t> id)
    : id_(id), firstName_(std::move(firstName)), lastName_(std::move(lastName)),
      dateOfBirth_(dateOfBirth), embedding_(std::move(embedding)) {
    if (isBlank(firstName_)) {
        throw utils::ValidationException("First name must not be empty", "first_name");
    }
    if (isBlank(lastName_)) {
        throw utils::ValidationException("Last name must not be empty", "last_name");
    }
    if (embedding_.empty()) {
        throw utils::ValidationException("Embedding must not be empty", "embedding");
    }
    // NaN and infinity have no JSON form; one stored record would make the whole store unreadable
    for (float v : embedding_.values()) {
        if (!std::isfinite(v)) {
            throw utils::ValidationException("Embedding contains a non-finite element", "embedding");
        }
    }
}

std::string IdentityRecord::fullName() const {
    return firstName_ + " " + lastName_;
}

IdentityRecord IdentityRecord::withId(int64_t id) const {
    IdentityRecord copy(*this);
    copy.id_ = id;
    return copy;
}

bool IdentityRecord::operator==(const IdentityRecord& other) const {
    return id_ == other.id_ &&
           firstName_ == other.firstName_ &&
           lastName_ == other.lastName_ &&
           dateOfBirth_ == other.dateOfBirth_ &&
           embedding_ == other.embedding_;
}

} // namespace identity
} // namespace voiceguard
