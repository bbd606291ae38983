#pragma once

#include "identity/calendar_date.hpp"
#include "identity/embedding_vector.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace voiceguard {
namespace identity {

/**
 * One enrolled person.
 *
 * The id is unset until the record is committed; the store hands back a copy
 * carrying the assigned id. The embedding never changes after construction.
 */
class IdentityRecord {
public:
    /**
     * @throws ValidationException if a name is empty or the embedding is empty
     */
    IdentityRecord(std::string firstName, std::string lastName,
                   CalendarDate dateOfBirth, EmbeddingVector embedding,
                   std::optional<int64_t> id = std::nullopt);

    const std::optional<int64_t>& id() const { return id_; }
    bool isPersisted() const { return id_.has_value(); }

    const std::string& firstName() const { return firstName_; }
    const std::string& lastName() const { return lastName_; }
    const CalendarDate& dateOfBirth() const { return dateOfBirth_; }
    const EmbeddingVector& embedding() const { return embedding_; }

    std::string fullName() const;

    IdentityRecord withId(int64_t id) const;

    bool operator==(const IdentityRecord& other) const;
    bool operator!=(const IdentityRecord& other) const { return !(*this == other); }

private:
    std::optional<int64_t> id_;
    std::string firstName_;
    std::string lastName_;
    CalendarDate dateOfBirth_;
    EmbeddingVector embedding_;
};

} // namespace identity
} // namespace voiceguard
