#pragma once

#include "identity/identity_record.hpp"
#include "identity/record_store.hpp"
#include <vector>

namespace voiceguard {
namespace identity {

/**
 * Snapshot of the store returned by Session::query()
 */
class RecordSet {
public:
    explicit RecordSet(std::vector<IdentityRecord> records)
        : records_(std::move(records)) {}

    const std::vector<IdentityRecord>& all() const { return records_; }
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

private:
    std::vector<IdentityRecord> records_;
};

/**
 * Staging buffer for new identities.
 *
 * Staged records stay invisible to the repository until commit(), which
 * assigns ids in insertion order and persists store + pending in a single
 * persist() call. A failed commit leaves both the store and the pending list
 * untouched. Sessions do not share pending records.
 *
 * Not thread-safe; commits against the same repository must be serialized
 * by the caller.
 */
class Session {
public:
    explicit Session(RecordRepository& repository);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * Stage a record.
     * @throws ValidationException if the record already carries an id
     */
    void add(const IdentityRecord& record);

    /**
     * Persist all staged records.
     * @return the committed records with their assigned ids (empty if nothing was staged)
     * @throws DimensionMismatchException if a staged embedding does not match the stored dimension
     * @throws StorageException if persisting fails
     */
    std::vector<IdentityRecord> commit();

    // Drop every staged record without touching the store
    void discard();

    // Always re-reads the repository
    RecordSet query() const;

    size_t pendingCount() const { return pending_.size(); }
    const std::vector<IdentityRecord>& pending() const { return pending_; }

private:
    void checkDimensions(const std::vector<IdentityRecord>& current) const;

    RecordRepository& repository_;
    std::vector<IdentityRecord> pending_;
};

} // namespace identity
} // namespace voiceguard
