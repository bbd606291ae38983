#pragma once

#include "identity/identity_record.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace voiceguard {
namespace identity {

/**
 * Repository of enrolled identities.
 *
 * Implementations provide exactly two primitives: read everything, and
 * replace everything atomically. Id assignment and delete-by-id are built on
 * top of them.
 */
class RecordRepository {
public:
    virtual ~RecordRepository() = default;

    /**
     * Read the durable representation.
     * Never throws for missing or corrupt state; both read as empty.
     */
    virtual std::vector<IdentityRecord> load() const = 0;

    /**
     * Replace the durable representation with records.
     * Readers never observe a partially written result.
     * @throws StorageException if the write cannot be completed
     */
    virtual void persist(const std::vector<IdentityRecord>& records) = 0;

    /**
     * Delete the record with the given id and persist the remainder.
     * @return false (and no write) when no record carries the id
     * @throws StorageException if persisting the remainder fails
     */
    bool remove(int64_t id);

    // max(existing ids, default 0) + 1; records without an id are ignored.
    // Throws StorageException when the largest id is already INT64_MAX
    static int64_t nextId(const std::vector<IdentityRecord>& existing);
};

/**
 * RecordRepository backed by a JSON file:
 *
 *     {"users": [{"id": 1, "first_name": ..., "last_name": ...,
 *                 "date_of_birth": "YYYY-MM-DD", "embedding": "[...]"}]}
 *
 * A bare top-level array is accepted on read (legacy format).
 */
class JsonRecordStore : public RecordRepository {
public:
    explicit JsonRecordStore(std::string path);

    /**
     * Create an empty store file when missing. A corrupt file is moved aside
     * to <path>.corrupt-<unix seconds> and replaced by an empty store.
     * @return true if the file had to be created or replaced
     */
    bool initialize();

    std::vector<IdentityRecord> load() const override;

    /**
     * A corrupt file found at the path is moved aside first, as in initialize().
     */
    void persist(const std::vector<IdentityRecord>& records) override;

    const std::string& path() const { return path_; }

private:
    enum class ReadStatus {
        OK,
        MISSING,
        CORRUPT
    };

    ReadStatus read(std::vector<IdentityRecord>& records, std::string& problem) const;
    void moveCorruptFileAside(const std::string& problem);

    std::string path_;
};

} // namespace identity
} // namespace voiceguard
