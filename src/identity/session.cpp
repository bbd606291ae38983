#include "identity/session.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <cstdint>
#include <limits>

namespace voiceguard {
namespace identity {

Session::Session(RecordRepository& repository)
    : repository_(repository) {
}

void Session::add(const IdentityRecord& record) {
    if (record.isPersisted()) {
        throw utils::ValidationException("Only records without an id can be staged",
                                         "id=" + std::to_string(*record.id()));
    }
    pending_.push_back(record);
}

std::vector<IdentityRecord> Session::commit() {
    if (pending_.empty()) {
        return {};
    }

    std::vector<IdentityRecord> combined = repository_.load();
    checkDimensions(combined);

    const int64_t firstId = RecordRepository::nextId(combined);
    if (static_cast<uint64_t>(pending_.size() - 1) >
            static_cast<uint64_t>(std::numeric_limits<int64_t>::max() - firstId)) {
        throw utils::StorageException("Record ids are exhausted",
                                      std::to_string(pending_.size()) + " pending");
    }
    std::vector<IdentityRecord> committed;
    committed.reserve(pending_.size());
    for (size_t i = 0; i < pending_.size(); ++i) {
        committed.push_back(pending_[i].withId(firstId + static_cast<int64_t>(i)));
    }

    combined.insert(combined.end(), committed.begin(), committed.end());

    // Pending records survive a failed persist so the caller can retry
    repository_.persist(combined);
    pending_.clear();

    utils::Logger::info("Committed " + std::to_string(committed.size()) +
                        " identity record(s), first id " + std::to_string(firstId));
    return committed;
}

void Session::discard() {
    if (!pending_.empty()) {
        utils::Logger::debug("Discarding " + std::to_string(pending_.size()) + " staged record(s)");
    }
    pending_.clear();
}

RecordSet Session::query() const {
    return RecordSet(repository_.load());
}

void Session::checkDimensions(const std::vector<IdentityRecord>& current) const {
    const EmbeddingVector& reference = current.empty()
        ? pending_.front().embedding()
        : current.front().embedding();

    for (const auto& record : pending_) {
        reference.requireSameDimension(record.embedding());
    }
}

} // namespace identity
} // namespace voiceguard
