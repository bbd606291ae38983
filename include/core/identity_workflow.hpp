#pragma once

#include "audio/silence_trimmer.hpp"
#include "identity/match_engine.hpp"
#include "identity/record_store.hpp"
#include "models/embedding_extractor.hpp"
#include "utils/config.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace voiceguard {
namespace core {

/**
 * Set from the interactive side when the user backs out; checked by the
 * workflow before anything is committed.
 */
class CancellationToken {
public:
    void cancel() { cancelled_ = true; }
    bool isCancelled() const { return cancelled_; }

private:
    std::atomic<bool> cancelled_{false};
};

struct EnrollmentRequest {
    std::string firstName;
    std::string lastName;
    std::string dateOfBirth; // YYYY-MM-DD
    std::string audioPath;
};

enum class EnrollmentStatus {
    ENROLLED,
    CANCELLED
};

struct EnrollmentOutcome {
    EnrollmentStatus status;
    std::optional<identity::IdentityRecord> record;
};

/**
 * Enrollment and verification use-cases: trim the recording, extract an
 * embedding, then commit a new identity or match against the store.
 *
 * Every call is synchronous. A failure at any step leaves the store exactly
 * as it was; the error is reported to the ErrorHandler and rethrown.
 */
class IdentityWorkflow {
public:
    IdentityWorkflow(identity::RecordRepository& repository,
                     models::EmbeddingExtractor& extractor,
                     const utils::ConfigPolicy& config,
                     audio::SilenceTrimmer trimmer = audio::SilenceTrimmer());

    /**
     * @throws ValidationException for bad names or date, before any audio work
     */
    EnrollmentOutcome enroll(const EnrollmentRequest& request,
                             const CancellationToken& token = CancellationToken());

    /**
     * @return nullopt when cancelled before matching
     */
    std::optional<identity::VerificationResult> verify(const std::string& audioPath,
                                                       const CancellationToken& token = CancellationToken());

    std::vector<identity::IdentityRecord> listIdentities() const;
    bool deleteIdentity(int64_t id);

private:
    identity::EmbeddingVector embed(const std::string& audioPath);

    identity::RecordRepository& repository_;
    models::EmbeddingExtractor& extractor_;
    const utils::ConfigPolicy& config_;
    audio::SilenceTrimmer trimmer_;
};

} // namespace core
} // namespace voiceguard
