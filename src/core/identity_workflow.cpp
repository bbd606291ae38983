#include "core/identity_workflow.hpp"
#include "identity/session.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <filesystem>

namespace voiceguard {
namespace core {

namespace {

// Removes an intermediate audio file when the attempt ends, however it ends
class ScopedTempFile {
public:
    ScopedTempFile(std::string path, const std::string& source)
        : path_(path != source ? std::move(path) : std::string()) {}

    ~ScopedTempFile() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
            if (ec) {
                utils::Logger::warn("Could not remove temporary audio " + path_ + ": " + ec.message());
            }
        }
    }

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

private:
    std::string path_;
};

bool isBlank(const std::string& value) {
    return value.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

IdentityWorkflow::IdentityWorkflow(identity::RecordRepository& repository,
                                   models::EmbeddingExtractor& extractor,
                                   const utils::ConfigPolicy& config,
                                   audio::SilenceTrimmer trimmer)
    : repository_(repository), extractor_(extractor), config_(config), trimmer_(trimmer) {
}

EnrollmentOutcome IdentityWorkflow::enroll(const EnrollmentRequest& request,
                                           const CancellationToken& token) {
    try {
        if (isBlank(request.firstName)) {
            throw utils::ValidationException("First name must not be empty", "first_name");
        }
        if (isBlank(request.lastName)) {
            throw utils::ValidationException("Last name must not be empty", "last_name");
        }
        identity::CalendarDate dateOfBirth = identity::CalendarDate::parse(request.dateOfBirth);

        if (token.isCancelled()) {
            utils::Logger::info("Enrollment cancelled before processing");
            return EnrollmentOutcome{EnrollmentStatus::CANCELLED, std::nullopt};
        }

        identity::EmbeddingVector embedding = embed(request.audioPath);

        if (token.isCancelled()) {
            utils::Logger::info("Enrollment cancelled, embedding discarded");
            return EnrollmentOutcome{EnrollmentStatus::CANCELLED, std::nullopt};
        }

        identity::Session session(repository_);
        session.add(identity::IdentityRecord(request.firstName, request.lastName,
                                             dateOfBirth, std::move(embedding)));
        std::vector<identity::IdentityRecord> committed = session.commit();

        const identity::IdentityRecord& record = committed.front();
        utils::Logger::info("Enrolled " + record.fullName() + " with id " + std::to_string(*record.id()));
        return EnrollmentOutcome{EnrollmentStatus::ENROLLED, record};

    } catch (const std::exception& e) {
        utils::ErrorHandler::getInstance().reportError(e, "Enrollment");
        throw;
    }
}

std::optional<identity::VerificationResult> IdentityWorkflow::verify(const std::string& audioPath,
                                                                     const CancellationToken& token) {
    try {
        if (token.isCancelled()) {
            return std::nullopt;
        }

        identity::EmbeddingVector query = embed(audioPath);

        if (token.isCancelled()) {
            utils::Logger::info("Verification cancelled, embedding discarded");
            return std::nullopt;
        }

        std::vector<identity::IdentityRecord> candidates = identity::Session(repository_).query().all();
        float threshold = static_cast<float>(config_.getSimilarityThreshold());
        identity::VerificationResult result = identity::MatchEngine::verify(query, candidates, threshold);

        switch (result.kind) {
            case identity::VerificationKind::MATCHED:
                utils::Logger::info("Verified as " + result.record->fullName() +
                                    " (score " + std::to_string(result.score) + ")");
                break;
            case identity::VerificationKind::NO_MATCH:
                utils::Logger::info("No match; best similarity " + std::to_string(result.score) +
                                    " below threshold " + std::to_string(threshold));
                break;
            case identity::VerificationKind::NO_ENROLLMENTS:
                utils::Logger::info("No enrolled identities to verify against");
                break;
        }
        return result;

    } catch (const std::exception& e) {
        utils::ErrorHandler::getInstance().reportError(e, "Verification");
        throw;
    }
}

std::vector<identity::IdentityRecord> IdentityWorkflow::listIdentities() const {
    return identity::Session(repository_).query().all();
}

bool IdentityWorkflow::deleteIdentity(int64_t id) {
    try {
        bool removed = repository_.remove(id);
        if (removed) {
            utils::Logger::info("Deleted identity " + std::to_string(id));
        } else {
            utils::Logger::warn("No identity with id " + std::to_string(id));
        }
        return removed;
    } catch (const std::exception& e) {
        utils::ErrorHandler::getInstance().reportError(e, "Delete");
        throw;
    }
}

identity::EmbeddingVector IdentityWorkflow::embed(const std::string& audioPath) {
    std::string trimmedPath = trimmer_.trimFile(audioPath);
    ScopedTempFile cleanup(trimmedPath, audioPath);
    return extractor_.extract(trimmedPath);
}

} // namespace core
} // namespace voiceguard
