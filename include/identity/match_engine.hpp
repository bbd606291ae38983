#pragma once

#include "identity/embedding_vector.hpp"
#include "identity/identity_record.hpp"
#include <optional>
#include <string>
#include <vector>

namespace voiceguard {
namespace identity {

enum class VerificationKind {
    MATCHED,
    NO_MATCH,
    NO_ENROLLMENTS
};

std::string toString(VerificationKind kind);

/**
 * Outcome of a verification. NO_ENROLLMENTS carries no score; NO_MATCH
 * carries the best score seen; MATCHED carries the winning record and score.
 */
struct VerificationResult {
    VerificationKind kind;
    std::optional<IdentityRecord> record;
    float score;
    size_t candidateIndex;

    static VerificationResult matched(IdentityRecord record, float score, size_t index);
    static VerificationResult noMatch(float bestScore, size_t index);
    static VerificationResult noEnrollments();

    bool isMatched() const { return kind == VerificationKind::MATCHED; }
};

/**
 * Nearest-neighbour matching over enrolled embeddings. Stateless: every call
 * is a pure function of its arguments.
 */
class MatchEngine {
public:
    MatchEngine() = delete;

    /**
     * Cosine similarity in [-1, 1]; 0 when either vector has zero norm.
     * @throws DimensionMismatchException if the dimensions differ
     */
    static float similarity(const EmbeddingVector& a, const EmbeddingVector& b);

    // Scores in candidate order
    static std::vector<float> scoreAll(const EmbeddingVector& query,
                                       const std::vector<IdentityRecord>& candidates);

    /**
     * Pick the best candidate (first occurrence of the maximum score) and
     * accept it when its score is >= threshold.
     */
    static VerificationResult verify(const EmbeddingVector& query,
                                     const std::vector<IdentityRecord>& candidates,
                                     float threshold);
};

} // namespace identity
} // namespace voiceguard
