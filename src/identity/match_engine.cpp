#include "identity/match_engine.hpp"
#include "utils/error_handler.hpp"
#include <algorithm>
#include <cmath>

namespace voiceguard {
namespace identity {

std::string toString(VerificationKind kind) {
    switch (kind) {
        case VerificationKind::MATCHED: return "MATCHED";
        case VerificationKind::NO_MATCH: return "NO_MATCH";
        case VerificationKind::NO_ENROLLMENTS: return "NO_ENROLLMENTS";
    }
    return "UNKNOWN";
}

VerificationResult VerificationResult::matched(IdentityRecord record, float score, size_t index) {
    return VerificationResult{VerificationKind::MATCHED, std::move(record), score, index};
}

VerificationResult VerificationResult::noMatch(float bestScore, size_t index) {
    return VerificationResult{VerificationKind::NO_MATCH, std::nullopt, bestScore, index};
}

VerificationResult VerificationResult::noEnrollments() {
    return VerificationResult{VerificationKind::NO_ENROLLMENTS, std::nullopt, 0.0f, 0};
}

float MatchEngine::similarity(const EmbeddingVector& a, const EmbeddingVector& b) {
    a.requireSameDimension(b);

    const std::vector<float>& va = a.values();
    const std::vector<float>& vb = b.values();

    double dotProduct = 0.0;
    double norm1 = 0.0;
    double norm2 = 0.0;
    for (size_t i = 0; i < va.size(); ++i) {
        dotProduct += static_cast<double>(va[i]) * vb[i];
        norm1 += static_cast<double>(va[i]) * va[i];
        norm2 += static_cast<double>(vb[i]) * vb[i];
    }

    if (norm1 == 0.0 || norm2 == 0.0) {
        return 0.0f;
    }

    double cosine = dotProduct / (std::sqrt(norm1) * std::sqrt(norm2));
    return static_cast<float>(std::clamp(cosine, -1.0, 1.0));
}

std::vector<float> MatchEngine::scoreAll(const EmbeddingVector& query,
                                         const std::vector<IdentityRecord>& candidates) {
    std::vector<float> scores;
    scores.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        scores.push_back(similarity(query, candidate.embedding()));
    }
    return scores;
}

VerificationResult MatchEngine::verify(const EmbeddingVector& query,
                                       const std::vector<IdentityRecord>& candidates,
                                       float threshold) {
    if (candidates.empty()) {
        return VerificationResult::noEnrollments();
    }

    std::vector<float> scores = scoreAll(query, candidates);

    // max_element returns the first of equal maxima
    auto best = std::max_element(scores.begin(), scores.end());
    size_t bestIndex = static_cast<size_t>(std::distance(scores.begin(), best));
    float bestScore = *best;

    if (bestScore >= threshold) {
        return VerificationResult::matched(candidates[bestIndex], bestScore, bestIndex);
    }
    return VerificationResult::noMatch(bestScore, bestIndex);
}

} // namespace identity
} // namespace voiceguard
