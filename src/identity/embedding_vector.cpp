#include "identity/embedding_vector.hpp"
#include "utils/error_handler.hpp"
#include <nlohmann/json.hpp>
#include <cmath>

namespace voiceguard {
namespace identity {

EmbeddingVector::EmbeddingVector(std::vector<float> values)
    : values_(std::move(values)) {
}

double EmbeddingVector::norm() const {
    double sum = 0.0;
    for (float v : values_) {
        sum += static_cast<double>(v) * static_cast<double>(v);
    }
    return std::sqrt(sum);
}

void EmbeddingVector::requireSameDimension(const EmbeddingVector& other) const {
    if (values_.size() != other.values_.size()) {
        throw utils::DimensionMismatchException(values_.size(), other.values_.size());
    }
}

std::string EmbeddingVector::toString() const {
    nlohmann::json j = nlohmann::json::array();
    for (float v : values_) {
        j.push_back(v);
    }
    return j.dump();
}

EmbeddingVector EmbeddingVector::fromString(const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
        throw utils::ValidationException("Embedding text is not a JSON array", "embedding");
    }

    std::vector<float> values;
    values.reserve(j.size());
    for (const auto& element : j) {
        if (!element.is_number()) {
            throw utils::ValidationException("Embedding contains a non-numeric element", "embedding");
        }
        double value = element.get<double>();
        if (!std::isfinite(value)) {
            throw utils::ValidationException("Embedding contains a non-finite element", "embedding");
        }
        values.push_back(static_cast<float>(value));
    }
    return EmbeddingVector(std::move(values));
}

bool EmbeddingVector::approximatelyEquals(const EmbeddingVector& other, float tolerance) const {
    if (values_.size() != other.values_.size()) {
        return false;
    }
    for (size_t i = 0; i < values_.size(); ++i) {
        if (std::fabs(values_[i] - other.values_[i]) > tolerance) {
            return false;
        }
    }
    return true;
}

} // namespace identity
} // namespace voiceguard
