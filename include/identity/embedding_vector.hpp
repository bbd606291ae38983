#pragma once

#include <string>
#include <vector>

namespace voiceguard {
namespace identity {

/**
 * Fixed-length speaker embedding produced by the upstream model.
 *
 * The dimension is whatever the model emits (192 for ECAPA-TDNN); every
 * vector compared against another must share it. The textual form is a JSON
 * array of numbers, order-preserving and lossless to float precision.
 */
class EmbeddingVector {
public:
    EmbeddingVector() = default;
    explicit EmbeddingVector(std::vector<float> values);

    size_t dimension() const { return values_.size(); }
    bool empty() const { return values_.empty(); }
    const std::vector<float>& values() const { return values_; }
    float operator[](size_t index) const { return values_[index]; }

    double norm() const;

    // Throws DimensionMismatchException when dimensions differ
    void requireSameDimension(const EmbeddingVector& other) const;

    std::string toString() const;

    /**
     * Parse the textual form
     * @throws ValidationException on anything but a JSON array of finite numbers
     */
    static EmbeddingVector fromString(const std::string& text);

    bool operator==(const EmbeddingVector& other) const { return values_ == other.values_; }
    bool operator!=(const EmbeddingVector& other) const { return !(*this == other); }

    // Element-wise comparison with an absolute tolerance
    bool approximatelyEquals(const EmbeddingVector& other, float tolerance = 1e-6f) const;

private:
    std::vector<float> values_;
};

} // namespace identity
} // namespace voiceguard
