#pragma once

#include "identity/embedding_vector.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace voiceguard {
namespace models {

/**
 * Speaker embedding model boundary: mono 16 kHz WAV path in, fixed-length
 * vector out.
 */
class EmbeddingExtractor {
public:
    virtual ~EmbeddingExtractor() = default;

    /**
     * @throws AudioProcessingException if the file is missing or undecodable
     * @throws ModelLoadingException / EmbeddingException on model failures
     */
    virtual identity::EmbeddingVector extract(const std::string& wavPath) = 0;

    virtual std::string getModelInfo() const = 0;
};

using EmbeddingExtractorFactory = std::function<std::unique_ptr<EmbeddingExtractor>()>;

/**
 * Defers construction of the wrapped extractor until the first extract()
 * call. Construction happens once; a failed construction is retried on the
 * next call.
 */
class LazyEmbeddingExtractor : public EmbeddingExtractor {
public:
    explicit LazyEmbeddingExtractor(EmbeddingExtractorFactory factory);

    identity::EmbeddingVector extract(const std::string& wavPath) override;
    std::string getModelInfo() const override;

    bool isLoaded() const;

private:
    EmbeddingExtractor& get();

    EmbeddingExtractorFactory factory_;
    std::unique_ptr<EmbeddingExtractor> instance_;
    mutable std::mutex mutex_;
};

} // namespace models
} // namespace voiceguard
