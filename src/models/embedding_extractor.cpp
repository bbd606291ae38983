#include "models/embedding_extractor.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace voiceguard {
namespace models {

LazyEmbeddingExtractor::LazyEmbeddingExtractor(EmbeddingExtractorFactory factory)
    : factory_(std::move(factory)) {
}

identity::EmbeddingVector LazyEmbeddingExtractor::extract(const std::string& wavPath) {
    return get().extract(wavPath);
}

std::string LazyEmbeddingExtractor::getModelInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!instance_) {
        return "not loaded";
    }
    return instance_->getModelInfo();
}

bool LazyEmbeddingExtractor::isLoaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instance_ != nullptr;
}

EmbeddingExtractor& LazyEmbeddingExtractor::get() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!instance_) {
        if (!factory_) {
            throw utils::ModelLoadingException("No embedding extractor factory configured");
        }
        utils::Logger::info("Loading speaker embedding model");
        instance_ = factory_();
        if (!instance_) {
            throw utils::ModelLoadingException("Embedding extractor factory returned nothing");
        }
        utils::Logger::info("Speaker embedding model ready: " + instance_->getModelInfo());
    }
    return *instance_;
}

} // namespace models
} // namespace voiceguard
