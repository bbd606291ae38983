#pragma once

#include "models/embedding_extractor.hpp"
#include <onnxruntime_cxx_api.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace voiceguard {
namespace models {

/**
 * ECAPA-TDNN style speaker model exported to ONNX.
 *
 * Input 0: waveform [1, samples] float at 16 kHz.
 * Optional input 1: relative lengths [1] float (SpeechBrain export), fed 1.0.
 * Output 0: embedding [1, D] or [1, 1, D].
 */
class OnnxEmbeddingExtractor : public EmbeddingExtractor {
public:
    /**
     * @throws ModelLoadingException if the model cannot be loaded
     */
    explicit OnnxEmbeddingExtractor(const std::string& modelPath, int intraOpThreads = 1);

    identity::EmbeddingVector extract(const std::string& wavPath) override;
    std::string getModelInfo() const override;

    identity::EmbeddingVector extractFromSamples(const std::vector<float>& samples);

private:
    std::string modelPath_;
    Ort::Env env_;
    Ort::SessionOptions sessionOptions_;
    std::unique_ptr<Ort::Session> session_;
    Ort::MemoryInfo memoryInfo_;

    std::vector<std::string> inputNames_;
    std::string outputName_;
    int64_t embeddingDim_ = -1;

    std::mutex inferenceMutex_;
};

} // namespace models
} // namespace voiceguard
