#include "models/onnx_embedding_extractor.hpp"
#include "audio/wav_file.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <cmath>
#include <filesystem>

namespace voiceguard {
namespace models {

OnnxEmbeddingExtractor::OnnxEmbeddingExtractor(const std::string& modelPath, int intraOpThreads)
    : modelPath_(modelPath),
      env_(ORT_LOGGING_LEVEL_WARNING, "voiceguard-embedding"),
      memoryInfo_(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)) {

    std::error_code ec;
    if (modelPath.empty() || !std::filesystem::exists(modelPath, ec)) {
        throw utils::ModelLoadingException("Speaker embedding model not found", modelPath);
    }

    sessionOptions_.SetIntraOpNumThreads(intraOpThreads);
    sessionOptions_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

    try {
        session_ = std::make_unique<Ort::Session>(env_, modelPath.c_str(), sessionOptions_);

        Ort::AllocatorWithDefaultOptions allocator;
        size_t inputCount = session_->GetInputCount();
        if (inputCount == 0 || inputCount > 2) {
            throw utils::ModelLoadingException("Unexpected number of model inputs: " +
                                               std::to_string(inputCount), modelPath);
        }
        for (size_t i = 0; i < inputCount; ++i) {
            auto name = session_->GetInputNameAllocated(i, allocator);
            inputNames_.emplace_back(name.get());
        }

        auto outputName = session_->GetOutputNameAllocated(0, allocator);
        outputName_ = outputName.get();

        auto outputShape = session_->GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        if (!outputShape.empty()) {
            embeddingDim_ = outputShape.back();
        }
    } catch (const Ort::Exception& e) {
        throw utils::ModelLoadingException("Failed to load speaker embedding model: " +
                                           std::string(e.what()), modelPath);
    }

    utils::Logger::info("Speaker embedding model loaded: " + getModelInfo());
}

identity::EmbeddingVector OnnxEmbeddingExtractor::extract(const std::string& wavPath) {
    audio::AudioBuffer buffer = audio::WavFile::read(wavPath, audio::kModelSampleRate);
    if (buffer.samples.empty()) {
        throw utils::AudioProcessingException("Recording contains no samples", wavPath);
    }
    return extractFromSamples(buffer.samples);
}

identity::EmbeddingVector OnnxEmbeddingExtractor::extractFromSamples(const std::vector<float>& samples) {
    std::lock_guard<std::mutex> lock(inferenceMutex_);

    try {
        std::vector<float> waveform(samples);
        std::vector<int64_t> waveShape = {1, static_cast<int64_t>(waveform.size())};

        std::vector<float> lengths = {1.0f};
        std::vector<int64_t> lengthShape = {1};

        std::vector<Ort::Value> inputs;
        inputs.push_back(Ort::Value::CreateTensor<float>(
            memoryInfo_, waveform.data(), waveform.size(), waveShape.data(), waveShape.size()));
        if (inputNames_.size() == 2) {
            inputs.push_back(Ort::Value::CreateTensor<float>(
                memoryInfo_, lengths.data(), lengths.size(), lengthShape.data(), lengthShape.size()));
        }

        std::vector<const char*> inputNames;
        for (const auto& name : inputNames_) {
            inputNames.push_back(name.c_str());
        }
        const char* outputNames[] = {outputName_.c_str()};

        auto outputs = session_->Run(Ort::RunOptions{nullptr},
                                     inputNames.data(), inputs.data(), inputs.size(),
                                     outputNames, 1);
        if (outputs.empty() || !outputs[0].IsTensor()) {
            throw utils::EmbeddingException("Model produced no embedding tensor", modelPath_);
        }

        auto info = outputs[0].GetTensorTypeAndShapeInfo();
        size_t count = info.GetElementCount();
        const float* data = outputs[0].GetTensorData<float>();

        std::vector<float> values(data, data + count);
        for (float v : values) {
            if (!std::isfinite(v)) {
                throw utils::EmbeddingException("Model produced a non-finite embedding", modelPath_);
            }
        }
        if (values.empty()) {
            throw utils::EmbeddingException("Model produced an empty embedding", modelPath_);
        }
        return identity::EmbeddingVector(std::move(values));

    } catch (const Ort::Exception& e) {
        throw utils::EmbeddingException("Speaker embedding inference failed: " + std::string(e.what()),
                                        modelPath_);
    }
}

std::string OnnxEmbeddingExtractor::getModelInfo() const {
    std::string info = modelPath_ + " (inputs:";
    for (const auto& name : inputNames_) {
        info += " " + name;
    }
    info += ", output: " + outputName_;
    if (embeddingDim_ > 0) {
        info += " [" + std::to_string(embeddingDim_) + "]";
    }
    return info + ")";
}

} // namespace models
} // namespace voiceguard
