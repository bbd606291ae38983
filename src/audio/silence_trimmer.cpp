#include "audio/silence_trimmer.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <limits>

namespace voiceguard {
namespace audio {

SilenceTrimmer::SilenceTrimmer(const SilenceTrimmerConfig& config)
    : config_(config) {
}

float SilenceTrimmer::rmsDbfs(const float* samples, size_t count) {
    if (count == 0) {
        return -std::numeric_limits<float>::infinity();
    }

    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * samples[i];
    }
    double rms = std::sqrt(sum / count);
    if (rms <= 0.0) {
        return -std::numeric_limits<float>::infinity();
    }
    return static_cast<float>(20.0 * std::log10(rms));
}

AudioBuffer SilenceTrimmer::trim(const AudioBuffer& input) const {
    const size_t frameSize = std::max<size_t>(1, input.sampleRate * config_.frameMs / 1000);
    const size_t total = input.samples.size();
    if (total == 0) {
        return input;
    }

    const size_t frameCount = (total + frameSize - 1) / frameSize;
    size_t firstLoud = frameCount;
    size_t lastLoud = 0;

    for (size_t f = 0; f < frameCount; ++f) {
        size_t start = f * frameSize;
        size_t count = std::min(frameSize, total - start);
        if (rmsDbfs(input.samples.data() + start, count) >= config_.silenceThresholdDbfs) {
            if (firstLoud == frameCount) {
                firstLoud = f;
            }
            lastLoud = f;
        }
    }

    if (firstLoud == frameCount) {
        utils::Logger::debug("No speech above threshold, keeping recording as is");
        return input;
    }

    const size_t minSilenceSamples = static_cast<size_t>(input.sampleRate) * config_.minSilenceMs / 1000;

    size_t begin = firstLoud * frameSize;
    if (begin < minSilenceSamples) {
        begin = 0;
    }

    size_t end = std::min(total, (lastLoud + 1) * frameSize);
    if (total - end < minSilenceSamples) {
        end = total;
    }

    AudioBuffer output;
    output.sampleRate = input.sampleRate;
    output.samples.assign(input.samples.begin() + begin, input.samples.begin() + end);
    return output;
}

std::string SilenceTrimmer::trimFile(const std::string& path) const {
    AudioBuffer original = WavFile::read(path);
    AudioBuffer trimmed = trim(original);

    if (trimmed.samples.size() == original.samples.size()) {
        return path;
    }

    std::filesystem::path p(path);
    std::filesystem::path trimmedPath = p.parent_path() / (p.stem().string() + "_trimmed.wav");
    WavFile::write(trimmedPath.string(), trimmed);

    utils::Logger::debug("Trimmed " + path + " from " + std::to_string(original.durationMs()) +
                         " ms to " + std::to_string(trimmed.durationMs()) + " ms");
    return trimmedPath.string();
}

} // namespace audio
} // namespace voiceguard
