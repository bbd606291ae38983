#pragma once

#include "audio/wav_file.hpp"

namespace voiceguard {
namespace audio {

struct SilenceTrimmerConfig {
    float silenceThresholdDbfs = -40.0f;
    uint32_t minSilenceMs = 300;
    uint32_t frameMs = 10;
};

/**
 * Strips leading and trailing silence from a recording. A silent run is only
 * removed when it lasts at least minSilenceMs; a recording with no frame above
 * the threshold is returned unchanged.
 */
class SilenceTrimmer {
public:
    SilenceTrimmer() = default;
    explicit SilenceTrimmer(const SilenceTrimmerConfig& config);

    AudioBuffer trim(const AudioBuffer& input) const;

    // Read path, trim, write <stem>_trimmed.wav beside it and return the new path
    std::string trimFile(const std::string& path) const;

    static float rmsDbfs(const float* samples, size_t count);

    const SilenceTrimmerConfig& config() const { return config_; }

private:
    SilenceTrimmerConfig config_;
};

} // namespace audio
} // namespace voiceguard
