#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace voiceguard {
namespace audio {

constexpr uint32_t kModelSampleRate = 16000;

/**
 * Mono float samples in [-1, 1]
 */
struct AudioBuffer {
    std::vector<float> samples;
    uint32_t sampleRate = kModelSampleRate;

    double durationMs() const {
        return sampleRate == 0 ? 0.0 : samples.size() * 1000.0 / sampleRate;
    }
};

class WavFile {
public:
    /**
     * Decode a RIFF/WAVE file (PCM 16/24/32-bit or IEEE float 32-bit),
     * average channels to mono and resample to targetRate.
     * @throws AudioProcessingException if the file is missing or cannot be decoded
     */
    static AudioBuffer read(const std::string& path, uint32_t targetRate = kModelSampleRate);

    /**
     * Write 16-bit PCM mono.
     * @throws AudioProcessingException if the file cannot be written
     */
    static void write(const std::string& path, const AudioBuffer& buffer);

    static std::vector<float> averageChannels(const std::vector<float>& interleaved, uint16_t channels);

    // Linear interpolation resampler
    static std::vector<float> resample(const std::vector<float>& input,
                                       uint32_t inputRate, uint32_t outputRate);
};

} // namespace audio
} // namespace voiceguard
