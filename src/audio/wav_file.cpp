#include "audio/wav_file.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>

namespace voiceguard {
namespace audio {

namespace {

constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

uint16_t readU16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readU32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

void writeU16(std::ofstream& out, uint16_t v) {
    const char bytes[2] = {static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF)};
    out.write(bytes, 2);
}

void writeU32(std::ofstream& out, uint32_t v) {
    const char bytes[4] = {static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF),
                           static_cast<char>((v >> 16) & 0xFF), static_cast<char>((v >> 24) & 0xFF)};
    out.write(bytes, 4);
}

struct WavFormat {
    uint16_t formatTag = 0;
    uint16_t channels = 0;
    uint32_t sampleRate = 0;
    uint16_t bitsPerSample = 0;
};

std::vector<float> decodeSamples(const uint8_t* data, size_t size, const WavFormat& format,
                                 const std::string& path) {
    std::vector<float> samples;

    if (format.formatTag == kFormatFloat) {
        if (format.bitsPerSample != 32) {
            throw utils::AudioProcessingException("Unsupported float bit depth " +
                                                  std::to_string(format.bitsPerSample), path);
        }
        size_t count = size / 4;
        samples.resize(count);
        for (size_t i = 0; i < count; ++i) {
            uint32_t bits = readU32(data + i * 4);
            float value;
            std::memcpy(&value, &bits, sizeof(value));
            samples[i] = value;
        }
        return samples;
    }

    switch (format.bitsPerSample) {
        case 16: {
            size_t count = size / 2;
            samples.reserve(count);
            for (size_t i = 0; i < count; ++i) {
                int16_t sample = static_cast<int16_t>(readU16(data + i * 2));
                samples.push_back(static_cast<float>(sample) / 32768.0f);
            }
            break;
        }
        case 24: {
            size_t count = size / 3;
            samples.reserve(count);
            for (size_t i = 0; i < count; ++i) {
                const uint8_t* p = data + i * 3;
                int32_t sample = static_cast<int32_t>((static_cast<uint32_t>(p[0]) << 8) |
                                                      (static_cast<uint32_t>(p[1]) << 16) |
                                                      (static_cast<uint32_t>(p[2]) << 24));
                sample >>= 8; // Sign extend
                samples.push_back(static_cast<float>(sample) / 8388608.0f);
            }
            break;
        }
        case 32: {
            size_t count = size / 4;
            samples.reserve(count);
            for (size_t i = 0; i < count; ++i) {
                int32_t sample = static_cast<int32_t>(readU32(data + i * 4));
                samples.push_back(static_cast<float>(sample) / 2147483648.0f);
            }
            break;
        }
        default:
            throw utils::AudioProcessingException("Unsupported PCM bit depth " +
                                                  std::to_string(format.bitsPerSample), path);
    }
    return samples;
}

} // namespace

AudioBuffer WavFile::read(const std::string& path, uint32_t targetRate) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw utils::AudioProcessingException("Audio file not found or unreadable", path);
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        throw utils::AudioProcessingException("Not a RIFF/WAVE file", path);
    }

    WavFormat format;
    bool haveFormat = false;
    const uint8_t* data = nullptr;
    size_t dataSize = 0;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = bytes.data() + pos;
        uint32_t chunkSize = readU32(chunk + 4);
        size_t bodyStart = pos + 8;
        size_t available = bytes.size() - bodyStart;
        size_t bodySize = std::min<size_t>(chunkSize, available);

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (bodySize < 16) {
                throw utils::AudioProcessingException("Truncated fmt chunk", path);
            }
            const uint8_t* body = bytes.data() + bodyStart;
            format.formatTag = readU16(body);
            format.channels = readU16(body + 2);
            format.sampleRate = readU32(body + 4);
            format.bitsPerSample = readU16(body + 14);
            if (format.formatTag == kFormatExtensible && bodySize >= 26) {
                // First two bytes of the SubFormat GUID carry the real format tag
                format.formatTag = readU16(body + 24);
            }
            haveFormat = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            data = bytes.data() + bodyStart;
            dataSize = bodySize;
        }

        // Chunks are word aligned
        pos = bodyStart + chunkSize + (chunkSize & 1u);
    }

    if (!haveFormat || data == nullptr) {
        throw utils::AudioProcessingException("WAV file lacks fmt or data chunk", path);
    }
    if (format.formatTag != kFormatPcm && format.formatTag != kFormatFloat) {
        throw utils::AudioProcessingException("Unsupported WAV encoding " +
                                              std::to_string(format.formatTag), path);
    }
    if (format.channels == 0 || format.sampleRate == 0) {
        throw utils::AudioProcessingException("Invalid channel count or sample rate", path);
    }

    std::vector<float> interleaved = decodeSamples(data, dataSize, format, path);

    AudioBuffer buffer;
    buffer.samples = resample(averageChannels(interleaved, format.channels),
                              format.sampleRate, targetRate);
    buffer.sampleRate = targetRate;

    utils::Logger::debug("Read " + path + ": " + std::to_string(format.channels) + " channel(s) @ " +
                         std::to_string(format.sampleRate) + " Hz, " +
                         std::to_string(buffer.samples.size()) + " samples after conversion");
    return buffer;
}

void WavFile::write(const std::string& path, const AudioBuffer& buffer) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw utils::AudioProcessingException("Cannot open audio file for writing", path);
    }

    const uint16_t channels = 1;
    const uint16_t bitsPerSample = 16;
    const uint32_t dataSize = static_cast<uint32_t>(buffer.samples.size() * sizeof(int16_t));

    out.write("RIFF", 4);
    writeU32(out, 36 + dataSize);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    writeU32(out, 16);
    writeU16(out, kFormatPcm);
    writeU16(out, channels);
    writeU32(out, buffer.sampleRate);
    writeU32(out, buffer.sampleRate * channels * bitsPerSample / 8);
    writeU16(out, channels * bitsPerSample / 8);
    writeU16(out, bitsPerSample);
    out.write("data", 4);
    writeU32(out, dataSize);

    for (float sample : buffer.samples) {
        float clamped = std::max(-1.0f, std::min(1.0f, sample));
        writeU16(out, static_cast<uint16_t>(static_cast<int16_t>(std::lround(clamped * 32767.0f))));
    }

    out.flush();
    if (!out.good()) {
        throw utils::AudioProcessingException("Failed to write audio file", path);
    }
}

std::vector<float> WavFile::averageChannels(const std::vector<float>& interleaved, uint16_t channels) {
    if (channels <= 1) {
        return interleaved;
    }

    size_t frames = interleaved.size() / channels;
    std::vector<float> mono;
    mono.reserve(frames);
    for (size_t f = 0; f < frames; ++f) {
        float sum = 0.0f;
        for (uint16_t c = 0; c < channels; ++c) {
            sum += interleaved[f * channels + c];
        }
        mono.push_back(sum / channels);
    }
    return mono;
}

std::vector<float> WavFile::resample(const std::vector<float>& input,
                                     uint32_t inputRate, uint32_t outputRate) {
    if (inputRate == outputRate || input.empty()) {
        return input;
    }

    double ratio = static_cast<double>(outputRate) / static_cast<double>(inputRate);
    size_t outputSize = static_cast<size_t>(input.size() * ratio);
    std::vector<float> output;
    output.reserve(outputSize);

    for (size_t i = 0; i < outputSize; ++i) {
        double srcIndex = static_cast<double>(i) / ratio;
        size_t i0 = static_cast<size_t>(std::floor(srcIndex));
        size_t i1 = i0 + 1;
        if (i0 >= input.size()) {
            output.push_back(input.back());
        } else if (i1 >= input.size()) {
            output.push_back(input[i0]);
        } else {
            float frac = static_cast<float>(srcIndex - static_cast<double>(i0));
            output.push_back(input[i0] * (1.0f - frac) + input[i1] * frac);
        }
    }
    return output;
}

} // namespace audio
} // namespace voiceguard
