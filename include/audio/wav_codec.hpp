#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace streamscribe {
namespace audio {

/**
 * Decoded PCM audio: mono samples normalized to [-1, 1).
 */
struct WavData {
    std::vector<float> samples;
    uint32_t sampleRate = 0;
    uint16_t channels = 0;        // channel count before downmix
    uint16_t bitsPerSample = 0;

    double durationSeconds() const {
        return sampleRate == 0 ? 0.0 : static_cast<double>(samples.size()) / sampleRate;
    }
};

/**
 * Decoder for RIFF/WAVE buffers holding integer PCM (16, 24 or 32 bit).
 *
 * Multi-channel frames are averaged into a single channel. Chunks are
 * scanned in order, unknown chunks are skipped by their declared length,
 * and scanning stops at the first data chunk. All failures are reported
 * as utils::AudioDecodeException.
 */
class WavDecoder {
public:
    static WavData decode(const std::vector<uint8_t>& bytes);
    static WavData decode(const uint8_t* bytes, size_t size);

    /**
     * Read a file and decode it. An unreadable path throws with
     * WavError::FILE_NOT_FOUND.
     */
    static WavData loadFile(const std::string& path);

private:
    static std::vector<float> decodeFrames(const uint8_t* data, size_t size,
                                           uint16_t channels, uint16_t bitsPerSample);
};

class WavEncoder {
public:
    // Mono 16-bit PCM container, samples clamped to [-1, 1].
    static std::vector<uint8_t> encodePcm16(const std::vector<float>& samples,
                                            uint32_t sampleRate);

    static void saveFile(const std::string& path, const std::vector<float>& samples,
                         uint32_t sampleRate);
};

} // namespace audio
} // namespace streamscribe
