#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fixtures {

/**
 * Assembles RIFF/WAVE byte buffers chunk by chunk, including malformed
 * ones, for decoder tests.
 */
class WavBuilder {
public:
    WavBuilder& fmt(uint16_t encoding, uint16_t channels, uint32_t sampleRate, uint16_t bitsPerSample);
    WavBuilder& pcmFormat(uint16_t channels, uint32_t sampleRate, uint16_t bitsPerSample) {
        return fmt(1, channels, sampleRate, bitsPerSample);
    }

    WavBuilder& chunk(const std::string& tag, const std::vector<uint8_t>& payload);

    // Declares a length that differs from the payload actually written.
    WavBuilder& chunkWithLength(const std::string& tag, uint32_t declaredLength,
                                const std::vector<uint8_t>& payload);

    WavBuilder& data16(const std::vector<int16_t>& interleaved);
    WavBuilder& data24(const std::vector<int32_t>& interleaved);
    WavBuilder& data32(const std::vector<int32_t>& interleaved);

    WavBuilder& raw(const std::vector<uint8_t>& bytes);

    std::vector<uint8_t> build() const;

private:
    std::vector<uint8_t> body_;
};

std::vector<float> sineWave(float frequency, float durationSeconds, int sampleRate,
                            float amplitude = 0.5f);

} // namespace fixtures
