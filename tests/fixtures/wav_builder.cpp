#include "wav_builder.hpp"
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace fixtures {

namespace {

void put16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>(value >> 8));
}

void put32(std::vector<uint8_t>& out, uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

void putTag(std::vector<uint8_t>& out, const std::string& tag) {
    for (size_t i = 0; i < 4; ++i) {
        out.push_back(i < tag.size() ? static_cast<uint8_t>(tag[i]) : ' ');
    }
}

} // namespace

WavBuilder& WavBuilder::fmt(uint16_t encoding, uint16_t channels, uint32_t sampleRate,
                            uint16_t bitsPerSample) {
    std::vector<uint8_t> payload;
    const uint16_t blockAlign = static_cast<uint16_t>(channels * (bitsPerSample / 8));
    put16(payload, encoding);
    put16(payload, channels);
    put32(payload, sampleRate);
    put32(payload, sampleRate * blockAlign);
    put16(payload, blockAlign);
    put16(payload, bitsPerSample);
    return chunk("fmt ", payload);
}

WavBuilder& WavBuilder::chunk(const std::string& tag, const std::vector<uint8_t>& payload) {
    return chunkWithLength(tag, static_cast<uint32_t>(payload.size()), payload);
}

WavBuilder& WavBuilder::chunkWithLength(const std::string& tag, uint32_t declaredLength,
                                        const std::vector<uint8_t>& payload) {
    putTag(body_, tag);
    put32(body_, declaredLength);
    body_.insert(body_.end(), payload.begin(), payload.end());
    return *this;
}

WavBuilder& WavBuilder::data16(const std::vector<int16_t>& interleaved) {
    std::vector<uint8_t> payload;
    for (int16_t sample : interleaved) {
        put16(payload, static_cast<uint16_t>(sample));
    }
    return chunk("data", payload);
}

WavBuilder& WavBuilder::data24(const std::vector<int32_t>& interleaved) {
    std::vector<uint8_t> payload;
    for (int32_t sample : interleaved) {
        uint32_t bits = static_cast<uint32_t>(sample);
        payload.push_back(static_cast<uint8_t>(bits & 0xFF));
        payload.push_back(static_cast<uint8_t>((bits >> 8) & 0xFF));
        payload.push_back(static_cast<uint8_t>((bits >> 16) & 0xFF));
    }
    return chunk("data", payload);
}

WavBuilder& WavBuilder::data32(const std::vector<int32_t>& interleaved) {
    std::vector<uint8_t> payload;
    for (int32_t sample : interleaved) {
        put32(payload, static_cast<uint32_t>(sample));
    }
    return chunk("data", payload);
}

WavBuilder& WavBuilder::raw(const std::vector<uint8_t>& bytes) {
    body_.insert(body_.end(), bytes.begin(), bytes.end());
    return *this;
}

std::vector<uint8_t> WavBuilder::build() const {
    std::vector<uint8_t> out;
    putTag(out, "RIFF");
    put32(out, static_cast<uint32_t>(4 + body_.size()));
    putTag(out, "WAVE");
    out.insert(out.end(), body_.begin(), body_.end());
    return out;
}

std::vector<float> sineWave(float frequency, float durationSeconds, int sampleRate, float amplitude) {
    const size_t count = static_cast<size_t>(durationSeconds * static_cast<float>(sampleRate));
    std::vector<float> samples(count);
    for (size_t i = 0; i < count; ++i) {
        samples[i] = amplitude * static_cast<float>(
            std::sin(2.0 * M_PI * frequency * static_cast<double>(i) / sampleRate));
    }
    return samples;
}

} // namespace fixtures
