#include "audio/audio_utils.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>

namespace streamscribe {
namespace audio {

std::vector<float> AudioFormatConverter::resample(const std::vector<float>& input,
                                                 uint32_t inputRate, uint32_t outputRate) {
    if (inputRate == outputRate || input.empty()) {
        return input;
    }
    if (inputRate == 0 || outputRate == 0) {
        utils::Logger::warn("Cannot resample with a zero sample rate");
        return {};
    }

    double ratio = static_cast<double>(outputRate) / static_cast<double>(inputRate);
    size_t outputSize = static_cast<size_t>(
        static_cast<uint64_t>(input.size()) * outputRate / inputRate);
    std::vector<float> output;
    output.reserve(outputSize);

    for (size_t i = 0; i < outputSize; ++i) {
        double srcIndex = static_cast<double>(i) / ratio;
        output.push_back(interpolate(input, srcIndex));
    }

    return output;
}

std::vector<float> AudioFormatConverter::downmixToMono(const std::vector<float>& interleaved,
                                                      uint16_t channels) {
    if (channels <= 1) {
        return interleaved;
    }
    if (interleaved.size() % channels != 0) {
        utils::Logger::warn("Interleaved data size is not a multiple of the channel count");
    }

    size_t frames = interleaved.size() / channels;
    std::vector<float> mono;
    mono.reserve(frames);

    for (size_t frame = 0; frame < frames; ++frame) {
        float sum = 0.0f;
        for (uint16_t ch = 0; ch < channels; ++ch) {
            sum += interleaved[frame * channels + ch];
        }
        mono.push_back(sum / static_cast<float>(channels));
    }

    return mono;
}

std::vector<int16_t> AudioFormatConverter::convertToPCM16(const std::vector<float>& samples) {
    std::vector<int16_t> pcm;
    pcm.reserve(samples.size());

    for (float sample : samples) {
        float clamped = std::max(-1.0f, std::min(1.0f, sample));
        long scaled = std::lround(clamped * 32768.0f);
        pcm.push_back(static_cast<int16_t>(std::max(-32768L, std::min(32767L, scaled))));
    }

    return pcm;
}

std::vector<std::vector<float>> AudioFormatConverter::splitIntoChunks(const std::vector<float>& samples,
                                                                    size_t chunkSize) {
    std::vector<std::vector<float>> chunks;
    if (chunkSize == 0) {
        return chunks;
    }

    for (size_t offset = 0; offset < samples.size(); offset += chunkSize) {
        size_t end = std::min(samples.size(), offset + chunkSize);
        chunks.emplace_back(samples.begin() + offset, samples.begin() + end);
    }

    return chunks;
}

size_t AudioFormatConverter::samplesForDuration(uint32_t sampleRate, uint32_t durationMs) {
    return static_cast<size_t>(sampleRate) * durationMs / 1000;
}

float AudioFormatConverter::interpolate(const std::vector<float>& data, double index) {
    if (data.empty()) return 0.0f;

    size_t i0 = static_cast<size_t>(std::floor(index));
    size_t i1 = i0 + 1;

    if (i0 >= data.size()) return data.back();
    if (i1 >= data.size()) return data[i0];

    float frac = static_cast<float>(index - static_cast<double>(i0));
    return data[i0] * (1.0f - frac) + data[i1] * frac;
}

} // namespace audio
} // namespace streamscribe
