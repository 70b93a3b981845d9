#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace streamscribe {
namespace audio {

// Sample rate expected by the inference engines.
constexpr uint32_t INTERNAL_SAMPLE_RATE = 16000;

// Audio format converter
class AudioFormatConverter {
public:
  AudioFormatConverter() = default;
  ~AudioFormatConverter() = default;

  // Sample rate conversion (linear interpolation)
  static std::vector<float> resample(const std::vector<float> &input,
                                     uint32_t inputRate, uint32_t outputRate);

  // Channel conversion
  static std::vector<float> downmixToMono(const std::vector<float> &interleaved,
                                          uint16_t channels);

  // Codec conversion
  static std::vector<int16_t> convertToPCM16(const std::vector<float> &samples);

  /**
   * Split samples into consecutive chunks of chunkSize samples.
   * The last chunk holds the remainder and may be shorter.
   */
  static std::vector<std::vector<float>>
  splitIntoChunks(const std::vector<float> &samples, size_t chunkSize);

  static size_t samplesForDuration(uint32_t sampleRate, uint32_t durationMs);

private:
  static float interpolate(const std::vector<float> &data, double index);
};

} // namespace audio
} // namespace streamscribe
