#include "audio/wav_codec.hpp"
#include "audio/audio_utils.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <cstring>
#include <fstream>
#include <iterator>

namespace streamscribe {
namespace audio {

namespace {

constexpr uint16_t WAVE_FORMAT_PCM = 1;
constexpr size_t RIFF_HEADER_SIZE = 12;
constexpr size_t CHUNK_HEADER_SIZE = 8;
constexpr size_t MIN_FMT_CHUNK_SIZE = 16;

uint16_t readLE16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readLE32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

void writeLE16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void writeLE32(std::vector<uint8_t>& out, uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

void writeTag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

bool tagEquals(const uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

struct FormatChunk {
    uint16_t channels = 0;
    uint32_t sampleRate = 0;
    uint16_t bitsPerSample = 0;
};

FormatChunk parseFormatChunk(const uint8_t* payload, uint32_t length) {
    if (length < MIN_FMT_CHUNK_SIZE) {
        throw utils::AudioDecodeException(utils::WavError::MISSING_FORMAT_CHUNK,
            "fmt chunk is " + std::to_string(length) + " bytes, expected at least 16");
    }

    uint16_t encoding = readLE16(payload);
    if (encoding != WAVE_FORMAT_PCM) {
        throw utils::AudioDecodeException(utils::WavError::UNSUPPORTED_ENCODING,
            "encoding code " + std::to_string(encoding) + " is not integer PCM");
    }

    FormatChunk format;
    format.channels = readLE16(payload + 2);
    format.sampleRate = readLE32(payload + 4);
    format.bitsPerSample = readLE16(payload + 14);

    if (format.channels == 0) {
        throw utils::AudioDecodeException(utils::WavError::INVALID_CONTAINER,
                                          "fmt chunk declares zero channels");
    }
    if (format.bitsPerSample != 16 && format.bitsPerSample != 24 &&
        format.bitsPerSample != 32) {
        throw utils::AudioDecodeException(utils::WavError::UNSUPPORTED_BIT_DEPTH,
            std::to_string(format.bitsPerSample) + " bits per sample");
    }
    return format;
}

} // namespace

WavData WavDecoder::decode(const std::vector<uint8_t>& bytes) {
    return decode(bytes.data(), bytes.size());
}

WavData WavDecoder::decode(const uint8_t* bytes, size_t size) {
    if (size < RIFF_HEADER_SIZE || !tagEquals(bytes, "RIFF") ||
        !tagEquals(bytes + 8, "WAVE")) {
        throw utils::AudioDecodeException(utils::WavError::INVALID_CONTAINER,
                                          "missing RIFF/WAVE header");
    }

    bool haveFormat = false;
    FormatChunk format;
    size_t offset = RIFF_HEADER_SIZE;

    while (offset < size) {
        if (size - offset < CHUNK_HEADER_SIZE) {
            throw utils::AudioDecodeException(utils::WavError::TRUNCATED_CHUNK,
                "chunk header at offset " + std::to_string(offset) + " is incomplete");
        }

        const uint8_t* header = bytes + offset;
        uint32_t length = readLE32(header + 4);
        size_t payloadOffset = offset + CHUNK_HEADER_SIZE;

        if (length > size - payloadOffset) {
            throw utils::AudioDecodeException(utils::WavError::TRUNCATED_CHUNK,
                "chunk '" + std::string(reinterpret_cast<const char*>(header), 4) +
                "' declares " + std::to_string(length) + " bytes but only " +
                std::to_string(size - payloadOffset) + " remain");
        }

        const uint8_t* payload = bytes + payloadOffset;

        if (tagEquals(header, "fmt ")) {
            format = parseFormatChunk(payload, length);
            haveFormat = true;
        } else if (tagEquals(header, "data")) {
            if (!haveFormat) {
                throw utils::AudioDecodeException(utils::WavError::MISSING_FORMAT_CHUNK,
                                                  "data chunk precedes fmt chunk");
            }

            WavData result;
            result.sampleRate = format.sampleRate;
            result.channels = format.channels;
            result.bitsPerSample = format.bitsPerSample;
            result.samples = decodeFrames(payload, length, format.channels, format.bitsPerSample);
            return result;
        }

        offset = payloadOffset + length;
    }

    if (!haveFormat) {
        throw utils::AudioDecodeException(utils::WavError::MISSING_FORMAT_CHUNK,
                                          "no fmt chunk found");
    }
    throw utils::AudioDecodeException(utils::WavError::MISSING_DATA_CHUNK,
                                      "no data chunk found");
}

WavData WavDecoder::loadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw utils::AudioDecodeException(utils::WavError::FILE_NOT_FOUND,
                                          "cannot open file", path);
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());

    try {
        WavData data = decode(bytes);
        utils::Logger::debug("Decoded " + path + ": " + std::to_string(data.samples.size()) +
                             " samples at " + std::to_string(data.sampleRate) + " Hz");
        return data;
    } catch (const utils::AudioDecodeException& e) {
        throw utils::AudioDecodeException(e.getWavError(), e.getErrorInfo().details, path);
    }
}

std::vector<float> WavDecoder::decodeFrames(const uint8_t* data, size_t size,
                                            uint16_t channels, uint16_t bitsPerSample) {
    const size_t bytesPerSample = bitsPerSample / 8;
    const size_t bytesPerFrame = bytesPerSample * channels;
    const size_t frameCount = size / bytesPerFrame;

    std::vector<float> samples;
    samples.reserve(frameCount);

    for (size_t frame = 0; frame < frameCount; ++frame) {
        const uint8_t* p = data + frame * bytesPerFrame;
        float sum = 0.0f;

        for (uint16_t ch = 0; ch < channels; ++ch, p += bytesPerSample) {
            switch (bitsPerSample) {
                case 16:
                    sum += static_cast<float>(static_cast<int16_t>(readLE16(p))) / 32768.0f;
                    break;
                case 24: {
                    int32_t value = static_cast<int32_t>(p[0] | (p[1] << 8) | (p[2] << 16));
                    if (value & 0x800000) {
                        value -= 0x1000000;
                    }
                    sum += static_cast<float>(value) / 8388608.0f;
                    break;
                }
                case 32:
                    sum += static_cast<float>(static_cast<double>(static_cast<int32_t>(readLE32(p))) /
                                              2147483648.0);
                    break;
            }
        }

        samples.push_back(channels == 1 ? sum : sum / static_cast<float>(channels));
    }

    return samples;
}

std::vector<uint8_t> WavEncoder::encodePcm16(const std::vector<float>& samples,
                                             uint32_t sampleRate) {
    const std::vector<int16_t> pcm = AudioFormatConverter::convertToPCM16(samples);
    const uint32_t dataSize = static_cast<uint32_t>(pcm.size() * sizeof(int16_t));

    std::vector<uint8_t> out;
    out.reserve(44 + dataSize);

    writeTag(out, "RIFF");
    writeLE32(out, 36 + dataSize);
    writeTag(out, "WAVE");

    writeTag(out, "fmt ");
    writeLE32(out, 16);
    writeLE16(out, WAVE_FORMAT_PCM);
    writeLE16(out, 1);
    writeLE32(out, sampleRate);
    writeLE32(out, sampleRate * 2);
    writeLE16(out, 2);
    writeLE16(out, 16);

    writeTag(out, "data");
    writeLE32(out, dataSize);
    for (int16_t sample : pcm) {
        writeLE16(out, static_cast<uint16_t>(sample));
    }

    return out;
}

void WavEncoder::saveFile(const std::string& path, const std::vector<float>& samples,
                          uint32_t sampleRate) {
    std::vector<uint8_t> bytes = encodePcm16(samples, sampleRate);
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw utils::StreamScribeException(utils::ErrorInfo(
            utils::ErrorCategory::SYSTEM, utils::ErrorSeverity::ERROR,
            "Failed to open output file", path, "WavEncoder"));
    }
    file.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        throw utils::StreamScribeException(utils::ErrorInfo(
            utils::ErrorCategory::SYSTEM, utils::ErrorSeverity::ERROR,
            "Failed to write output file", path, "WavEncoder"));
    }
}

} // namespace audio
} // namespace streamscribe
