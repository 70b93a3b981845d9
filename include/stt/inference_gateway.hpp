#pragma once

#include "stt/transcript.hpp"
#include "utils/error_handler.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace streamscribe {
namespace stt {

using ModelHandle = int32_t;
using StreamHandle = int32_t;

// Status codes returned by every gateway call. Negative values are errors.
constexpr int32_t STATUS_OK = 0;
constexpr int32_t STATUS_UNKNOWN_ERROR = -1;
constexpr int32_t STATUS_INVALID_HANDLE = -2;
constexpr int32_t STATUS_INVALID_ARGUMENT = -3;

// Re-run inference even if too little new audio has arrived.
constexpr uint32_t FLAG_FORCE_UPDATE = 1u << 0;

constexpr int32_t GATEWAY_HEADER_VERSION = 20000;

enum class ModelArch {
    TINY = 0,
    BASE = 1,
    TINY_STREAMING = 2,
    BASE_STREAMING = 3,
    SMALL_STREAMING = 4,
    MEDIUM_STREAMING = 5
};

std::string modelArchToString(ModelArch arch);
// Accepts "tiny", "base", "tiny-streaming", "base_streaming", ... (case-insensitive).
bool modelArchFromString(const std::string& name, ModelArch& arch);

struct TranscriberOption {
    std::string name;
    std::string value;
};

/**
 * Handle-based boundary to an inference engine.
 *
 * Every call returns a status code (STATUS_OK or a negative error). Model
 * handles own loaded weights, stream handles own per-stream audio and
 * transcript state. A stream handle is valid from createStream until
 * freeStream and must be freed before its model.
 *
 * transcribeStream reports per-line update flags relative to the previous
 * call on the same stream; callers rely on those flags instead of diffing.
 */
class InferenceGateway {
public:
    virtual ~InferenceGateway() = default;

    virtual int32_t loadModel(const std::string& path, ModelArch arch,
                              const std::vector<TranscriberOption>& options,
                              ModelHandle& model) = 0;
    virtual int32_t freeModel(ModelHandle model) = 0;

    virtual int32_t createStream(ModelHandle model, uint32_t flags, StreamHandle& stream) = 0;
    virtual int32_t freeStream(ModelHandle model, StreamHandle stream) = 0;
    virtual int32_t startStream(ModelHandle model, StreamHandle stream) = 0;
    virtual int32_t stopStream(ModelHandle model, StreamHandle stream) = 0;

    virtual int32_t pushAudio(ModelHandle model, StreamHandle stream,
                              const std::vector<float>& samples, int32_t sampleRate,
                              uint32_t flags) = 0;
    virtual int32_t transcribeStream(ModelHandle model, StreamHandle stream, uint32_t flags,
                                     Transcript& transcript) = 0;

    /**
     * Transcribe a complete buffer. Empty input yields an empty transcript.
     */
    virtual int32_t transcribeOneShot(ModelHandle model, const std::vector<float>& samples,
                                      int32_t sampleRate, uint32_t flags,
                                      Transcript& transcript) = 0;

    virtual std::string errorToString(int32_t status) const = 0;
    virtual int32_t version() const = 0;
};

/**
 * Map a status code onto the closed error taxonomy:
 * -1 unknown, -2 invalid handle, -3 invalid argument, anything else custom.
 */
utils::GatewayErrorCode gatewayErrorCodeFromStatus(int32_t status);

/**
 * Throw utils::GatewayException when status is negative. The message
 * names the operation and carries gateway.errorToString(status).
 */
void checkGatewayStatus(const InferenceGateway& gateway, int32_t status,
                        const std::string& operation);

} // namespace stt
} // namespace streamscribe
