#pragma once

#include "stt/inference_gateway.hpp"
#include "stt/line_tracker.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct whisper_context;

namespace streamscribe {
namespace stt {

// Gateway-specific status codes (mapped to GatewayErrorCode::CUSTOM)
constexpr int32_t STATUS_MODEL_LOAD_FAILED = -4;
constexpr int32_t STATUS_INFERENCE_FAILED = -5;
constexpr int32_t STATUS_STREAM_NOT_STARTED = -6;

/**
 * InferenceGateway backed by whisper.cpp.
 *
 * Each stream keeps the audio that has not yet been committed to a
 * completed line. An inference pass transcribes that window; all whisper
 * segments except the last become complete lines and their audio is
 * dropped from the window. The last segment stays open until more audio
 * arrives, the window exceeds max_window_duration, or the stream stops.
 *
 * Supported options: n_threads, language, transcription_interval,
 * max_window_duration, return_audio_data.
 */
class WhisperGateway : public InferenceGateway {
public:
    WhisperGateway();
    ~WhisperGateway() override;

    WhisperGateway(const WhisperGateway&) = delete;
    WhisperGateway& operator=(const WhisperGateway&) = delete;

    int32_t loadModel(const std::string& path, ModelArch arch,
                      const std::vector<TranscriberOption>& options,
                      ModelHandle& model) override;
    int32_t freeModel(ModelHandle model) override;

    int32_t createStream(ModelHandle model, uint32_t flags, StreamHandle& stream) override;
    int32_t freeStream(ModelHandle model, StreamHandle stream) override;
    int32_t startStream(ModelHandle model, StreamHandle stream) override;
    int32_t stopStream(ModelHandle model, StreamHandle stream) override;

    int32_t pushAudio(ModelHandle model, StreamHandle stream,
                      const std::vector<float>& samples, int32_t sampleRate,
                      uint32_t flags) override;
    int32_t transcribeStream(ModelHandle model, StreamHandle stream, uint32_t flags,
                             Transcript& transcript) override;
    int32_t transcribeOneShot(ModelHandle model, const std::vector<float>& samples,
                              int32_t sampleRate, uint32_t flags,
                              Transcript& transcript) override;

    std::string errorToString(int32_t status) const override;
    int32_t version() const override;

private:
    struct ModelOptions {
        int nThreads = 4;
        std::string language = "en";
        double transcriptionInterval = 0.5;
        double maxWindowDuration = 20.0;
        bool returnAudioData = false;
    };

    struct ModelState {
        whisper_context* ctx = nullptr;
        ModelArch arch = ModelArch::BASE;
        ModelOptions options;
        std::mutex inferenceMutex;
    };

    struct StreamState {
        ModelHandle model = 0;
        bool active = false;
        std::vector<float> window;        // uncommitted audio at 16 kHz
        double windowStartTime = 0.0;     // seconds
        size_t newSamples = 0;            // samples since the last inference pass
        LineTracker lines;
        std::mutex mutex;
    };

    struct Segment {
        std::string text;
        double start = 0.0;   // seconds, relative to the transcribed buffer
        double end = 0.0;
    };

    static bool parseOptions(const std::vector<TranscriberOption>& options, ModelOptions& parsed,
                             std::string& error);
    int32_t runInference(ModelState& model, const std::vector<float>& audio,
                         std::vector<Segment>& segments);
    int32_t findModel(ModelHandle handle, std::shared_ptr<ModelState>& model);
    int32_t findStream(ModelHandle model, StreamHandle handle, std::shared_ptr<StreamState>& stream);
    static int32_t guarded(const char* operation, const std::function<int32_t()>& call);

    std::mutex tablesMutex_;
    std::map<ModelHandle, std::shared_ptr<ModelState>> models_;
    std::map<StreamHandle, std::shared_ptr<StreamState>> streams_;
    ModelHandle nextModelHandle_;
    StreamHandle nextStreamHandle_;
};

} // namespace stt
} // namespace streamscribe
