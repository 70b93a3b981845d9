#pragma once

#include "stt/inference_gateway.hpp"
#include "stt/streaming_session.hpp"
#include "stt/transcript.hpp"
#include <memory>
#include <string>
#include <vector>

namespace streamscribe {
namespace stt {

/**
 * Owns one loaded model on an inference gateway.
 *
 * Offers one-shot transcription of complete buffers, creates streaming
 * sessions, and keeps a lazily created default session for callers that
 * only ever need one stream. Closing the transcriber closes every
 * session it created, then frees the model exactly once.
 */
class Transcriber {
public:
    /**
     * Load the model at modelPath.
     * @throws utils::GatewayException if the gateway cannot load it
     */
    Transcriber(std::shared_ptr<InferenceGateway> gateway, const std::string& modelPath,
                ModelArch arch = ModelArch::BASE,
                const std::vector<TranscriberOption>& options = {});
    ~Transcriber();

    Transcriber(const Transcriber&) = delete;
    Transcriber& operator=(const Transcriber&) = delete;

    // Empty input returns an empty transcript without calling the gateway.
    Transcript transcribeWithoutStreaming(const std::vector<float>& samples,
                                          int32_t sampleRate = DEFAULT_SAMPLE_RATE,
                                          uint32_t flags = 0);

    std::shared_ptr<StreamingSession> createStream(double updateInterval = DEFAULT_UPDATE_INTERVAL,
                                                   uint32_t flags = 0);

    // Created on first use and reused afterwards.
    StreamingSession& defaultStream();
    bool hasDefaultStream() const { return defaultStream_ != nullptr; }

    // Shortcuts operating on the default stream
    void start();
    void stop();
    void addAudio(const std::vector<float>& samples, int32_t sampleRate = DEFAULT_SAMPLE_RATE);
    void addListener(const std::shared_ptr<TranscriptEventListener>& listener);
    void addListener(TranscriptEventCallback callback);
    bool removeListener(const std::shared_ptr<TranscriptEventListener>& listener);
    bool removeListener(const TranscriptEventCallback& callback);
    void removeAllListeners();

    void close();

    int32_t version() const;
    ModelHandle modelHandle() const { return model_; }
    ModelArch arch() const { return arch_; }
    const std::string& modelPath() const { return modelPath_; }
    bool isClosed() const { return closed_; }

private:
    void requireOpen(const std::string& operation) const;

    std::shared_ptr<InferenceGateway> gateway_;
    std::string modelPath_;
    ModelArch arch_;
    ModelHandle model_;
    bool closed_;

    std::shared_ptr<StreamingSession> defaultStream_;
    std::vector<std::weak_ptr<StreamingSession>> sessions_;
};

} // namespace stt
} // namespace streamscribe
