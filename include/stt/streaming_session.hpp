#pragma once

#include "stt/event_deriver.hpp"
#include "stt/inference_gateway.hpp"
#include "stt/listener_registry.hpp"
#include "stt/transcript.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace streamscribe {
namespace stt {

constexpr double DEFAULT_UPDATE_INTERVAL = 0.5;   // seconds of audio between updates
constexpr int32_t DEFAULT_SAMPLE_RATE = 16000;

enum class SessionState {
    CREATED,   // stream handle allocated
    RUNNING,   // accepting audio
    STOPPED,   // stopped, may be restarted
    CLOSED     // handle released
};

std::string sessionStateToString(SessionState state);

/**
 * One incremental transcription stream on an inference gateway.
 *
 * Audio pushed while running advances the stream clock, kept as integer
 * nanoseconds. When a chunk carries the clock across a multiple of
 * updateInterval, the gateway is asked for a fresh snapshot and the
 * resulting line events are delivered to the listeners before addAudio
 * returns. A chunk spanning several multiples triggers a single update.
 *
 * A session is driven from a single thread. Concurrent calls into the
 * same session must be serialized by the caller.
 */
class StreamingSession {
public:
    /**
     * Allocate a stream for model on gateway.
     * @throws utils::GatewayException if the stream cannot be created
     * @throws std::invalid_argument if updateInterval is not positive
     */
    StreamingSession(std::shared_ptr<InferenceGateway> gateway, ModelHandle model,
                     double updateInterval = DEFAULT_UPDATE_INTERVAL, uint32_t flags = 0);
    ~StreamingSession();

    StreamingSession(const StreamingSession&) = delete;
    StreamingSession& operator=(const StreamingSession&) = delete;

    // Calling start() on a running session does nothing.
    void start();

    /**
     * Stop accepting audio, flush the stream and run one final update so
     * every open line completes. Gateway failures are delivered to the
     * listeners as TranscriptError events instead of being thrown.
     */
    void stop();

    // Release the stream handle and drop all listeners. Idempotent.
    void close();

    /**
     * Forward mono samples to the gateway.
     * @throws utils::SessionStateException unless the session is running
     * @throws utils::GatewayException if the gateway rejects the audio
     */
    void addAudio(const std::vector<float>& samples, int32_t sampleRate = DEFAULT_SAMPLE_RATE);

    /**
     * Fetch a snapshot now, dispatch the derived events and return it.
     * Pass FLAG_FORCE_UPDATE to re-run inference on pending audio.
     */
    Transcript updateTranscription(uint32_t flags = 0);

    void addListener(const std::shared_ptr<TranscriptEventListener>& listener);
    void addListener(TranscriptEventCallback callback);
    bool removeListener(const std::shared_ptr<TranscriptEventListener>& listener);
    bool removeListener(const TranscriptEventCallback& callback);
    void removeAllListeners();

    StreamHandle handle() const { return handle_; }
    SessionState state() const { return state_; }
    bool isRunning() const { return state_ == SessionState::RUNNING; }
    bool isClosed() const { return state_ == SessionState::CLOSED; }
    double streamTime() const;
    double updateInterval() const { return updateInterval_; }
    const Transcript& lastTranscript() const { return lastTranscript_; }
    size_t listenerCount() const { return listeners_.size(); }
    std::string sessionId() const;

private:
    Transcript runUpdate(uint32_t flags);
    void emitError(std::exception_ptr cause);
    void requireOpen(const std::string& operation) const;

    std::shared_ptr<InferenceGateway> gateway_;
    ModelHandle model_;
    StreamHandle handle_;
    double updateInterval_;
    SessionState state_;

    uint64_t intervalTicks_;
    uint64_t streamTicks_;
    uint64_t lastUpdateCrossing_;

    Transcript lastTranscript_;
    TranscriptEventDeriver deriver_;
    ListenerRegistry listeners_;
};

} // namespace stt
} // namespace streamscribe
