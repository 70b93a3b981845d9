#include "stt/streaming_session.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace streamscribe {
namespace stt {

namespace {

constexpr uint64_t TICKS_PER_SECOND = 1000000000ULL;

} // namespace

std::string sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::CREATED: return "created";
        case SessionState::RUNNING: return "running";
        case SessionState::STOPPED: return "stopped";
        case SessionState::CLOSED: return "closed";
    }
    return "unknown";
}

StreamingSession::StreamingSession(std::shared_ptr<InferenceGateway> gateway, ModelHandle model,
                                   double updateInterval, uint32_t flags)
    : gateway_(std::move(gateway))
    , model_(model)
    , handle_(0)
    , updateInterval_(updateInterval)
    , state_(SessionState::CREATED)
    , intervalTicks_(0)
    , streamTicks_(0)
    , lastUpdateCrossing_(0) {
    if (!gateway_) {
        throw std::invalid_argument("StreamingSession requires an inference gateway");
    }
    if (!(updateInterval_ > 0.0)) {
        throw std::invalid_argument("Update interval must be positive, got " +
                                    std::to_string(updateInterval_));
    }
    intervalTicks_ = std::max<uint64_t>(
        1, static_cast<uint64_t>(std::llround(updateInterval_ * static_cast<double>(TICKS_PER_SECOND))));

    checkGatewayStatus(*gateway_, gateway_->createStream(model_, flags, handle_), "createStream");
    utils::Logger::debug("Created " + sessionId() + " on model " + std::to_string(model_));
}

StreamingSession::~StreamingSession() {
    close();
}

void StreamingSession::start() {
    requireOpen("start");
    if (state_ == SessionState::RUNNING) {
        utils::Logger::warn(sessionId() + " is already running, ignoring start()");
        return;
    }

    utils::ErrorContext context("StreamingSession::start", sessionId());
    checkGatewayStatus(*gateway_, gateway_->startStream(model_, handle_), "startStream");

    state_ = SessionState::RUNNING;
    streamTicks_ = 0;
    lastUpdateCrossing_ = 0;
    lastTranscript_ = Transcript{};
    deriver_.reset();
    utils::Logger::debug(sessionId() + " started");
}

void StreamingSession::stop() {
    if (state_ != SessionState::RUNNING) {
        utils::Logger::debug(sessionId() + " is " + sessionStateToString(state_) +
                             ", ignoring stop()");
        return;
    }

    utils::ErrorContext context("StreamingSession::stop", sessionId());
    state_ = SessionState::STOPPED;

    try {
        checkGatewayStatus(*gateway_, gateway_->stopStream(model_, handle_), "stopStream");
    } catch (const std::exception& e) {
        HANDLE_EXCEPTION_AS_WARNING(e, "StreamingSession::stop");
        emitError(std::current_exception());
    }

    try {
        runUpdate(0);
    } catch (const std::exception& e) {
        HANDLE_EXCEPTION_AS_WARNING(e, "StreamingSession::stop final update");
        emitError(std::current_exception());
    }

    utils::Logger::debug(sessionId() + " stopped after " + std::to_string(streamTime()) + "s");
}

void StreamingSession::close() {
    if (state_ == SessionState::CLOSED) {
        return;
    }

    utils::ErrorContext context("StreamingSession::close", sessionId());
    state_ = SessionState::CLOSED;

    try {
        int32_t status = gateway_->freeStream(model_, handle_);
        if (status < STATUS_OK) {
            HANDLE_ERROR(utils::ErrorCategory::INFERENCE_GATEWAY, utils::ErrorSeverity::WARNING,
                         "Failed to free stream " + std::to_string(handle_),
                         gateway_->errorToString(status));
        }
    } catch (const std::exception& e) {
        HANDLE_EXCEPTION_AS_WARNING(e, "StreamingSession::close");
    }

    listeners_.clear();
    utils::Logger::debug(sessionId() + " closed");
}

void StreamingSession::addAudio(const std::vector<float>& samples, int32_t sampleRate) {
    if (state_ != SessionState::RUNNING) {
        throw utils::SessionStateException("Session not accepting audio (state: " +
                                           sessionStateToString(state_) + ")", sessionId());
    }
    if (sampleRate <= 0) {
        throw utils::GatewayException(utils::GatewayErrorCode::INVALID_ARGUMENT,
                                      STATUS_INVALID_ARGUMENT,
                                      "Sample rate must be positive, got " +
                                      std::to_string(sampleRate), "addAudio");
    }
    if (samples.empty()) {
        return;
    }

    utils::ErrorContext context("StreamingSession::addAudio", sessionId());
    checkGatewayStatus(*gateway_, gateway_->pushAudio(model_, handle_, samples, sampleRate, 0),
                       "pushAudio");

    streamTicks_ += static_cast<uint64_t>(samples.size()) * TICKS_PER_SECOND /
                    static_cast<uint64_t>(sampleRate);

    // At most one update per call, however many interval boundaries it crossed.
    uint64_t crossing = streamTicks_ / intervalTicks_;
    if (crossing <= lastUpdateCrossing_) {
        return;
    }

    lastUpdateCrossing_ = crossing;
    try {
        runUpdate(0);
    } catch (const std::exception& e) {
        HANDLE_EXCEPTION_AS_WARNING(e, "StreamingSession::addAudio update");
        emitError(std::current_exception());
    }
}

Transcript StreamingSession::updateTranscription(uint32_t flags) {
    requireOpen("updateTranscription");
    if (state_ == SessionState::CREATED) {
        throw utils::SessionStateException("Session has not been started", sessionId());
    }

    utils::ErrorContext context("StreamingSession::updateTranscription", sessionId());
    return runUpdate(flags);
}

void StreamingSession::addListener(const std::shared_ptr<TranscriptEventListener>& listener) {
    listeners_.subscribe(listener);
}

void StreamingSession::addListener(TranscriptEventCallback callback) {
    listeners_.subscribe(std::move(callback));
}

bool StreamingSession::removeListener(const std::shared_ptr<TranscriptEventListener>& listener) {
    return listeners_.unsubscribe(listener);
}

bool StreamingSession::removeListener(const TranscriptEventCallback& callback) {
    return listeners_.unsubscribe(callback);
}

void StreamingSession::removeAllListeners() {
    listeners_.clear();
}

double StreamingSession::streamTime() const {
    return static_cast<double>(streamTicks_) / static_cast<double>(TICKS_PER_SECOND);
}

std::string StreamingSession::sessionId() const {
    return "stream-" + std::to_string(handle_);
}

Transcript StreamingSession::runUpdate(uint32_t flags) {
    Transcript snapshot;
    checkGatewayStatus(*gateway_,
                       gateway_->transcribeStream(model_, handle_, flags, snapshot),
                       "transcribeStream");

    std::vector<TranscriptEvent> events = deriver_.derive(snapshot, handle_);
    lastTranscript_ = snapshot;

    for (const TranscriptEvent& event : events) {
        listeners_.dispatch(event);
    }
    return snapshot;
}

void StreamingSession::emitError(std::exception_ptr cause) {
    listeners_.dispatch(makeTranscriptError(handle_, cause));
}

void StreamingSession::requireOpen(const std::string& operation) const {
    if (state_ == SessionState::CLOSED) {
        throw utils::SessionStateException("Cannot " + operation + " a closed session", sessionId());
    }
}

} // namespace stt
} // namespace streamscribe
