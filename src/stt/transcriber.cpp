#include "stt/transcriber.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace streamscribe {
namespace stt {

Transcriber::Transcriber(std::shared_ptr<InferenceGateway> gateway, const std::string& modelPath,
                         ModelArch arch, const std::vector<TranscriberOption>& options)
    : gateway_(std::move(gateway))
    , modelPath_(modelPath)
    , arch_(arch)
    , model_(0)
    , closed_(false) {
    if (!gateway_) {
        throw std::invalid_argument("Transcriber requires an inference gateway");
    }

    utils::ErrorContext context("Transcriber::loadModel");
    checkGatewayStatus(*gateway_, gateway_->loadModel(modelPath_, arch_, options, model_),
                       "loadModel(" + modelPath_ + ")");

    utils::Logger::info("Loaded " + modelArchToString(arch_) + " model from " + modelPath_ +
                        " (handle " + std::to_string(model_) + ")");
}

Transcriber::~Transcriber() {
    close();
}

Transcript Transcriber::transcribeWithoutStreaming(const std::vector<float>& samples,
                                                   int32_t sampleRate, uint32_t flags) {
    requireOpen("transcribe");
    if (samples.empty()) {
        return Transcript{};
    }
    if (sampleRate <= 0) {
        throw utils::GatewayException(utils::GatewayErrorCode::INVALID_ARGUMENT,
                                      STATUS_INVALID_ARGUMENT,
                                      "Sample rate must be positive, got " +
                                      std::to_string(sampleRate), "transcribeOneShot");
    }

    utils::ErrorContext context("Transcriber::transcribeWithoutStreaming");
    Transcript transcript;
    checkGatewayStatus(*gateway_,
                       gateway_->transcribeOneShot(model_, samples, sampleRate, flags, transcript),
                       "transcribeOneShot");
    return transcript;
}

std::shared_ptr<StreamingSession> Transcriber::createStream(double updateInterval, uint32_t flags) {
    requireOpen("create a stream on");

    auto session = std::make_shared<StreamingSession>(gateway_, model_, updateInterval, flags);

    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                   [](const std::weak_ptr<StreamingSession>& s) {
                                       return s.expired();
                                   }),
                    sessions_.end());
    sessions_.push_back(session);
    return session;
}

StreamingSession& Transcriber::defaultStream() {
    if (!defaultStream_) {
        defaultStream_ = createStream();
    }
    return *defaultStream_;
}

void Transcriber::start() {
    defaultStream().start();
}

void Transcriber::stop() {
    defaultStream().stop();
}

void Transcriber::addAudio(const std::vector<float>& samples, int32_t sampleRate) {
    defaultStream().addAudio(samples, sampleRate);
}

void Transcriber::addListener(const std::shared_ptr<TranscriptEventListener>& listener) {
    defaultStream().addListener(listener);
}

void Transcriber::addListener(TranscriptEventCallback callback) {
    defaultStream().addListener(std::move(callback));
}

bool Transcriber::removeListener(const std::shared_ptr<TranscriptEventListener>& listener) {
    return defaultStream().removeListener(listener);
}

bool Transcriber::removeListener(const TranscriptEventCallback& callback) {
    return defaultStream().removeListener(callback);
}

void Transcriber::removeAllListeners() {
    defaultStream().removeAllListeners();
}

void Transcriber::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    // Streams must be released before the model that backs them.
    for (auto& weak : sessions_) {
        if (auto session = weak.lock()) {
            session->close();
        }
    }
    sessions_.clear();
    defaultStream_.reset();

    try {
        int32_t status = gateway_->freeModel(model_);
        if (status != STATUS_OK) {
            HANDLE_ERROR(utils::ErrorCategory::MODEL_LOADING, utils::ErrorSeverity::WARNING,
                         "Failed to free model " + std::to_string(model_),
                         gateway_->errorToString(status));
        }
    } catch (const std::exception& e) {
        HANDLE_EXCEPTION_AS_WARNING(e, "Transcriber::close");
    }
    utils::Logger::debug("Released model handle " + std::to_string(model_));
}

int32_t Transcriber::version() const {
    return gateway_->version();
}

void Transcriber::requireOpen(const std::string& operation) const {
    if (closed_) {
        throw utils::SessionStateException("Cannot " + operation + " a closed transcriber");
    }
}

} // namespace stt
} // namespace streamscribe
