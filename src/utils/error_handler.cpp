#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <sstream>
#include <iomanip>
#include <random>
#include <algorithm>
#include <mutex>

namespace streamscribe {
namespace utils {

// Thread-local storage for error context
thread_local std::string ErrorContext::current_context_;
thread_local std::string ErrorContext::current_session_id_;

std::string errorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::AUDIO_DECODING: return "AudioDecoding";
        case ErrorCategory::INFERENCE_GATEWAY: return "InferenceGateway";
        case ErrorCategory::STREAMING_SESSION: return "StreamingSession";
        case ErrorCategory::LISTENER: return "Listener";
        case ErrorCategory::MODEL_LOADING: return "ModelLoading";
        case ErrorCategory::CONFIGURATION: return "Configuration";
        case ErrorCategory::SYSTEM: return "System";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

std::string errorSeverityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARN";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "ERROR";
}

std::string wavErrorToString(WavError error) {
    switch (error) {
        case WavError::FILE_NOT_FOUND: return "file not found";
        case WavError::INVALID_CONTAINER: return "invalid RIFF/WAVE container";
        case WavError::TRUNCATED_CHUNK: return "truncated chunk";
        case WavError::MISSING_FORMAT_CHUNK: return "missing fmt chunk";
        case WavError::MISSING_DATA_CHUNK: return "missing data chunk";
        case WavError::UNSUPPORTED_ENCODING: return "unsupported encoding";
        case WavError::UNSUPPORTED_BIT_DEPTH: return "unsupported bit depth";
    }
    return "unknown WAV error";
}

std::string gatewayErrorCodeToString(GatewayErrorCode code) {
    switch (code) {
        case GatewayErrorCode::UNKNOWN: return "unknown";
        case GatewayErrorCode::INVALID_HANDLE: return "invalid handle";
        case GatewayErrorCode::INVALID_ARGUMENT: return "invalid argument";
        case GatewayErrorCode::CUSTOM: return "custom";
    }
    return "unknown";
}

// ErrorInfo implementation
ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx, const std::string& sid)
    : category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestamp(std::chrono::steady_clock::now()), session_id(sid) {

    // Generate unique error ID
    static thread_local std::mt19937 gen(std::random_device{}());
    static thread_local std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "err_";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

// StreamScribeException implementation
StreamScribeException::StreamScribeException(const ErrorInfo& error_info)
    : error_info_(error_info) {
    what_message_ = error_info_.message;
    if (!error_info_.details.empty()) {
        what_message_ += ": " + error_info_.details;
    }
}

const char* StreamScribeException::what() const noexcept {
    return what_message_.c_str();
}

// Specific exception implementations
AudioDecodeException::AudioDecodeException(WavError error, const std::string& message,
                                           const std::string& path)
    : StreamScribeException(ErrorInfo(ErrorCategory::AUDIO_DECODING, ErrorSeverity::ERROR,
                                      wavErrorToString(error), message,
                                      path.empty() ? "WavDecoder" : path)),
      wav_error_(error) {
}

GatewayException::GatewayException(GatewayErrorCode code, int32_t status,
                                   const std::string& message, const std::string& context)
    : StreamScribeException(ErrorInfo(ErrorCategory::INFERENCE_GATEWAY, ErrorSeverity::ERROR,
                                      message, "", context.empty() ? "InferenceGateway" : context)),
      code_(code), status_(status) {
}

SessionStateException::SessionStateException(const std::string& message, const std::string& session_id)
    : StreamScribeException(ErrorInfo(ErrorCategory::STREAMING_SESSION, ErrorSeverity::ERROR,
                                      message, "", "StreamingSession", session_id)) {
}

ConfigurationException::ConfigurationException(const std::string& message, const std::string& source)
    : StreamScribeException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::ERROR,
                                      message, "", source.empty() ? "Configuration" : source)) {
}

// ErrorHandler implementation
ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        logError(error);

        error_history_.push_back(error);
        if (error_history_.size() > max_history_size_) {
            error_history_.erase(error_history_.begin());
        }
        callback = error_callback_;
    }

    // The callback runs unlocked so it may query the handler.
    if (callback) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context,
                               const std::string& session_id, ErrorSeverity severity) {
    ErrorCategory category = ErrorCategory::UNKNOWN;

    // Try to determine category from exception type
    if (auto* known = dynamic_cast<const StreamScribeException*>(&e)) {
        category = known->getErrorInfo().category;
    }

    ErrorInfo error(category, severity, e.what(), "", context, session_id);
    reportError(error);
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = std::move(callback);
}

size_t ErrorHandler::getErrorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_history_.size();
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::count_if(error_history_.begin(), error_history_.end(),
                        [category](const ErrorInfo& error) {
                            return error.category == category;
                        });
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (error_history_.size() <= count) {
        return error_history_;
    }

    return std::vector<ErrorInfo>(error_history_.end() - count, error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
}

void ErrorHandler::setMaxHistorySize(size_t max_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_history_size_ = std::max<size_t>(1, max_size);
    while (error_history_.size() > max_history_size_) {
        error_history_.erase(error_history_.begin());
    }
}

void ErrorHandler::logError(const ErrorInfo& error) {
    std::stringstream log_message;
    log_message << "[" << error.id << "] " << errorCategoryToString(error.category)
                << " - " << error.message;

    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }

    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }

    if (!error.session_id.empty()) {
        log_message << " | Session: " << error.session_id;
    }

    switch (error.severity) {
        case ErrorSeverity::INFO:
            Logger::info(log_message.str());
            break;
        case ErrorSeverity::WARNING:
            Logger::warn(log_message.str());
            break;
        case ErrorSeverity::ERROR:
        case ErrorSeverity::CRITICAL:
            Logger::error(log_message.str());
            break;
    }
}

// ErrorContext implementation
ErrorContext::ErrorContext(const std::string& context, const std::string& session_id)
    : previous_context_(current_context_), previous_session_id_(current_session_id_) {
    current_context_ = context;
    if (!session_id.empty()) {
        current_session_id_ = session_id;
    }
}

ErrorContext::~ErrorContext() {
    current_context_ = previous_context_;
    current_session_id_ = previous_session_id_;
}

void ErrorContext::setContext(const std::string& context) {
    current_context_ = context;
}

void ErrorContext::setSessionId(const std::string& session_id) {
    current_session_id_ = session_id;
}

std::string ErrorContext::getCurrentContext() {
    return current_context_;
}

std::string ErrorContext::getCurrentSessionId() {
    return current_session_id_;
}

} // namespace utils
} // namespace streamscribe
