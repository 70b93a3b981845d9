#pragma once

#include <string>
#include <exception>
#include <memory>
#include <functional>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <vector>

namespace streamscribe {
namespace utils {

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * Error categories for better classification
 */
enum class ErrorCategory {
    AUDIO_DECODING,
    INFERENCE_GATEWAY,
    STREAMING_SESSION,
    LISTENER,
    MODEL_LOADING,
    CONFIGURATION,
    SYSTEM,
    UNKNOWN
};

std::string errorCategoryToString(ErrorCategory category);
std::string errorSeverityToString(ErrorSeverity severity);

/**
 * Structured error information
 */
struct ErrorInfo {
    std::string id;
    ErrorCategory category;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::steady_clock::time_point timestamp;
    std::string session_id;

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "",
              const std::string& sid = "");
};

/**
 * Base class for every exception raised by the library
 */
class StreamScribeException : public std::exception {
public:
    explicit StreamScribeException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    std::string what_message_;
};

/**
 * Reasons a RIFF/WAVE buffer can be rejected
 */
enum class WavError {
    FILE_NOT_FOUND,
    INVALID_CONTAINER,
    TRUNCATED_CHUNK,
    MISSING_FORMAT_CHUNK,
    MISSING_DATA_CHUNK,
    UNSUPPORTED_ENCODING,
    UNSUPPORTED_BIT_DEPTH
};

std::string wavErrorToString(WavError error);

class AudioDecodeException : public StreamScribeException {
public:
    AudioDecodeException(WavError error, const std::string& message,
                         const std::string& path = "");

    WavError getWavError() const { return wav_error_; }

private:
    WavError wav_error_;
};

/**
 * Closed taxonomy of inference gateway failures.
 * Any negative status other than -1, -2 and -3 maps to CUSTOM.
 */
enum class GatewayErrorCode {
    UNKNOWN,
    INVALID_HANDLE,
    INVALID_ARGUMENT,
    CUSTOM
};

std::string gatewayErrorCodeToString(GatewayErrorCode code);

class GatewayException : public StreamScribeException {
public:
    GatewayException(GatewayErrorCode code, int32_t status, const std::string& message,
                     const std::string& context = "");

    GatewayErrorCode getCode() const { return code_; }
    int32_t getStatus() const { return status_; }

private:
    GatewayErrorCode code_;
    int32_t status_;
};

class SessionStateException : public StreamScribeException {
public:
    SessionStateException(const std::string& message, const std::string& session_id = "");
};

class ConfigurationException : public StreamScribeException {
public:
    ConfigurationException(const std::string& message, const std::string& source = "");
};

/**
 * Error handler callback type
 */
using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Central error handler for the application
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    // Error reporting
    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "",
                     const std::string& session_id = "",
                     ErrorSeverity severity = ErrorSeverity::ERROR);

    void setErrorCallback(ErrorCallback callback);

    // Error statistics
    size_t getErrorCount() const;
    size_t getErrorCount(ErrorCategory category) const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();
    void setMaxHistorySize(size_t max_size);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    void logError(const ErrorInfo& error);

    ErrorCallback error_callback_;
    std::vector<ErrorInfo> error_history_;
    size_t max_history_size_ = 1000;

    mutable std::mutex mutex_;
};

/**
 * RAII error context manager
 */
class ErrorContext {
public:
    ErrorContext(const std::string& context, const std::string& session_id = "");
    ~ErrorContext();

    void setContext(const std::string& context);
    void setSessionId(const std::string& session_id);

    static std::string getCurrentContext();
    static std::string getCurrentSessionId();

private:
    std::string previous_context_;
    std::string previous_session_id_;

    static thread_local std::string current_context_;
    static thread_local std::string current_session_id_;
};

/**
 * Utility macros for error handling
 */
#define HANDLE_ERROR(category, severity, message, details) \
    do { \
        ::streamscribe::utils::ErrorInfo error_info_(category, severity, message, details, \
                       ::streamscribe::utils::ErrorContext::getCurrentContext(), \
                       ::streamscribe::utils::ErrorContext::getCurrentSessionId()); \
        ::streamscribe::utils::ErrorHandler::getInstance().reportError(error_info_); \
    } while(0)

#define HANDLE_EXCEPTION(e, context) \
    ::streamscribe::utils::ErrorHandler::getInstance().reportError(e, context, \
        ::streamscribe::utils::ErrorContext::getCurrentSessionId())

#define HANDLE_EXCEPTION_AS_WARNING(e, context) \
    ::streamscribe::utils::ErrorHandler::getInstance().reportError(e, context, \
        ::streamscribe::utils::ErrorContext::getCurrentSessionId(), \
        ::streamscribe::utils::ErrorSeverity::WARNING)

} // namespace utils
} // namespace streamscribe
