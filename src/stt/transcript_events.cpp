#include "stt/transcript_events.hpp"

namespace streamscribe {
namespace stt {

TranscriptEventType eventType(const TranscriptEvent& event) {
    switch (event.index()) {
        case 0: return TranscriptEventType::LINE_STARTED;
        case 1: return TranscriptEventType::LINE_UPDATED;
        case 2: return TranscriptEventType::LINE_TEXT_CHANGED;
        case 3: return TranscriptEventType::LINE_COMPLETED;
        default: return TranscriptEventType::ERROR;
    }
}

std::string eventTypeToString(TranscriptEventType type) {
    switch (type) {
        case TranscriptEventType::LINE_STARTED: return "LineStarted";
        case TranscriptEventType::LINE_UPDATED: return "LineUpdated";
        case TranscriptEventType::LINE_TEXT_CHANGED: return "LineTextChanged";
        case TranscriptEventType::LINE_COMPLETED: return "LineCompleted";
        case TranscriptEventType::ERROR: return "TranscriptError";
    }
    return "Unknown";
}

StreamHandle eventStreamHandle(const TranscriptEvent& event) {
    return std::visit([](const auto& e) { return e.streamHandle; }, event);
}

const TranscriptLine* eventLine(const TranscriptEvent& event) {
    if (auto* e = std::get_if<LineStarted>(&event)) return &e->line;
    if (auto* e = std::get_if<LineUpdated>(&event)) return &e->line;
    if (auto* e = std::get_if<LineTextChanged>(&event)) return &e->line;
    if (auto* e = std::get_if<LineCompleted>(&event)) return &e->line;

    const auto& error = std::get<TranscriptError>(event);
    return error.line ? &*error.line : nullptr;
}

TranscriptError makeTranscriptError(StreamHandle streamHandle, std::exception_ptr cause,
                                    std::optional<TranscriptLine> line) {
    TranscriptError error;
    error.streamHandle = streamHandle;
    error.line = std::move(line);
    error.cause = cause;
    error.message = "unknown error";

    if (cause) {
        try {
            std::rethrow_exception(cause);
        } catch (const std::exception& e) {
            error.message = e.what();
        } catch (...) {
            error.message = "non-standard exception";
        }
    }
    return error;
}

std::string describeEvent(const TranscriptEvent& event) {
    std::string result = eventTypeToString(eventType(event)) +
                         " [stream " + std::to_string(eventStreamHandle(event)) + "]";

    if (auto* error = std::get_if<TranscriptError>(&event)) {
        result += " " + error->message;
    }
    if (const TranscriptLine* line = eventLine(event)) {
        result += " #" + std::to_string(line->lineId) + " '" + line->text + "'";
    }
    return result;
}

} // namespace stt
} // namespace streamscribe
