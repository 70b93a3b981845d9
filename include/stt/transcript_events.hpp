#pragma once

#include "stt/inference_gateway.hpp"
#include "stt/transcript.hpp"
#include <exception>
#include <optional>
#include <string>
#include <variant>

namespace streamscribe {
namespace stt {

struct LineStarted {
    TranscriptLine line;
    StreamHandle streamHandle = 0;
};

struct LineUpdated {
    TranscriptLine line;
    StreamHandle streamHandle = 0;
};

struct LineTextChanged {
    TranscriptLine line;
    StreamHandle streamHandle = 0;
};

struct LineCompleted {
    TranscriptLine line;
    StreamHandle streamHandle = 0;
};

/**
 * A failure inside the streaming pipeline or inside a listener.
 * cause holds the original exception when one was thrown.
 */
struct TranscriptError {
    std::optional<TranscriptLine> line;
    StreamHandle streamHandle = 0;
    std::string message;
    std::exception_ptr cause;
};

using TranscriptEvent =
    std::variant<LineStarted, LineUpdated, LineTextChanged, LineCompleted, TranscriptError>;

enum class TranscriptEventType {
    LINE_STARTED,
    LINE_UPDATED,
    LINE_TEXT_CHANGED,
    LINE_COMPLETED,
    ERROR
};

TranscriptEventType eventType(const TranscriptEvent& event);
std::string eventTypeToString(TranscriptEventType type);
StreamHandle eventStreamHandle(const TranscriptEvent& event);

// The line carried by the event, or nullptr for an error without a line.
const TranscriptLine* eventLine(const TranscriptEvent& event);

/**
 * Build an error event from a captured exception. The message is taken
 * from std::exception::what() when available.
 */
TranscriptError makeTranscriptError(StreamHandle streamHandle, std::exception_ptr cause,
                                    std::optional<TranscriptLine> line = std::nullopt);

std::string describeEvent(const TranscriptEvent& event);

} // namespace stt
} // namespace streamscribe
