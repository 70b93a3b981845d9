#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace streamscribe {
namespace stt {

/**
 * One span of recognized speech inside a transcript snapshot.
 *
 * The update flags describe the change relative to the previous snapshot
 * of the same stream, as reported by the inference engine.
 */
struct TranscriptLine {
    std::string text;
    float startTime = 0.0f;     // seconds from stream start
    float duration = 0.0f;      // seconds
    uint64_t lineId = 0;        // stable across snapshots, never reused in a session
    bool isComplete = false;
    bool isUpdated = false;
    bool isNew = false;
    bool hasTextChanged = false;

    // Raw mono audio for the span, empty unless the engine was asked for it.
    std::vector<float> audioData;

    bool hasSpeakerId = false;
    uint64_t speakerId = 0;
    uint32_t speakerIndex = 0;
    uint32_t lastTranscriptionLatencyMs = 0;

    std::string toString() const;
};

bool operator==(const TranscriptLine& a, const TranscriptLine& b);
inline bool operator!=(const TranscriptLine& a, const TranscriptLine& b) { return !(a == b); }

/**
 * Ordered snapshot of lines, chronological by start time.
 */
struct Transcript {
    std::vector<TranscriptLine> lines;

    bool empty() const { return lines.empty(); }
    size_t size() const { return lines.size(); }

    const TranscriptLine* findLine(uint64_t lineId) const;

    // Line texts joined by newlines.
    std::string text() const;
    std::string toString() const;
};

} // namespace stt
} // namespace streamscribe
