#pragma once

#include "stt/transcript.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace streamscribe {
namespace stt {

/**
 * A span produced by one inference pass over the uncommitted audio.
 */
struct LineSegment {
    std::string text;
    float startTime = 0.0f;
    float duration = 0.0f;
    bool isComplete = false;
    std::vector<float> audioData;
};

/**
 * Gateway-side bookkeeping that turns repeated inference passes into
 * transcript snapshots with stable line ids and per-line update flags.
 *
 * Completed lines are frozen. The open (incomplete) lines are matched to
 * the segments of the next pass by position: a matched line is updated in
 * place, surplus segments start new lines, and open lines without a
 * segment are kept unchanged. Line ids start at a random value and only
 * grow.
 */
class LineTracker {
public:
    LineTracker();
    explicit LineTracker(uint64_t firstLineId);

    // Reset isNew, isUpdated and hasTextChanged on every line.
    void clearUpdateFlags();

    void applySegments(const std::vector<LineSegment>& segments);

    // Complete every open line, flagging it as updated.
    void markAllComplete();

    // Drop all lines. Ids keep increasing.
    void reset();

    Transcript snapshot() const;
    size_t lineCount() const { return lines_.size(); }
    size_t openLineCount() const;
    uint64_t nextLineId() const { return nextLineId_; }

private:
    std::vector<TranscriptLine> lines_;
    uint64_t nextLineId_;
};

} // namespace stt
} // namespace streamscribe
