#include "stt/line_tracker.hpp"
#include <algorithm>
#include <random>

namespace streamscribe {
namespace stt {

namespace {

uint64_t randomLineId() {
    std::random_device rd;
    std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
    // Leave headroom so ids never wrap within a session.
    return gen() >> 1;
}

} // namespace

LineTracker::LineTracker()
    : nextLineId_(randomLineId()) {
}

LineTracker::LineTracker(uint64_t firstLineId)
    : nextLineId_(firstLineId) {
}

void LineTracker::clearUpdateFlags() {
    for (auto& line : lines_) {
        line.isNew = false;
        line.isUpdated = false;
        line.hasTextChanged = false;
    }
}

void LineTracker::applySegments(const std::vector<LineSegment>& segments) {
    auto firstOpen = std::stable_partition(lines_.begin(), lines_.end(),
                                           [](const TranscriptLine& line) { return line.isComplete; });
    std::vector<TranscriptLine> open(firstOpen, lines_.end());
    lines_.erase(firstOpen, lines_.end());

    for (size_t i = 0; i < segments.size(); ++i) {
        const LineSegment& segment = segments[i];

        TranscriptLine line;
        if (i < open.size()) {
            line = open[i];
            line.isNew = false;
            line.hasTextChanged = line.text != segment.text;
            line.isUpdated = line.hasTextChanged || line.isComplete != segment.isComplete ||
                             line.startTime != segment.startTime ||
                             line.duration != segment.duration;
        } else {
            line.lineId = nextLineId_++;
            line.isNew = true;
            line.isUpdated = true;
            line.hasTextChanged = !segment.text.empty();
        }

        line.text = segment.text;
        line.startTime = segment.startTime;
        line.duration = segment.duration;
        line.isComplete = segment.isComplete;
        line.audioData = segment.audioData;
        lines_.push_back(std::move(line));
    }

    // A pass that came back with fewer segments leaves the remaining open
    // lines as they were, so they still complete later.
    for (size_t i = segments.size(); i < open.size(); ++i) {
        TranscriptLine line = open[i];
        line.isNew = false;
        line.isUpdated = false;
        line.hasTextChanged = false;
        lines_.push_back(std::move(line));
    }
}

void LineTracker::markAllComplete() {
    for (auto& line : lines_) {
        if (!line.isComplete) {
            line.isComplete = true;
            line.isUpdated = true;
        }
    }
}

void LineTracker::reset() {
    lines_.clear();
}

Transcript LineTracker::snapshot() const {
    Transcript transcript;
    transcript.lines = lines_;
    return transcript;
}

size_t LineTracker::openLineCount() const {
    return std::count_if(lines_.begin(), lines_.end(),
                         [](const TranscriptLine& line) { return !line.isComplete; });
}

} // namespace stt
} // namespace streamscribe
