#include "stt/event_deriver.hpp"

namespace streamscribe {
namespace stt {

std::vector<TranscriptEvent> TranscriptEventDeriver::derive(const Transcript& snapshot,
                                                            StreamHandle streamHandle) {
    std::vector<TranscriptEvent> events;

    for (const TranscriptLine& line : snapshot.lines) {
        if (completed_.count(line.lineId) > 0) {
            continue;
        }

        const TranscriptLine* before = previous_.findLine(line.lineId);
        if (before && before->isComplete) {
            completed_.insert(line.lineId);
            continue;
        }

        if (line.isNew) {
            events.emplace_back(LineStarted{line, streamHandle});
        } else if (line.isUpdated && !line.isComplete) {
            events.emplace_back(LineUpdated{line, streamHandle});
        }

        if (line.hasTextChanged) {
            events.emplace_back(LineTextChanged{line, streamHandle});
        }

        if (line.isUpdated && line.isComplete) {
            events.emplace_back(LineCompleted{line, streamHandle});
            completed_.insert(line.lineId);
        }
    }

    previous_ = snapshot;
    return events;
}

void TranscriptEventDeriver::reset() {
    previous_ = Transcript{};
}

bool TranscriptEventDeriver::isCompleted(uint64_t lineId) const {
    return completed_.count(lineId) > 0;
}

} // namespace stt
} // namespace streamscribe
