#pragma once

#include "stt/transcript.hpp"
#include "stt/transcript_events.hpp"
#include <unordered_set>
#include <vector>

namespace streamscribe {
namespace stt {

/**
 * Turns successive transcript snapshots of one stream into line events.
 *
 * Lines are visited in snapshot order. Per line, events come out in the
 * order LineStarted, LineUpdated, LineTextChanged, LineCompleted, driven
 * only by the flags the engine set. Once a line id has completed it
 * produces nothing further.
 */
class TranscriptEventDeriver {
public:
    std::vector<TranscriptEvent> derive(const Transcript& snapshot, StreamHandle streamHandle);

    // Forget the baseline snapshot when the stream restarts. Completed
    // line ids stay terminal, so the completed set keeps growing with
    // every line the stream has finished until the deriver is destroyed.
    void reset();

    const Transcript& previousSnapshot() const { return previous_; }
    bool isCompleted(uint64_t lineId) const;

private:
    Transcript previous_;
    std::unordered_set<uint64_t> completed_;
};

} // namespace stt
} // namespace streamscribe
