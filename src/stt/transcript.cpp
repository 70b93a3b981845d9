#include "stt/transcript.hpp"
#include <cstdio>
#include <sstream>

namespace streamscribe {
namespace stt {

std::string TranscriptLine::toString() const {
    char times[64];
    std::snprintf(times, sizeof(times), "start=%.2fs, duration=%.2fs", startTime, duration);

    std::ostringstream ss;
    ss << "TranscriptLine(id=" << lineId << ", text='" << text << "', " << times
       << ", complete=" << isComplete << ", updated=" << isUpdated
       << ", new=" << isNew << ", textChanged=" << hasTextChanged;
    if (!audioData.empty()) {
        ss << ", audioSamples=" << audioData.size();
    }
    if (hasSpeakerId) {
        ss << ", speaker=" << speakerId << "#" << speakerIndex;
    }
    ss << ")";
    return ss.str();
}

bool operator==(const TranscriptLine& a, const TranscriptLine& b) {
    return a.text == b.text && a.startTime == b.startTime && a.duration == b.duration &&
           a.lineId == b.lineId && a.isComplete == b.isComplete &&
           a.isUpdated == b.isUpdated && a.isNew == b.isNew &&
           a.hasTextChanged == b.hasTextChanged && a.audioData == b.audioData &&
           a.hasSpeakerId == b.hasSpeakerId && a.speakerId == b.speakerId &&
           a.speakerIndex == b.speakerIndex;
}

const TranscriptLine* Transcript::findLine(uint64_t lineId) const {
    for (const auto& line : lines) {
        if (line.lineId == lineId) {
            return &line;
        }
    }
    return nullptr;
}

std::string Transcript::text() const {
    std::string result;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            result += "\n";
        }
        result += lines[i].text;
    }
    return result;
}

std::string Transcript::toString() const {
    std::ostringstream ss;
    ss << lines.size() << " lines\n";
    for (const auto& line : lines) {
        char time[32];
        std::snprintf(time, sizeof(time), "%.1fs: ", line.startTime);
        ss << time << line.text << "\n";
    }
    return ss.str();
}

} // namespace stt
} // namespace streamscribe
