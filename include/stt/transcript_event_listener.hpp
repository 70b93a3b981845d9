#pragma once

#include "stt/transcript_events.hpp"

namespace streamscribe {
namespace stt {

/**
 * Structured observer of a streaming session. Override only the
 * notifications of interest; the defaults do nothing.
 *
 * Handlers run synchronously on the thread that feeds the session.
 * An exception thrown here is reported to the other listeners as a
 * TranscriptError and never reaches the audio producer.
 */
class TranscriptEventListener {
public:
    virtual ~TranscriptEventListener() = default;

    virtual void onLineStarted(const LineStarted& event) { (void)event; }
    virtual void onLineUpdated(const LineUpdated& event) { (void)event; }
    virtual void onLineTextChanged(const LineTextChanged& event) { (void)event; }
    virtual void onLineCompleted(const LineCompleted& event) { (void)event; }
    virtual void onError(const TranscriptError& event) { (void)event; }
};

} // namespace stt
} // namespace streamscribe
