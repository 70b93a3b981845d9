#pragma once

#include "stt/transcript_event_listener.hpp"
#include "stt/transcript_events.hpp"
#include <functional>
#include <memory>
#include <variant>
#include <vector>

namespace streamscribe {
namespace stt {

using TranscriptEventCallback = std::function<void(const TranscriptEvent&)>;

/**
 * Insertion-ordered set of observers for one streaming session.
 *
 * Handler objects are held weakly and removed by identity. Callbacks have
 * no identity, so removing one is best-effort: the first registered
 * callback whose stored target type matches is removed, or the first
 * callback of any type when nothing matches.
 *
 * Not thread-safe; the owning session serializes access.
 */
class ListenerRegistry {
public:
    ListenerRegistry() = default;

    void subscribe(const std::shared_ptr<TranscriptEventListener>& listener);
    void subscribe(TranscriptEventCallback callback);

    // Returns true if at least one entry was removed.
    bool unsubscribe(const std::shared_ptr<TranscriptEventListener>& listener);
    bool unsubscribe(const TranscriptEventCallback& callback);

    void clear();
    size_t size() const;
    bool empty() const { return size() == 0; }

    /**
     * Deliver an event to every observer in registration order.
     *
     * If an observer throws, the remaining observers still receive the
     * event, and every other observer is sent a TranscriptError carrying
     * the failure. Failures while delivering that error, or while
     * delivering an event that is already a TranscriptError, are logged
     * and dropped.
     */
    void dispatch(const TranscriptEvent& event);

private:
    using Entry = std::variant<std::weak_ptr<TranscriptEventListener>, TranscriptEventCallback>;

    static void deliver(const Entry& entry, const TranscriptEvent& event);
    static void deliverToListener(TranscriptEventListener& listener, const TranscriptEvent& event);
    void redeliverFailure(const std::vector<Entry>& entries, size_t failedIndex,
                          const TranscriptEvent& event, std::exception_ptr cause);
    void pruneExpired();

    std::vector<Entry> entries_;
};

} // namespace stt
} // namespace streamscribe
