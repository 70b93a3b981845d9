#include "stt/listener_registry.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>

namespace streamscribe {
namespace stt {

void ListenerRegistry::subscribe(const std::shared_ptr<TranscriptEventListener>& listener) {
    if (!listener) {
        utils::Logger::debug("Ignoring null transcript listener");
        return;
    }
    entries_.emplace_back(std::weak_ptr<TranscriptEventListener>(listener));
}

void ListenerRegistry::subscribe(TranscriptEventCallback callback) {
    if (!callback) {
        utils::Logger::debug("Ignoring empty transcript callback");
        return;
    }
    entries_.emplace_back(std::move(callback));
}

bool ListenerRegistry::unsubscribe(const std::shared_ptr<TranscriptEventListener>& listener) {
    if (!listener) {
        return false;
    }

    const size_t before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&listener](const Entry& entry) {
                                      auto* weak = std::get_if<std::weak_ptr<TranscriptEventListener>>(&entry);
                                      return weak && weak->lock() == listener;
                                  }),
                   entries_.end());
    return entries_.size() != before;
}

bool ListenerRegistry::unsubscribe(const TranscriptEventCallback& callback) {
    auto firstCallback = entries_.end();

    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        auto* stored = std::get_if<TranscriptEventCallback>(&*it);
        if (!stored) {
            continue;
        }
        if (firstCallback == entries_.end()) {
            firstCallback = it;
        }
        if (callback && stored->target_type() == callback.target_type()) {
            entries_.erase(it);
            return true;
        }
    }

    if (firstCallback == entries_.end()) {
        return false;
    }
    entries_.erase(firstCallback);
    return true;
}

void ListenerRegistry::clear() {
    entries_.clear();
}

size_t ListenerRegistry::size() const {
    return std::count_if(entries_.begin(), entries_.end(), [](const Entry& entry) {
        auto* weak = std::get_if<std::weak_ptr<TranscriptEventListener>>(&entry);
        return !weak || !weak->expired();
    });
}

void ListenerRegistry::dispatch(const TranscriptEvent& event) {
    pruneExpired();

    // Observers may subscribe or unsubscribe while being notified.
    const std::vector<Entry> snapshot = entries_;
    const bool isErrorEvent = std::holds_alternative<TranscriptError>(event);

    for (size_t i = 0; i < snapshot.size(); ++i) {
        std::exception_ptr failure;
        try {
            deliver(snapshot[i], event);
        } catch (...) {
            failure = std::current_exception();
        }

        if (!failure) {
            continue;
        }

        if (isErrorEvent) {
            utils::Logger::debug("Listener failed while handling " + describeEvent(event) +
                                 ", not redelivering");
            continue;
        }
        redeliverFailure(snapshot, i, event, failure);
    }
}

void ListenerRegistry::deliver(const Entry& entry, const TranscriptEvent& event) {
    if (auto* callback = std::get_if<TranscriptEventCallback>(&entry)) {
        (*callback)(event);
        return;
    }

    auto listener = std::get<std::weak_ptr<TranscriptEventListener>>(entry).lock();
    if (listener) {
        deliverToListener(*listener, event);
    }
}

void ListenerRegistry::deliverToListener(TranscriptEventListener& listener,
                                         const TranscriptEvent& event) {
    if (auto* e = std::get_if<LineStarted>(&event)) {
        listener.onLineStarted(*e);
    } else if (auto* e = std::get_if<LineUpdated>(&event)) {
        listener.onLineUpdated(*e);
    } else if (auto* e = std::get_if<LineTextChanged>(&event)) {
        listener.onLineTextChanged(*e);
    } else if (auto* e = std::get_if<LineCompleted>(&event)) {
        listener.onLineCompleted(*e);
    } else {
        listener.onError(std::get<TranscriptError>(event));
    }
}

void ListenerRegistry::redeliverFailure(const std::vector<Entry>& entries, size_t failedIndex,
                                        const TranscriptEvent& event, std::exception_ptr cause) {
    const TranscriptEvent error = makeTranscriptError(eventStreamHandle(event), cause);
    const std::string& message = std::get<TranscriptError>(error).message;

    HANDLE_ERROR(utils::ErrorCategory::LISTENER, utils::ErrorSeverity::WARNING,
                 "Transcript listener failed", message);

    for (size_t j = 0; j < entries.size(); ++j) {
        if (j == failedIndex) {
            continue;
        }
        try {
            deliver(entries[j], error);
        } catch (const std::exception& e) {
            utils::Logger::debug("Listener failed while handling a listener error: " +
                                 std::string(e.what()));
        } catch (...) {
            utils::Logger::debug("Listener failed while handling a listener error");
        }
    }
}

void ListenerRegistry::pruneExpired() {
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [](const Entry& entry) {
                                      auto* weak = std::get_if<std::weak_ptr<TranscriptEventListener>>(&entry);
                                      return weak && weak->expired();
                                  }),
                   entries_.end());
}

} // namespace stt
} // namespace streamscribe
