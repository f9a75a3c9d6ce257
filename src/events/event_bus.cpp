// src/events/event_bus.cpp
#include "../../include/events/event_bus.h"
#include "../../include/storage_error/error_handler.h"

#include <exception>

namespace mapstore {

EventBus::EventBus(std::shared_ptr<ErrorContext> error_context)
    : error_context_(error_context ? std::move(error_context)
                                   : std::make_shared<ErrorContext>(std::make_shared<LoggingErrorHandler>())) {}

void EventBus::addSubscriber(std::type_index type, ErasedHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(Subscriber{type, std::make_shared<const ErasedHandler>(std::move(handler))});
}

size_t EventBus::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

void EventBus::dispatch(std::type_index type, const void* event) {
    // Snapshot under the lock; handlers run unlocked and may subscribe or publish.
    std::vector<std::shared_ptr<const ErasedHandler>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const Subscriber& s : subscribers_) {
            if (s.type == type) {
                targets.push_back(s.handler);
            }
        }
    }

    for (const auto& handler : targets) {
        try {
            (*handler)(event);
        } catch (const StorageError& e) {
            error_context_->reportError(StorageError(e).withContext("event_type", type.name()));
        } catch (const std::exception& e) {
            error_context_->reportError(StorageError(ErrorCode::INTERNAL_ERROR, "Event subscriber failed")
                                            .withDetails(e.what())
                                            .withContext("event_type", type.name()));
        }
    }
}

} // namespace mapstore
