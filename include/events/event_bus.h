// include/events/event_bus.h
#pragma once

#include "../storage_error/error_context.h"

#include <functional>
#include <memory>
#include <mutex>
#include <typeindex>
#include <utility>
#include <vector>

namespace mapstore {

/**
 * @brief Typed, synchronous publish/subscribe registry.
 *
 * Constructed explicitly and passed to the components that publish.
 * publish() delivers to the subscribers of that event type in registration
 * order on the calling thread. A subscriber that throws a std::exception is
 * reported to the bus's ErrorContext; delivery continues with the next
 * subscriber and the publisher never sees the failure. The default context
 * logs every report through a LoggingErrorHandler.
 *
 * Subscribing and publishing may happen from any thread.
 */
class EventBus {
public:
    explicit EventBus(std::shared_ptr<ErrorContext> error_context = nullptr);

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename Event>
    void subscribe(std::function<void(const Event&)> handler) {
        auto erased = [handler = std::move(handler)](const void* event) {
            handler(*static_cast<const Event*>(event));
        };
        addSubscriber(std::type_index(typeid(Event)), std::move(erased));
    }

    template<typename Event>
    void publish(const Event& event) {
        dispatch(std::type_index(typeid(Event)), &event);
    }

    size_t subscriberCount() const;

    const std::shared_ptr<ErrorContext>& errorContext() const { return error_context_; }

private:
    using ErasedHandler = std::function<void(const void*)>;

    struct Subscriber {
        std::type_index type;
        std::shared_ptr<const ErasedHandler> handler;
    };

    void addSubscriber(std::type_index type, ErasedHandler handler);
    void dispatch(std::type_index type, const void* event);

    std::shared_ptr<ErrorContext> error_context_;
    std::vector<Subscriber> subscribers_;
    mutable std::mutex mutex_;
};

} // namespace mapstore
