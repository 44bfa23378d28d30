#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include <spdlog/spdlog.h>

#include "core/TelemetryEvent.h"

// Threadsafe event bus for TelemetryEvent. Events are queued and handed to
// subscribers from one delivery thread, in publish order.
class EventBus {
public:
    using Callback = std::function<void(const TelemetryEvent&)>;

    explicit EventBus(std::shared_ptr<spdlog::logger> log);
    ~EventBus();

    // Subscribe and receive a numeric token that can be used to unsubscribe.
    int subscribe(Callback cb);

    // Unsubscribe by token; no-op if not found. Callable from a callback.
    void unsubscribe(int token);

    // Queue an event for delivery to all current subscribers.
    void publish(TelemetryEvent evt);

    // Block until every event published so far has been delivered.
    // Must not be called from a subscriber.
    void drain();

    // Deliver what is queued, then stop the delivery thread.
    void stop();

private:
    void deliveryLoop();

    std::shared_ptr<spdlog::logger> log_;
    std::mutex mtx_;
    std::condition_variable cv_;
    std::condition_variable idleCv_;
    int nextToken_{1};
    std::map<int, Callback> subscribers_;
    std::deque<TelemetryEvent> queue_;
    bool delivering_{false};
    bool running_{true};
    std::thread worker_;
};
