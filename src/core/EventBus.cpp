#include "core/EventBus.h"

#include <exception>
#include <utility>

const char* toString(TelemetryEvent::Kind k) {
    switch (k) {
        case TelemetryEvent::Kind::DeviceListUpdated: return "DeviceListUpdated";
        case TelemetryEvent::Kind::DeviceStateChanged: return "DeviceStateChanged";
        case TelemetryEvent::Kind::PackageInventoryUpdated: return "PackageInventoryUpdated";
        case TelemetryEvent::Kind::PackageDetailsReady: return "PackageDetailsReady";
        case TelemetryEvent::Kind::MemorySnapshotReady: return "MemorySnapshotReady";
        case TelemetryEvent::Kind::CpuSampleReady: return "CpuSampleReady";
        case TelemetryEvent::Kind::CrashOrAnrDetected: return "CrashOrAnrDetected";
        case TelemetryEvent::Kind::ActionCompleted: return "ActionCompleted";
        case TelemetryEvent::Kind::OperationFailed: return "OperationFailed";
    }
    return "Unknown";
}

EventBus::EventBus(std::shared_ptr<spdlog::logger> log) : log_(std::move(log)) {
    worker_ = std::thread([this] { deliveryLoop(); });
}

EventBus::~EventBus() {
    stop();
}

int EventBus::subscribe(Callback cb) {
    std::lock_guard<std::mutex> lock(mtx_);
    const int token = nextToken_++;
    subscribers_.emplace(token, std::move(cb));
    return token;
}

void EventBus::unsubscribe(int token) {
    std::lock_guard<std::mutex> lock(mtx_);
    subscribers_.erase(token);
}

void EventBus::publish(TelemetryEvent evt) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!running_) return;
        queue_.push_back(std::move(evt));
    }
    cv_.notify_one();
}

void EventBus::drain() {
    std::unique_lock<std::mutex> lk(mtx_);
    idleCv_.wait(lk, [this] { return queue_.empty() && !delivering_; });
}

void EventBus::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) worker_.join();
    idleCv_.notify_all();
}

void EventBus::deliveryLoop() {
    for (;;) {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this] { return !queue_.empty() || !running_; });
        if (queue_.empty()) break;

        TelemetryEvent evt = std::move(queue_.front());
        queue_.pop_front();
        delivering_ = true;
        // Copy callbacks under lock, then invoke without lock to allow re-entrant subscribe/publish.
        std::map<int, Callback> subsCopy = subscribers_;
        lk.unlock();

        for (auto& kv : subsCopy) {
            if (!kv.second) continue;
            try {
                kv.second(evt);
            } catch (const std::exception& ex) {
                log_->error("subscriber {} threw on {}: {}", kv.first, toString(evt.kind), ex.what());
            } catch (...) {
                log_->error("subscriber {} threw a non-standard exception on {}", kv.first, toString(evt.kind));
            }
        }

        lk.lock();
        delivering_ = false;
        if (queue_.empty()) idleCv_.notify_all();
    }
    idleCv_.notify_all();
}
