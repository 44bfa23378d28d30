#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "core/DeviceModel.h"

struct StateTransition {
    std::string deviceId;
    DeviceState from{DeviceState::Disconnected};
    DeviceState to{DeviceState::Disconnected};
    std::chrono::system_clock::time_point at{};
};

// Connection state of one device, fed with discovery poll results.
//
// Leaving Connected needs `debounceThreshold` consecutive polls agreeing on the
// same new state; entering Connected commits on the first poll. Disconnected
// and Error only recover through Connecting. The very first poll seeds the
// state without producing a transition.
class DeviceStateMachine {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    explicit DeviceStateMachine(std::string deviceId, int debounceThreshold = 2);

    // Returns the committed transitions in order (zero, one or two).
    std::vector<StateTransition> observe(DeviceState poll, TimePoint at);

    const std::string& deviceId() const { return deviceId_; }
    DeviceState state() const { return state_; }
    bool seeded() const { return seeded_; }
    int consecutiveMismatchCount() const { return mismatchCount_; }
    std::optional<DeviceState> pendingState() const { return pending_; }
    TimePoint lastConfirmedAt() const { return lastConfirmedAt_; }
    TimePoint stateSince() const { return stateSince_; }

private:
    void commit(DeviceState to, TimePoint at, std::vector<StateTransition>& out);

    std::string deviceId_;
    int threshold_;
    bool seeded_{false};
    DeviceState state_{DeviceState::Disconnected};
    std::optional<DeviceState> pending_;
    int mismatchCount_{0};
    TimePoint lastConfirmedAt_{};
    TimePoint stateSince_{};
};
