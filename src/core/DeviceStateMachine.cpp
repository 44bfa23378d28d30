#include "core/DeviceStateMachine.h"

#include <utility>

DeviceStateMachine::DeviceStateMachine(std::string deviceId, int debounceThreshold)
    : deviceId_(std::move(deviceId)), threshold_(debounceThreshold < 1 ? 1 : debounceThreshold) {}

void DeviceStateMachine::commit(DeviceState to, TimePoint at, std::vector<StateTransition>& out) {
    out.push_back(StateTransition{deviceId_, state_, to, at});
    state_ = to;
    stateSince_ = at;
    lastConfirmedAt_ = at;
    pending_.reset();
    mismatchCount_ = 0;
}

std::vector<StateTransition> DeviceStateMachine::observe(DeviceState poll, TimePoint at) {
    std::vector<StateTransition> out;

    if (!seeded_) {
        seeded_ = true;
        state_ = poll;
        stateSince_ = at;
        lastConfirmedAt_ = at;
        return out;
    }

    if (poll == state_) {
        pending_.reset();
        mismatchCount_ = 0;
        lastConfirmedAt_ = at;
        return out;
    }

    if (state_ == DeviceState::Connected) {
        // debounce: a single dropped poll must not take the device down
        if (pending_ && *pending_ == poll) {
            ++mismatchCount_;
        } else {
            pending_ = poll;
            mismatchCount_ = 1;
        }
        if (mismatchCount_ >= threshold_) {
            commit(poll, at, out);
        }
        return out;
    }

    const bool recovering = state_ == DeviceState::Disconnected || state_ == DeviceState::Error;
    const bool present = poll != DeviceState::Disconnected && poll != DeviceState::Error;
    if (recovering && present) {
        commit(DeviceState::Connecting, at, out);
        if (poll != DeviceState::Connecting) {
            commit(poll, at, out);
        }
        return out;
    }

    commit(poll, at, out);
    return out;
}
