#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "core/DeviceModel.h"
#include "core/Errors.h"

using RequestHandle = std::uint64_t;

struct DeviceListPayload {
    std::vector<Device> devices;
    bool multipleDevices{false};   // more than one Connected device
};

struct StateChangePayload {
    DeviceState oldState{DeviceState::Disconnected};
    DeviceState newState{DeviceState::Disconnected};
};

struct FailurePayload {
    ErrorKind error{ErrorKind::ProcessError};
    std::string message;
    std::string rawOutput;
};

struct TelemetryEvent {
    enum class Kind {
        DeviceListUpdated,
        DeviceStateChanged,
        PackageInventoryUpdated,
        PackageDetailsReady,
        MemorySnapshotReady,
        CpuSampleReady,
        CrashOrAnrDetected,
        ActionCompleted,
        OperationFailed
    };

    using Payload = std::variant<std::monostate,
                                 DeviceListPayload,
                                 StateChangePayload,
                                 PackageSnapshotPtr,
                                 PackageDetails,
                                 MemorySnapshot,
                                 CpuSample,
                                 CrashEvent,
                                 ActionOutcome,
                                 FailurePayload>;

    Kind kind{Kind::DeviceListUpdated};
    std::string deviceId;
    RequestHandle handle{0};    // 0 for events not tied to a request
    Payload payload;
};

const char* toString(TelemetryEvent::Kind k);
