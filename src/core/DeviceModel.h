#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Connection state of a device as committed by the state machine.
// Discovery poll results use the same vocabulary.
enum class DeviceState {
    Disconnected,
    Connecting,
    Connected,
    Unauthorized,
    Offline,
    Error
};

enum class Transport {
    Usb,
    Network
};

// What a request asks the bridge to do.
enum class CommandKind {
    DeviceDiscovery,
    PackageInventory,
    PackageDetails,
    MemorySnapshot,
    CpuSample,
    CrashScan,
    ForceStop,
    ClearData,
    Uninstall,
    EnableTcpip,
    ConnectNetwork,
    DisconnectNetwork
};

const char* toString(DeviceState s);
const char* toString(Transport t);
const char* toString(CommandKind k);

struct Device {
    std::string id;
    Transport transport{Transport::Usb};
    DeviceState state{DeviceState::Disconnected};
    std::chrono::system_clock::time_point lastConfirmedAt{};
    int consecutiveMismatchCount{0};

    // From `adb devices -l` extras, empty when the bridge does not report them
    std::string model;
    std::string product;
};

// One row of the discovery listing.
struct DeviceRecord {
    std::string id;
    std::string rawState;        // verbatim state column, e.g. "unauthorized"
    DeviceState state{DeviceState::Error};
    Transport transport{Transport::Usb};
    std::string model;
    std::string product;
    std::string deviceName;
    std::string transportId;
};

// One discovery result, shared so that every consumer sees the same poll.
using DeviceListing = std::shared_ptr<const std::vector<DeviceRecord>>;

enum class PackageCategory {
    System,
    User,
    Disabled
};

const char* toString(PackageCategory c);

struct PackageRecord {
    std::string name;
    std::optional<std::string> versionName;
    std::optional<std::int64_t> versionCode;
    std::optional<std::int64_t> sizeBytes;
    PackageCategory category{PackageCategory::User};
    std::string installPath;
};

// Immutable, name-ordered inventory; replaced wholesale on refresh.
using PackageSnapshot = std::vector<PackageRecord>;
using PackageSnapshotPtr = std::shared_ptr<const PackageSnapshot>;

struct PackageDetails {
    std::string name;
    std::optional<std::string> versionName;
    std::optional<std::int64_t> versionCode;
    std::optional<std::string> firstInstallTime;
    std::optional<std::string> lastUpdateTime;
    std::vector<std::string> codePaths;
    std::optional<std::int64_t> sizeBytes;
    std::vector<std::string> grantedPermissions;
    std::vector<std::string> deniedPermissions;
};

struct MemorySnapshot {
    std::string deviceId;
    std::string packageName;
    std::int64_t pssTotalKb{0};
    std::optional<std::int64_t> javaHeapKb;
    std::optional<std::int64_t> nativeHeapKb;
    std::optional<std::int64_t> graphicsKb;
    std::optional<std::int64_t> codeKb;
    std::optional<std::int64_t> stackKb;
    std::chrono::system_clock::time_point capturedAt{};
};

struct CpuSample {
    std::string deviceId;
    std::string packageName;
    std::optional<double> cpuPercent;   // absent when no process is running
    int processCount{0};
    std::chrono::system_clock::time_point capturedAt{};
};

enum class CrashKind {
    Crash,
    NativeCrash,
    Anr
};

const char* toString(CrashKind k);

struct CrashEvent {
    std::string deviceId;
    std::string packageName;
    CrashKind kind{CrashKind::Crash};
    std::string signature;
    std::chrono::system_clock::time_point occurredAt{};
};

using CrashScan = std::vector<CrashEvent>;

struct ActionOutcome {
    CommandKind kind{CommandKind::ForceStop};
    std::string target;     // package name or host:port
    std::string message;    // bridge output line describing the result
};
