#include "core/DeviceModel.h"

const char* toString(DeviceState s) {
    switch (s) {
        case DeviceState::Disconnected: return "disconnected";
        case DeviceState::Connecting: return "connecting";
        case DeviceState::Connected: return "connected";
        case DeviceState::Unauthorized: return "unauthorized";
        case DeviceState::Offline: return "offline";
        case DeviceState::Error: return "error";
    }
    return "error";
}

const char* toString(Transport t) {
    switch (t) {
        case Transport::Usb: return "usb";
        case Transport::Network: return "network";
    }
    return "usb";
}

const char* toString(CommandKind k) {
    switch (k) {
        case CommandKind::DeviceDiscovery: return "discovery";
        case CommandKind::PackageInventory: return "inventory";
        case CommandKind::PackageDetails: return "details";
        case CommandKind::MemorySnapshot: return "memory";
        case CommandKind::CpuSample: return "cpu";
        case CommandKind::CrashScan: return "crash";
        case CommandKind::ForceStop: return "force-stop";
        case CommandKind::ClearData: return "clear-data";
        case CommandKind::Uninstall: return "uninstall";
        case CommandKind::EnableTcpip: return "tcpip";
        case CommandKind::ConnectNetwork: return "connect";
        case CommandKind::DisconnectNetwork: return "disconnect";
    }
    return "unknown";
}

const char* toString(PackageCategory c) {
    switch (c) {
        case PackageCategory::System: return "system";
        case PackageCategory::User: return "user";
        case PackageCategory::Disabled: return "disabled";
    }
    return "user";
}

const char* toString(CrashKind k) {
    switch (k) {
        case CrashKind::Crash: return "crash";
        case CrashKind::NativeCrash: return "native-crash";
        case CrashKind::Anr: return "anr";
    }
    return "crash";
}
