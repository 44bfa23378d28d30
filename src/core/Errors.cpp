#include "core/Errors.h"

#include <utility>

const char* toString(ErrorKind k) {
    switch (k) {
        case ErrorKind::ExecutableNotFound: return "ExecutableNotFound";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::DeviceOffline: return "DeviceOffline";
        case ErrorKind::Unauthorized: return "Unauthorized";
        case ErrorKind::NoSuchPackage: return "NoSuchPackage";
        case ErrorKind::ParseError: return "ParseError";
        case ErrorKind::MultipleDevicesAmbiguous: return "MultipleDevicesAmbiguous";
        case ErrorKind::CacheFetchFailed: return "CacheFetchFailed";
        case ErrorKind::ProcessError: return "ProcessError";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::DeadlineExceeded: return "DeadlineExceeded";
    }
    return "ProcessError";
}

const char* defaultMessage(ErrorKind k) {
    switch (k) {
        case ErrorKind::ExecutableNotFound:
            return "adb executable not found. Install platform-tools or set ADB_PATH.";
        case ErrorKind::Timeout:
            return "Command timed out. Check the device connection and try again.";
        case ErrorKind::DeviceOffline:
            return "Device is offline or no longer connected.";
        case ErrorKind::Unauthorized:
            return "Device not authorized for debugging. Accept the prompt on the device.";
        case ErrorKind::NoSuchPackage:
            return "Package not found on device.";
        case ErrorKind::ParseError:
            return "Failed to parse command output.";
        case ErrorKind::MultipleDevicesAmbiguous:
            return "Multiple devices connected. Specify the target device.";
        case ErrorKind::CacheFetchFailed:
            return "Fetching data from the device failed.";
        case ErrorKind::ProcessError:
            return "Command failed on the device.";
        case ErrorKind::Cancelled:
            return "Request cancelled.";
        case ErrorKind::DeadlineExceeded:
            return "Request deadline exceeded before it could run.";
    }
    return "Unknown error.";
}

bool isTransient(ErrorKind k) {
    return k == ErrorKind::Timeout || k == ErrorKind::DeviceOffline;
}

BridgeError::BridgeError(ErrorKind kind, const std::string& message, std::string rawOutput)
    : std::runtime_error(message), kind_(kind), rawOutput_(std::move(rawOutput)) {}

ParseError::ParseError(const std::string& line, const std::string& reason)
    : BridgeError(ErrorKind::ParseError, reason + ": '" + line + "'", line),
      line_(line),
      reason_(reason) {}
