#pragma once

#include <stdexcept>
#include <string>

// Closed set of failure kinds surfaced to consumers.
enum class ErrorKind {
    ExecutableNotFound,
    Timeout,
    DeviceOffline,
    Unauthorized,
    NoSuchPackage,
    ParseError,
    MultipleDevicesAmbiguous,
    CacheFetchFailed,
    ProcessError,
    Cancelled,
    DeadlineExceeded
};

const char* toString(ErrorKind k);

// Stable human-readable description of an error kind.
const char* defaultMessage(ErrorKind k);

// Transient kinds are retried locally before being surfaced.
bool isTransient(ErrorKind k);

// Failure of a bridge invocation or of interpreting its output.
class BridgeError : public std::runtime_error {
public:
    BridgeError(ErrorKind kind, const std::string& message, std::string rawOutput = {});

    ErrorKind kind() const { return kind_; }
    const std::string& rawOutput() const { return rawOutput_; }

private:
    ErrorKind kind_;
    std::string rawOutput_;
};

// Parser rejection; carries the offending line verbatim.
class ParseError : public BridgeError {
public:
    ParseError(const std::string& line, const std::string& reason);

    const std::string& line() const { return line_; }
    const std::string& reason() const { return reason_; }

private:
    std::string line_;
    std::string reason_;
};
