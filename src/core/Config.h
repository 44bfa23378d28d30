#pragma once

#include <chrono>
#include <string>

#include "core/DeviceModel.h"

struct RetryPolicy {
    int timeoutRetries{1};     // extra attempts after a Timeout
    int offlineRetries{2};     // extra attempts after DeviceOffline
    std::chrono::milliseconds backoff{200};   // multiplied by the attempt number
};

struct CacheTtls {
    std::chrono::milliseconds discovery{2000};
    std::chrono::milliseconds inventory{30000};
    std::chrono::milliseconds details{30000};
    std::chrono::milliseconds memory{0};
    std::chrono::milliseconds cpu{0};
    std::chrono::milliseconds crash{5000};

    // Device actions are never cached.
    std::chrono::milliseconds forKind(CommandKind kind) const;
};

struct SessionConfig {
    std::string bridgePath{"adb"};
    int workerCount{4};
    std::chrono::milliseconds commandTimeout{10000};
    std::chrono::milliseconds requestDeadline{30000};
    std::chrono::milliseconds pollInterval{2000};
    int debounceThreshold{2};
    std::chrono::milliseconds removalGrace{10000};
    bool includeSystemPackages{true};
    std::string logLevel{"info"};
    CacheTtls ttl;
    RetryPolicy retry;
};

namespace Config {

// Parse a JSON document. Missing keys keep their defaults; a key of the wrong
// type throws std::runtime_error naming the key.
SessionConfig fromJsonText(const std::string& text);

// Read and parse a JSON file; throws std::runtime_error when unreadable.
SessionConfig loadFile(const std::string& path);

// Apply ADB_PATH / ANDROID_HOME / ANDROID_SDK_ROOT / DT_LOG.
void applyEnvironment(SessionConfig& cfg);

} // namespace Config
