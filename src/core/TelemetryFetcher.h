#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/CommandExecutor.h"
#include "core/Config.h"
#include "core/DeviceModel.h"
#include "core/SingleFlightCache.h"

struct TelemetryRequest {
    std::string deviceId;          // empty for discovery and network connect/disconnect
    CommandKind kind{CommandKind::DeviceDiscovery};
    int priority{0};               // higher runs first
    std::string packageName;
    std::string target;            // host:port, or the tcpip port
    std::optional<std::chrono::milliseconds> deadline;  // overrides requestDeadline
    bool forceRefresh{false};      // skip a stored result; an in-flight fetch is still shared

    std::size_t argsHash() const;
    CacheKey cacheKey() const;

    // Throws std::invalid_argument when a required argument is missing.
    void validate() const;
};

using TelemetryResult = std::variant<DeviceListing,
                                     PackageSnapshotPtr,
                                     PackageDetails,
                                     MemorySnapshot,
                                     CpuSample,
                                     CrashScan,
                                     ActionOutcome>;

// Turns one request into bridge invocations plus parsing. Transient failures
// are retried here so the single-flight cache shares the retries too.
class TelemetryFetcher {
public:
    TelemetryFetcher(CommandExecutor& executor, const SessionConfig& cfg, std::shared_ptr<spdlog::logger> log);

    TelemetryResult fetch(const TelemetryRequest& req, const CancelToken* cancel = nullptr);

private:
    CommandResult run(const std::string& deviceId, const std::vector<std::string>& args, const CancelToken* cancel);
    void backoff(int attempt, const CancelToken* cancel);

    DeviceListing discover(const CancelToken* cancel);
    PackageSnapshotPtr inventory(const TelemetryRequest& req, const CancelToken* cancel);
    PackageDetails details(const TelemetryRequest& req, const CancelToken* cancel);
    CrashScan crashes(const TelemetryRequest& req, const CancelToken* cancel);
    ActionOutcome action(const TelemetryRequest& req, const CancelToken* cancel);

    CommandExecutor& executor_;
    SessionConfig cfg_;
    std::shared_ptr<spdlog::logger> log_;
};
