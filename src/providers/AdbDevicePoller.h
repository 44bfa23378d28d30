#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

#include <spdlog/spdlog.h>

#include "core/TelemetryScheduler.h"

// Submits a device discovery request every poll interval.
class AdbDevicePoller {
public:
    AdbDevicePoller(TelemetryScheduler& scheduler, std::chrono::milliseconds interval,
                    std::shared_ptr<spdlog::logger> log);
    ~AdbDevicePoller();

    void start();
    void stop();
    bool isRunning() const { return running_; }

    std::uint64_t pollCount() const { return polls_; }

private:
    void runLoop();

    TelemetryScheduler& scheduler_;
    std::chrono::milliseconds interval_;
    std::shared_ptr<spdlog::logger> log_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> polls_{0};
};
