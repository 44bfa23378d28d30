#include "providers/AdbDevicePoller.h"

#include <algorithm>
#include <exception>
#include <utility>

namespace {
constexpr std::chrono::milliseconds kSleepSlice(100);
}

AdbDevicePoller::AdbDevicePoller(TelemetryScheduler& scheduler, std::chrono::milliseconds interval,
                                 std::shared_ptr<spdlog::logger> log)
    : scheduler_(scheduler), interval_(interval), log_(std::move(log)) {}

AdbDevicePoller::~AdbDevicePoller() {
    stop();
}

void AdbDevicePoller::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return; // already running
    }
    log_->info("poller starting, interval {}ms", interval_.count());
    worker_ = std::thread([this]() { runLoop(); });
}

void AdbDevicePoller::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return; // not running
    }
    log_->info("poller stopping");
    if (worker_.joinable()) worker_.join();
}

void AdbDevicePoller::runLoop() {
    while (running_) {
        try {
            // every poll must reach the state machine, so a stored listing is not reused
            TelemetryRequest req;
            req.kind = CommandKind::DeviceDiscovery;
            req.forceRefresh = true;
            const auto handle = scheduler_.submit(std::move(req));
            ++polls_;
            log_->debug("discovery #{} submitted", handle);
        } catch (const std::exception& ex) {
            log_->warn("discovery submit failed: {}", ex.what());
        }

        // Sleep in small slices so stop() is prompt
        const auto until = std::chrono::steady_clock::now() + interval_;
        for (auto now = std::chrono::steady_clock::now(); running_ && now < until;
             now = std::chrono::steady_clock::now()) {
            std::this_thread::sleep_for(
                std::min<std::chrono::steady_clock::duration>(kSleepSlice, until - now));
        }
    }
}
