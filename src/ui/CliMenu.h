#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "core/TelemetryScheduler.h"

class CliMenu {
public:
    CliMenu(TelemetryScheduler& scheduler, std::atomic<bool>& realtimePrintFlag, std::shared_ptr<spdlog::logger> log);
    ~CliMenu();

    int run(); // returns exit code

private:
    void printMenu(bool realtimeOn);
    void listDevices();
    void selectDevice();
    void listPackages();
    void showPackageDetails();
    void memorySnapshot();
    void cpuSample();
    void crashScan();
    void refresh();
    void forceStop();
    void exportJson();
    void exportCsv();
    void connectNetwork();

    // Submit and wait for the event answering the request.
    std::optional<TelemetryEvent> request(TelemetryRequest req, std::chrono::milliseconds wait,
                                          bool reportTimeout = true);
    bool requireDevice();
    std::string askPackage();
    static void printFailure(const TelemetryEvent& evt);

    TelemetryScheduler& scheduler_;
    std::atomic<bool>& realtimePrintFlag_;
    std::shared_ptr<spdlog::logger> log_;
    int token_{0};

    std::string device_;
    PackageSnapshotPtr lastInventory_;

    std::mutex mtx_;
    std::condition_variable cv_;
    RequestHandle waiting_{0};
    std::optional<TelemetryEvent> answer_;
};
