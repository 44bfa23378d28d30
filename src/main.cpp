// DeviceTelemetry main entry

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "core/CommandExecutor.h"
#include "core/Config.h"
#include "core/Logging.h"
#include "core/Serialize.h"
#include "core/TelemetryScheduler.h"
#include "core/Utils.h"
#include "providers/AdbDevicePoller.h"
#include "ui/CliMenu.h"

#ifndef DEVICETELEMETRY_VERSION
#define DEVICETELEMETRY_VERSION "0.0.0"
#endif

static void print_help(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--help] [--version] [--config <file>] [--json]\n"
              << "  --config <file>  JSON session configuration\n"
              << "  --json           print events as JSON lines\n"
              << "Environment: ADB_PATH, ANDROID_HOME, ANDROID_SDK_ROOT, DT_LOG=debug|info|warn|error|off\n";
}

static std::string describeEvent(const TelemetryEvent& evt) {
    if (auto list = std::get_if<DeviceListPayload>(&evt.payload)) {
        std::string ids;
        for (const auto& d : list->devices) {
            ids += fmt::format(" {}({})", d.id, toString(d.state));
        }
        return fmt::format("{} device(s){}{}", list->devices.size(), ids,
                           list->multipleDevices ? " [multiple connected]" : "");
    }
    if (auto change = std::get_if<StateChangePayload>(&evt.payload)) {
        return fmt::format("{} -> {}", toString(change->oldState), toString(change->newState));
    }
    if (auto inv = std::get_if<PackageSnapshotPtr>(&evt.payload)) {
        return fmt::format("{} package(s)", *inv ? (*inv)->size() : 0);
    }
    if (auto d = std::get_if<PackageDetails>(&evt.payload)) {
        return fmt::format("{} version={}", d->name, d->versionName.value_or("-"));
    }
    if (auto m = std::get_if<MemorySnapshot>(&evt.payload)) {
        return fmt::format("{} pss={}", m->packageName, Utils::formatKb(m->pssTotalKb));
    }
    if (auto c = std::get_if<CpuSample>(&evt.payload)) {
        return c->cpuPercent ? fmt::format("{} cpu={:.1f}%", c->packageName, *c->cpuPercent)
                             : fmt::format("{} not running", c->packageName);
    }
    if (auto crash = std::get_if<CrashEvent>(&evt.payload)) {
        return fmt::format("{} {} {}", toString(crash->kind), crash->packageName, crash->signature);
    }
    if (auto a = std::get_if<ActionOutcome>(&evt.payload)) {
        return fmt::format("{} {} {}", toString(a->kind), a->target, a->message);
    }
    if (auto f = std::get_if<FailurePayload>(&evt.payload)) {
        return fmt::format("{}: {}", toString(f->error), f->message);
    }
    return {};
}

int main(int argc, char** argv) {
    std::string configPath;
    bool jsonOutput = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_help(argv[0]);
            return 0;
        }
        if (arg == "--version" || arg == "-v") {
            std::cout << "DeviceTelemetry " << DEVICETELEMETRY_VERSION << "\n";
            return 0;
        }
        if (arg == "--json") {
            jsonOutput = true;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else {
            print_help(argv[0]);
            return 2;
        }
    }

    SessionConfig cfg;
    try {
        if (!configPath.empty()) cfg = Config::loadFile(configPath);
        Config::applyEnvironment(cfg);
        Logging::setDefaultLevel(cfg.logLevel);
    } catch (const std::exception& ex) {
        std::cerr << "config error: " << ex.what() << "\n";
        return 2;
    }

    auto log = Logging::makeLogger("main");
    fmt::print("DeviceTelemetry started\n");
    log->info("DeviceTelemetry version {}, bridge {}", DEVICETELEMETRY_VERSION, cfg.bridgePath);

    ProcessExecutor executor(cfg.bridgePath, Logging::makeLogger("exec"));
    TelemetryScheduler scheduler(executor, cfg, Logging::makeLogger("sched"));

    // Real-time printing switch (default on)
    std::atomic<bool> realtimePrint{true};
    scheduler.subscribe([&](const TelemetryEvent& evt) {
        if (!realtimePrint) return; // process but don't print
        if (jsonOutput) {
            fmt::print("{}\n", Serialize::eventToJson(evt).dump());
            return;
        }
        const std::string hhmmss = Utils::formatTimeHHMMSS(std::chrono::system_clock::now());
        fmt::print("[{}] {:<24} {} {}\n", hhmmss, toString(evt.kind), evt.deviceId.empty() ? "-" : evt.deviceId,
                   describeEvent(evt));
    });

    AdbDevicePoller poller(scheduler, cfg.pollInterval, Logging::makeLogger("poll"));
    poller.start();

    int rc = 0;
    {
        CliMenu menu(scheduler, realtimePrint, Logging::makeLogger("menu"));
        rc = menu.run();
    }
    poller.stop();
    scheduler.shutdown();
    return rc;
}
