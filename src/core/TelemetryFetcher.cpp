#include "core/TelemetryFetcher.h"

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <thread>

#include "core/Errors.h"
#include "parsers/ActionOutputParser.h"
#include "parsers/CpuTopParser.h"
#include "parsers/CrashScanner.h"
#include "parsers/DeviceListParser.h"
#include "parsers/MemInfoParser.h"
#include "parsers/PackageDetailsParser.h"
#include "parsers/PackageListParser.h"
#include "providers/AdbCommands.h"

namespace {

constexpr std::chrono::milliseconds kBackoffSlice(20);
constexpr const char* kDefaultTcpipPort = "5555";

bool needsPackage(CommandKind k) {
    switch (k) {
        case CommandKind::PackageDetails:
        case CommandKind::MemorySnapshot:
        case CommandKind::CpuSample:
        case CommandKind::ForceStop:
        case CommandKind::ClearData:
        case CommandKind::Uninstall:
            return true;
        default:
            return false;
    }
}

bool needsDevice(CommandKind k) {
    return k != CommandKind::DeviceDiscovery && k != CommandKind::ConnectNetwork &&
           k != CommandKind::DisconnectNetwork;
}

void throwIfCancelled(const CancelToken* cancel) {
    if (cancel && cancel->isCancelled()) {
        throw BridgeError(ErrorKind::Cancelled, "request cancelled");
    }
}

} // namespace

std::size_t TelemetryRequest::argsHash() const {
    return std::hash<std::string>{}(packageName + '\x1f' + target);
}

CacheKey TelemetryRequest::cacheKey() const {
    return CacheKey{deviceId, kind, argsHash()};
}

void TelemetryRequest::validate() const {
    if (needsDevice(kind) && deviceId.empty()) {
        throw std::invalid_argument(std::string(toString(kind)) + " requires a device id");
    }
    if (needsPackage(kind) && packageName.empty()) {
        throw std::invalid_argument(std::string(toString(kind)) + " requires a package name");
    }
    if ((kind == CommandKind::ConnectNetwork || kind == CommandKind::DisconnectNetwork) && target.empty()) {
        throw std::invalid_argument(std::string(toString(kind)) + " requires host:port");
    }
}

TelemetryFetcher::TelemetryFetcher(CommandExecutor& executor, const SessionConfig& cfg,
                                   std::shared_ptr<spdlog::logger> log)
    : executor_(executor), cfg_(cfg), log_(std::move(log)) {}

CommandResult TelemetryFetcher::run(const std::string& deviceId, const std::vector<std::string>& args,
                                    const CancelToken* cancel) {
    int timeouts = 0;
    int offline = 0;
    for (;;) {
        throwIfCancelled(cancel);
        try {
            return executor_.execute(deviceId, args, cfg_.commandTimeout, cancel);
        } catch (const BridgeError& e) {
            if (e.kind() == ErrorKind::Timeout && timeouts < cfg_.retry.timeoutRetries) {
                ++timeouts;
                log_->info("retrying after timeout ({}/{}): {}", timeouts, cfg_.retry.timeoutRetries,
                           AdbCommands::describe(args));
                continue;
            }
            if (e.kind() == ErrorKind::DeviceOffline && offline < cfg_.retry.offlineRetries) {
                ++offline;
                log_->info("device {} offline, retry {}/{} in {}ms", deviceId, offline, cfg_.retry.offlineRetries,
                           (cfg_.retry.backoff * offline).count());
                backoff(offline, cancel);
                continue;
            }
            throw;
        }
    }
}

void TelemetryFetcher::backoff(int attempt, const CancelToken* cancel) {
    const auto until = std::chrono::steady_clock::now() + cfg_.retry.backoff * attempt;
    while (std::chrono::steady_clock::now() < until) {
        throwIfCancelled(cancel);
        std::this_thread::sleep_for(kBackoffSlice);
    }
}

TelemetryResult TelemetryFetcher::fetch(const TelemetryRequest& req, const CancelToken* cancel) {
    using Clock = std::chrono::system_clock;
    switch (req.kind) {
        case CommandKind::DeviceDiscovery:
            return discover(cancel);
        case CommandKind::PackageInventory:
            return inventory(req, cancel);
        case CommandKind::PackageDetails:
            return details(req, cancel);
        case CommandKind::MemorySnapshot: {
            const auto out = run(req.deviceId, AdbCommands::meminfo(req.packageName), cancel);
            return Parsers::parseMemInfo(req.deviceId, req.packageName, out.stdoutText, Clock::now());
        }
        case CommandKind::CpuSample: {
            const auto out = run(req.deviceId, AdbCommands::top(), cancel);
            return Parsers::parseTopForPackage(req.deviceId, req.packageName, out.stdoutText, Clock::now());
        }
        case CommandKind::CrashScan:
            return crashes(req, cancel);
        case CommandKind::ForceStop:
        case CommandKind::ClearData:
        case CommandKind::Uninstall:
        case CommandKind::EnableTcpip:
        case CommandKind::ConnectNetwork:
        case CommandKind::DisconnectNetwork:
            return action(req, cancel);
    }
    throw BridgeError(ErrorKind::ProcessError, std::string("unsupported request kind ") + toString(req.kind));
}

DeviceListing TelemetryFetcher::discover(const CancelToken* cancel) {
    const auto out = run({}, AdbCommands::devices(), cancel);
    return std::make_shared<const std::vector<DeviceRecord>>(Parsers::parseDeviceList(out.stdoutText));
}

PackageSnapshotPtr TelemetryFetcher::inventory(const TelemetryRequest& req, const CancelToken* cancel) {
    std::vector<std::pair<const char*, PackageCategory>> variants{{"-3", PackageCategory::User}};
    if (cfg_.includeSystemPackages) variants.emplace_back("-s", PackageCategory::System);
    variants.emplace_back("-d", PackageCategory::Disabled);

    std::vector<PackageSnapshot> listings;
    for (const auto& v : variants) {
        const auto out = run(req.deviceId, AdbCommands::listPackages(v.first), cancel);
        listings.push_back(Parsers::parsePackageList(out.stdoutText, v.second));
    }
    auto merged = Parsers::mergeInventory(listings);
    log_->debug("inventory {}: {} packages", req.deviceId, merged->size());
    return merged;
}

PackageDetails TelemetryFetcher::details(const TelemetryRequest& req, const CancelToken* cancel) {
    const auto dump = run(req.deviceId, AdbCommands::dumpsysPackage(req.packageName), cancel);
    PackageDetails d = Parsers::parsePackageDetails(req.packageName, dump.stdoutText);

    // APK size is best effort: older shells lack `stat -c`
    try {
        const auto pathOut = run(req.deviceId, AdbCommands::packagePaths(req.packageName), cancel);
        const auto paths = Parsers::parsePackagePaths(pathOut.stdoutText);
        if (!paths.empty()) {
            const auto statOut = run(req.deviceId, AdbCommands::statSizes(paths), cancel);
            d.sizeBytes = Parsers::parseSizeSum(statOut.stdoutText);
        }
    } catch (const BridgeError& e) {
        if (e.kind() != ErrorKind::ProcessError && e.kind() != ErrorKind::ParseError) throw;
        log_->debug("size of {} unavailable: {}", req.packageName, e.what());
    }
    return d;
}

CrashScan TelemetryFetcher::crashes(const TelemetryRequest& req, const CancelToken* cancel) {
    const auto out = run(req.deviceId, AdbCommands::logcatDump(), cancel);
    CrashScan scan = Parsers::scanCrashes(req.deviceId, out.stdoutText, std::chrono::system_clock::now());
    if (!req.packageName.empty()) {
        scan.erase(std::remove_if(scan.begin(), scan.end(),
                                  [&](const CrashEvent& e) { return e.packageName != req.packageName; }),
                   scan.end());
    }
    return scan;
}

ActionOutcome TelemetryFetcher::action(const TelemetryRequest& req, const CancelToken* cancel) {
    std::string deviceId = req.deviceId;
    std::string target = req.target;
    std::vector<std::string> args;
    switch (req.kind) {
        case CommandKind::ForceStop:
            args = AdbCommands::forceStop(req.packageName);
            target = req.packageName;
            break;
        case CommandKind::ClearData:
            args = AdbCommands::clearData(req.packageName);
            target = req.packageName;
            break;
        case CommandKind::Uninstall:
            args = AdbCommands::uninstall(req.packageName);
            target = req.packageName;
            break;
        case CommandKind::EnableTcpip:
            if (target.empty()) target = kDefaultTcpipPort;
            args = AdbCommands::tcpip(target);
            break;
        case CommandKind::ConnectNetwork:
            args = AdbCommands::connect(target);
            deviceId.clear();
            break;
        case CommandKind::DisconnectNetwork:
            args = AdbCommands::disconnect(target);
            deviceId.clear();
            break;
        default:
            throw BridgeError(ErrorKind::ProcessError, std::string("not an action: ") + toString(req.kind));
    }

    CommandResult out;
    try {
        out = run(deviceId, args, cancel);
    } catch (const BridgeError& e) {
        // uninstall and pm clear exit non-zero with a "Failure [...]" verdict on stdout
        if (e.kind() != ErrorKind::ProcessError) throw;
        Parsers::parseActionOutput(req.kind, target, e.rawOutput());
        throw;
    }
    ActionOutcome outcome = Parsers::parseActionOutput(req.kind, target, out.stdoutText + out.stderrText);
    log_->info("{} {} on {}: {}", toString(req.kind), target, deviceId.empty() ? "-" : deviceId,
               outcome.message.empty() ? "ok" : outcome.message);
    return outcome;
}
