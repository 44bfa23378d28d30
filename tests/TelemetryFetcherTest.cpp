#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>

#include "TestSupport.h"
#include "core/Logging.h"
#include "core/TelemetryFetcher.h"

using namespace std::chrono_literals;
using testsupport::FakeExecutor;

namespace {

SessionConfig fastRetries() {
    SessionConfig cfg;
    cfg.retry.timeoutRetries = 1;
    cfg.retry.offlineRetries = 2;
    cfg.retry.backoff = 1ms;
    return cfg;
}

TelemetryRequest request(const std::string& deviceId, CommandKind kind, const std::string& pkg = {}) {
    TelemetryRequest req;
    req.deviceId = deviceId;
    req.kind = kind;
    req.packageName = pkg;
    return req;
}

ErrorKind failureOf(TelemetryFetcher& fetcher, const TelemetryRequest& req) {
    try {
        fetcher.fetch(req);
    } catch (const BridgeError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "fetch did not fail";
    return ErrorKind::ProcessError;
}

} // namespace

TEST(TelemetryFetcher, TimeoutRetriedOnce) {
    FakeExecutor exec;
    exec.fail("shell top -b -n 1", ErrorKind::Timeout, "command timed out after 10000ms");
    TelemetryFetcher fetcher(exec, fastRetries(), Logging::makeNullLogger("fetch"));

    EXPECT_EQ(failureOf(fetcher, request("d", CommandKind::CpuSample, "com.a")), ErrorKind::Timeout);
    EXPECT_EQ(exec.calls("shell top -b -n 1"), 2);
}

TEST(TelemetryFetcher, OfflineRetriedWithBackoff) {
    FakeExecutor exec;
    exec.fail("shell dumpsys meminfo com.a", ErrorKind::DeviceOffline, "device offline");
    TelemetryFetcher fetcher(exec, fastRetries(), Logging::makeNullLogger("fetch"));

    EXPECT_EQ(failureOf(fetcher, request("d", CommandKind::MemorySnapshot, "com.a")), ErrorKind::DeviceOffline);
    EXPECT_EQ(exec.calls("shell dumpsys meminfo com.a"), 3);
}

TEST(TelemetryFetcher, RecoversWhenRetrySucceeds) {
    FakeExecutor exec;
    std::atomic<int> attempts{0};
    exec.on("shell dumpsys meminfo com.a", [&](const std::string&, const CancelToken*) {
        if (attempts++ == 0) throw BridgeError(ErrorKind::DeviceOffline, "device offline");
        CommandResult r;
        r.stdoutText = "TOTAL PSS: 2048\n";
        return r;
    });
    TelemetryFetcher fetcher(exec, fastRetries(), Logging::makeNullLogger("fetch"));

    const auto result = fetcher.fetch(request("d", CommandKind::MemorySnapshot, "com.a"));
    EXPECT_EQ(std::get<MemorySnapshot>(result).pssTotalKb, 2048);
    EXPECT_EQ(attempts.load(), 2);
}

TEST(TelemetryFetcher, PermanentFailuresAreNotRetried) {
    FakeExecutor exec;
    exec.reply("shell dumpsys meminfo com.a", "nothing useful\n");
    exec.fail("shell dumpsys meminfo com.b", ErrorKind::Unauthorized, "device unauthorized");
    TelemetryFetcher fetcher(exec, fastRetries(), Logging::makeNullLogger("fetch"));

    EXPECT_EQ(failureOf(fetcher, request("d", CommandKind::MemorySnapshot, "com.a")), ErrorKind::ParseError);
    EXPECT_EQ(failureOf(fetcher, request("d", CommandKind::MemorySnapshot, "com.b")), ErrorKind::Unauthorized);
    EXPECT_EQ(exec.calls("shell dumpsys meminfo com.a"), 1);
    EXPECT_EQ(exec.calls("shell dumpsys meminfo com.b"), 1);
}

TEST(TelemetryFetcher, InventoryMergesListings) {
    FakeExecutor exec;
    exec.reply("shell pm list packages -f --show-versioncode -3",
               "package:/data/app/b/base.apk=com.b versionCode:2\npackage:/data/app/a/base.apk=com.a versionCode:1\n");
    exec.reply("shell pm list packages -f --show-versioncode -s", "package:/system/app/S/S.apk=android.sys\n");
    exec.reply("shell pm list packages -f --show-versioncode -d", "package:/data/app/b/base.apk=com.b\n");
    TelemetryFetcher fetcher(exec, fastRetries(), Logging::makeNullLogger("fetch"));

    const auto snap = std::get<PackageSnapshotPtr>(fetcher.fetch(request("d", CommandKind::PackageInventory)));
    ASSERT_EQ(snap->size(), 3u);
    EXPECT_EQ((*snap)[0].name, "android.sys");
    EXPECT_EQ((*snap)[0].category, PackageCategory::System);
    EXPECT_EQ((*snap)[2].name, "com.b");
    EXPECT_EQ((*snap)[2].category, PackageCategory::Disabled);
    for (const auto& id : exec.deviceIds()) EXPECT_EQ(id, "d");
}

TEST(TelemetryFetcher, InventoryCanSkipSystemPackages) {
    FakeExecutor exec;
    exec.reply("shell pm list packages -f --show-versioncode -3", "package:com.a\n");
    exec.reply("shell pm list packages -f --show-versioncode -d", "");
    auto cfg = fastRetries();
    cfg.includeSystemPackages = false;
    TelemetryFetcher fetcher(exec, cfg, Logging::makeNullLogger("fetch"));

    const auto snap = std::get<PackageSnapshotPtr>(fetcher.fetch(request("d", CommandKind::PackageInventory)));
    EXPECT_EQ(snap->size(), 1u);
    EXPECT_EQ(exec.calls("shell pm list packages -f --show-versioncode -s"), 0);
}

TEST(TelemetryFetcher, DetailsIncludeApkSize) {
    FakeExecutor exec;
    exec.reply("shell dumpsys package com.a",
               "Packages:\n  Package [com.a] (abc):\n    versionCode=7 minSdk=21\n    versionName=0.7\n");
    exec.reply("shell pm path com.a", "package:/data/app/a/base.apk\npackage:/data/app/a/split.apk\n");
    exec.reply("shell stat -c %s /data/app/a/base.apk /data/app/a/split.apk", "1048576\n2048\n");
    TelemetryFetcher fetcher(exec, fastRetries(), Logging::makeNullLogger("fetch"));

    const auto d = std::get<PackageDetails>(fetcher.fetch(request("d", CommandKind::PackageDetails, "com.a")));
    EXPECT_EQ(d.versionName.value_or(""), "0.7");
    EXPECT_EQ(d.sizeBytes.value_or(0), 1050624);
}

TEST(TelemetryFetcher, DetailsWithoutSizeWhenStatFails) {
    FakeExecutor exec;
    exec.reply("shell dumpsys package com.a", "  Package [com.a] (abc):\n    versionCode=7\n");
    exec.reply("shell pm path com.a", "package:/data/app/a/base.apk\n");
    TelemetryFetcher fetcher(exec, fastRetries(), Logging::makeNullLogger("fetch"));

    const auto d = std::get<PackageDetails>(fetcher.fetch(request("d", CommandKind::PackageDetails, "com.a")));
    EXPECT_EQ(d.versionCode.value_or(0), 7);
    EXPECT_FALSE(d.sizeBytes.has_value());
}

TEST(TelemetryFetcher, UninstallFailureVerdict) {
    FakeExecutor exec;
    exec.fail("uninstall com.gone", ErrorKind::ProcessError, "command exited with code 1",
              "Failure [DELETE_FAILED_INTERNAL_ERROR]\n");
    TelemetryFetcher fetcher(exec, fastRetries(), Logging::makeNullLogger("fetch"));

    EXPECT_EQ(failureOf(fetcher, request("d", CommandKind::Uninstall, "com.gone")), ErrorKind::NoSuchPackage);
}

TEST(TelemetryFetcher, NetworkActionsAddressNoDevice) {
    FakeExecutor exec;
    exec.reply("connect 10.0.0.2:5555", "connected to 10.0.0.2:5555\n");
    exec.reply("tcpip 5555", "restarting in TCP mode port: 5555\n");
    TelemetryFetcher fetcher(exec, fastRetries(), Logging::makeNullLogger("fetch"));

    auto connect = request("emulator-5554", CommandKind::ConnectNetwork);
    connect.target = "10.0.0.2:5555";
    const auto outcome = std::get<ActionOutcome>(fetcher.fetch(connect));
    EXPECT_EQ(outcome.target, "10.0.0.2:5555");
    EXPECT_EQ(outcome.message, "connected to 10.0.0.2:5555");

    const auto tcpip = std::get<ActionOutcome>(fetcher.fetch(request("emulator-5554", CommandKind::EnableTcpip)));
    EXPECT_EQ(tcpip.target, "5555");

    const auto ids = exec.deviceIds();
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], "");
    EXPECT_EQ(ids[1], "emulator-5554");
}

TEST(TelemetryFetcher, CrashScanFiltersByPackage) {
    FakeExecutor exec;
    exec.reply("logcat -d -v threadtime -b main -b system -b crash",
               "10-18 11:00:00.000   101   101 E AndroidRuntime: FATAL EXCEPTION: main\n"
               "10-18 11:00:00.000   101   101 E AndroidRuntime: Process: com.a, PID: 101\n"
               "10-18 11:00:00.000   101   101 E AndroidRuntime: java.lang.Error: a\n"
               "10-18 11:00:05.000   202   202 E AndroidRuntime: FATAL EXCEPTION: main\n"
               "10-18 11:00:05.000   202   202 E AndroidRuntime: Process: com.b, PID: 202\n"
               "10-18 11:00:05.000   202   202 E AndroidRuntime: java.lang.Error: b\n");
    TelemetryFetcher fetcher(exec, fastRetries(), Logging::makeNullLogger("fetch"));

    EXPECT_EQ(std::get<CrashScan>(fetcher.fetch(request("d", CommandKind::CrashScan))).size(), 2u);
    const auto onlyB = std::get<CrashScan>(fetcher.fetch(request("d", CommandKind::CrashScan, "com.b")));
    ASSERT_EQ(onlyB.size(), 1u);
    EXPECT_EQ(onlyB[0].signature, "java.lang.Error: b");
}

TEST(TelemetryFetcher, CancelledBeforeRunning) {
    FakeExecutor exec;
    exec.reply("shell top -b -n 1", "");
    TelemetryFetcher fetcher(exec, fastRetries(), Logging::makeNullLogger("fetch"));
    CancelToken token;
    token.cancel();

    try {
        fetcher.fetch(request("d", CommandKind::CpuSample, "com.a"), &token);
        FAIL() << "expected Cancelled";
    } catch (const BridgeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Cancelled);
    }
    EXPECT_EQ(exec.calls("shell top -b -n 1"), 0);
}

TEST(TelemetryRequest, ValidateRequiresArguments) {
    EXPECT_NO_THROW(request("", CommandKind::DeviceDiscovery).validate());
    EXPECT_THROW(request("", CommandKind::PackageInventory).validate(), std::invalid_argument);
    EXPECT_THROW(request("d", CommandKind::MemorySnapshot).validate(), std::invalid_argument);
    EXPECT_THROW(request("", CommandKind::ConnectNetwork).validate(), std::invalid_argument);
    EXPECT_NO_THROW(request("d", CommandKind::CrashScan).validate());

    auto connect = request("", CommandKind::ConnectNetwork);
    connect.target = "10.0.0.2:5555";
    EXPECT_NO_THROW(connect.validate());
}

TEST(TelemetryRequest, CacheKeyTracksArguments) {
    const auto a = request("d", CommandKind::MemorySnapshot, "com.a").cacheKey();
    const auto b = request("d", CommandKind::MemorySnapshot, "com.b").cacheKey();
    EXPECT_FALSE(a == b);
    EXPECT_TRUE(a == request("d", CommandKind::MemorySnapshot, "com.a").cacheKey());
}
