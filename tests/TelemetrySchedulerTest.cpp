#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "TestSupport.h"
#include "core/Logging.h"
#include "core/TelemetryScheduler.h"

using namespace std::chrono_literals;
using testsupport::EventRecorder;
using testsupport::FakeExecutor;
using testsupport::Gate;

namespace {

using Kind = TelemetryEvent::Kind;

const char* kDevices = "devices -l";
const char* kLogcat = "logcat -d -v threadtime -b main -b system -b crash";
const char* kUserPackages = "shell pm list packages -f --show-versioncode -3";
const char* kDisabledPackages = "shell pm list packages -f --show-versioncode -d";

std::string meminfoCmd(const std::string& pkg) {
    return "shell dumpsys meminfo " + pkg;
}

std::string listing(std::initializer_list<const char*> lines) {
    std::string out = "List of devices attached\n";
    for (const char* l : lines) {
        out += l;
        out += '\n';
    }
    return out + "\n";
}

CommandResult output(const std::string& text) {
    CommandResult r;
    r.stdoutText = text;
    return r;
}

} // namespace

class TelemetrySchedulerTest : public ::testing::Test {
protected:
    static SessionConfig baseConfig() {
        SessionConfig cfg;
        cfg.workerCount = 2;
        cfg.debounceThreshold = 1;
        cfg.includeSystemPackages = false;
        cfg.ttl.discovery = 0ms;
        cfg.ttl.crash = 0ms;
        cfg.retry.backoff = 1ms;
        return cfg;
    }

    void start(SessionConfig cfg = baseConfig()) {
        sched_ = std::make_unique<TelemetryScheduler>(exec_, std::move(cfg), Logging::makeNullLogger("sched"));
        sched_->subscribe([this](const TelemetryEvent& e) { rec_(e); });
    }

    void TearDown() override {
        gate_.open();
        if (sched_) sched_->shutdown();
    }

    RequestHandle discover() {
        return sched_->submit(std::string(), CommandKind::DeviceDiscovery);
    }

    RequestHandle discoverFresh() {
        TelemetryRequest req;
        req.kind = CommandKind::DeviceDiscovery;
        req.forceRefresh = true;
        return sched_->submit(std::move(req));
    }

    // Runs one discovery and waits until its listing has been applied.
    void poll(int expectedCalls) {
        discover();
        ASSERT_TRUE(exec_.waitForCalls(kDevices, expectedCalls));
        std::this_thread::sleep_for(50ms);
        sched_->flush();
    }

    std::vector<StateChangePayload> stateChanges() const {
        std::vector<StateChangePayload> out;
        for (const auto& e : rec_.ofKind(Kind::DeviceStateChanged)) {
            out.push_back(std::get<StateChangePayload>(e.payload));
        }
        return out;
    }

    RequestHandle submit(const std::string& deviceId, CommandKind kind, const std::string& pkg = {},
                         int priority = 0) {
        TelemetryRequest req;
        req.deviceId = deviceId;
        req.kind = kind;
        req.packageName = pkg;
        req.priority = priority;
        return sched_->submit(std::move(req));
    }

    bool waitForTransition(const std::string& deviceId, DeviceState to, std::size_t n = 1) {
        return rec_.waitFor(
            [&](const TelemetryEvent& e) {
                auto p = std::get_if<StateChangePayload>(&e.payload);
                return e.kind == Kind::DeviceStateChanged && e.deviceId == deviceId && p && p->newState == to;
            },
            n);
    }

    bool waitForFailure(RequestHandle handle, ErrorKind error) {
        return rec_.waitFor([&](const TelemetryEvent& e) {
            auto f = std::get_if<FailurePayload>(&e.payload);
            return e.kind == Kind::OperationFailed && e.handle == handle && f && f->error == error;
        });
    }

    void replyMemory(const std::string& pkg, const std::string& pss = "100") {
        exec_.reply(meminfoCmd(pkg), "TOTAL PSS: " + pss + "\n");
    }

    void blockMemory(const std::string& pkg) {
        exec_.on(meminfoCmd(pkg), [this](const std::string&, const CancelToken* cancel) {
            gate_.wait(cancel);
            return output("TOTAL PSS: 1\n");
        });
    }

    // Brings device "dev" up as Connected.
    void connectDevice() {
        exec_.reply(kDevices, listing({"dev\tdevice product:p model:m device:d transport_id:1"}));
        discover();
        ASSERT_TRUE(rec_.waitForKind(Kind::DeviceListUpdated));
    }

    FakeExecutor exec_;
    Gate gate_;
    EventRecorder rec_;
    std::unique_ptr<TelemetryScheduler> sched_;
};

TEST_F(TelemetrySchedulerTest, DiscoveryPublishesDeviceList) {
    start();
    exec_.reply(kDevices, listing({"emulator-5554\tdevice product:sdk model:Pixel device:emu transport_id:1",
                                   "R58M12\tunauthorized usb:1-1 transport_id:2"}));
    discover();
    ASSERT_TRUE(rec_.waitForKind(Kind::DeviceListUpdated));
    sched_->flush();

    const auto lists = rec_.ofKind(Kind::DeviceListUpdated);
    ASSERT_EQ(lists.size(), 1u);
    const auto& payload = std::get<DeviceListPayload>(lists[0].payload);
    ASSERT_EQ(payload.devices.size(), 2u);
    EXPECT_EQ(payload.devices[0].id, "R58M12");
    EXPECT_EQ(payload.devices[0].state, DeviceState::Unauthorized);
    EXPECT_EQ(payload.devices[1].id, "emulator-5554");
    EXPECT_EQ(payload.devices[1].model, "Pixel");
    EXPECT_FALSE(payload.multipleDevices);
    EXPECT_TRUE(rec_.ofKind(Kind::DeviceStateChanged).empty());
    EXPECT_EQ(sched_->devices()->size(), 2u);
}

TEST_F(TelemetrySchedulerTest, UnchangedDiscoveryIsQuiet) {
    start();
    connectDevice();
    discover();
    ASSERT_TRUE(exec_.waitForCalls(kDevices, 2));
    std::this_thread::sleep_for(50ms);
    sched_->flush();
    EXPECT_EQ(rec_.ofKind(Kind::DeviceListUpdated).size(), 1u);
}

TEST_F(TelemetrySchedulerTest, FlagsMultipleConnectedDevices) {
    start();
    exec_.reply(kDevices, listing({"a\tdevice", "b\tdevice"}));
    discover();
    ASSERT_TRUE(rec_.waitForKind(Kind::DeviceListUpdated));
    const auto lists = rec_.ofKind(Kind::DeviceListUpdated);
    EXPECT_TRUE(std::get<DeviceListPayload>(lists[0].payload).multipleDevices);
}

TEST_F(TelemetrySchedulerTest, ConcurrentInventoryRequestsShareOneFetch) {
    start();
    exec_.on(kUserPackages, [this](const std::string&, const CancelToken* cancel) {
        gate_.wait(cancel);
        return output("package:/data/app/a/base.apk=com.a versionCode:1\n");
    });
    exec_.reply(kDisabledPackages, "");

    const auto h1 = submit("dev", CommandKind::PackageInventory);
    const auto h2 = submit("dev", CommandKind::PackageInventory);
    ASSERT_TRUE(exec_.waitForCalls(kUserPackages, 1));
    std::this_thread::sleep_for(50ms);
    gate_.open();

    ASSERT_TRUE(rec_.waitForKind(Kind::PackageInventoryUpdated, 2));
    const auto e1 = rec_.forHandle(h1);
    const auto e2 = rec_.forHandle(h2);
    ASSERT_EQ(e1.size(), 1u);
    ASSERT_EQ(e2.size(), 1u);
    const auto& p1 = std::get<PackageSnapshotPtr>(e1[0].payload);
    const auto& p2 = std::get<PackageSnapshotPtr>(e2[0].payload);
    EXPECT_EQ(p1.get(), p2.get());
    EXPECT_EQ(p1->size(), 1u);
    EXPECT_EQ(exec_.calls(kUserPackages), 1);
}

TEST_F(TelemetrySchedulerTest, CachedInventoryIsServedUntilInvalidated) {
    start();
    exec_.reply(kUserPackages, "package:com.a\n");
    exec_.reply(kDisabledPackages, "");

    submit("dev", CommandKind::PackageInventory);
    ASSERT_TRUE(rec_.waitForKind(Kind::PackageInventoryUpdated, 1));
    submit("dev", CommandKind::PackageInventory);
    ASSERT_TRUE(rec_.waitForKind(Kind::PackageInventoryUpdated, 2));
    EXPECT_EQ(exec_.calls(kUserPackages), 1);

    sched_->invalidate("dev");
    submit("dev", CommandKind::PackageInventory);
    ASSERT_TRUE(rec_.waitForKind(Kind::PackageInventoryUpdated, 3));
    EXPECT_EQ(exec_.calls(kUserPackages), 2);
}

TEST_F(TelemetrySchedulerTest, CancelledQueuedRequestNeverRuns) {
    auto cfg = baseConfig();
    cfg.workerCount = 1;
    start(cfg);
    blockMemory("com.block");
    replyMemory("com.later");

    const auto blocker = submit("dev", CommandKind::MemorySnapshot, "com.block");
    ASSERT_TRUE(exec_.waitForCalls(meminfoCmd("com.block"), 1));
    const auto later = submit("dev", CommandKind::MemorySnapshot, "com.later");
    sched_->cancel(later);
    sched_->flush();
    gate_.open();

    ASSERT_TRUE(rec_.waitForHandle(blocker));
    sched_->flush();
    EXPECT_EQ(exec_.calls(meminfoCmd("com.later")), 0);
    EXPECT_TRUE(rec_.forHandle(later).empty());
}

TEST_F(TelemetrySchedulerTest, CancelledRunningRequestDropsResult) {
    start();
    blockMemory("com.slow");

    const auto h = submit("dev", CommandKind::MemorySnapshot, "com.slow");
    ASSERT_TRUE(exec_.waitForCalls(meminfoCmd("com.slow"), 1));
    sched_->cancel(h);
    sched_->flush();

    replyMemory("com.next");
    const auto next = submit("dev", CommandKind::MemorySnapshot, "com.next");
    ASSERT_TRUE(rec_.waitForHandle(next));
    sched_->flush();
    EXPECT_TRUE(rec_.forHandle(h).empty());
}

TEST_F(TelemetrySchedulerTest, CancellingOneSharerKeepsTheFetchForTheOther) {
    start();
    blockMemory("com.shared");

    const auto first = submit("dev", CommandKind::MemorySnapshot, "com.shared");
    const auto second = submit("dev", CommandKind::MemorySnapshot, "com.shared");
    ASSERT_TRUE(exec_.waitForCalls(meminfoCmd("com.shared"), 1));
    sched_->flush();
    sched_->cancel(first);
    sched_->flush();
    gate_.open();

    ASSERT_TRUE(rec_.waitForHandle(second));
    sched_->flush();
    EXPECT_EQ(rec_.forHandle(second)[0].kind, Kind::MemorySnapshotReady);
    EXPECT_TRUE(rec_.forHandle(first).empty());
    EXPECT_EQ(exec_.calls(meminfoCmd("com.shared")), 1);
}

TEST_F(TelemetrySchedulerTest, RequestAfterAbandonedFetchStartsAfresh) {
    start();
    blockMemory("com.slow");

    const auto abandoned = submit("dev", CommandKind::MemorySnapshot, "com.slow");
    ASSERT_TRUE(exec_.waitForCalls(meminfoCmd("com.slow"), 1));
    sched_->cancel(abandoned);
    sched_->flush();

    replyMemory("com.slow", "77");
    const auto next = submit("dev", CommandKind::MemorySnapshot, "com.slow");
    ASSERT_TRUE(rec_.waitForHandle(next));
    const auto events = rec_.forHandle(next);
    ASSERT_EQ(events[0].kind, Kind::MemorySnapshotReady);
    EXPECT_EQ(std::get<MemorySnapshot>(events[0].payload).pssTotalKb, 77);
    EXPECT_EQ(exec_.calls(meminfoCmd("com.slow")), 2);
    EXPECT_TRUE(rec_.forHandle(abandoned).empty());
}

TEST_F(TelemetrySchedulerTest, HigherPriorityRunsFirst) {
    auto cfg = baseConfig();
    cfg.workerCount = 1;
    start(cfg);
    blockMemory("com.block");
    for (const char* pkg : {"com.low", "com.mid", "com.high"}) replyMemory(pkg);

    submit("dev", CommandKind::MemorySnapshot, "com.block");
    ASSERT_TRUE(exec_.waitForCalls(meminfoCmd("com.block"), 1));
    submit("dev", CommandKind::MemorySnapshot, "com.low", 0);
    submit("dev", CommandKind::MemorySnapshot, "com.high", 5);
    submit("dev", CommandKind::MemorySnapshot, "com.mid", 2);
    sched_->flush();
    gate_.open();

    ASSERT_TRUE(rec_.waitForKind(Kind::MemorySnapshotReady, 4));
    const auto log = exec_.log();
    ASSERT_EQ(log.size(), 4u);
    EXPECT_EQ(log[1], meminfoCmd("com.high"));
    EXPECT_EQ(log[2], meminfoCmd("com.mid"));
    EXPECT_EQ(log[3], meminfoCmd("com.low"));
}

TEST_F(TelemetrySchedulerTest, DeadlineExpiresWhileQueued) {
    auto cfg = baseConfig();
    cfg.workerCount = 1;
    start(cfg);
    blockMemory("com.block");
    replyMemory("com.late");

    submit("dev", CommandKind::MemorySnapshot, "com.block");
    ASSERT_TRUE(exec_.waitForCalls(meminfoCmd("com.block"), 1));

    TelemetryRequest req;
    req.deviceId = "dev";
    req.kind = CommandKind::MemorySnapshot;
    req.packageName = "com.late";
    req.deadline = 30ms;
    const auto late = sched_->submit(req);

    ASSERT_TRUE(waitForFailure(late, ErrorKind::DeadlineExceeded));
    gate_.open();
    sched_->flush();
    EXPECT_EQ(exec_.calls(meminfoCmd("com.late")), 0);
}

TEST_F(TelemetrySchedulerTest, BoundedConcurrency) {
    start();
    std::atomic<int> inFlight{0};
    std::atomic<int> peak{0};
    const std::vector<std::string> pkgs{"p1", "p2", "p3", "p4", "p5", "p6"};
    for (const auto& pkg : pkgs) {
        exec_.on(meminfoCmd(pkg), [&](const std::string&, const CancelToken*) {
            const int now = ++inFlight;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(20ms);
            --inFlight;
            return output("TOTAL PSS: 5\n");
        });
    }
    for (const auto& pkg : pkgs) submit("dev", CommandKind::MemorySnapshot, pkg);

    ASSERT_TRUE(rec_.waitForKind(Kind::MemorySnapshotReady, pkgs.size()));
    EXPECT_LE(peak.load(), 2);
    sched_->shutdown();
}

TEST_F(TelemetrySchedulerTest, DisconnectCancelsWorkAndInvalidatesCache) {
    auto cfg = baseConfig();
    cfg.ttl.inventory = 60s;
    start(cfg);
    connectDevice();

    exec_.reply(kUserPackages, "package:com.a\n");
    exec_.reply(kDisabledPackages, "");
    submit("dev", CommandKind::PackageInventory);
    ASSERT_TRUE(rec_.waitForKind(Kind::PackageInventoryUpdated, 1));

    blockMemory("com.slow");
    const auto slow = submit("dev", CommandKind::MemorySnapshot, "com.slow");
    ASSERT_TRUE(exec_.waitForCalls(meminfoCmd("com.slow"), 1));

    exec_.reply(kDevices, listing({}));
    discover();
    ASSERT_TRUE(waitForTransition("dev", DeviceState::Disconnected));
    ASSERT_TRUE(waitForFailure(slow, ErrorKind::Cancelled));
    EXPECT_EQ(std::get<FailurePayload>(rec_.forHandle(slow)[0].payload).message, "device disconnected");

    exec_.reply(kDevices, listing({"dev\tdevice"}));
    discover();
    ASSERT_TRUE(waitForTransition("dev", DeviceState::Connected));

    submit("dev", CommandKind::PackageInventory);
    ASSERT_TRUE(rec_.waitForKind(Kind::PackageInventoryUpdated, 2));
    EXPECT_EQ(exec_.calls(kUserPackages), 2);

    sched_->flush();
    EXPECT_EQ(rec_.forHandle(slow).size(), 1u);
}

TEST_F(TelemetrySchedulerTest, SingleOfflinePollIsDebounced) {
    auto cfg = baseConfig();
    cfg.debounceThreshold = 2;
    start(cfg);
    connectDevice();

    exec_.reply(kDevices, listing({"dev\toffline"}));
    poll(2);
    exec_.reply(kDevices, listing({"dev\tdevice"}));
    poll(3);

    EXPECT_TRUE(stateChanges().empty());
    EXPECT_EQ(sched_->devices()->at(0).state, DeviceState::Connected);
    EXPECT_EQ(rec_.ofKind(Kind::DeviceListUpdated).size(), 1u);
}

TEST_F(TelemetrySchedulerTest, TwoOfflinePollsCommitOneTransition) {
    auto cfg = baseConfig();
    cfg.debounceThreshold = 2;
    start(cfg);
    connectDevice();

    exec_.reply(kDevices, listing({"dev\toffline"}));
    poll(2);
    EXPECT_TRUE(stateChanges().empty());
    EXPECT_EQ(sched_->devices()->at(0).consecutiveMismatchCount, 1);

    poll(3);
    const auto changes = stateChanges();
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].oldState, DeviceState::Connected);
    EXPECT_EQ(changes[0].newState, DeviceState::Offline);
    EXPECT_EQ(sched_->devices()->at(0).state, DeviceState::Offline);
}

TEST_F(TelemetrySchedulerTest, ForcedDiscoverySkipsStoredListing) {
    auto cfg = baseConfig();
    cfg.debounceThreshold = 2;
    cfg.ttl.discovery = 60s;
    start(cfg);
    connectDevice();

    // a plain request within the ttl is answered from the stored listing
    poll(1);
    EXPECT_EQ(exec_.calls(kDevices), 1);

    exec_.reply(kDevices, listing({"dev\toffline"}));
    discoverFresh();
    ASSERT_TRUE(exec_.waitForCalls(kDevices, 2));
    std::this_thread::sleep_for(50ms);
    sched_->flush();
    EXPECT_TRUE(stateChanges().empty());
    discoverFresh();
    ASSERT_TRUE(waitForTransition("dev", DeviceState::Offline));
    EXPECT_EQ(exec_.calls(kDevices), 3);
    EXPECT_EQ(stateChanges().size(), 1u);
}

TEST_F(TelemetrySchedulerTest, RecoveryPassesThroughConnecting) {
    start();
    connectDevice();
    exec_.reply(kDevices, listing({}));
    discover();
    ASSERT_TRUE(waitForTransition("dev", DeviceState::Disconnected));

    exec_.reply(kDevices, listing({"dev\tdevice"}));
    discover();
    ASSERT_TRUE(waitForTransition("dev", DeviceState::Connected));
    sched_->flush();

    std::vector<DeviceState> seen;
    for (const auto& e : rec_.ofKind(Kind::DeviceStateChanged)) {
        seen.push_back(std::get<StateChangePayload>(e.payload).newState);
    }
    const std::vector<DeviceState> expected{DeviceState::Disconnected, DeviceState::Connecting,
                                            DeviceState::Connected};
    EXPECT_EQ(seen, expected);
}

TEST_F(TelemetrySchedulerTest, StateChangePrecedesListUpdate) {
    start();
    connectDevice();
    exec_.reply(kDevices, listing({"dev\toffline"}));
    discover();
    ASSERT_TRUE(rec_.waitForKind(Kind::DeviceListUpdated, 2));
    sched_->flush();

    const auto events = rec_.events();
    auto change = std::find_if(events.begin(), events.end(),
                               [](const TelemetryEvent& e) { return e.kind == Kind::DeviceStateChanged; });
    auto list = std::find_if(events.rbegin(), events.rend(),
                             [](const TelemetryEvent& e) { return e.kind == Kind::DeviceListUpdated; });
    ASSERT_NE(change, events.end());
    EXPECT_LT(change - events.begin(), events.rend() - list - 1);
    EXPECT_EQ(sched_->devices()->at(0).state, DeviceState::Offline);
}

TEST_F(TelemetrySchedulerTest, UnauthorizedFailureUpdatesDeviceState) {
    start();
    connectDevice();
    exec_.fail(meminfoCmd("com.a"), ErrorKind::Unauthorized, "device unauthorized");

    const auto h = submit("dev", CommandKind::MemorySnapshot, "com.a");
    ASSERT_TRUE(waitForFailure(h, ErrorKind::Unauthorized));
    ASSERT_TRUE(waitForTransition("dev", DeviceState::Unauthorized));
    EXPECT_EQ(exec_.calls(meminfoCmd("com.a")), 1);
}

TEST_F(TelemetrySchedulerTest, MissingBridgeMarksDevicesError) {
    start();
    connectDevice();
    exec_.fail(kDevices, ErrorKind::ExecutableNotFound, "cannot execute 'adb'");

    const auto h = discover();
    ASSERT_TRUE(waitForFailure(h, ErrorKind::ExecutableNotFound));
    ASSERT_TRUE(waitForTransition("dev", DeviceState::Error));
}

TEST_F(TelemetrySchedulerTest, CrashReportedOnceAcrossScans) {
    start();
    exec_.reply(kLogcat,
                "10-18 11:59:01.123  4321  4321 E AndroidRuntime: FATAL EXCEPTION: main\n"
                "10-18 11:59:01.123  4321  4321 E AndroidRuntime: Process: com.example.app, PID: 4321\n"
                "10-18 11:59:01.123  4321  4321 E AndroidRuntime: java.lang.IllegalStateException: boom\n");

    submit("dev", CommandKind::CrashScan);
    ASSERT_TRUE(rec_.waitForKind(Kind::CrashOrAnrDetected));
    submit("dev", CommandKind::CrashScan);
    ASSERT_TRUE(exec_.waitForCalls(kLogcat, 2));
    std::this_thread::sleep_for(50ms);
    sched_->flush();

    const auto crashes = rec_.ofKind(Kind::CrashOrAnrDetected);
    ASSERT_EQ(crashes.size(), 1u);
    EXPECT_EQ(std::get<CrashEvent>(crashes[0].payload).packageName, "com.example.app");
}

TEST_F(TelemetrySchedulerTest, UninstallInvalidatesDeviceCache) {
    auto cfg = baseConfig();
    cfg.ttl.inventory = 60s;
    start(cfg);
    exec_.reply(kUserPackages, "package:com.a\n");
    exec_.reply(kDisabledPackages, "");
    exec_.reply("uninstall com.a", "Success\n");

    submit("dev", CommandKind::PackageInventory);
    ASSERT_TRUE(rec_.waitForKind(Kind::PackageInventoryUpdated, 1));
    submit("dev", CommandKind::Uninstall, "com.a");
    ASSERT_TRUE(rec_.waitForKind(Kind::ActionCompleted));
    submit("dev", CommandKind::PackageInventory);
    ASSERT_TRUE(rec_.waitForKind(Kind::PackageInventoryUpdated, 2));
    EXPECT_EQ(exec_.calls(kUserPackages), 2);
}

TEST_F(TelemetrySchedulerTest, NetworkConnectRefreshesDevices) {
    start();
    exec_.reply("connect 10.0.0.2:5555", "connected to 10.0.0.2:5555\n");
    exec_.reply(kDevices, listing({"10.0.0.2:5555\tdevice product:p model:m device:d transport_id:3"}));

    TelemetryRequest req;
    req.kind = CommandKind::ConnectNetwork;
    req.target = "10.0.0.2:5555";
    sched_->submit(req);

    ASSERT_TRUE(rec_.waitForKind(Kind::ActionCompleted));
    ASSERT_TRUE(rec_.waitForKind(Kind::DeviceListUpdated));
    const auto devices = sched_->devices();
    ASSERT_EQ(devices->size(), 1u);
    EXPECT_EQ(devices->at(0).transport, Transport::Network);
}

TEST_F(TelemetrySchedulerTest, RejectsBadRequests) {
    start();
    EXPECT_THROW(sched_->submit(std::string(), CommandKind::PackageInventory), std::invalid_argument);
    sched_->shutdown();
    EXPECT_THROW(discover(), std::runtime_error);
}
