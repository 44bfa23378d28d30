#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <tuple>
#include <unordered_map>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "core/CommandExecutor.h"
#include "core/Config.h"
#include "core/DeviceStateMachine.h"
#include "core/EventBus.h"
#include "core/SingleFlightCache.h"
#include "core/TelemetryEvent.h"
#include "core/TelemetryFetcher.h"

// Accepts telemetry requests and delivers their results as events.
//
// All bookkeeping (queue, active requests, result cache, devices,
// de-duplication state) lives on one coordinator thread running an
// asio::io_context. Fetches run on an asio::thread_pool of `workerCount`
// threads and only post their outcome back. At most `workerCount` fetches run
// at a time; requests needing another one wait in priority order.
class TelemetryScheduler {
public:
    using DeviceList = std::vector<Device>;
    using DeviceListPtr = std::shared_ptr<const DeviceList>;

    TelemetryScheduler(CommandExecutor& executor, SessionConfig cfg, std::shared_ptr<spdlog::logger> log);
    ~TelemetryScheduler();

    TelemetryScheduler(const TelemetryScheduler&) = delete;
    TelemetryScheduler& operator=(const TelemetryScheduler&) = delete;

    // Throws std::invalid_argument for a malformed request.
    RequestHandle submit(TelemetryRequest req);
    RequestHandle submit(const std::string& deviceId, CommandKind kind, int priority = 0);

    // Queued requests are dropped at once. A dispatched request's result is
    // discarded and its command is killed unless another request shares it.
    void cancel(RequestHandle handle);

    // Drop every cached result of a device. Takes effect on the coordinator.
    void invalidate(const std::string& deviceId);

    // Last published device list, ordered by id.
    DeviceListPtr devices() const;

    int subscribe(EventBus::Callback cb);
    void unsubscribe(int token);

    // Wait until the coordinator has processed everything posted so far and
    // the resulting events are delivered.
    void flush();

    void shutdown();

    const SessionConfig& config() const { return cfg_; }

private:
    using SteadyClock = std::chrono::steady_clock;

    // priority descending, then submission order
    using QueueOrder = std::tuple<int, RequestHandle>;

    struct Queued {
        TelemetryRequest req;
        QueueOrder order;
        std::unique_ptr<asio::steady_timer> deadline;
    };

    using ResultCache = SingleFlightCache<TelemetryResult, RequestHandle>;

    // Dispatched request waiting on a fetch.
    struct Active {
        TelemetryRequest req;
        ResultCache::FetchId fetch{0};
    };

    struct Outcome {
        std::optional<TelemetryResult> result;
        FailurePayload failure;
    };

    struct DeviceEntry {
        Device device;
        DeviceStateMachine machine;
        std::optional<SteadyClock::time_point> absentSince;
    };

    // Coordinator thread only.
    void enqueue(RequestHandle handle, TelemetryRequest req);
    void dispatch();
    void onDeadline(RequestHandle handle);
    void startFetch(ResultCache::FetchId id, const TelemetryRequest& req);
    void onFetchDone(ResultCache::FetchId id, Outcome outcome);
    void deliver(RequestHandle handle, const TelemetryRequest& req, const Outcome& outcome);
    void cancelOnCoordinator(RequestHandle handle);
    void cancelActive(RequestHandle handle);

    void handleResult(RequestHandle handle, const TelemetryRequest& req, const TelemetryResult& result);
    void handleFailure(RequestHandle handle, const TelemetryRequest& req, const FailurePayload& failure);
    void applyDiscovery(const DeviceListing& listing);
    void observeAll(DeviceState poll);
    void observeDevice(const std::string& deviceId, DeviceState poll);
    void applyTransitions(const std::vector<StateTransition>& transitions);
    void onDisconnected(const std::string& deviceId);
    void syncDevice(DeviceEntry& e);
    void refreshSnapshot();
    void publishDeviceList();
    void submitDiscovery();
    void publishFailure(RequestHandle handle, const std::string& deviceId, ErrorKind kind,
                        const std::string& message, const std::string& rawOutput = {});

    // Worker threads.
    Outcome runFetch(const TelemetryRequest& req, const CancelToken& token);

    SessionConfig cfg_;
    std::shared_ptr<spdlog::logger> log_;
    TelemetryFetcher fetcher_;
    EventBus bus_;

    std::atomic<RequestHandle> nextHandle_{1};
    std::atomic<bool> stopped_{false};

    // coordinator state
    std::map<QueueOrder, RequestHandle> order_;
    std::unordered_map<RequestHandle, Queued> queued_;
    std::unordered_map<RequestHandle, Active> active_;
    ResultCache cache_;
    std::map<ResultCache::FetchId, std::shared_ptr<CancelToken>> fetchTokens_;
    std::map<std::string, DeviceEntry> devices_;
    std::map<std::string, std::set<std::tuple<std::string, std::string, long long>>> crashSeen_;
    std::map<std::pair<std::string, std::string>, std::chrono::system_clock::time_point> lastMemoryAt_;
    DeviceListing lastDiscovery_;
    bool multipleDevices_{false};
    bool listPublished_{false};
    bool stopping_{false};

    mutable std::mutex snapMtx_;
    DeviceListPtr snapshot_;

    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    std::thread coordinator_;
    asio::thread_pool pool_;
};
