#include "core/TelemetryScheduler.h"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <utility>

#include "core/Errors.h"

namespace {

constexpr int kNetworkDiscoveryPriority = 10;

TelemetryEvent makeEvent(TelemetryEvent::Kind kind, const std::string& deviceId, RequestHandle handle,
                         TelemetryEvent::Payload payload) {
    TelemetryEvent evt;
    evt.kind = kind;
    evt.deviceId = deviceId;
    evt.handle = handle;
    evt.payload = std::move(payload);
    return evt;
}

} // namespace

TelemetryScheduler::TelemetryScheduler(CommandExecutor& executor, SessionConfig cfg,
                                       std::shared_ptr<spdlog::logger> log)
    : cfg_(std::move(cfg)),
      log_(std::move(log)),
      fetcher_(executor, cfg_, log_),
      bus_(log_),
      snapshot_(std::make_shared<const DeviceList>()),
      work_(asio::make_work_guard(io_)),
      pool_(static_cast<std::size_t>(std::max(1, cfg_.workerCount))) {
    coordinator_ = std::thread([this]() {
        for (;;) {
            try {
                io_.run();
                break;
            } catch (const std::exception& ex) {
                log_->error("coordinator handler failed: {}", ex.what());
            }
        }
    });
    log_->debug("scheduler started with {} workers", cfg_.workerCount);
}

TelemetryScheduler::~TelemetryScheduler() {
    shutdown();
}

RequestHandle TelemetryScheduler::submit(TelemetryRequest req) {
    req.validate();
    if (stopped_) {
        throw std::runtime_error("scheduler is shut down");
    }
    const RequestHandle handle = nextHandle_++;
    asio::post(io_, [this, handle, req = std::move(req)]() mutable { enqueue(handle, std::move(req)); });
    return handle;
}

RequestHandle TelemetryScheduler::submit(const std::string& deviceId, CommandKind kind, int priority) {
    TelemetryRequest req;
    req.deviceId = deviceId;
    req.kind = kind;
    req.priority = priority;
    return submit(std::move(req));
}

void TelemetryScheduler::cancel(RequestHandle handle) {
    asio::post(io_, [this, handle]() { cancelOnCoordinator(handle); });
}

void TelemetryScheduler::invalidate(const std::string& deviceId) {
    asio::post(io_, [this, deviceId]() {
        log_->debug("invalidating cache of {}", deviceId);
        cache_.invalidate(deviceId);
    });
}

TelemetryScheduler::DeviceListPtr TelemetryScheduler::devices() const {
    std::lock_guard<std::mutex> lk(snapMtx_);
    return snapshot_;
}

int TelemetryScheduler::subscribe(EventBus::Callback cb) {
    return bus_.subscribe(std::move(cb));
}

void TelemetryScheduler::unsubscribe(int token) {
    bus_.unsubscribe(token);
}

void TelemetryScheduler::flush() {
    if (!stopped_) {
        std::promise<void> done;
        auto f = done.get_future();
        asio::post(io_, [&done]() { done.set_value(); });
        f.wait();
    }
    bus_.drain();
}

void TelemetryScheduler::shutdown() {
    bool expected = false;
    if (!stopped_.compare_exchange_strong(expected, true)) {
        return;
    }
    log_->debug("scheduler stopping");
    asio::post(io_, [this]() {
        stopping_ = true;
        for (auto& kv : queued_) {
            if (kv.second.deadline) kv.second.deadline->cancel();
        }
        queued_.clear();
        order_.clear();
        for (auto& kv : fetchTokens_) {
            kv.second->cancel();
        }
    });
    pool_.join();
    work_.reset();
    if (coordinator_.joinable()) coordinator_.join();
    bus_.stop();
}

void TelemetryScheduler::enqueue(RequestHandle handle, TelemetryRequest req) {
    if (stopping_) return;

    Queued q;
    q.req = std::move(req);
    q.order = QueueOrder{-q.req.priority, handle};
    const auto deadline = q.req.deadline.value_or(cfg_.requestDeadline);
    if (deadline.count() > 0) {
        q.deadline = std::make_unique<asio::steady_timer>(io_, deadline);
        q.deadline->async_wait([this, handle](const std::error_code& ec) {
            if (!ec) onDeadline(handle);
        });
    }
    log_->debug("queued #{} {} {} (priority {})", handle, toString(q.req.kind), q.req.deviceId, q.req.priority);
    order_.emplace(q.order, handle);
    queued_.emplace(handle, std::move(q));
    dispatch();
}

void TelemetryScheduler::dispatch() {
    while (!stopping_ && !order_.empty()) {
        const RequestHandle handle = order_.begin()->second;
        auto qit = queued_.find(handle);
        if (qit == queued_.end()) {
            order_.erase(order_.begin());
            continue;
        }
        const CacheKey key = qit->second.req.cacheKey();
        const bool refresh = qit->second.req.forceRefresh;
        if (cache_.needsFetch(key, refresh) &&
            cache_.fetchesInFlight() >= static_cast<std::size_t>(std::max(1, cfg_.workerCount))) {
            break;
        }

        order_.erase(order_.begin());
        Queued q = std::move(qit->second);
        queued_.erase(qit);
        if (q.deadline) q.deadline->cancel();

        const auto admission = cache_.getOrFetch(
            key, cfg_.ttl.forKind(key.kind), handle,
            [this, &q](ResultCache::FetchId id) { startFetch(id, q.req); }, refresh);
        if (admission.value) {
            log_->debug("#{} {} {} served from cache", handle, toString(q.req.kind), q.req.deviceId);
            Outcome hit;
            hit.result = *admission.value;
            deliver(handle, q.req, hit);
            continue;
        }
        log_->debug("#{} {} {} {} fetch {}", handle, toString(q.req.kind), q.req.deviceId,
                    admission.started ? "started" : "joined", admission.fetch);
        active_.emplace(handle, Active{std::move(q.req), admission.fetch});
    }
}

void TelemetryScheduler::startFetch(ResultCache::FetchId id, const TelemetryRequest& req) {
    auto token = std::make_shared<CancelToken>();
    fetchTokens_.emplace(id, token);
    asio::post(pool_, [this, id, req, token]() {
        Outcome outcome = runFetch(req, *token);
        asio::post(io_, [this, id, outcome = std::move(outcome)]() mutable {
            onFetchDone(id, std::move(outcome));
        });
    });
}

TelemetryScheduler::Outcome TelemetryScheduler::runFetch(const TelemetryRequest& req, const CancelToken& token) {
    Outcome o;
    try {
        o.result = fetcher_.fetch(req, &token);
    } catch (const BridgeError& e) {
        o.failure = FailurePayload{e.kind(), e.what(), e.rawOutput()};
    } catch (const std::exception& e) {
        o.failure = FailurePayload{ErrorKind::CacheFetchFailed, e.what(), {}};
    }
    return o;
}

void TelemetryScheduler::onFetchDone(ResultCache::FetchId id, Outcome outcome) {
    fetchTokens_.erase(id);
    const auto waiters = cache_.complete(id, outcome.result ? &*outcome.result : nullptr);
    if (stopping_) return;

    for (RequestHandle handle : waiters) {
        auto it = active_.find(handle);
        if (it == active_.end()) continue;
        const TelemetryRequest req = std::move(it->second.req);
        active_.erase(it);
        deliver(handle, req, outcome);
    }
    dispatch();
}

void TelemetryScheduler::deliver(RequestHandle handle, const TelemetryRequest& req, const Outcome& outcome) {
    if (outcome.result) {
        handleResult(handle, req, *outcome.result);
    } else {
        handleFailure(handle, req, outcome.failure);
    }
}

void TelemetryScheduler::onDeadline(RequestHandle handle) {
    auto it = queued_.find(handle);
    if (it == queued_.end()) return;
    const TelemetryRequest req = it->second.req;
    order_.erase(it->second.order);
    queued_.erase(it);
    log_->warn("#{} {} {} missed its deadline while queued", handle, toString(req.kind), req.deviceId);
    publishFailure(handle, req.deviceId, ErrorKind::DeadlineExceeded, defaultMessage(ErrorKind::DeadlineExceeded));
}

void TelemetryScheduler::cancelOnCoordinator(RequestHandle handle) {
    auto qit = queued_.find(handle);
    if (qit != queued_.end()) {
        if (qit->second.deadline) qit->second.deadline->cancel();
        order_.erase(qit->second.order);
        queued_.erase(qit);
        log_->debug("cancelled queued #{}", handle);
        return;
    }
    cancelActive(handle);
}

void TelemetryScheduler::cancelActive(RequestHandle handle) {
    auto it = active_.find(handle);
    if (it == active_.end()) return;
    const auto fetch = it->second.fetch;
    const CacheKey key = it->second.req.cacheKey();
    active_.erase(it);
    log_->debug("cancelled running #{}", handle);
    if (!cache_.leave(fetch, handle)) return;

    auto tit = fetchTokens_.find(fetch);
    if (tit != fetchTokens_.end()) {
        log_->debug("no request left for {} {}, killing command", toString(key.kind), key.deviceId);
        tit->second->cancel();
    }
}

void TelemetryScheduler::handleResult(RequestHandle handle, const TelemetryRequest& req,
                                      const TelemetryResult& result) {
    using Kind = TelemetryEvent::Kind;

    if (auto listing = std::get_if<DeviceListing>(&result)) {
        applyDiscovery(*listing);
    } else if (auto inventory = std::get_if<PackageSnapshotPtr>(&result)) {
        bus_.publish(makeEvent(Kind::PackageInventoryUpdated, req.deviceId, handle, *inventory));
    } else if (auto details = std::get_if<PackageDetails>(&result)) {
        bus_.publish(makeEvent(Kind::PackageDetailsReady, req.deviceId, handle, *details));
    } else if (auto mem = std::get_if<MemorySnapshot>(&result)) {
        const auto key = std::make_pair(mem->deviceId, mem->packageName);
        auto last = lastMemoryAt_.find(key);
        if (last != lastMemoryAt_.end() && mem->capturedAt < last->second) {
            log_->debug("dropped stale meminfo of {} on {}", mem->packageName, mem->deviceId);
            return;
        }
        lastMemoryAt_[key] = mem->capturedAt;
        bus_.publish(makeEvent(Kind::MemorySnapshotReady, req.deviceId, handle, *mem));
    } else if (auto cpu = std::get_if<CpuSample>(&result)) {
        bus_.publish(makeEvent(Kind::CpuSampleReady, req.deviceId, handle, *cpu));
    } else if (auto scan = std::get_if<CrashScan>(&result)) {
        auto& seen = crashSeen_[req.deviceId];
        for (const auto& ev : *scan) {
            const long long second =
                std::chrono::duration_cast<std::chrono::seconds>(ev.occurredAt.time_since_epoch()).count();
            if (!seen.emplace(ev.packageName, ev.signature, second).second) continue;
            log_->info("{} in {} on {}: {}", toString(ev.kind), ev.packageName, ev.deviceId, ev.signature);
            bus_.publish(makeEvent(Kind::CrashOrAnrDetected, req.deviceId, handle, ev));
        }
    } else if (auto outcome = std::get_if<ActionOutcome>(&result)) {
        bus_.publish(makeEvent(Kind::ActionCompleted, req.deviceId, handle, *outcome));
        if (outcome->kind == CommandKind::Uninstall || outcome->kind == CommandKind::ClearData) {
            cache_.invalidate(req.deviceId);
        } else if (outcome->kind == CommandKind::ConnectNetwork || outcome->kind == CommandKind::DisconnectNetwork) {
            submitDiscovery();
        }
    }
}

void TelemetryScheduler::handleFailure(RequestHandle handle, const TelemetryRequest& req,
                                       const FailurePayload& failure) {
    log_->warn("#{} {} {} failed: {} ({})", handle, toString(req.kind), req.deviceId.empty() ? "-" : req.deviceId,
               toString(failure.error), failure.message);
    publishFailure(handle, req.deviceId, failure.error,
                   failure.message.empty() ? defaultMessage(failure.error) : failure.message, failure.rawOutput);

    if (req.kind == CommandKind::DeviceDiscovery &&
        (failure.error == ErrorKind::ExecutableNotFound || failure.error == ErrorKind::ProcessError)) {
        observeAll(DeviceState::Error);
    } else if (!req.deviceId.empty() && failure.error == ErrorKind::DeviceOffline) {
        observeDevice(req.deviceId, DeviceState::Offline);
    } else if (!req.deviceId.empty() && failure.error == ErrorKind::Unauthorized) {
        observeDevice(req.deviceId, DeviceState::Unauthorized);
    }
}

void TelemetryScheduler::applyDiscovery(const DeviceListing& listing) {
    // joined requests share one listing; it is a single poll
    if (!listing || listing == lastDiscovery_) return;
    lastDiscovery_ = listing;

    const auto now = std::chrono::system_clock::now();
    const auto steadyNow = SteadyClock::now();
    bool changed = !listPublished_;
    std::vector<StateTransition> transitions;
    std::set<std::string> seen;

    for (const auto& r : *listing) {
        seen.insert(r.id);
        auto it = devices_.find(r.id);
        if (it == devices_.end()) {
            DeviceEntry e{Device{}, DeviceStateMachine(r.id, cfg_.debounceThreshold), std::nullopt};
            e.machine.observe(r.state, now);
            e.device.id = r.id;
            e.device.transport = r.transport;
            e.device.model = r.model;
            e.device.product = r.product;
            syncDevice(e);
            log_->info("device {} appeared: {} {}", r.id, toString(r.state), r.model);
            devices_.emplace(r.id, std::move(e));
            changed = true;
            continue;
        }
        DeviceEntry& e = it->second;
        e.absentSince.reset();
        if (e.device.model != r.model || e.device.product != r.product || e.device.transport != r.transport) {
            e.device.model = r.model;
            e.device.product = r.product;
            e.device.transport = r.transport;
            changed = true;
        }
        const auto t = e.machine.observe(r.state, now);
        transitions.insert(transitions.end(), t.begin(), t.end());
        syncDevice(e);
    }

    for (auto it = devices_.begin(); it != devices_.end();) {
        if (seen.count(it->first)) {
            ++it;
            continue;
        }
        DeviceEntry& e = it->second;
        const auto t = e.machine.observe(DeviceState::Disconnected, now);
        transitions.insert(transitions.end(), t.begin(), t.end());
        syncDevice(e);
        if (e.machine.state() == DeviceState::Disconnected) {
            if (!e.absentSince) {
                e.absentSince = steadyNow;
            } else if (steadyNow - *e.absentSince >= cfg_.removalGrace) {
                log_->info("device {} removed after {}ms absent", it->first,
                           std::chrono::duration_cast<std::chrono::milliseconds>(steadyNow - *e.absentSince).count());
                it = devices_.erase(it);
                changed = true;
                continue;
            }
        }
        ++it;
    }

    if (!transitions.empty()) changed = true;
    applyTransitions(transitions);
    if (changed) {
        publishDeviceList();
    } else {
        refreshSnapshot();
    }
}

void TelemetryScheduler::observeAll(DeviceState poll) {
    const auto now = std::chrono::system_clock::now();
    std::vector<StateTransition> transitions;
    for (auto& kv : devices_) {
        const auto t = kv.second.machine.observe(poll, now);
        transitions.insert(transitions.end(), t.begin(), t.end());
        syncDevice(kv.second);
    }
    applyTransitions(transitions);
    if (!transitions.empty()) publishDeviceList();
}

void TelemetryScheduler::observeDevice(const std::string& deviceId, DeviceState poll) {
    auto it = devices_.find(deviceId);
    if (it == devices_.end()) return;
    const auto transitions = it->second.machine.observe(poll, std::chrono::system_clock::now());
    syncDevice(it->second);
    applyTransitions(transitions);
    if (!transitions.empty()) publishDeviceList();
}

void TelemetryScheduler::applyTransitions(const std::vector<StateTransition>& transitions) {
    for (const auto& t : transitions) {
        log_->info("device {}: {} -> {}", t.deviceId, toString(t.from), toString(t.to));
        bus_.publish(makeEvent(TelemetryEvent::Kind::DeviceStateChanged, t.deviceId, 0,
                               StateChangePayload{t.from, t.to}));
        if (t.to == DeviceState::Disconnected) {
            onDisconnected(t.deviceId);
        }
    }
}

void TelemetryScheduler::onDisconnected(const std::string& deviceId) {
    std::vector<RequestHandle> dropped;
    for (const auto& kv : queued_) {
        if (kv.second.req.deviceId == deviceId) dropped.push_back(kv.first);
    }
    std::sort(dropped.begin(), dropped.end());
    for (RequestHandle h : dropped) {
        auto it = queued_.find(h);
        if (it->second.deadline) it->second.deadline->cancel();
        order_.erase(it->second.order);
        queued_.erase(it);
        publishFailure(h, deviceId, ErrorKind::Cancelled, "device disconnected");
    }

    std::vector<RequestHandle> running;
    for (const auto& kv : active_) {
        if (kv.second.req.deviceId == deviceId) running.push_back(kv.first);
    }
    std::sort(running.begin(), running.end());
    for (RequestHandle h : running) {
        cancelActive(h);
        publishFailure(h, deviceId, ErrorKind::Cancelled, "device disconnected");
    }

    cache_.invalidate(deviceId);
    crashSeen_.erase(deviceId);
    for (auto it = lastMemoryAt_.begin(); it != lastMemoryAt_.end();) {
        if (it->first.first == deviceId) {
            it = lastMemoryAt_.erase(it);
        } else {
            ++it;
        }
    }
    log_->info("device {} disconnected: cancelled {} queued and {} running requests", deviceId, dropped.size(),
               running.size());
}

void TelemetryScheduler::syncDevice(DeviceEntry& e) {
    e.device.state = e.machine.state();
    e.device.lastConfirmedAt = e.machine.lastConfirmedAt();
    e.device.consecutiveMismatchCount = e.machine.consecutiveMismatchCount();
}

void TelemetryScheduler::refreshSnapshot() {
    auto list = std::make_shared<DeviceList>();
    list->reserve(devices_.size());
    for (const auto& kv : devices_) {
        list->push_back(kv.second.device);
    }
    std::lock_guard<std::mutex> lk(snapMtx_);
    snapshot_ = std::move(list);
}

void TelemetryScheduler::publishDeviceList() {
    refreshSnapshot();
    DeviceListPayload payload;
    payload.devices = *devices();
    const auto connected = std::count_if(payload.devices.begin(), payload.devices.end(),
                                         [](const Device& d) { return d.state == DeviceState::Connected; });
    payload.multipleDevices = connected > 1;
    if (payload.multipleDevices && !multipleDevices_) {
        log_->info("{}: {} devices connected, requests must name a device",
                   toString(ErrorKind::MultipleDevicesAmbiguous), connected);
    }
    multipleDevices_ = payload.multipleDevices;
    listPublished_ = true;
    bus_.publish(makeEvent(TelemetryEvent::Kind::DeviceListUpdated, {}, 0, std::move(payload)));
}

void TelemetryScheduler::submitDiscovery() {
    TelemetryRequest req;
    req.kind = CommandKind::DeviceDiscovery;
    req.priority = kNetworkDiscoveryPriority;
    req.forceRefresh = true;
    enqueue(nextHandle_++, std::move(req));
}

void TelemetryScheduler::publishFailure(RequestHandle handle, const std::string& deviceId, ErrorKind kind,
                                        const std::string& message, const std::string& rawOutput) {
    bus_.publish(makeEvent(TelemetryEvent::Kind::OperationFailed, deviceId, handle,
                           FailurePayload{kind, message, rawOutput}));
}
