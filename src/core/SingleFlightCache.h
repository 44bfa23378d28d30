#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "core/DeviceModel.h"

struct CacheKey {
    std::string deviceId;
    CommandKind kind{CommandKind::DeviceDiscovery};
    std::size_t argsHash{0};

    bool operator<(const CacheKey& o) const {
        return std::tie(deviceId, kind, argsHash) < std::tie(o.deviceId, o.kind, o.argsHash);
    }
    bool operator==(const CacheKey& o) const {
        return deviceId == o.deviceId && kind == o.kind && argsHash == o.argsHash;
    }
};

enum class CacheEntryState {
    Idle,       // no entry
    InFlight,
    Ready
};

// TTL cache where concurrent callers of the same key share one fetch.
//
// Not thread-safe: the scheduler's coordinator is its only user. A fetch is
// launched through the function handed to getOrFetch and its outcome comes
// back through complete(), which names every caller waiting on it. Failures
// are handed to every waiter and never stored.
template <typename Value, typename Waiter>
class SingleFlightCache {
public:
    using Clock = std::chrono::steady_clock;
    using FetchId = std::uint64_t;
    using LaunchFn = std::function<void(FetchId)>;

    struct Admission {
        std::optional<Value> value;   // stored value, delivered at once
        FetchId fetch{0};             // otherwise the fetch the waiter is attached to
        bool started{false};          // true when this call launched the fetch
    };

    // A stored value is skipped when `refresh` is set; an in-flight fetch is
    // still joined. A ttl of zero never stores the fetched value.
    Admission getOrFetch(const CacheKey& key, std::chrono::milliseconds ttl, const Waiter& waiter,
                         const LaunchFn& launch, bool refresh = false, Clock::time_point now = Clock::now()) {
        Admission a;
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            Entry& e = it->second;
            if (e.state == CacheEntryState::InFlight) {
                fetches_.at(e.fetch).waiters.push_back(waiter);
                a.fetch = e.fetch;
                return a;
            }
            if (!refresh && now < e.expiresAt) {
                a.value = e.value;
                return a;
            }
            entries_.erase(it);
        }

        const FetchId id = nextFetch_++;
        Fetch f;
        f.key = key;
        f.ttl = ttl;
        f.waiters.push_back(waiter);
        fetches_.emplace(id, std::move(f));

        Entry e;
        e.state = CacheEntryState::InFlight;
        e.fetch = id;
        entries_.emplace(key, std::move(e));

        a.fetch = id;
        a.started = true;
        launch(id);
        return a;
    }

    // True when a request for key would launch a new fetch.
    bool needsFetch(const CacheKey& key, bool refresh = false, Clock::time_point now = Clock::now()) const {
        auto it = entries_.find(key);
        if (it == entries_.end()) return true;
        if (it->second.state == CacheEntryState::InFlight) return false;
        return refresh || now >= it->second.expiresAt;
    }

    // Record the outcome of a fetch (`value` is null on failure) and return
    // its remaining waiters in arrival order. The value is stored only when
    // the key was not invalidated meanwhile.
    std::vector<Waiter> complete(FetchId id, const Value* value, Clock::time_point now = Clock::now()) {
        auto fit = fetches_.find(id);
        if (fit == fetches_.end()) return {};
        Fetch f = std::move(fit->second);
        fetches_.erase(fit);

        auto it = entries_.find(f.key);
        if (it != entries_.end() && it->second.state == CacheEntryState::InFlight && it->second.fetch == id) {
            if (value && f.ttl.count() > 0) {
                it->second.state = CacheEntryState::Ready;
                it->second.value = *value;
                it->second.expiresAt = now + f.ttl;
                it->second.fetch = 0;
            } else {
                entries_.erase(it);
            }
        }
        return std::move(f.waiters);
    }

    // Detach a waiter. Returns true when nobody waits on the fetch any more;
    // the key is then released so the next caller starts afresh.
    bool leave(FetchId id, const Waiter& waiter) {
        auto fit = fetches_.find(id);
        if (fit == fetches_.end()) return false;
        auto& waiters = fit->second.waiters;
        waiters.erase(std::remove(waiters.begin(), waiters.end(), waiter), waiters.end());
        if (!waiters.empty()) return false;
        auto it = entries_.find(fit->second.key);
        if (it != entries_.end() && it->second.fetch == id) entries_.erase(it);
        return true;
    }

    // Drop every entry of a device, in-flight ones included. Their waiters
    // are still answered by complete().
    void invalidate(const std::string& deviceId) {
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->first.deviceId == deviceId) {
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void invalidate(const CacheKey& key) { entries_.erase(key); }

    void clear() { entries_.clear(); }

    CacheEntryState state(const CacheKey& key, Clock::time_point now = Clock::now()) const {
        auto it = entries_.find(key);
        if (it == entries_.end()) return CacheEntryState::Idle;
        if (it->second.state == CacheEntryState::Ready && now >= it->second.expiresAt) {
            return CacheEntryState::Idle;
        }
        return it->second.state;
    }

    std::size_t size() const { return entries_.size(); }

    // Fetches launched and not yet completed, detached ones included.
    std::size_t fetchesInFlight() const { return fetches_.size(); }

    std::size_t waiterCount(FetchId id) const {
        auto it = fetches_.find(id);
        return it == fetches_.end() ? 0 : it->second.waiters.size();
    }

    // Number of fetches launched since construction.
    std::uint64_t fetchCount() const { return nextFetch_ - 1; }

private:
    struct Entry {
        CacheEntryState state{CacheEntryState::Idle};
        std::optional<Value> value;
        Clock::time_point expiresAt{};
        FetchId fetch{0};
    };

    struct Fetch {
        CacheKey key;
        std::chrono::milliseconds ttl{0};
        std::vector<Waiter> waiters;
    };

    std::map<CacheKey, Entry> entries_;
    std::map<FetchId, Fetch> fetches_;
    FetchId nextFetch_{1};
};
