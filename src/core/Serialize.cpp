#include "core/Serialize.h"

#include <filesystem>
#include <fstream>

#include "core/Utils.h"

using nlohmann::json;

namespace {

template <typename T>
json orNull(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

std::string timeOrEmpty(const std::chrono::system_clock::time_point& tp) {
    return tp.time_since_epoch().count() == 0 ? std::string() : Utils::formatTimeISO8601(tp);
}

void ensureParent(const std::string& path) {
    std::filesystem::path p(path);
    if (!p.parent_path().empty()) {
        std::filesystem::create_directories(p.parent_path());
    }
}

} // namespace

namespace Serialize {

json deviceToJson(const Device& d) {
    json o;
    o["id"] = d.id;
    o["transport"] = toString(d.transport);
    o["state"] = toString(d.state);
    o["model"] = d.model;
    o["product"] = d.product;
    o["lastConfirmedAt"] = timeOrEmpty(d.lastConfirmedAt);
    o["consecutiveMismatchCount"] = d.consecutiveMismatchCount;
    return o;
}

json packageToJson(const PackageRecord& p) {
    json o;
    o["name"] = p.name;
    o["versionName"] = orNull(p.versionName);
    o["versionCode"] = orNull(p.versionCode);
    o["sizeBytes"] = orNull(p.sizeBytes);
    o["category"] = toString(p.category);
    o["installPath"] = p.installPath;
    return o;
}

json eventToJson(const TelemetryEvent& evt) {
    json o;
    o["event"] = toString(evt.kind);
    if (!evt.deviceId.empty()) o["deviceId"] = evt.deviceId;
    if (evt.handle != 0) o["handle"] = evt.handle;

    if (auto list = std::get_if<DeviceListPayload>(&evt.payload)) {
        json arr = json::array();
        for (const auto& d : list->devices) arr.push_back(deviceToJson(d));
        o["devices"] = std::move(arr);
        o["multipleDevices"] = list->multipleDevices;
    } else if (auto change = std::get_if<StateChangePayload>(&evt.payload)) {
        o["oldState"] = toString(change->oldState);
        o["newState"] = toString(change->newState);
    } else if (auto inv = std::get_if<PackageSnapshotPtr>(&evt.payload)) {
        json arr = json::array();
        if (*inv) {
            for (const auto& p : **inv) arr.push_back(packageToJson(p));
        }
        o["packages"] = std::move(arr);
    } else if (auto d = std::get_if<PackageDetails>(&evt.payload)) {
        o["packageName"] = d->name;
        o["versionName"] = orNull(d->versionName);
        o["versionCode"] = orNull(d->versionCode);
        o["firstInstallTime"] = orNull(d->firstInstallTime);
        o["lastUpdateTime"] = orNull(d->lastUpdateTime);
        o["codePaths"] = d->codePaths;
        o["sizeBytes"] = orNull(d->sizeBytes);
        o["grantedPermissions"] = d->grantedPermissions;
        o["deniedPermissions"] = d->deniedPermissions;
    } else if (auto m = std::get_if<MemorySnapshot>(&evt.payload)) {
        o["packageName"] = m->packageName;
        o["pssTotalKb"] = m->pssTotalKb;
        o["javaHeapKb"] = orNull(m->javaHeapKb);
        o["nativeHeapKb"] = orNull(m->nativeHeapKb);
        o["graphicsKb"] = orNull(m->graphicsKb);
        o["codeKb"] = orNull(m->codeKb);
        o["stackKb"] = orNull(m->stackKb);
        o["capturedAt"] = Utils::formatTimeISO8601(m->capturedAt);
    } else if (auto c = std::get_if<CpuSample>(&evt.payload)) {
        o["packageName"] = c->packageName;
        o["cpuPercent"] = orNull(c->cpuPercent);
        o["processCount"] = c->processCount;
        o["capturedAt"] = Utils::formatTimeISO8601(c->capturedAt);
    } else if (auto crash = std::get_if<CrashEvent>(&evt.payload)) {
        o["packageName"] = crash->packageName;
        o["kind"] = toString(crash->kind);
        o["signature"] = crash->signature;
        o["occurredAt"] = Utils::formatTimeISO8601(crash->occurredAt);
    } else if (auto a = std::get_if<ActionOutcome>(&evt.payload)) {
        o["action"] = toString(a->kind);
        o["target"] = a->target;
        o["message"] = a->message;
    } else if (auto f = std::get_if<FailurePayload>(&evt.payload)) {
        o["error"] = toString(f->error);
        o["message"] = f->message;
        o["rawOutput"] = f->rawOutput;
    }
    return o;
}

bool writeDevicesJson(const std::string& path, const std::vector<Device>& list, spdlog::logger& log) {
    try {
        ensureParent(path);
        json arr = json::array();
        for (const auto& d : list) {
            arr.push_back(deviceToJson(d));
        }
        std::ofstream ofs(path, std::ios::binary);
        ofs << arr.dump(2);
        ofs.close();
        return static_cast<bool>(ofs);
    } catch (const std::exception& ex) {
        log.error("writeDevicesJson {} failed: {}", path, ex.what());
        return false;
    }
}

bool writePackagesCsv(const std::string& path, const PackageSnapshot& packages, spdlog::logger& log) {
    try {
        ensureParent(path);
        std::ofstream ofs(path, std::ios::binary);
        ofs << "name,category,versionName,versionCode,sizeBytes,installPath\n";
        for (const auto& p : packages) {
            ofs << csvEscape(p.name) << ','
                << toString(p.category) << ','
                << csvEscape(p.versionName.value_or("")) << ','
                << (p.versionCode ? std::to_string(*p.versionCode) : std::string()) << ','
                << (p.sizeBytes ? std::to_string(*p.sizeBytes) : std::string()) << ','
                << csvEscape(p.installPath)
                << "\n";
        }
        ofs.close();
        return static_cast<bool>(ofs);
    } catch (const std::exception& ex) {
        log.error("writePackagesCsv {} failed: {}", path, ex.what());
        return false;
    }
}

std::string csvEscape(const std::string& s) {
    const bool needQuotes = s.find_first_of(",\"\n\r") != std::string::npos;
    if (!needQuotes) return s;
    std::string out;
    out.reserve(s.size() + 4);
    out.push_back('"');
    for (char c : s) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace Serialize
