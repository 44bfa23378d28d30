#include "core/Config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using nlohmann::json;

std::chrono::milliseconds CacheTtls::forKind(CommandKind kind) const {
    switch (kind) {
        case CommandKind::DeviceDiscovery: return discovery;
        case CommandKind::PackageInventory: return inventory;
        case CommandKind::PackageDetails: return details;
        case CommandKind::MemorySnapshot: return memory;
        case CommandKind::CpuSample: return cpu;
        case CommandKind::CrashScan: return crash;
        default: return std::chrono::milliseconds(0);
    }
}

namespace {

template <typename T>
void readKey(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& ex) {
        throw std::runtime_error(std::string("config key '") + key + "': " + ex.what());
    }
}

void readMs(const json& obj, const char* key, std::chrono::milliseconds& out) {
    long long v = out.count();
    readKey(obj, key, v);
    if (v < 0) {
        throw std::runtime_error(std::string("config key '") + key + "' must not be negative");
    }
    out = std::chrono::milliseconds(v);
}

} // namespace

namespace Config {

SessionConfig fromJsonText(const std::string& text) {
    SessionConfig cfg;
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& ex) {
        throw std::runtime_error(std::string("config is not valid JSON: ") + ex.what());
    }
    if (!root.is_object()) {
        throw std::runtime_error("config root must be a JSON object");
    }

    readKey(root, "bridgePath", cfg.bridgePath);
    readKey(root, "workerCount", cfg.workerCount);
    readMs(root, "commandTimeoutMs", cfg.commandTimeout);
    readMs(root, "requestDeadlineMs", cfg.requestDeadline);
    readMs(root, "pollIntervalMs", cfg.pollInterval);
    readKey(root, "debounceThreshold", cfg.debounceThreshold);
    readMs(root, "removalGraceMs", cfg.removalGrace);
    readKey(root, "includeSystemPackages", cfg.includeSystemPackages);
    readKey(root, "logLevel", cfg.logLevel);

    if (auto it = root.find("ttlMs"); it != root.end() && it->is_object()) {
        readMs(*it, "discovery", cfg.ttl.discovery);
        readMs(*it, "inventory", cfg.ttl.inventory);
        readMs(*it, "details", cfg.ttl.details);
        readMs(*it, "memory", cfg.ttl.memory);
        readMs(*it, "cpu", cfg.ttl.cpu);
        readMs(*it, "crash", cfg.ttl.crash);
    }
    if (auto it = root.find("retry"); it != root.end() && it->is_object()) {
        readKey(*it, "timeoutRetries", cfg.retry.timeoutRetries);
        readKey(*it, "offlineRetries", cfg.retry.offlineRetries);
        readMs(*it, "backoffMs", cfg.retry.backoff);
    }

    if (cfg.workerCount < 1) {
        throw std::runtime_error("config key 'workerCount' must be at least 1");
    }
    if (cfg.debounceThreshold < 1) {
        throw std::runtime_error("config key 'debounceThreshold' must be at least 1");
    }
    if (cfg.retry.timeoutRetries < 0 || cfg.retry.offlineRetries < 0) {
        throw std::runtime_error("retry counts must not be negative");
    }
    return cfg;
}

SessionConfig loadFile(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error("cannot open config file: " + path);
    }
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return fromJsonText(oss.str());
}

void applyEnvironment(SessionConfig& cfg) {
    if (const char* p = std::getenv("ADB_PATH"); p && *p) {
        cfg.bridgePath = p;
    } else if (cfg.bridgePath == "adb") {
        // Prefer the SDK copy of adb over a PATH lookup when an SDK is configured
        for (const char* var : {"ANDROID_HOME", "ANDROID_SDK_ROOT"}) {
            const char* root = std::getenv(var);
            if (!root || !*root) continue;
            std::filesystem::path candidate = std::filesystem::path(root) / "platform-tools" / "adb";
            std::error_code ec;
            if (std::filesystem::exists(candidate, ec)) {
                cfg.bridgePath = candidate.string();
                break;
            }
        }
    }
    if (const char* lvl = std::getenv("DT_LOG"); lvl && *lvl) {
        cfg.logLevel = lvl;
    }
}

} // namespace Config
