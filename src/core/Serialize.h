#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/DeviceModel.h"
#include "core/TelemetryEvent.h"

namespace Serialize {

nlohmann::json deviceToJson(const Device& d);
nlohmann::json packageToJson(const PackageRecord& p);

// One object per event: {"event", "deviceId", "handle", ...payload fields}.
nlohmann::json eventToJson(const TelemetryEvent& evt);

// Write devices as JSON array with fields:
// id, transport, state, model, product, lastConfirmedAt
// Failures are logged to `log` and reported as false.
bool writeDevicesJson(const std::string& path, const std::vector<Device>& list, spdlog::logger& log);

// Write an inventory as CSV with header.
bool writePackagesCsv(const std::string& path, const PackageSnapshot& packages, spdlog::logger& log);

std::string csvEscape(const std::string& s);

} // namespace Serialize
