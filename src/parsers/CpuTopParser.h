#pragma once

#include <chrono>
#include <string>

#include "core/DeviceModel.h"

namespace Parsers {

// Pick the rows of a `top -b -n 1` snapshot that belong to packageName
// (its main process and "packageName:<suffix>" subprocesses) and sum their
// %CPU. cpuPercent is empty when no such row exists.
CpuSample parseTopForPackage(const std::string& deviceId,
                             const std::string& packageName,
                             const std::string& text,
                             std::chrono::system_clock::time_point capturedAt);

} // namespace Parsers
