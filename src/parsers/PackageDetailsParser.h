#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/DeviceModel.h"

namespace Parsers {

// Parse `dumpsys package <name>`. Throws BridgeError(NoSuchPackage) when the
// package is not known to the device.
PackageDetails parsePackageDetails(const std::string& packageName, const std::string& text);

// Parse `pm path <name>`: one "package:<apk path>" per line.
std::vector<std::string> parsePackagePaths(const std::string& text);

// Sum the byte counts printed by `stat -c %s <paths...>`, one per line.
std::int64_t parseSizeSum(const std::string& text);

} // namespace Parsers
