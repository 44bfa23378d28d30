#pragma once

#include <chrono>
#include <string>

#include "core/DeviceModel.h"

namespace Parsers {

// Scan a `logcat -d -v threadtime` dump (plain lines are accepted too) for
// FATAL EXCEPTION, Fatal signal and "ANR in" markers in one forward pass.
//
// The package of a marker comes from the marker line when it names one,
// otherwise from the nearest identifier line ("Process: X", ">>> X <<<",
// "ANR in X") of the same logcat pid within `window` lines: preceding first,
// then following. Lacking that, the nearest preceding identifier of any pid
// within the window is used. Events are de-duplicated by package, signature
// and second; one event per distinct marker.
//
// Logcat timestamps carry no year; it is taken from `reference`, which also
// stands in for lines without a timestamp.
CrashScan scanCrashes(const std::string& deviceId,
                      const std::string& text,
                      std::chrono::system_clock::time_point reference,
                      std::size_t window = 50);

} // namespace Parsers
