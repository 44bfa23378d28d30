#pragma once

#include <chrono>
#include <string>

#include "core/DeviceModel.h"

namespace Parsers {

// Parse `dumpsys meminfo <package>`.
//
// Reads "Label: value [unit]" pairs (several may share a line), strips
// thousands separators and converts MB to kB. TOTAL PSS is required and falls
// back to the legacy "TOTAL <pss> ..." table row; heap, graphics, code and
// stack fields stay empty when the block does not report them.
// Throws BridgeError(NoSuchPackage) for "No process found", ParseError when
// no total is present.
MemorySnapshot parseMemInfo(const std::string& deviceId,
                            const std::string& packageName,
                            const std::string& text,
                            std::chrono::system_clock::time_point capturedAt);

} // namespace Parsers
