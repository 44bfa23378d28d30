#pragma once

#include <string>
#include <vector>

#include "core/DeviceModel.h"

namespace Parsers {

// Map an `adb devices` state column onto the poll vocabulary.
// Unknown strings map to DeviceState::Error.
DeviceState mapDeviceState(const std::string& rawState);

// Parse `adb devices -l`. Header and daemon banner lines are skipped; every
// other non-blank line produces exactly one record. Throws ParseError for a
// line with an id but no state.
std::vector<DeviceRecord> parseDeviceList(const std::string& text);

} // namespace Parsers
