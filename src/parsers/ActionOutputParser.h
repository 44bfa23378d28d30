#pragma once

#include <string>

#include "core/DeviceModel.h"

namespace Parsers {

// Interpret the output of a device action (force-stop, pm clear, uninstall,
// tcpip, connect, disconnect). Returns the outcome for a recognised success
// line; throws BridgeError for a recognised failure. Silent commands
// (am force-stop prints nothing) succeed with an empty message.
ActionOutcome parseActionOutput(CommandKind kind, const std::string& target, const std::string& text);

} // namespace Parsers
