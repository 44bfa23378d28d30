#include "parsers/ActionOutputParser.h"

#include "core/Errors.h"
#include "parsers/TextUtil.h"

using TextUtil::contains;
using TextUtil::startsWith;

namespace Parsers {

namespace {

bool isSuccessLine(const std::string& line) {
    return line == "Success" || startsWith(line, "connected to") || startsWith(line, "already connected") ||
           startsWith(line, "restarting in TCP mode") || startsWith(line, "disconnected");
}

void throwForFailureLine(const std::string& line, const std::string& text) {
    if (contains(line, "DELETE_FAILED_INTERNAL_ERROR") || contains(line, "Unknown package") ||
        contains(line, "not installed")) {
        throw BridgeError(ErrorKind::NoSuchPackage, line, text);
    }
    if (contains(line, "failed to authenticate")) {
        throw BridgeError(ErrorKind::Unauthorized, line, text);
    }
    if (contains(line, "no such device") || contains(line, "device offline")) {
        throw BridgeError(ErrorKind::DeviceOffline, line, text);
    }
    if (startsWith(line, "Failure [") || startsWith(line, "Failed") || contains(line, "failed to connect") ||
        startsWith(line, "error:") || startsWith(line, "Exception")) {
        throw BridgeError(ErrorKind::ProcessError, line, text);
    }
}

} // namespace

ActionOutcome parseActionOutput(CommandKind kind, const std::string& target, const std::string& text) {
    ActionOutcome out;
    out.kind = kind;
    out.target = target;

    std::string lastLine;
    for (const auto& raw : TextUtil::splitLines(text)) {
        const std::string line = TextUtil::trim(raw);
        if (line.empty()) continue;
        throwForFailureLine(line, text);
        if (isSuccessLine(line)) {
            out.message = line;
            return out;
        }
        lastLine = line;
    }

    // uninstall and pm clear always report a verdict
    if ((kind == CommandKind::Uninstall || kind == CommandKind::ClearData) && !lastLine.empty()) {
        throw ParseError(lastLine, "no Success or Failure line in action output");
    }
    if (kind == CommandKind::ConnectNetwork) {
        throw BridgeError(ErrorKind::ProcessError,
                          lastLine.empty() ? "connect printed nothing" : lastLine, text);
    }
    out.message = lastLine;
    return out;
}

} // namespace Parsers
