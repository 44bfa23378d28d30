#include "parsers/DeviceListParser.h"

#include "core/Errors.h"
#include "parsers/TextUtil.h"

using TextUtil::startsWith;

namespace Parsers {

DeviceState mapDeviceState(const std::string& rawState) {
    if (rawState == "device") return DeviceState::Connected;
    if (rawState == "offline" || rawState == "bootloader" || rawState == "recovery" ||
        rawState == "sideload" || rawState == "rescue") {
        return DeviceState::Offline;
    }
    if (rawState == "unauthorized" || startsWith(rawState, "no permissions")) {
        return DeviceState::Unauthorized;
    }
    if (rawState == "connecting" || rawState == "authorizing") return DeviceState::Connecting;
    return DeviceState::Error;
}

namespace {

bool isBanner(const std::string& line) {
    return startsWith(line, "List of devices") || startsWith(line, "*") || startsWith(line, "adb server");
}

Transport transportFor(const std::string& id, bool usbTokenSeen) {
    if (usbTokenSeen) return Transport::Usb;
    // host:port from `adb connect`, or an mDNS TLS service name
    if (id.find(':') != std::string::npos || id.find("._adb-tls-") != std::string::npos) {
        return Transport::Network;
    }
    return Transport::Usb;
}

} // namespace

std::vector<DeviceRecord> parseDeviceList(const std::string& text) {
    std::vector<DeviceRecord> out;

    for (const auto& raw : TextUtil::splitLines(text)) {
        const std::string line = TextUtil::trim(raw);
        if (line.empty() || isBanner(line)) continue;

        const auto sep = line.find_first_of(" \t");
        if (sep == std::string::npos) {
            throw ParseError(raw, "device line has no state column");
        }

        DeviceRecord rec;
        rec.id = line.substr(0, sep);
        const std::string rest = TextUtil::trim(line.substr(sep));

        bool usbTokenSeen = false;
        if (startsWith(rest, "no permissions")) {
            // the state itself contains spaces and a trailing hint
            const auto semi = rest.find(';');
            rec.rawState = TextUtil::trim(semi == std::string::npos ? rest : rest.substr(0, semi));
        } else {
            const auto toks = TextUtil::tokens(rest);
            rec.rawState = toks.front();
            for (std::size_t i = 1; i < toks.size(); ++i) {
                const auto& tok = toks[i];
                if (startsWith(tok, "product:")) rec.product = tok.substr(8);
                else if (startsWith(tok, "model:")) rec.model = tok.substr(6);
                else if (startsWith(tok, "device:")) rec.deviceName = tok.substr(7);
                else if (startsWith(tok, "transport_id:")) rec.transportId = tok.substr(13);
                else if (startsWith(tok, "usb:")) usbTokenSeen = true;
            }
        }

        rec.state = mapDeviceState(rec.rawState);
        rec.transport = transportFor(rec.id, usbTokenSeen);
        out.push_back(std::move(rec));
    }
    return out;
}

} // namespace Parsers
