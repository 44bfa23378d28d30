#include "parsers/MemInfoParser.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <regex>

#include "core/Errors.h"
#include "parsers/TextUtil.h"

namespace Parsers {

namespace {

const std::regex kLabeledValue(
    R"(([A-Za-z][A-Za-z ()]*?)\s*:\s*([0-9][0-9,]*(?:\.[0-9]+)?)\s*(?:(kB|KB|K|MB|M)\b)?)");

std::string lowerTrim(const std::string& s) {
    std::string out = TextUtil::trim(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<std::int64_t> toKb(const std::string& number, const std::string& unit) {
    std::string digits;
    digits.reserve(number.size());
    for (char c : number) {
        if (c != ',') digits.push_back(c);
    }
    const bool mega = unit == "MB" || unit == "M";
    if (digits.find('.') != std::string::npos) {
        try {
            const double v = std::stod(digits);
            return static_cast<std::int64_t>(std::llround(mega ? v * 1024.0 : v));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    auto v = TextUtil::parseGroupedInt(digits);
    if (!v) return std::nullopt;
    return mega ? *v * 1024 : *v;
}

} // namespace

MemorySnapshot parseMemInfo(const std::string& deviceId,
                            const std::string& packageName,
                            const std::string& text,
                            std::chrono::system_clock::time_point capturedAt) {
    MemorySnapshot snap;
    snap.deviceId = deviceId;
    snap.packageName = packageName;
    snap.capturedAt = capturedAt;

    std::optional<std::int64_t> totalPss;
    std::optional<std::int64_t> legacyTotal;

    for (const auto& raw : TextUtil::splitLines(text)) {
        if (TextUtil::contains(raw, "No process found for")) {
            throw BridgeError(ErrorKind::NoSuchPackage, TextUtil::trim(raw), text);
        }

        for (auto it = std::sregex_iterator(raw.begin(), raw.end(), kLabeledValue); it != std::sregex_iterator(); ++it) {
            const std::smatch& m = *it;
            const std::string label = lowerTrim(m[1].str());
            const auto kb = toKb(m[2].str(), m[3].matched ? m[3].str() : std::string());
            if (!kb) {
                throw ParseError(raw, "bad numeric value for '" + label + "'");
            }
            if (label == "total pss" || label == "total") {
                if (!totalPss) totalPss = kb;
            } else if (label == "java heap") {
                if (!snap.javaHeapKb) snap.javaHeapKb = kb;
            } else if (label == "native heap") {
                if (!snap.nativeHeapKb) snap.nativeHeapKb = kb;
            } else if (label == "graphics") {
                if (!snap.graphicsKb) snap.graphicsKb = kb;
            } else if (label == "code") {
                if (!snap.codeKb) snap.codeKb = kb;
            } else if (label == "stack") {
                if (!snap.stackKb) snap.stackKb = kb;
            }
        }

        // pre-summary layout: "TOTAL   31228   ..." as a table row
        const auto toks = TextUtil::tokens(raw);
        if (!legacyTotal && toks.size() >= 2 && toks[0] == "TOTAL") {
            legacyTotal = TextUtil::parseGroupedInt(toks[1]);
        }
    }

    if (!totalPss) totalPss = legacyTotal;
    if (!totalPss) {
        std::string firstLine;
        for (const auto& l : TextUtil::splitLines(text)) {
            if (!TextUtil::trim(l).empty()) {
                firstLine = l;
                break;
            }
        }
        throw ParseError(firstLine, "no TOTAL PSS field in meminfo output");
    }
    snap.pssTotalKb = *totalPss;
    return snap;
}

} // namespace Parsers
