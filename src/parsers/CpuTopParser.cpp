#include "parsers/CpuTopParser.h"

#include <algorithm>
#include <optional>

#include "core/Errors.h"
#include "parsers/TextUtil.h"

namespace Parsers {

namespace {

struct Header {
    std::size_t cpuIndex{0};
    std::size_t nameIndex{0};
};

// toybox prints "S[%CPU]"; older top prints "CPU%" and a "Name" column
std::vector<std::string> headerTokens(std::string line) {
    std::replace(line.begin(), line.end(), '[', ' ');
    std::replace(line.begin(), line.end(), ']', ' ');
    return TextUtil::tokens(line);
}

std::optional<Header> findHeader(const std::string& line) {
    const auto toks = headerTokens(line);
    if (std::find(toks.begin(), toks.end(), "PID") == toks.end()) return std::nullopt;

    Header h;
    bool cpu = false;
    bool name = false;
    for (std::size_t i = 0; i < toks.size(); ++i) {
        if (toks[i] == "%CPU" || toks[i] == "CPU%") {
            h.cpuIndex = i;
            cpu = true;
        } else if (toks[i] == "ARGS" || toks[i] == "NAME" || toks[i] == "Name" || toks[i] == "COMMAND" ||
                   toks[i] == "CMD") {
            h.nameIndex = i;
            name = true;
        }
    }
    if (!cpu || !name) return std::nullopt;
    return h;
}

bool belongsTo(const std::string& processName, const std::string& packageName) {
    return processName == packageName || TextUtil::startsWith(processName, packageName + ":");
}

} // namespace

CpuSample parseTopForPackage(const std::string& deviceId,
                             const std::string& packageName,
                             const std::string& text,
                             std::chrono::system_clock::time_point capturedAt) {
    CpuSample sample;
    sample.deviceId = deviceId;
    sample.packageName = packageName;
    sample.capturedAt = capturedAt;

    std::optional<Header> header;
    double total = 0.0;

    for (const auto& raw : TextUtil::splitLines(text)) {
        if (TextUtil::trim(raw).empty()) continue;
        if (!header) {
            header = findHeader(raw);
            continue;
        }

        const auto toks = TextUtil::tokens(raw);
        if (toks.size() <= std::max(header->cpuIndex, header->nameIndex)) continue;
        if (!belongsTo(toks[header->nameIndex], packageName)) continue;

        std::string cpu = toks[header->cpuIndex];
        if (!cpu.empty() && cpu.back() == '%') cpu.pop_back();
        try {
            std::size_t used = 0;
            const double v = std::stod(cpu, &used);
            if (used != cpu.size()) throw std::invalid_argument(cpu);
            total += v;
        } catch (const std::exception&) {
            throw ParseError(raw, "bad %CPU value");
        }
        ++sample.processCount;
    }

    if (!header) {
        const auto lines = TextUtil::splitLines(text);
        throw ParseError(lines.empty() ? std::string() : lines.front(), "no process table header in top output");
    }
    if (sample.processCount > 0) sample.cpuPercent = total;
    return sample;
}

} // namespace Parsers
