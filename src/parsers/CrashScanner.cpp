#include "parsers/CrashScanner.h"

#include <ctime>
#include <optional>
#include <regex>
#include <set>
#include <tuple>
#include <vector>

#include "parsers/TextUtil.h"

using TextUtil::startsWith;

namespace Parsers {

namespace {

using TimePoint = std::chrono::system_clock::time_point;

// 10-18 12:34:56.789  1234  1234 E AndroidRuntime: FATAL EXCEPTION: main
const std::regex kThreadtime(
    R"(^\s*(\d\d)-(\d\d)\s+(\d\d):(\d\d):(\d\d)\.(\d{3})\s+(\d+)\s+(\d+)\s+([VDIWEFAS])\s+(.*)$)");

struct LogLine {
    std::optional<TimePoint> at;
    std::optional<int> pid;
    std::string message;
};

struct Identifier {
    std::size_t index;
    std::optional<int> pid;
    std::string name;
};

struct Pending {
    std::size_t index{0};
    CrashKind kind{CrashKind::Crash};
    std::optional<int> pid;
    TimePoint at{};
    std::string markerMessage;
    std::optional<std::string> package;
    std::optional<std::string> fallbackPackage;
    std::optional<std::string> signature;
    bool needsSignature{true};
    bool done{false};
};

int localYear(TimePoint tp) {
    const std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);
    return tm.tm_year + 1900;
}

TimePoint makeTime(int year, const std::smatch& m) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = std::stoi(m[1].str()) - 1;
    tm.tm_mday = std::stoi(m[2].str());
    tm.tm_hour = std::stoi(m[3].str());
    tm.tm_min = std::stoi(m[4].str());
    tm.tm_sec = std::stoi(m[5].str());
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm)) +
           std::chrono::milliseconds(std::stoi(m[6].str()));
}

LogLine splitLine(const std::string& raw, TimePoint reference) {
    LogLine l;
    std::smatch m;
    if (!std::regex_match(raw, m, kThreadtime)) {
        l.message = TextUtil::trim(raw);
        return l;
    }
    const int year = localYear(reference);
    TimePoint at = makeTime(year, m);
    // a December entry read in January belongs to the previous year
    if (at > reference + std::chrono::hours(24)) at = makeTime(year - 1, m);
    l.at = at;
    l.pid = std::stoi(m[7].str());

    const std::string rest = m[10].str();
    const auto colon = rest.find(':');
    l.message = TextUtil::trim(colon == std::string::npos ? rest : rest.substr(colon + 1));
    return l;
}

std::string cutAt(const std::string& s, const char* stops) {
    const auto p = s.find_first_of(stops);
    return p == std::string::npos ? s : s.substr(0, p);
}

std::optional<std::string> identifierIn(const std::string& msg) {
    if (auto p = msg.find("Process: "); p != std::string::npos) {
        std::string name = cutAt(msg.substr(p + 9), ", ");
        if (!name.empty()) return name;
    }
    if (auto a = msg.find(">>> "); a != std::string::npos) {
        const auto b = msg.find(" <<<", a + 4);
        if (b != std::string::npos && b > a + 4) return msg.substr(a + 4, b - a - 4);
    }
    if (auto p = msg.find("ANR in "); p != std::string::npos) {
        std::string name = cutAt(msg.substr(p + 7), " (");
        if (!name.empty()) return name;
    }
    return std::nullopt;
}

std::optional<CrashKind> markerIn(const std::string& msg) {
    if (TextUtil::contains(msg, "FATAL EXCEPTION")) return CrashKind::Crash;
    if (TextUtil::contains(msg, "Fatal signal")) return CrashKind::NativeCrash;
    if (TextUtil::contains(msg, "ANR in ")) return CrashKind::Anr;
    return std::nullopt;
}

// "Fatal signal 11 (SIGSEGV), code 1 ..., pid 1234 (com.example.app)"
std::optional<std::string> nativeProcessName(const std::string& msg) {
    const auto p = msg.rfind(", pid ");
    if (p == std::string::npos) return std::nullopt;
    const auto open = msg.find('(', p);
    const auto close = open == std::string::npos ? std::string::npos : msg.find(')', open);
    if (close == std::string::npos || close == open + 1) return std::nullopt;
    return msg.substr(open + 1, close - open - 1);
}

std::string nativeSignature(const std::string& msg) {
    const auto p = msg.find("Fatal signal");
    const auto close = msg.find(')', p);
    return close == std::string::npos ? msg.substr(p) : msg.substr(p, close - p + 1);
}

bool samePid(const std::optional<int>& a, const std::optional<int>& b) {
    return !a || !b || *a == *b;
}

} // namespace

CrashScan scanCrashes(const std::string& deviceId,
                      const std::string& text,
                      std::chrono::system_clock::time_point reference,
                      std::size_t window) {
    const auto lines = TextUtil::splitLines(text);
    std::vector<Pending> pending;
    std::vector<Identifier> recent;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (TextUtil::trim(lines[i]).empty()) continue;
        const LogLine l = splitLine(lines[i], reference);
        const auto ident = identifierIn(l.message);
        const auto marker = markerIn(l.message);

        for (auto& p : pending) {
            if (p.done) continue;
            if (i - p.index > window) {
                p.done = true;
                continue;
            }
            if (!samePid(p.pid, l.pid) || marker) continue;
            if (!p.package && ident) p.package = ident;
            if (p.needsSignature && !p.signature && !ident && !l.message.empty()) {
                if (p.kind == CrashKind::Crash) {
                    p.signature = l.message;
                } else if (p.kind == CrashKind::Anr && startsWith(l.message, "Reason:")) {
                    p.signature = TextUtil::trim(l.message.substr(7));
                }
            }
            if (p.package && (!p.needsSignature || p.signature)) p.done = true;
        }

        while (!recent.empty() && i - recent.front().index > window) {
            recent.erase(recent.begin());
        }

        if (marker) {
            Pending p;
            p.index = i;
            p.kind = *marker;
            p.pid = l.pid;
            p.at = l.at.value_or(reference);
            p.markerMessage = l.message;
            if (p.kind == CrashKind::Anr) {
                p.package = ident;
            } else if (p.kind == CrashKind::NativeCrash) {
                p.package = nativeProcessName(l.message);
                p.signature = nativeSignature(l.message);
                p.needsSignature = false;
            }
            for (auto it = recent.rbegin(); it != recent.rend(); ++it) {
                if (!p.fallbackPackage) p.fallbackPackage = it->name;
                if (!p.package && samePid(p.pid, it->pid)) {
                    p.package = it->name;
                    break;
                }
            }
            pending.push_back(std::move(p));
        }

        if (ident) recent.push_back(Identifier{i, l.pid, *ident});
    }

    CrashScan out;
    std::set<std::tuple<std::string, std::string, long long>> seen;
    for (auto& p : pending) {
        CrashEvent ev;
        ev.deviceId = deviceId;
        ev.kind = p.kind;
        ev.packageName = p.package.value_or(p.fallbackPackage.value_or(std::string()));
        ev.signature = p.signature.value_or(p.markerMessage);
        ev.occurredAt = p.at;

        const long long second =
            std::chrono::duration_cast<std::chrono::seconds>(ev.occurredAt.time_since_epoch()).count();
        if (!seen.emplace(ev.packageName, ev.signature, second).second) continue;
        out.push_back(std::move(ev));
    }
    return out;
}

} // namespace Parsers
