#include "core/Utils.h"

#include <ctime>
#include <cstdlib>

#include <fmt/core.h>

namespace Utils {

namespace {

std::tm localTm(const std::chrono::system_clock::time_point& tp) {
    const std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);
    return tm;
}

} // namespace

std::string formatTimeHHMMSS(const std::chrono::system_clock::time_point& tp) {
    const std::tm tm = localTm(tp);
    return fmt::format("{:02}:{:02}:{:02}", tm.tm_hour, tm.tm_min, tm.tm_sec);
}

std::string formatTimeISO8601(const std::chrono::system_clock::time_point& tp) {
    using namespace std::chrono;
    const std::tm tm = localTm(tp);
    const auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;

    long offset = tm.tm_gmtoff;
    char sign = '+';
    if (offset < 0) {
        sign = '-';
        offset = -offset;
    }
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}{}{:02}:{:02}", tm.tm_year + 1900, tm.tm_mon + 1,
                       tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, ms < 0 ? ms + 1000 : ms, sign, offset / 3600,
                       (offset % 3600) / 60);
}

std::string formatKb(std::int64_t kb) {
    if (std::llabs(kb) < 1024) return fmt::format("{} kB", kb);
    if (std::llabs(kb) < 1024 * 1024) return fmt::format("{:.1f} MB", kb / 1024.0);
    return fmt::format("{:.1f} GB", kb / (1024.0 * 1024.0));
}

std::string formatBytes(std::int64_t bytes) {
    if (std::llabs(bytes) < 1024) return fmt::format("{} B", bytes);
    return formatKb(bytes / 1024);
}

} // namespace Utils
