#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace Utils {

// Local time as HH:MM:SS
std::string formatTimeHHMMSS(const std::chrono::system_clock::time_point& tp);

// Local time with milliseconds and UTC offset, e.g. 2025-11-09T22:07:02.125+08:00
std::string formatTimeISO8601(const std::chrono::system_clock::time_point& tp);

// 812 kB, 12.4 MB, 1.2 GB
std::string formatKb(std::int64_t kb);

std::string formatBytes(std::int64_t bytes);

} // namespace Utils
