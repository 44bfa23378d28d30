#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace TextUtil {

// Split on '\n', dropping a trailing '\r' from every line. Blank lines are kept.
std::vector<std::string> splitLines(const std::string& text);

std::string trim(const std::string& s);

bool startsWith(const std::string& s, const std::string& prefix);

bool contains(const std::string& s, const std::string& needle);

// Whitespace tokenization.
std::vector<std::string> tokens(const std::string& s);

// "12,345" -> 12345. Rejects anything but digits and separators.
std::optional<std::int64_t> parseGroupedInt(const std::string& s);

} // namespace TextUtil
