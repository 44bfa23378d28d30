#include "parsers/TextUtil.h"

#include <cctype>
#include <limits>
#include <sstream>

namespace TextUtil {

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string line;
    std::istringstream iss(text);
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

std::vector<std::string> tokens(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream ws(s);
    std::string tok;
    while (ws >> tok) out.push_back(tok);
    return out;
}

std::optional<std::int64_t> parseGroupedInt(const std::string& s) {
    std::int64_t v = 0;
    bool any = false;
    for (char c : s) {
        if (c == ',') continue;
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        if (v > (std::numeric_limits<std::int64_t>::max() - 9) / 10) return std::nullopt;
        v = v * 10 + (c - '0');
        any = true;
    }
    if (!any) return std::nullopt;
    return v;
}

} // namespace TextUtil
