#include "parsers/PackageDetailsParser.h"

#include <algorithm>

#include "core/Errors.h"
#include "parsers/TextUtil.h"

using TextUtil::contains;
using TextUtil::startsWith;

namespace Parsers {

namespace {

void addUnique(std::vector<std::string>& list, const std::string& v) {
    if (std::find(list.begin(), list.end(), v) == list.end()) list.push_back(v);
}

// "versionCode=42 minSdk=24" -> "42"
std::string valueOf(const std::string& line, const std::string& key) {
    std::string v = line.substr(key.size());
    const auto space = v.find(' ');
    return space == std::string::npos ? v : v.substr(0, space);
}

} // namespace

PackageDetails parsePackageDetails(const std::string& packageName, const std::string& text) {
    PackageDetails d;
    d.name = packageName;

    const std::string sectionHeader = "Package [" + packageName + "]";
    bool found = false;

    for (const auto& raw : TextUtil::splitLines(text)) {
        const std::string line = TextUtil::trim(raw);
        if (line.empty()) continue;

        if (startsWith(line, "Unable to find package")) {
            throw BridgeError(ErrorKind::NoSuchPackage, line, text);
        }
        if (startsWith(line, sectionHeader)) {
            found = true;
            continue;
        }
        if (!found) continue;

        // first occurrence wins; hidden system copies repeat the keys later
        if (startsWith(line, "versionCode=") && !d.versionCode) {
            auto code = TextUtil::parseGroupedInt(valueOf(line, "versionCode="));
            if (!code) throw ParseError(raw, "bad versionCode");
            d.versionCode = *code;
        } else if (startsWith(line, "versionName=") && !d.versionName) {
            d.versionName = line.substr(12);
        } else if (startsWith(line, "firstInstallTime=") && !d.firstInstallTime) {
            d.firstInstallTime = line.substr(17);
        } else if (startsWith(line, "lastUpdateTime=") && !d.lastUpdateTime) {
            d.lastUpdateTime = line.substr(15);
        } else if (startsWith(line, "codePath=")) {
            addUnique(d.codePaths, line.substr(9));
        } else if (contains(line, ": granted=")) {
            const auto colon = line.find(": granted=");
            const std::string perm = line.substr(0, colon);
            if (startsWith(line.substr(colon + 10), "true")) {
                addUnique(d.grantedPermissions, perm);
            } else {
                addUnique(d.deniedPermissions, perm);
            }
        }
    }

    if (!found) {
        throw BridgeError(ErrorKind::NoSuchPackage, "package not found: " + packageName, text);
    }
    return d;
}

std::vector<std::string> parsePackagePaths(const std::string& text) {
    std::vector<std::string> paths;
    for (const auto& raw : TextUtil::splitLines(text)) {
        const std::string line = TextUtil::trim(raw);
        if (line.empty()) continue;
        if (!startsWith(line, "package:")) {
            throw ParseError(raw, "expected 'package:' path line");
        }
        paths.push_back(line.substr(8));
    }
    return paths;
}

std::int64_t parseSizeSum(const std::string& text) {
    std::int64_t total = 0;
    for (const auto& raw : TextUtil::splitLines(text)) {
        const std::string line = TextUtil::trim(raw);
        if (line.empty()) continue;
        auto v = TextUtil::parseGroupedInt(line);
        if (!v) throw ParseError(raw, "expected a byte count");
        total += *v;
    }
    return total;
}

} // namespace Parsers
