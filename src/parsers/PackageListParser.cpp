#include "parsers/PackageListParser.h"

#include <map>
#include <unordered_set>

#include "core/Errors.h"
#include "parsers/TextUtil.h"

using TextUtil::startsWith;

namespace Parsers {

namespace {

const std::string kPrefix = "package:";

// package:/data/app/~~x==/com.foo-y==/base.apk=com.foo versionCode:42
PackageRecord parseLine(const std::string& raw, const std::string& line, PackageCategory category) {
    const std::string body = line.substr(kPrefix.size());
    const auto space = body.find_first_of(" \t");
    const std::string head = body.substr(0, space);

    PackageRecord rec;
    rec.category = category;

    // the install path may itself contain '=', the name never does
    const auto eq = head.rfind('=');
    if (eq == std::string::npos) {
        rec.name = head;
    } else {
        rec.installPath = head.substr(0, eq);
        rec.name = head.substr(eq + 1);
    }
    if (rec.name.empty()) {
        throw ParseError(raw, "package line has no package name");
    }

    if (space != std::string::npos) {
        for (const auto& tok : TextUtil::tokens(body.substr(space))) {
            if (startsWith(tok, "versionCode:")) {
                auto code = TextUtil::parseGroupedInt(tok.substr(12));
                if (!code) throw ParseError(raw, "bad versionCode");
                rec.versionCode = *code;
            }
        }
    }
    return rec;
}

} // namespace

PackageSnapshot parsePackageList(const std::string& text, PackageCategory category) {
    PackageSnapshot out;
    std::unordered_set<std::string> names;
    bool first = true;

    for (const auto& raw : TextUtil::splitLines(text)) {
        const std::string line = TextUtil::trim(raw);
        if (line.empty()) continue;
        if (!startsWith(line, kPrefix)) {
            if (first) {
                first = false;
                continue;   // banner
            }
            throw ParseError(raw, "expected 'package:' line");
        }
        first = false;
        PackageRecord rec = parseLine(raw, line, category);
        if (names.insert(rec.name).second) {
            out.push_back(std::move(rec));
        }
    }
    return out;
}

PackageSnapshotPtr mergeInventory(const std::vector<PackageSnapshot>& listings) {
    std::map<std::string, PackageRecord> byName;
    for (const auto& listing : listings) {
        for (const auto& rec : listing) {
            auto it = byName.find(rec.name);
            if (it == byName.end()) {
                byName.emplace(rec.name, rec);
                continue;
            }
            if (rec.category == PackageCategory::Disabled) {
                it->second.category = PackageCategory::Disabled;
            }
            if (it->second.installPath.empty()) it->second.installPath = rec.installPath;
            if (!it->second.versionCode) it->second.versionCode = rec.versionCode;
        }
    }

    auto snapshot = std::make_shared<PackageSnapshot>();
    snapshot->reserve(byName.size());
    for (auto& kv : byName) snapshot->push_back(std::move(kv.second));
    return snapshot;
}

} // namespace Parsers
