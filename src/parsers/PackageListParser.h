#pragma once

#include <string>
#include <vector>

#include "core/DeviceModel.h"

namespace Parsers {

// Parse one `pm list packages -f --show-versioncode` listing. The category is
// the listing variant that produced the text (-3 user, -s system, -d disabled).
PackageSnapshot parsePackageList(const std::string& text, PackageCategory category);

// Merge listings into one name-ordered snapshot, unique by name. A package
// reported by the disabled listing keeps the Disabled category.
PackageSnapshotPtr mergeInventory(const std::vector<PackageSnapshot>& listings);

} // namespace Parsers
