#pragma once

#include <string>
#include <vector>

// Argument vectors for the adb invocations the fetcher makes. The bridge
// executable and the `-s <id>` selector are added by the executor.
namespace AdbCommands {

using Args = std::vector<std::string>;

Args devices();

// -3 user, -s system, -d disabled
Args listPackages(const std::string& variantFlag);

Args dumpsysPackage(const std::string& packageName);
Args packagePaths(const std::string& packageName);
Args statSizes(const std::vector<std::string>& paths);

Args meminfo(const std::string& packageName);
Args top();
Args logcatDump();

Args forceStop(const std::string& packageName);
Args clearData(const std::string& packageName);
Args uninstall(const std::string& packageName);

Args tcpip(const std::string& port);
Args connect(const std::string& hostPort);
Args disconnect(const std::string& hostPort);

// Join for log lines; never handed to a shell.
std::string describe(const Args& args);

} // namespace AdbCommands
