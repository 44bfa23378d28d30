#include "providers/AdbCommands.h"

namespace AdbCommands {

Args devices() {
    return {"devices", "-l"};
}

Args listPackages(const std::string& variantFlag) {
    return {"shell", "pm", "list", "packages", "-f", "--show-versioncode", variantFlag};
}

Args dumpsysPackage(const std::string& packageName) {
    return {"shell", "dumpsys", "package", packageName};
}

Args packagePaths(const std::string& packageName) {
    return {"shell", "pm", "path", packageName};
}

Args statSizes(const std::vector<std::string>& paths) {
    Args a{"shell", "stat", "-c", "%s"};
    a.insert(a.end(), paths.begin(), paths.end());
    return a;
}

Args meminfo(const std::string& packageName) {
    return {"shell", "dumpsys", "meminfo", packageName};
}

Args top() {
    return {"shell", "top", "-b", "-n", "1"};
}

Args logcatDump() {
    return {"logcat", "-d", "-v", "threadtime", "-b", "main", "-b", "system", "-b", "crash"};
}

Args forceStop(const std::string& packageName) {
    return {"shell", "am", "force-stop", packageName};
}

Args clearData(const std::string& packageName) {
    return {"shell", "pm", "clear", packageName};
}

Args uninstall(const std::string& packageName) {
    return {"uninstall", packageName};
}

Args tcpip(const std::string& port) {
    return {"tcpip", port};
}

Args connect(const std::string& hostPort) {
    return {"connect", hostPort};
}

Args disconnect(const std::string& hostPort) {
    return {"disconnect", hostPort};
}

std::string describe(const Args& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out.push_back(' ');
        out += a;
    }
    return out;
}

} // namespace AdbCommands
