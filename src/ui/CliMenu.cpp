// CLI menu: a thin consumer that submits requests and prints their answers
#include "ui/CliMenu.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <iterator>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "core/Serialize.h"
#include "core/Utils.h"

using std::string;

namespace {

// Waiting for the answer is bounded by the request deadline plus command retries.
std::chrono::milliseconds answerWait(const SessionConfig& cfg) {
    return cfg.requestDeadline + cfg.commandTimeout * (cfg.retry.timeoutRetries + 1) + std::chrono::seconds(2);
}

string orDash(const std::optional<string>& v) {
    return v ? *v : string("-");
}

} // namespace

CliMenu::CliMenu(TelemetryScheduler& scheduler, std::atomic<bool>& realtimePrintFlag,
                 std::shared_ptr<spdlog::logger> log)
    : scheduler_(scheduler), realtimePrintFlag_(realtimePrintFlag), log_(std::move(log)) {
    token_ = scheduler_.subscribe([this](const TelemetryEvent& evt) {
        if (evt.handle == 0) return;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (evt.handle != waiting_ || answer_) return;
            answer_ = evt;
        }
        cv_.notify_all();
    });
}

CliMenu::~CliMenu() {
    scheduler_.unsubscribe(token_);
}

void CliMenu::printMenu(bool realtimeOn) {
    std::cout << "\n=== DeviceTelemetry 菜单 === 当前设备: " << (device_.empty() ? "<未选择>" : device_) << "\n";
    std::cout << "[1] 实时事件 " << (realtimeOn ? "开" : "关") << "（默认开）\n";
    std::cout << "[2] 当前设备列表（表格：id state transport model）\n";
    std::cout << "[3] 选择设备（输入编号或 id）\n";
    std::cout << "[4] 应用列表\n";
    std::cout << "[5] 应用详情（输入包名）\n";
    std::cout << "[6] 内存快照（输入包名）\n";
    std::cout << "[7] CPU 占用（输入包名）\n";
    std::cout << "[8] 崩溃 / ANR 扫描\n";
    std::cout << "[R] 刷新（清空当前设备缓存并重新发现设备）\n";
    std::cout << "[F] 强制停止应用\n";
    std::cout << "[J] 导出设备清单 JSON 到 ./out/devices.json\n";
    std::cout << "[V] 导出应用列表 CSV 到 ./out/packages.csv\n";
    std::cout << "[N] 连接网络设备（host:port）\n";
    std::cout << "[9] 退出\n";
}

std::optional<TelemetryEvent> CliMenu::request(TelemetryRequest req, std::chrono::milliseconds wait,
                                               bool reportTimeout) {
    // Held across submit so the answer cannot arrive before waiting_ is set
    std::unique_lock<std::mutex> lk(mtx_);
    answer_.reset();
    try {
        waiting_ = scheduler_.submit(std::move(req));
    } catch (const std::exception& ex) {
        std::cout << "请求无效: " << ex.what() << std::endl;
        return std::nullopt;
    }

    const bool answered = cv_.wait_for(lk, wait, [this] { return answer_.has_value(); });
    const RequestHandle handle = waiting_;
    waiting_ = 0;
    if (!answered) {
        scheduler_.cancel(handle);
        if (reportTimeout) std::cout << "等待结果超时" << std::endl;
        return std::nullopt;
    }
    auto evt = std::move(answer_);
    answer_.reset();
    return evt;
}

void CliMenu::printFailure(const TelemetryEvent& evt) {
    if (auto f = std::get_if<FailurePayload>(&evt.payload)) {
        fmt::print("失败 [{}]: {}\n", toString(f->error), f->message);
        if (!f->rawOutput.empty()) {
            fmt::print("原始输出:\n{}\n", f->rawOutput);
        }
    }
}

bool CliMenu::requireDevice() {
    if (!device_.empty()) return true;
    auto list = scheduler_.devices();
    std::vector<Device> connected;
    std::copy_if(list->begin(), list->end(), std::back_inserter(connected),
                 [](const Device& d) { return d.state == DeviceState::Connected; });
    if (connected.size() == 1) {
        device_ = connected.front().id;
        std::cout << "自动选择唯一在线设备: " << device_ << std::endl;
        return true;
    }
    if (connected.empty()) {
        std::cout << "当前无在线设备" << std::endl;
    } else {
        std::cout << "有多台在线设备，请先用 [3] 选择设备" << std::endl;
    }
    return false;
}

string CliMenu::askPackage() {
    std::cout << "请输入包名: ";
    string pkg;
    if (!(std::cin >> pkg)) return {};
    return pkg;
}

void CliMenu::listDevices() {
    auto list = scheduler_.devices();
    if (list->empty()) {
        std::cout << "当前无设备" << std::endl;
        return;
    }

    fmt::print("\n{:<4} {:<28} {:<13} {:<9} {:<20} {:<10}\n", "#", "id", "state", "transport", "model",
               "confirmed");
    int i = 1;
    for (const auto& d : *list) {
        const string confirmed =
            d.lastConfirmedAt.time_since_epoch().count() == 0 ? "-" : Utils::formatTimeHHMMSS(d.lastConfirmedAt);
        fmt::print("{:<4} {:<28} {:<13} {:<9} {:<20} {:<10}\n", i++, d.id, toString(d.state),
                   toString(d.transport), d.model, confirmed);
    }
}

void CliMenu::selectDevice() {
    listDevices();
    std::cout << "请输入设备编号或 id: ";
    string sel;
    if (!(std::cin >> sel)) return;

    auto list = scheduler_.devices();
    const bool isIndex = std::all_of(sel.begin(), sel.end(), ::isdigit);
    if (isIndex) {
        const size_t idx = std::stoul(sel);
        if (idx == 0 || idx > list->size()) {
            std::cout << "无效编号: " << sel << std::endl;
            return;
        }
        device_ = (*list)[idx - 1].id;
    } else {
        auto it = std::find_if(list->begin(), list->end(), [&](const Device& d) { return d.id == sel; });
        if (it == list->end()) {
            std::cout << "未找到设备: " << sel << std::endl;
            return;
        }
        device_ = sel;
    }
    std::cout << "当前设备: " << device_ << std::endl;
}

void CliMenu::listPackages() {
    if (!requireDevice()) return;
    TelemetryRequest req;
    req.deviceId = device_;
    req.kind = CommandKind::PackageInventory;
    req.priority = 5;
    auto evt = request(std::move(req), answerWait(scheduler_.config()));
    if (!evt) return;
    auto inv = std::get_if<PackageSnapshotPtr>(&evt->payload);
    if (!inv || !*inv) {
        printFailure(*evt);
        return;
    }
    lastInventory_ = *inv;

    fmt::print("\n{:<56} {:<9} {:<12}\n", "package", "category", "versionCode");
    for (const auto& p : **inv) {
        fmt::print("{:<56} {:<9} {:<12}\n", p.name, toString(p.category),
                   p.versionCode ? std::to_string(*p.versionCode) : string("-"));
    }
    fmt::print("共 {} 个应用\n", (*inv)->size());
}

void CliMenu::showPackageDetails() {
    if (!requireDevice()) return;
    TelemetryRequest req;
    req.deviceId = device_;
    req.kind = CommandKind::PackageDetails;
    req.packageName = askPackage();
    auto evt = request(std::move(req), answerWait(scheduler_.config()));
    if (!evt) return;
    auto d = std::get_if<PackageDetails>(&evt->payload);
    if (!d) {
        printFailure(*evt);
        return;
    }

    std::cout << "\n=== 应用详情 ===\n";
    fmt::print("name: {}\n", d->name);
    fmt::print("versionName: {}\n", orDash(d->versionName));
    fmt::print("versionCode: {}\n", d->versionCode ? std::to_string(*d->versionCode) : string("-"));
    fmt::print("firstInstallTime: {}\n", orDash(d->firstInstallTime));
    fmt::print("lastUpdateTime: {}\n", orDash(d->lastUpdateTime));
    for (const auto& p : d->codePaths) fmt::print("codePath: {}\n", p);
    fmt::print("size: {}\n", d->sizeBytes ? Utils::formatBytes(*d->sizeBytes) : string("-"));
    fmt::print("granted permissions: {}\n", d->grantedPermissions.size());
    for (const auto& p : d->grantedPermissions) fmt::print("  + {}\n", p);
    for (const auto& p : d->deniedPermissions) fmt::print("  - {}\n", p);
}

void CliMenu::memorySnapshot() {
    if (!requireDevice()) return;
    TelemetryRequest req;
    req.deviceId = device_;
    req.kind = CommandKind::MemorySnapshot;
    req.packageName = askPackage();
    req.priority = 5;
    auto evt = request(std::move(req), answerWait(scheduler_.config()));
    if (!evt) return;
    auto m = std::get_if<MemorySnapshot>(&evt->payload);
    if (!m) {
        printFailure(*evt);
        return;
    }

    auto kb = [](const std::optional<std::int64_t>& v) { return v ? Utils::formatKb(*v) : string("-"); };
    std::cout << "\n=== 内存快照 " << m->packageName << " @ " << Utils::formatTimeHHMMSS(m->capturedAt) << " ===\n";
    fmt::print("{:<14} {}\n", "TOTAL PSS", Utils::formatKb(m->pssTotalKb));
    fmt::print("{:<14} {}\n", "Java Heap", kb(m->javaHeapKb));
    fmt::print("{:<14} {}\n", "Native Heap", kb(m->nativeHeapKb));
    fmt::print("{:<14} {}\n", "Graphics", kb(m->graphicsKb));
    fmt::print("{:<14} {}\n", "Code", kb(m->codeKb));
    fmt::print("{:<14} {}\n", "Stack", kb(m->stackKb));
}

void CliMenu::cpuSample() {
    if (!requireDevice()) return;
    TelemetryRequest req;
    req.deviceId = device_;
    req.kind = CommandKind::CpuSample;
    req.packageName = askPackage();
    req.priority = 5;
    auto evt = request(std::move(req), answerWait(scheduler_.config()));
    if (!evt) return;
    auto c = std::get_if<CpuSample>(&evt->payload);
    if (!c) {
        printFailure(*evt);
        return;
    }
    if (!c->cpuPercent) {
        fmt::print("{} 未在运行\n", c->packageName);
        return;
    }
    fmt::print("{} CPU {:.1f}% ({} 个进程)\n", c->packageName, *c->cpuPercent, c->processCount);
}

void CliMenu::crashScan() {
    if (!requireDevice()) return;
    TelemetryRequest req;
    req.deviceId = device_;
    req.kind = CommandKind::CrashScan;
    // no answer means the scan found nothing new
    const auto& cfg = scheduler_.config();
    auto evt = request(std::move(req), cfg.commandTimeout + std::chrono::seconds(2), false);
    if (!evt) {
        std::cout << "未发现新的崩溃或 ANR" << std::endl;
        return;
    }
    if (auto crash = std::get_if<CrashEvent>(&evt->payload)) {
        // further events of the same scan are printed by the realtime printer
        fmt::print("[{}] {:<12} {} {}\n", Utils::formatTimeHHMMSS(crash->occurredAt), toString(crash->kind),
                   crash->packageName.empty() ? "<unknown>" : crash->packageName, crash->signature);
        return;
    }
    printFailure(*evt);
}

void CliMenu::refresh() {
    if (!device_.empty()) scheduler_.invalidate(device_);
    scheduler_.invalidate(string()); // cached discovery
    try {
        scheduler_.submit(string(), CommandKind::DeviceDiscovery, 10);
        std::cout << "已提交刷新，设备变化会实时显示" << std::endl;
    } catch (const std::exception& ex) {
        std::cout << "刷新失败: " << ex.what() << std::endl;
    }
}

void CliMenu::forceStop() {
    if (!requireDevice()) return;
    TelemetryRequest req;
    req.deviceId = device_;
    req.kind = CommandKind::ForceStop;
    req.packageName = askPackage();
    req.priority = 8;
    auto evt = request(std::move(req), answerWait(scheduler_.config()));
    if (!evt) return;
    if (auto a = std::get_if<ActionOutcome>(&evt->payload)) {
        fmt::print("已强制停止 {}\n", a->target);
        return;
    }
    printFailure(*evt);
}

void CliMenu::exportJson() {
    auto list = scheduler_.devices();
    const std::string path = "./out/devices.json";
    if (Serialize::writeDevicesJson(path, *list, *log_)) {
        std::cout << "已导出 JSON: " << path << std::endl;
    } else {
        std::cout << "导出 JSON 失败: " << path << std::endl;
    }
}

void CliMenu::exportCsv() {
    if (!lastInventory_) {
        std::cout << "请先用 [4] 获取应用列表" << std::endl;
        return;
    }
    const std::string path = "./out/packages.csv";
    if (Serialize::writePackagesCsv(path, *lastInventory_, *log_)) {
        std::cout << "已导出 CSV: " << path << std::endl;
    } else {
        std::cout << "导出 CSV 失败: " << path << std::endl;
    }
}

void CliMenu::connectNetwork() {
    std::cout << "请输入 host:port（如 192.168.1.20:5555）: ";
    string target;
    if (!(std::cin >> target)) return;
    TelemetryRequest req;
    req.kind = CommandKind::ConnectNetwork;
    req.target = target;
    req.priority = 8;
    auto evt = request(std::move(req), answerWait(scheduler_.config()));
    if (!evt) return;
    if (auto a = std::get_if<ActionOutcome>(&evt->payload)) {
        fmt::print("{}\n", a->message);
        return;
    }
    printFailure(*evt);
}

int CliMenu::run() {
    printMenu(realtimePrintFlag_);
    std::string cmd;
    while (true) {
        std::cout << "> ";
        if (!(std::cin >> cmd)) break;
        if (cmd == "9" || cmd == "q" || cmd == "Q") {
            break;
        }
        if (cmd == "1") {
            realtimePrintFlag_ = !realtimePrintFlag_;
            std::cout << "实时事件已" << (realtimePrintFlag_ ? "开启" : "关闭") << std::endl;
        } else if (cmd == "2") {
            listDevices();
        } else if (cmd == "3") {
            selectDevice();
        } else if (cmd == "4") {
            listPackages();
        } else if (cmd == "5") {
            showPackageDetails();
        } else if (cmd == "6") {
            memorySnapshot();
        } else if (cmd == "7") {
            cpuSample();
        } else if (cmd == "8") {
            crashScan();
        } else if (cmd == "R" || cmd == "r") {
            refresh();
        } else if (cmd == "F" || cmd == "f") {
            forceStop();
        } else if (cmd == "J" || cmd == "j") {
            exportJson();
        } else if (cmd == "V" || cmd == "v") {
            exportCsv();
        } else if (cmd == "N" || cmd == "n") {
            connectNetwork();
        } else {
            std::cout << "无效选项: " << cmd << std::endl;
        }
        printMenu(realtimePrintFlag_);
    }
    return 0;
}
