#include "core/Logging.h"

#include <atomic>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

std::atomic<int> gDefaultLevel{static_cast<int>(spdlog::level::info)};

spdlog::sink_ptr consoleSink() {
    static spdlog::sink_ptr sink = [] {
        auto s = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        s->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        return s;
    }();
    return sink;
}

} // namespace

namespace Logging {

std::shared_ptr<spdlog::logger> makeLogger(const std::string& name) {
    auto logger = std::make_shared<spdlog::logger>(name, consoleSink());
    logger->set_level(static_cast<spdlog::level::level_enum>(gDefaultLevel.load()));
    return logger;
}

std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name) {
    auto logger = std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
    logger->set_level(spdlog::level::off);
    return logger;
}

void setDefaultLevel(const std::string& levelName) {
    // from_str maps unknown names to "off"; keep the current level instead
    const auto lvl = spdlog::level::from_str(levelName);
    if (lvl == spdlog::level::off && levelName != "off") {
        return;
    }
    gDefaultLevel = static_cast<int>(lvl);
}

} // namespace Logging
