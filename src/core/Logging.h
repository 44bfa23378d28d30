#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace Logging {

// Create a named logger writing to the shared colored console sink.
// Loggers are handed to components explicitly; nothing is registered globally.
std::shared_ptr<spdlog::logger> makeLogger(const std::string& name);

// Logger that discards everything (tests, quiet embedding).
std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name);

// Level applied to loggers created afterwards. Accepts spdlog level names.
void setDefaultLevel(const std::string& levelName);

} // namespace Logging
