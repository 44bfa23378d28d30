#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

struct CommandResult {
    std::string stdoutText;
    std::string stderrText;
    int exitCode{0};
    std::chrono::milliseconds duration{0};
};

// Cooperative cancellation flag shared between the scheduler and a running command.
class CancelToken {
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Runs the diagnostic bridge. Failures are thrown as BridgeError.
class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;

    // args never pass through a shell; when deviceId is non-empty the bridge
    // is addressed with `-s <deviceId>` ahead of args.
    virtual CommandResult execute(const std::string& deviceId,
                                  const std::vector<std::string>& args,
                                  std::chrono::milliseconds timeout,
                                  const CancelToken* cancel = nullptr) = 0;
};

// fork/execvp implementation with captured stdout/stderr.
class ProcessExecutor : public CommandExecutor {
public:
    ProcessExecutor(std::string bridgePath, std::shared_ptr<spdlog::logger> log);

    CommandResult execute(const std::string& deviceId,
                          const std::vector<std::string>& args,
                          std::chrono::milliseconds timeout,
                          const CancelToken* cancel = nullptr) override;

    const std::string& bridgePath() const { return bridgePath_; }

    // Map a non-zero exit to the error kind its output indicates and throw.
    [[noreturn]] static void throwForExit(const CommandResult& result, const std::string& commandLine);

private:
    CommandResult runProcess(const std::vector<std::string>& argv,
                             std::chrono::milliseconds timeout,
                             const CancelToken* cancel);

    std::string bridgePath_;
    std::shared_ptr<spdlog::logger> log_;
};
