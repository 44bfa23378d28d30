#include "core/CommandExecutor.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "core/Errors.h"

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds kPollSlice(10);

// Owns one file descriptor.
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { reset(); }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_{-1};
};

void makePipe(Fd& readEnd, Fd& writeEnd) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        throw BridgeError(ErrorKind::ProcessError, std::string("pipe2 failed: ") + std::strerror(errno));
    }
    readEnd.reset(fds[0]);
    writeEnd.reset(fds[1]);
}

void setNonBlocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags != -1) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Read whatever is available; closes the descriptor on EOF or error.
void drain(Fd& fd, std::string& out) {
    char buf[4096];
    for (;;) {
        const ssize_t n = ::read(fd.get(), buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<std::size_t>(n));
            continue;
        }
        if (n == -1 && errno == EINTR) continue;
        if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        fd.reset();
        return;
    }
}

void killAndReap(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

std::string joinForLog(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out.push_back(' ');
        const bool quote = a.empty() || a.find_first_of(" \t|&;<>'\"") != std::string::npos;
        if (quote) out.push_back('\'');
        out += a;
        if (quote) out.push_back('\'');
    }
    return out;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string firstNonEmptyLine(const std::string& text) {
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t nl = text.find('\n', pos);
        std::string line = text.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) return line;
        if (nl == std::string::npos) break;
        pos = nl + 1;
    }
    return {};
}

} // namespace

ProcessExecutor::ProcessExecutor(std::string bridgePath, std::shared_ptr<spdlog::logger> log)
    : bridgePath_(std::move(bridgePath)), log_(std::move(log)) {}

CommandResult ProcessExecutor::execute(const std::string& deviceId,
                                       const std::vector<std::string>& args,
                                       std::chrono::milliseconds timeout,
                                       const CancelToken* cancel) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 3);
    argv.push_back(bridgePath_);
    if (!deviceId.empty()) {
        argv.push_back("-s");
        argv.push_back(deviceId);
    }
    argv.insert(argv.end(), args.begin(), args.end());

    const std::string commandLine = joinForLog(argv);
    log_->debug("exec: {} (timeout {}ms)", commandLine, timeout.count());

    CommandResult result = runProcess(argv, timeout, cancel);
    log_->debug("exit={} duration={}ms stdout={}B stderr={}B: {}", result.exitCode, result.duration.count(),
                result.stdoutText.size(), result.stderrText.size(), commandLine);

    if (result.exitCode != 0) {
        throwForExit(result, commandLine);
    }
    return result;
}

void ProcessExecutor::throwForExit(const CommandResult& result, const std::string& commandLine) {
    const std::string raw = result.stderrText.empty() ? result.stdoutText : result.stderrText + result.stdoutText;
    const std::string text = lower(raw);
    std::string detail = firstNonEmptyLine(result.stderrText);
    if (detail.empty()) detail = firstNonEmptyLine(result.stdoutText);

    if (text.find("unauthorized") != std::string::npos) {
        throw BridgeError(ErrorKind::Unauthorized, "device unauthorized: " + detail, raw);
    }
    if (text.find("device offline") != std::string::npos ||
        text.find("no devices/emulators found") != std::string::npos ||
        (text.find("device '") != std::string::npos && text.find("not found") != std::string::npos) ||
        text.find("device not found") != std::string::npos ||
        text.find("error: closed") != std::string::npos) {
        throw BridgeError(ErrorKind::DeviceOffline, "device offline: " + detail, raw);
    }
    if (text.find("unknown package") != std::string::npos ||
        text.find("not installed") != std::string::npos ||
        text.find("no process found") != std::string::npos) {
        throw BridgeError(ErrorKind::NoSuchPackage, "no such package: " + detail, raw);
    }
    throw BridgeError(ErrorKind::ProcessError,
                      "command exited with code " + std::to_string(result.exitCode) + ": " + commandLine +
                          (detail.empty() ? std::string() : " (" + detail + ")"),
                      raw);
}

CommandResult ProcessExecutor::runProcess(const std::vector<std::string>& argv,
                                          std::chrono::milliseconds timeout,
                                          const CancelToken* cancel) {
    const auto start = Clock::now();
    const auto deadline = start + timeout;

    Fd outRead, outWrite, errRead, errWrite, execRead, execWrite;
    makePipe(outRead, outWrite);
    makePipe(errRead, errWrite);
    makePipe(execRead, execWrite);

    // Built before fork; the child must not allocate.
    std::vector<char*> cArgs;
    cArgs.reserve(argv.size() + 1);
    for (const auto& a : argv) cArgs.push_back(const_cast<char*>(a.c_str()));
    cArgs.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid == -1) {
        throw BridgeError(ErrorKind::ProcessError, std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        const int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) ::dup2(devNull, STDIN_FILENO);
        ::dup2(outWrite.get(), STDOUT_FILENO);
        ::dup2(errWrite.get(), STDERR_FILENO);
        ::execvp(cArgs[0], cArgs.data());
        const int err = errno;
        ssize_t ignored = ::write(execWrite.get(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    outWrite.reset();
    errWrite.reset();
    execWrite.reset();

    // Closed by a successful exec; carries errno otherwise.
    int execErr = 0;
    ssize_t n;
    do {
        n = ::read(execRead.get(), &execErr, sizeof(execErr));
    } while (n == -1 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(execErr))) {
        killAndReap(pid);
        if (execErr == ENOENT || execErr == EACCES || execErr == ENOTDIR) {
            throw BridgeError(ErrorKind::ExecutableNotFound,
                              "cannot execute '" + argv.front() + "': " + std::strerror(execErr));
        }
        throw BridgeError(ErrorKind::ProcessError,
                          "exec of '" + argv.front() + "' failed: " + std::strerror(execErr));
    }

    setNonBlocking(outRead.get());
    setNonBlocking(errRead.get());

    CommandResult result;
    bool exited = false;
    int status = 0;

    while (true) {
        if (cancel && cancel->isCancelled()) {
            killAndReap(pid);
            log_->debug("cancelled pid {}: {}", pid, argv.front());
            throw BridgeError(ErrorKind::Cancelled, "command cancelled");
        }
        // Reap first: a child that exited before the deadline is not a timeout.
        if (!exited) {
            const pid_t w = ::waitpid(pid, &status, WNOHANG);
            if (w == pid) exited = true;
        }
        if (exited) {
            // A daemon spawned by the bridge may keep the pipes open after
            // the child itself has exited; take what is buffered and stop.
            if (outRead.valid()) drain(outRead, result.stdoutText);
            if (errRead.valid()) drain(errRead, result.stderrText);
            outRead.reset();
            errRead.reset();
            break;
        }

        const auto now = Clock::now();
        if (now >= deadline) {
            killAndReap(pid);
            log_->warn("timeout after {}ms, killed pid {}", timeout.count(), pid);
            throw BridgeError(ErrorKind::Timeout,
                              "command timed out after " + std::to_string(timeout.count()) + "ms",
                              result.stderrText);
        }

        if (!outRead.valid() && !errRead.valid()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            continue;
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (outRead.valid()) fds[count++] = pollfd{outRead.get(), POLLIN, 0};
        if (errRead.valid()) fds[count++] = pollfd{errRead.get(), POLLIN, 0};

        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        wait = std::min(wait, kPollSlice);
        const int rc = ::poll(fds, count, static_cast<int>(std::max<long long>(wait.count(), 1)));
        if (rc == -1 && errno != EINTR) {
            killAndReap(pid);
            throw BridgeError(ErrorKind::ProcessError, std::string("poll failed: ") + std::strerror(errno));
        }

        if (outRead.valid()) drain(outRead, result.stdoutText);
        if (errRead.valid()) drain(errRead, result.stderrText);
    }

    result.exitCode = decodeStatus(status);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    return result;
}
