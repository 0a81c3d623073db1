#include <procd/supervisor/child_process.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace procd::supervisor {

namespace {

std::string errnoMessage(int err) {
    return std::system_category().message(err);
}

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Owns a set of descriptors until they are handed over, so a failed spawn leaks nothing
struct FdSet {
    std::vector<int*> fds;
    ~FdSet() {
        for (int* fd : fds)
            closeFd(*fd);
    }
};

void makePipe(int (&fds)[2]) {
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        throw std::runtime_error("Failed to create pipe: " + errnoMessage(errno));
    }
}

void setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw std::runtime_error("Failed to set O_NONBLOCK: " + errnoMessage(errno));
    }
}

// Written by the child to the exec-status pipe when it cannot run the command
struct ExecFailure {
    int stage;
    int error;
};

constexpr int kStageRedirect = 1;
constexpr int kStageChdir = 2;
constexpr int kStageExec = 3;

const char* stageName(int stage) {
    switch (stage) {
        case kStageRedirect: return "redirect stdio";
        case kStageChdir: return "chdir";
        case kStageExec: return "exec";
    }
    return "spawn";
}

// Async-signal-safe: used between fork() and exec()
int redirect(int fd, int target) {
    if (fd == target) {
        return ::fcntl(fd, F_SETFD, 0);
    }
    return ::dup2(fd, target);
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

std::once_flag sigpipeOnce;

} // namespace

class ChildProcess::Impl {
public:
    explicit Impl(const ProcessRecord& record);
    ~Impl();

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    int64_t pid() const noexcept { return pid_; }
    Result<PipeRead> readOutput(OutputStream stream, std::span<char> buffer,
                                std::chrono::milliseconds timeout);
    void closeOutput(OutputStream stream) noexcept { closeFd(outputFd(stream)); }
    Result<void> writeStdin(std::span<const std::byte> data, std::chrono::milliseconds timeout);
    void closeStdin() noexcept;
    Result<void> signal(int signo);
    Result<int> waitForExit();
    bool reaped() const noexcept;
    std::optional<int> exitCode() const noexcept;

private:
    void spawn(const ProcessRecord& record);
    int& outputFd(OutputStream stream) noexcept {
        return stream == OutputStream::Stdout ? stdoutFd_ : stderrFd_;
    }

    pid_t pid_{-1};
    int stdinFd_{-1};
    int stdoutFd_{-1};
    int stderrFd_{-1};

    std::mutex stdinMutex_;
    mutable std::mutex reapMutex_;
    bool reaped_{false};
    std::optional<int> exitCode_;
};

ChildProcess::Impl::Impl(const ProcessRecord& record) {
    if (record.command.empty() || record.command.front().empty()) {
        throw std::runtime_error("Empty command");
    }

    // A child that closes its stdin must not kill the supervisor on the next write
    std::call_once(sigpipeOnce, [] {
        ::signal(SIGPIPE, SIG_IGN);
        spdlog::debug("ChildProcess: SIGPIPE ignored for the supervisor");
    });

    spawn(record);
}

void ChildProcess::Impl::spawn(const ProcessRecord& record) {
    // Everything the child needs is built before fork(); only async-signal-safe calls follow it
    std::vector<char*> argv;
    argv.reserve(record.command.size() + 1);
    for (const auto& arg : record.command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string_view kv{*entry};
        auto eq = kv.find('=');
        if (eq == std::string_view::npos)
            continue;
        merged.emplace(std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
    }
    for (const auto& [key, value] : record.env) {
        merged[key] = value;
    }
    std::vector<std::string> envStrings;
    envStrings.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        envStrings.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(envStrings.size() + 1);
    for (auto& kv : envStrings) {
        envp.push_back(kv.data());
    }
    envp.push_back(nullptr);

    std::string cwd = record.workingDirectory ? record.workingDirectory->string() : std::string{};

    int in[2]{-1, -1}, out[2]{-1, -1}, err[2]{-1, -1}, status[2]{-1, -1};
    FdSet guard{{&in[0], &in[1], &out[0], &out[1], &err[0], &err[1], &status[0], &status[1]}};
    makePipe(in);
    makePipe(out);
    makePipe(err);
    makePipe(status);
    setNonBlocking(in[1]);
    setNonBlocking(out[0]);
    setNonBlocking(err[0]);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error("fork() failed: " + errnoMessage(errno));
    }

    if (pid == 0) {
        // Child process
        ::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        auto fail = [&](int stage) {
            ExecFailure failure{stage, errno};
            [[maybe_unused]] auto n = ::write(status[1], &failure, sizeof failure);
            ::_exit(127);
        };

        if (redirect(in[0], STDIN_FILENO) < 0 || redirect(out[1], STDOUT_FILENO) < 0 ||
            redirect(err[1], STDERR_FILENO) < 0) {
            fail(kStageRedirect);
        }
        if (!cwd.empty() && ::chdir(cwd.c_str()) < 0) {
            fail(kStageChdir);
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        fail(kStageExec);
    }

    // Parent process
    pid_ = pid;
    if (::setpgid(pid, pid) < 0 && errno != EACCES) {
        // EACCES: the child already exec'd after doing it itself
        spdlog::debug("ChildProcess: setpgid({}) failed: {}", pid, errnoMessage(errno));
    }

    closeFd(in[0]);
    closeFd(out[1]);
    closeFd(err[1]);
    closeFd(status[1]);

    ExecFailure failure{};
    ssize_t n;
    do {
        n = ::read(status[0], &failure, sizeof failure);
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof failure)) {
        int wstatus = 0;
        pid_t r;
        do {
            r = ::waitpid(pid, &wstatus, 0);
        } while (r < 0 && errno == EINTR);
        reaped_ = true;
        if (r == pid)
            exitCode_ = decodeWaitStatus(wstatus);
        throw std::runtime_error(fmt::format("{} '{}' failed: {}", stageName(failure.stage),
                                             failure.stage == kStageChdir ? cwd
                                                                          : record.command.front(),
                                             errnoMessage(failure.error)));
    }

    stdinFd_ = std::exchange(in[1], -1);
    stdoutFd_ = std::exchange(out[0], -1);
    stderrFd_ = std::exchange(err[0], -1);

    spdlog::info("ChildProcess: spawned '{}' (pid={})", record.command.front(), pid_);
}

ChildProcess::Impl::~Impl() {
    closeStdin();
    if (!reaped()) {
        spdlog::debug("ChildProcess: pid {} still running at teardown, killing group", pid_);
        if (auto r = signal(SIGKILL); !r) {
            spdlog::warn("ChildProcess: {}", r.error().message);
        }
        if (auto w = waitForExit(); !w) {
            spdlog::warn("ChildProcess: failed to reap pid {}: {}", pid_, w.error().message);
        }
    }
    closeFd(stdoutFd_);
    closeFd(stderrFd_);
}

Result<PipeRead> ChildProcess::Impl::readOutput(OutputStream stream, std::span<char> buffer,
                                                std::chrono::milliseconds timeout) {
    int fd = outputFd(stream);
    if (fd < 0) {
        return PipeRead{0, true};
    }

    pollfd pfd{fd, POLLIN, 0};
    int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc < 0) {
        if (errno == EINTR)
            return PipeRead{};
        return Error{ErrorCode::IOError, "poll() failed on " + std::string(toString(stream)) +
                                             ": " + errnoMessage(errno)};
    }
    if (rc == 0) {
        return PipeRead{};
    }

    ssize_t n = ::read(fd, buffer.data(), buffer.size());
    if (n > 0) {
        return PipeRead{static_cast<std::size_t>(n), false};
    }
    if (n == 0) {
        return PipeRead{0, true};
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        return PipeRead{};
    }
    return Error{ErrorCode::IOError, "read() failed on " + std::string(toString(stream)) + ": " +
                                         errnoMessage(errno)};
}

Result<void> ChildProcess::Impl::writeStdin(std::span<const std::byte> data,
                                            std::chrono::milliseconds timeout) {
    std::lock_guard lock{stdinMutex_};

    if (stdinFd_ < 0) {
        return Error{ErrorCode::NotRunning, "stdin is closed"};
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto* p = reinterpret_cast<const char*>(data.data());
    std::size_t left = data.size();

    while (left > 0) {
        ssize_t n = ::write(stdinFd_, p, left);
        if (n > 0) {
            p += n;
            left -= static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return Error{ErrorCode::Timeout,
                             fmt::format("stdin accepted {} of {} bytes before timing out",
                                         data.size() - left, data.size())};
            }
            pollfd pfd{stdinFd_, POLLOUT, 0};
            if (::poll(&pfd, 1, static_cast<int>(remaining.count())) < 0 && errno != EINTR) {
                return Error{ErrorCode::IOError, "poll() failed on stdin: " + errnoMessage(errno)};
            }
            continue;
        }

        int err = errno;
        if (err == EPIPE) {
            spdlog::warn("ChildProcess: broken pipe writing to pid {} stdin", pid_);
            closeFd(stdinFd_);
            return Error{ErrorCode::IOError, "Broken pipe: process closed its stdin"};
        }
        return Error{ErrorCode::IOError, "write() to stdin failed: " + errnoMessage(err)};
    }
    return {};
}

void ChildProcess::Impl::closeStdin() noexcept {
    std::lock_guard lock{stdinMutex_};
    closeFd(stdinFd_);
}

Result<void> ChildProcess::Impl::signal(int signo) {
    std::lock_guard lock{reapMutex_};
    if (reaped_ || pid_ <= 0) {
        return {};
    }

    if (::kill(-pid_, signo) == 0) {
        return {};
    }
    int err = errno;
    if (err == ESRCH) {
        // Group not formed yet; address the child directly
        if (::kill(pid_, signo) == 0 || errno == ESRCH) {
            return {};
        }
        err = errno;
    }
    return Error{ErrorCode::KillFailed, fmt::format("kill(pid={}, signal={}) failed: {}", pid_,
                                                    signo, errnoMessage(err))};
}

Result<int> ChildProcess::Impl::waitForExit() {
    {
        std::lock_guard lock{reapMutex_};
        if (reaped_) {
            return exitCode_.value_or(-1);
        }
    }

    // Wait without reaping so the pid cannot be recycled while signal() may still target it
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) < 0) {
        if (errno == EINTR)
            continue;
        int err = errno;
        std::lock_guard lock{reapMutex_};
        if (reaped_) {
            return exitCode_.value_or(-1);
        }
        return Error{ErrorCode::InternalError,
                     fmt::format("waitid(pid={}) failed: {}", pid_, errnoMessage(err))};
    }

    std::lock_guard lock{reapMutex_};
    if (reaped_) {
        return exitCode_.value_or(-1);
    }

    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r < 0) {
        return Error{ErrorCode::InternalError,
                     fmt::format("waitpid(pid={}) failed: {}", pid_, errnoMessage(errno))};
    }

    reaped_ = true;
    exitCode_ = decodeWaitStatus(status);
    spdlog::debug("ChildProcess: reaped pid {} (exit code {})", pid_, *exitCode_);
    return *exitCode_;
}

bool ChildProcess::Impl::reaped() const noexcept {
    std::lock_guard lock{reapMutex_};
    return reaped_;
}

std::optional<int> ChildProcess::Impl::exitCode() const noexcept {
    std::lock_guard lock{reapMutex_};
    return exitCode_;
}

// ============================================================================
// ChildProcess Public Interface (forwards to Impl)
// ============================================================================

ChildProcess::ChildProcess(const ProcessRecord& record)
    : impl_{std::make_unique<Impl>(record)} {}

ChildProcess::~ChildProcess() = default;

int64_t ChildProcess::pid() const noexcept {
    return impl_->pid();
}

Result<PipeRead> ChildProcess::readOutput(OutputStream stream, std::span<char> buffer,
                                          std::chrono::milliseconds timeout) {
    return impl_->readOutput(stream, buffer, timeout);
}

void ChildProcess::closeOutput(OutputStream stream) noexcept {
    impl_->closeOutput(stream);
}

Result<void> ChildProcess::writeStdin(std::span<const std::byte> data,
                                      std::chrono::milliseconds timeout) {
    return impl_->writeStdin(data, timeout);
}

void ChildProcess::closeStdin() noexcept {
    impl_->closeStdin();
}

Result<void> ChildProcess::signal(int signo) {
    return impl_->signal(signo);
}

Result<int> ChildProcess::waitForExit() {
    return impl_->waitForExit();
}

bool ChildProcess::reaped() const noexcept {
    return impl_->reaped();
}

std::optional<int> ChildProcess::exitCode() const noexcept {
    return impl_->exitCode();
}

} // namespace procd::supervisor
