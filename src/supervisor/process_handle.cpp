#include <procd/compat/thread_stop_compat.h>
#include <procd/supervisor/child_process.h>
#include <procd/supervisor/output_broadcaster.h>
#include <procd/supervisor/output_buffer.h>
#include <procd/supervisor/process_handle.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <iterator>
#include <string>
#include <utility>

#include <signal.h>

namespace procd::supervisor {

/**
 * @brief One start→exit lifetime of a supervised process
 */
class ProcessHandle::Generation {
public:
    Generation(uint64_t number, ProcessId id, const SupervisorConfig& config,
               OutputBroadcaster& broadcaster);
    ~Generation();

    Generation(const Generation&) = delete;
    Generation& operator=(const Generation&) = delete;

    Result<void> launch(const ProcessRecord& record);
    Result<void> stop(std::chrono::milliseconds grace);
    Result<void> sendInput(std::span<const std::byte> data);

    ProcessStatus status() const;
    const OutputBuffer& buffer(OutputStream stream) const {
        return stream == OutputStream::Stdout ? stdout_ : stderr_;
    }
    // True until the OS process has been waited for
    bool hasLiveChild() const;

private:
    void pump(compat::stop_token st, OutputStream stream);
    void emit(OutputStream stream, std::string data);
    void reap();
    bool waitUntilReaped(std::chrono::milliseconds timeout);
    OutputBuffer& writableBuffer(OutputStream stream) {
        return stream == OutputStream::Stdout ? stdout_ : stderr_;
    }

    const uint64_t number_;
    const ProcessId id_;
    const SupervisorConfig config_;
    OutputBroadcaster& broadcaster_;

    OutputBuffer stdout_;
    OutputBuffer stderr_;
    std::unique_ptr<ChildProcess> child_;

    mutable std::mutex mutex_;
    std::condition_variable reapedCv_;
    ProcessStatus status_;
    bool stopRequested_{false};
    bool reaped_{false};
    std::atomic<int> openStreams_{2};

    // Declared last: joined before anything they touch is destroyed
    compat::jthread stdoutPump_;
    compat::jthread stderrPump_;
};

ProcessHandle::Generation::Generation(uint64_t number, ProcessId id,
                                      const SupervisorConfig& config,
                                      OutputBroadcaster& broadcaster)
    : number_(number), id_(std::move(id)), config_(config), broadcaster_(broadcaster),
      stdout_(OutputStream::Stdout, number, config.maxBufferBytesPerStream),
      stderr_(OutputStream::Stderr, number, config.maxBufferBytesPerStream) {
    status_.state = ProcessState::Pending;
    status_.generation = number;
    status_.startedAt = std::chrono::system_clock::now();
}

ProcessHandle::Generation::~Generation() {
    stdoutPump_.request_stop();
    stderrPump_.request_stop();

    if (child_ && !child_->reaped()) {
        spdlog::debug("ProcessHandle[{}]: generation {} torn down while alive, killing", id_,
                      number_);
        if (auto r = child_->signal(SIGKILL); !r) {
            spdlog::warn("ProcessHandle[{}]: {}", id_, r.error().message);
        }
    }

    if (stdoutPump_.joinable())
        stdoutPump_.join();
    if (stderrPump_.joinable())
        stderrPump_.join();

    child_.reset();
}

Result<void> ProcessHandle::Generation::launch(const ProcessRecord& record) {
    try {
        child_ = std::make_unique<ChildProcess>(record);
    } catch (const std::exception& e) {
        spdlog::error("ProcessHandle[{}]: spawn failed: {}", id_, e.what());
        {
            std::lock_guard lock(mutex_);
            status_.state = ProcessState::Failed;
            status_.reason = e.what();
            status_.endedAt = std::chrono::system_clock::now();
            reaped_ = true;
        }
        reapedCv_.notify_all();
        return Error{ErrorCode::SpawnFailed, e.what()};
    }

    {
        std::lock_guard lock(mutex_);
        status_.state = ProcessState::Running;
        status_.pid = child_->pid();
    }

    try {
        stdoutPump_ = compat::jthread{
            [this](compat::stop_token st) { pump(std::move(st), OutputStream::Stdout); }};
        stderrPump_ = compat::jthread{
            [this](compat::stop_token st) { pump(std::move(st), OutputStream::Stderr); }};
    } catch (const std::exception& e) {
        spdlog::error("ProcessHandle[{}]: failed to start output pumps: {}", id_, e.what());
        std::string reason = std::string("output pump: ") + e.what();
        {
            std::lock_guard lock(mutex_);
            status_.state = ProcessState::Failed;
            status_.reason = reason;
        }
        if (auto r = child_->signal(SIGKILL); !r) {
            spdlog::warn("ProcessHandle[{}]: {}", id_, r.error().message);
        }
        // No pump will reap this child
        reap();
        return Error{ErrorCode::InternalError, std::move(reason)};
    }

    spdlog::info("ProcessHandle[{}]: generation {} running (pid={})", id_, number_,
                 child_->pid());
    return {};
}

void ProcessHandle::Generation::pump(compat::stop_token st, OutputStream stream) {
    std::array<char, 4096> buf;
    std::string pending;
    const std::size_t maxLine = config_.maxLineBytes;

    while (!st.stop_requested()) {
        auto r = child_->readOutput(stream, buf, config_.pumpPollInterval);
        if (!r) {
            spdlog::warn("ProcessHandle[{}]: {} pump stopped: {}", id_, toString(stream),
                         r.error().message);
            break;
        }
        const PipeRead& got = r.value();
        if (got.eof)
            break;
        if (got.bytes == 0)
            continue;

        pending.append(buf.data(), got.bytes);

        std::size_t begin = 0;
        for (auto nl = pending.find('\n'); nl != std::string::npos;
             nl = pending.find('\n', begin)) {
            emit(stream, pending.substr(begin, nl - begin + 1));
            begin = nl + 1;
        }
        pending.erase(0, begin);

        while (maxLine > 0 && pending.size() >= maxLine) {
            emit(stream, pending.substr(0, maxLine));
            pending.erase(0, maxLine);
        }
    }

    if (!pending.empty()) {
        emit(stream, std::move(pending));
    }
    child_->closeOutput(stream);
    spdlog::trace("ProcessHandle[{}]: {} closed", id_, toString(stream));

    if (openStreams_.fetch_sub(1, std::memory_order_acq_rel) == 1 && !st.stop_requested()) {
        reap();
    }
}

void ProcessHandle::Generation::emit(OutputStream stream, std::string data) {
    auto stored = writableBuffer(stream).append(std::move(data));
    broadcaster_.publish(id_, stored);
}

void ProcessHandle::Generation::reap() {
    auto exit = child_->waitForExit();
    {
        std::lock_guard lock(mutex_);
        reaped_ = true;
        if (!status_.endedAt)
            status_.endedAt = std::chrono::system_clock::now();

        if (!exit) {
            if (isLive(status_.state)) {
                status_.state = ProcessState::Failed;
                status_.reason = exit.error().message;
            }
        } else {
            status_.exitCode = exit.value();
            if (status_.state == ProcessState::Running) {
                status_.state = stopRequested_ ? ProcessState::Stopped : ProcessState::Exited;
            }
        }
    }
    reapedCv_.notify_all();

    if (exit) {
        spdlog::info("ProcessHandle[{}]: generation {} exited with code {}", id_, number_,
                     exit.value());
    } else {
        spdlog::error("ProcessHandle[{}]: {}", id_, exit.error().message);
    }
}

bool ProcessHandle::Generation::waitUntilReaped(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return reapedCv_.wait_for(lock, timeout, [this] { return reaped_; });
}

bool ProcessHandle::Generation::hasLiveChild() const {
    std::lock_guard lock(mutex_);
    return status_.pid.has_value() && !reaped_;
}

// Acts on any generation whose child is still unreaped, including one that went Failed after a
// broken stdin pipe. A Failed generation keeps its state and reason.
Result<void> ProcessHandle::Generation::stop(std::chrono::milliseconds grace) {
    {
        std::lock_guard lock(mutex_);
        if (!status_.pid || reaped_) {
            return {};
        }
        stopRequested_ = true;
    }

    spdlog::info("ProcessHandle[{}]: stopping pid {} (grace {}ms)", id_, child_->pid(),
                 grace.count());

    if (auto r = child_->signal(SIGTERM); !r) {
        std::lock_guard lock(mutex_);
        stopRequested_ = false;
        return r.error();
    }
    child_->closeStdin();

    if (!waitUntilReaped(grace)) {
        spdlog::warn("ProcessHandle[{}]: pid {} ignored SIGTERM for {}ms, sending SIGKILL", id_,
                     child_->pid(), grace.count());
        if (auto r = child_->signal(SIGKILL); !r) {
            std::lock_guard lock(mutex_);
            stopRequested_ = false;
            return r.error();
        }
        if (!waitUntilReaped(config_.killWait)) {
            spdlog::warn("ProcessHandle[{}]: exit of pid {} not observed {}ms after SIGKILL",
                         id_, child_->pid(), config_.killWait.count());
        }
    }

    std::lock_guard lock(mutex_);
    if (status_.state == ProcessState::Running)
        status_.state = ProcessState::Stopped;
    if (!status_.endedAt)
        status_.endedAt = std::chrono::system_clock::now();
    return {};
}

Result<void> ProcessHandle::Generation::sendInput(std::span<const std::byte> data) {
    {
        std::lock_guard lock(mutex_);
        if (status_.state != ProcessState::Running) {
            return Error{ErrorCode::NotRunning,
                         fmt::format("'{}' is {}", id_, toString(status_.state))};
        }
    }

    auto r = child_->writeStdin(data, config_.stdinWriteTimeout);
    if (!r && r.error().code == ErrorCode::IOError) {
        std::lock_guard lock(mutex_);
        if (status_.state == ProcessState::Running) {
            status_.state = ProcessState::Failed;
            status_.reason = "stdin: " + r.error().message;
        }
        spdlog::warn("ProcessHandle[{}]: stdin write failed: {}", id_, r.error().message);
    }
    return r;
}

ProcessStatus ProcessHandle::Generation::status() const {
    std::lock_guard lock(mutex_);
    ProcessStatus s = status_;
    // A Failed generation can still own a running process
    if (reaped_)
        s.pid.reset();
    if (s.state == ProcessState::Running)
        s.exitCode.reset();
    return s;
}

// ============================================================================
// ProcessHandle
// ============================================================================

ProcessHandle::ProcessHandle(ProcessRecord record, const SupervisorConfig& config,
                             OutputBroadcaster& broadcaster)
    : record_(std::move(record)), config_(config), broadcaster_(broadcaster) {}

ProcessHandle::~ProcessHandle() {
    std::shared_ptr<Generation> last;
    {
        std::lock_guard lock(currentMutex_);
        last = std::move(current_);
    }
}

std::shared_ptr<ProcessHandle::Generation> ProcessHandle::current() const {
    std::lock_guard lock(currentMutex_);
    return current_;
}

Result<void> ProcessHandle::start() {
    if (auto cur = current(); cur && isLive(cur->status().state)) {
        return Error{ErrorCode::AlreadyRunning,
                     fmt::format("'{}' is already {}", record_.id, toString(cur->status().state))};
    }

    auto next = std::make_shared<Generation>(generationCounter_ + 1, record_.id, config_,
                                             broadcaster_);
    std::shared_ptr<Generation> previous;
    {
        std::lock_guard lock(currentMutex_);
        ++generationCounter_;
        previous = std::exchange(current_, next);
    }
    // The previous generation's buffers and pumps go away here
    previous.reset();

    return next->launch(record_);
}

Result<void> ProcessHandle::stop(std::chrono::milliseconds grace) {
    auto cur = current();
    if (!cur) {
        return {};
    }
    return cur->stop(grace);
}

Result<void> ProcessHandle::restart(std::chrono::milliseconds grace) {
    if (auto r = stop(grace); !r) {
        return r;
    }
    return start();
}

Result<void> ProcessHandle::sendInput(std::span<const std::byte> data) {
    auto cur = current();
    if (!cur) {
        return Error{ErrorCode::NotRunning, fmt::format("'{}' was never started", record_.id)};
    }
    return cur->sendInput(data);
}

Result<void> ProcessHandle::sendInput(std::string_view text) {
    return sendInput(std::as_bytes(std::span{text.data(), text.size()}));
}

Result<OutputSlice> ProcessHandle::readOutput(OutputStream stream, uint64_t sinceSequence) const {
    auto cur = current();
    if (!cur) {
        return OutputSlice{};
    }
    return std::as_const(*cur).buffer(stream).read(sinceSequence);
}

std::vector<OutputChunk> ProcessHandle::tail(std::size_t n, bool includeStderr) const {
    auto cur = current();
    if (!cur || n == 0) {
        return {};
    }

    const Generation& gen = *cur;
    auto merged = gen.buffer(OutputStream::Stdout).tail(n);
    if (includeStderr) {
        auto err = gen.buffer(OutputStream::Stderr).tail(n);
        std::vector<OutputChunk> out;
        out.reserve(merged.size() + err.size());
        std::merge(std::make_move_iterator(merged.begin()), std::make_move_iterator(merged.end()),
                   std::make_move_iterator(err.begin()), std::make_move_iterator(err.end()),
                   std::back_inserter(out), [](const OutputChunk& a, const OutputChunk& b) {
                       return a.timestamp < b.timestamp;
                   });
        merged = std::move(out);
    }

    if (merged.size() > n) {
        merged.erase(merged.begin(), merged.end() - static_cast<std::ptrdiff_t>(n));
    }
    return merged;
}

ProcessStatus ProcessHandle::status() const {
    auto cur = current();
    if (!cur) {
        return ProcessStatus{};
    }
    return cur->status();
}

ProcessState ProcessHandle::state() const {
    return status().state;
}

bool ProcessHandle::hasLiveProcess() const {
    auto cur = current();
    return cur && cur->hasLiveChild();
}

std::optional<int> ProcessHandle::exitCode() const {
    return status().exitCode;
}

uint64_t ProcessHandle::generation() const {
    return status().generation;
}

} // namespace procd::supervisor
