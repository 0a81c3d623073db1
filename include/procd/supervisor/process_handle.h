#pragma once

#include <procd/core/types.h>
#include <procd/supervisor/supervisor_config.h>
#include <procd/supervisor/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace procd::supervisor {

class OutputBroadcaster;

/**
 * @brief Owner of one supervised id: its launch record and its current generation
 *
 * A generation is one start→exit lifetime: an OS child process, one OutputBuffer per stream,
 * the stdin channel, and a state machine
 * `Pending → Running → {Exited(code) | Failed(reason)}` with `Running → Stopped` on stop().
 * Each start()/restart() replaces the generation; the previous one's buffers are dropped.
 *
 * Output is drained by two pump threads per generation that run whether or not anyone reads.
 * When both streams reach EOF the child is reaped and the exit recorded; there is no other
 * exit detection.
 *
 * **Thread Safety:**
 * start()/stop()/restart() must be serialized by the caller (ProcessRegistry does this per
 * id). Every other method may be called concurrently with them and with each other.
 */
class ProcessHandle {
public:
    ProcessHandle(ProcessRecord record, const SupervisorConfig& config,
                  OutputBroadcaster& broadcaster);
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    /**
     * @brief Launch a new generation
     * @return AlreadyRunning if the current generation is Pending/Running, SpawnFailed if the
     *         command could not be started (the generation is then Failed)
     */
    Result<void> start();

    /**
     * @brief SIGTERM the process group, SIGKILL after `grace`, end in Stopped
     *
     * No-op once the OS process has been reaped. A generation that went Failed while its
     * process kept running (broken stdin pipe) is terminated the same way but stays Failed.
     * Blocks at most `grace` plus the configured kill wait.
     * @return KillFailed if a signal could not be delivered
     */
    Result<void> stop(std::chrono::milliseconds grace);

    // stop() followed by start() with the same record
    Result<void> restart(std::chrono::milliseconds grace);

    /**
     * @brief Write bytes to the process's stdin
     * @return NotRunning unless Running; IOError on a broken pipe (the generation becomes
     *         Failed); Timeout if the process does not drain its stdin
     */
    Result<void> sendInput(std::span<const std::byte> data);
    Result<void> sendInput(std::string_view text);

    [[nodiscard]] Result<OutputSlice> readOutput(OutputStream stream,
                                                 uint64_t sinceSequence) const;

    // Newest `n` chunks of the current generation across streams, ordered by timestamp
    [[nodiscard]] std::vector<OutputChunk> tail(std::size_t n, bool includeStderr) const;

    [[nodiscard]] ProcessStatus status() const;
    [[nodiscard]] ProcessState state() const;
    // The current generation's OS process exists and has not been reaped
    [[nodiscard]] bool hasLiveProcess() const;
    [[nodiscard]] std::optional<int> exitCode() const;
    [[nodiscard]] uint64_t generation() const;

    const ProcessRecord& record() const noexcept { return record_; }

private:
    class Generation;

    std::shared_ptr<Generation> current() const;

    const ProcessRecord record_;
    const SupervisorConfig config_;
    OutputBroadcaster& broadcaster_;

    mutable std::mutex currentMutex_;
    std::shared_ptr<Generation> current_;
    uint64_t generationCounter_{0};
};

} // namespace procd::supervisor
