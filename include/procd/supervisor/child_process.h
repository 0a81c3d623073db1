#pragma once

#include <procd/core/types.h>
#include <procd/supervisor/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>

namespace procd::supervisor {

/**
 * @brief Outcome of one bounded read from a child's output pipe
 */
struct PipeRead {
    std::size_t bytes{0}; ///< 0 with eof == false means the wait timed out
    bool eof{false};
};

/**
 * @brief RAII owner of one spawned OS process and its three pipes
 *
 * The child is started in its own process group so that termination signals reach everything
 * it forked. Exec and chdir failures are reported back to the parent through a close-on-exec
 * pipe and surface as a constructor exception.
 *
 * **Thread Safety:**
 * - readOutput()/closeOutput() for one stream must be called from a single thread
 * - writeStdin()/closeStdin() are serialized internally
 * - signal()/waitForExit() may race each other; signals are never delivered after the child
 *   has been reaped, so a recycled pid is never hit
 */
class ChildProcess {
public:
    /**
     * @brief Spawn the process described by `record`
     * @throws std::runtime_error if pipes cannot be created, fork fails, or the child cannot
     *         change directory or exec its command
     */
    explicit ChildProcess(const ProcessRecord& record);

    /**
     * @brief Kills the process group if the child has not been reaped, then reaps it
     */
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] int64_t pid() const noexcept;

    /**
     * @brief Wait up to `timeout` for output and read what is available
     * @return IOError on a read failure other than EINTR/EAGAIN
     */
    [[nodiscard]] Result<PipeRead> readOutput(OutputStream stream, std::span<char> buffer,
                                              std::chrono::milliseconds timeout);

    // Release the read end of a stream's pipe once the pump is done with it
    void closeOutput(OutputStream stream) noexcept;

    /**
     * @brief Write all of `data` to the child's stdin
     *
     * Waits at most `timeout` for pipe space. Returns NotRunning if stdin was already closed,
     * IOError on EPIPE or any other write error, Timeout if the child stopped reading.
     */
    [[nodiscard]] Result<void> writeStdin(std::span<const std::byte> data,
                                          std::chrono::milliseconds timeout);

    void closeStdin() noexcept;

    /**
     * @brief Send `signo` to the child's process group
     *
     * Succeeds without sending anything once the child has been reaped. ESRCH is treated as
     * success; any other errno is returned as KillFailed.
     */
    [[nodiscard]] Result<void> signal(int signo);

    /**
     * @brief Block until the child exits, reap it and return its exit code
     *
     * Exit code is the exit status, or 128 + signal number when the child was killed.
     */
    [[nodiscard]] Result<int> waitForExit();

    [[nodiscard]] bool reaped() const noexcept;
    [[nodiscard]] std::optional<int> exitCode() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace procd::supervisor
