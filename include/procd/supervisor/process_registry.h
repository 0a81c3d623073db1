#pragma once

#include <procd/core/types.h>
#include <procd/supervisor/output_broadcaster.h>
#include <procd/supervisor/supervisor_config.h>
#include <procd/supervisor/types.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace procd::supervisor {

class ProcessHandle;

/**
 * @brief Supervisor registry: id → ProcessHandle, with per-id command serialization
 *
 * Lifecycle commands (start/stop/restart/remove) for one id run one at a time; commands for
 * different ids run in parallel. Reads (list/info/readOutput/tail/subscribe) never wait on a
 * lifecycle command in progress.
 *
 * A record stays registered after its process exits and is only evicted by remove() or
 * shutdown().
 */
class ProcessRegistry {
public:
    explicit ProcessRegistry(SupervisorConfig config = {});
    ~ProcessRegistry();

    ProcessRegistry(const ProcessRegistry&) = delete;
    ProcessRegistry& operator=(const ProcessRegistry&) = delete;

    /**
     * @brief Register `id` (if unknown) and start a new generation
     *
     * For a known id the record must describe the same launch as the stored one.
     * @return InvalidArgument (bad id, empty command, different record), AlreadyRunning,
     *         SpawnFailed
     */
    Result<void> start(const ProcessId& id, ProcessRecord record);

    // Start a known id again with its stored record
    Result<void> start(const ProcessId& id);

    /**
     * @brief Register `id` without starting it
     *
     * The entry sits at generation 0 until start(id) launches it.
     * @return InvalidArgument (bad id, empty command, id already registered), InvalidState
     *         after shutdown()
     */
    Result<void> create(const ProcessId& id, ProcessRecord record);

    Result<void> stop(const ProcessId& id,
                      std::optional<std::chrono::milliseconds> grace = std::nullopt);
    Result<void> restart(const ProcessId& id,
                         std::optional<std::chrono::milliseconds> grace = std::nullopt);

    /**
     * @brief Evict a process that is not live and close its subscriptions
     * @return NotFound, StillRunning (also while a Failed generation's process is alive)
     */
    Result<void> remove(const ProcessId& id);

    // Point-in-time snapshot sorted by id
    [[nodiscard]] std::vector<ProcessInfo> list() const;
    [[nodiscard]] Result<ProcessInfo> info(const ProcessId& id) const;

    [[nodiscard]] Result<OutputSlice> readOutput(const ProcessId& id, OutputStream stream,
                                                 uint64_t sinceSequence) const;
    [[nodiscard]] Result<std::vector<OutputChunk>> tail(const ProcessId& id, std::size_t n,
                                                        bool includeStderr) const;

    Result<void> sendInput(const ProcessId& id, std::span<const std::byte> data);
    Result<void> sendInput(const ProcessId& id, std::string_view text);

    [[nodiscard]] Result<std::unique_ptr<Subscription>>
    subscribe(const ProcessId& id, std::optional<OutputStream> stream = std::nullopt);

    /**
     * @brief Stop every live process in parallel, then evict all records
     *
     * Idempotent. start() fails with InvalidState afterwards.
     */
    void shutdown(std::optional<std::chrono::milliseconds> grace = std::nullopt);

    [[nodiscard]] std::size_t size() const;
    const SupervisorConfig& config() const noexcept { return config_; }

    static bool isValidId(std::string_view id);

private:
    struct Entry;

    std::shared_ptr<Entry> find(const ProcessId& id) const;
    Result<std::shared_ptr<Entry>> lookup(const ProcessId& id) const;
    Result<void> startEntry(const ProcessId& id, const ProcessRecord* record);
    static Result<void> validate(const ProcessId& id, const ProcessRecord& record);

    const SupervisorConfig config_;
    // Outlives every handle: pumps publish into it until their generation is destroyed
    OutputBroadcaster broadcaster_;

    mutable std::shared_mutex entriesMutex_;
    std::unordered_map<ProcessId, std::shared_ptr<Entry>> entries_;
    std::atomic<bool> shuttingDown_{false};
};

} // namespace procd::supervisor
