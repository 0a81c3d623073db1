#pragma once

#include <procd/core/types.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace procd::supervisor {

enum class OutputStream : uint8_t { Stdout, Stderr };

constexpr const char* toString(OutputStream stream) {
    return stream == OutputStream::Stdout ? "stdout" : "stderr";
}

std::optional<OutputStream> parseOutputStream(std::string_view name);

/**
 * @brief One framed piece of process output (normally one line, terminator included)
 *
 * `sequence` starts at 1 for each stream of each generation.
 */
struct OutputChunk {
    OutputStream stream{OutputStream::Stdout};
    uint64_t sequence{0};
    uint64_t generation{0};
    std::string data;
    TimePoint timestamp;
};

/**
 * @brief Result of an incremental buffer read
 *
 * `floorSequence` is the sequence of the newest evicted chunk; everything above it is retained.
 */
struct OutputSlice {
    std::vector<OutputChunk> chunks;
    uint64_t floorSequence{0};
    uint64_t lastSequence{0};
};

/**
 * @brief Launch specification of a supervised process
 */
struct ProcessRecord {
    ProcessId id;
    std::vector<std::string> command; ///< argv[0] is resolved through PATH
    std::optional<std::filesystem::path> workingDirectory;
    std::map<std::string, std::string> env; ///< merged over the supervisor's environment

    bool sameLaunchSpec(const ProcessRecord& other) const {
        return command == other.command && workingDirectory == other.workingDirectory &&
               env == other.env;
    }
};

enum class ProcessState : uint8_t { Pending, Running, Exited, Failed, Stopped };

constexpr const char* toString(ProcessState state) {
    switch (state) {
        case ProcessState::Pending: return "pending";
        case ProcessState::Running: return "running";
        case ProcessState::Exited: return "exited";
        case ProcessState::Failed: return "failed";
        case ProcessState::Stopped: return "stopped";
    }
    return "unknown";
}

constexpr bool isLive(ProcessState state) {
    return state == ProcessState::Pending || state == ProcessState::Running;
}

// Snapshot of one generation's state machine
struct ProcessStatus {
    ProcessState state{ProcessState::Pending};
    std::optional<int64_t> pid;
    std::optional<int> exitCode;
    std::string reason; ///< set for Failed
    uint64_t generation{0};
    TimePoint startedAt;
    std::optional<TimePoint> endedAt;
};

// Row returned by ProcessRegistry::list()
struct ProcessInfo {
    ProcessId id;
    std::vector<std::string> command;
    ProcessStatus status;
};

} // namespace procd::supervisor
